#include "montecarlo/scenario_parser.hpp"
#include "physics/constants.hpp"
#include "core/errors.hpp"

namespace wormsim::mc {

namespace {

std::string join(const std::string& path, const char* key) {
    return path.empty() ? std::string(key) : path + "." + key;
}

double number_or(const JsonValue& obj, const char* key, const std::string& path, double def) {
    const JsonValue& v = obj[key];
    if (v.is_null()) return def;
    if (!v.is_number()) {
        throw ConfigurationError(join(path, key), "expected a number");
    }
    return v.as_number();
}

int int_or(const JsonValue& obj, const char* key, const std::string& path, int def) {
    const JsonValue& v = obj[key];
    if (v.is_null()) return def;
    if (!v.is_number() || v.as_number() != static_cast<double>(static_cast<int>(v.as_number()))) {
        throw ConfigurationError(join(path, key), "expected an integer");
    }
    return static_cast<int>(v.as_number());
}

bool bool_or(const JsonValue& obj, const char* key, const std::string& path, bool def) {
    const JsonValue& v = obj[key];
    if (v.is_null()) return def;
    if (!v.is_bool()) {
        throw ConfigurationError(join(path, key), "expected true or false");
    }
    return v.as_bool();
}

std::string string_or(const JsonValue& obj, const char* key, const std::string& path,
                      const std::string& def) {
    const JsonValue& v = obj[key];
    if (v.is_null()) return def;
    if (!v.is_string()) {
        throw ConfigurationError(join(path, key), "expected a string");
    }
    return v.as_string();
}

std::vector<int> int_list(const JsonValue& obj, const char* key, const std::string& path) {
    std::vector<int> out;
    const JsonValue& v = obj[key];
    if (v.is_null()) return out;
    if (!v.is_array()) {
        throw ConfigurationError(join(path, key), "expected an array of integers");
    }
    for (const auto& item : v.as_array()) {
        if (!item.is_number()) {
            throw ConfigurationError(join(path, key), "expected an array of integers");
        }
        out.push_back(static_cast<int>(item.as_number()));
    }
    return out;
}

void require_object(const JsonValue& v, const std::string& path) {
    if (!v.is_null() && !v.is_object()) {
        throw ConfigurationError(path, "expected an object");
    }
}

}  // anonymous namespace

SimulationConfig ScenarioParser::parse(const JsonValue& scenario) {
    if (!scenario.is_object()) {
        throw ConfigurationError("scenario", "top level must be an object");
    }

    SimulationConfig config;
    config.epoch_jd = number_or(scenario, "epoch_jd", "", config.epoch_jd);
    config.horizon_s = number_or(scenario, "horizon_s", "", config.horizon_s);
    config.step_s = number_or(scenario, "step_s", "", config.step_s);
    config.epidemic_substeps = int_or(scenario, "epidemic_substeps", "", config.epidemic_substeps);

    parse_constellation(scenario["constellation"], config);
    parse_topology(scenario["topology"], config);

    const JsonValue& sun = scenario["sun"];
    require_object(sun, "sun");
    std::string model = string_or(sun, "model", "sun", "ephemeris");
    if (model == "ephemeris") {
        config.sun_model = SunModel::EPHEMERIS;
    } else if (model == "fixed") {
        config.sun_model = SunModel::FIXED;
    } else {
        throw ConfigurationError("sun.model", "expected \"ephemeris\" or \"fixed\"");
    }

    parse_ground(scenario["ground_stations"], scenario["ground"], config);
    parse_epidemic(scenario["epidemic"], config);
    parse_defense(scenario["defense"], config);
    parse_routing(scenario["routing"], config);
    parse_monte_carlo(scenario["monte_carlo"], config);

    config.validate();
    return config;
}

SimulationConfig ScenarioParser::parse_file(const std::string& path) {
    return parse(JsonReader::parse_file(path));
}

void ScenarioParser::parse_constellation(const JsonValue& node, SimulationConfig& config) {
    require_object(node, "constellation");
    const JsonValue& walker = node["walker"];
    const JsonValue& tabulated = node["tabulated"];

    if (!walker.is_null() && !tabulated.is_null()) {
        throw ConfigurationError("constellation", "give either walker or tabulated, not both");
    }

    if (!tabulated.is_null()) {
        require_object(tabulated, "constellation.tabulated");
        config.constellation = ConstellationKind::TABULATED;

        const JsonValue& samples = tabulated["samples"];
        const std::string path = "constellation.tabulated.samples";
        if (!samples.is_array() || samples.size() == 0) {
            throw ConfigurationError(path, "expected a non-empty array");
        }
        for (const auto& s : samples.as_array()) {
            orbit::PositionSample sample;
            sample.time = number_or(s, "t", path, 0.0);
            const JsonValue& sats = s["satellites"];
            if (!sats.is_array()) {
                throw ConfigurationError(path + ".satellites", "expected an array");
            }
            for (const auto& sat : sats.as_array()) {
                const std::string sp = path + ".satellites";
                orbit::SatellitePosition pos;
                pos.id = int_or(sat, "id", sp, -1);
                pos.plane_id = int_or(sat, "plane", sp, 0);
                pos.position = Vec3(number_or(sat, "x", sp, 0.0),
                                    number_or(sat, "y", sp, 0.0),
                                    number_or(sat, "z", sp, 0.0));
                pos.velocity = Vec3(number_or(sat, "vx", sp, 0.0),
                                    number_or(sat, "vy", sp, 0.0),
                                    number_or(sat, "vz", sp, 0.0));
                sample.satellites.push_back(pos);
            }
            config.samples.push_back(std::move(sample));
        }
        return;
    }

    config.constellation = ConstellationKind::WALKER;
    require_object(walker, "constellation.walker");
    const std::string path = "constellation.walker";
    auto& w = config.walker;
    w.total = int_or(walker, "total", path, w.total);
    w.planes = int_or(walker, "planes", path, w.planes);
    w.phasing = int_or(walker, "phasing", path, w.phasing);
    w.altitude_m = number_or(walker, "altitude_km", path, w.altitude_m / 1000.0) * 1000.0;
    w.inclination_rad = number_or(walker, "inclination_deg", path,
                                  w.inclination_rad * RAD_TO_DEG) * DEG_TO_RAD;
    w.raan_spread_rad = number_or(walker, "raan_spread_deg", path,
                                  w.raan_spread_rad * RAD_TO_DEG) * DEG_TO_RAD;
}

void ScenarioParser::parse_topology(const JsonValue& node, SimulationConfig& config) {
    require_object(node, "topology");
    const std::string path = "topology";
    auto& t = config.topology;
    t.max_range_m = number_or(node, "max_range_km", path, t.max_range_m / 1000.0) * 1000.0;
    t.max_intra_plane_range_m = number_or(node, "max_intra_plane_range_km", path,
                                          t.max_intra_plane_range_m / 1000.0) * 1000.0;
    t.los_min_radius_m = number_or(node, "los_min_radius_km", path,
                                   t.los_min_radius_m / 1000.0) * 1000.0;
    t.link_failure_prob = number_or(node, "link_failure_prob", path, t.link_failure_prob);
    t.link_failure_enabled = bool_or(node, "link_failure_enabled", path, t.link_failure_enabled);

    auto& c = config.classifier;
    c.inclination_bucket_rad = number_or(node, "inclination_bucket_deg", path,
                                         c.inclination_bucket_rad * RAD_TO_DEG) * DEG_TO_RAD;
    c.raan_bucket_rad = number_or(node, "raan_bucket_deg", path,
                                  c.raan_bucket_rad * RAD_TO_DEG) * DEG_TO_RAD;
}

void ScenarioParser::parse_ground(const JsonValue& stations, const JsonValue& ground,
                                  SimulationConfig& config) {
    if (!stations.is_null()) {
        if (!stations.is_array()) {
            throw ConfigurationError("ground_stations", "expected an array");
        }
        const std::string path = "ground_stations";
        for (const auto& s : stations.as_array()) {
            ground::GroundStation gs;
            gs.id = string_or(s, "id", path, "GS" + std::to_string(config.stations.size()));
            if (!s.has("lat_deg") || !s.has("lon_deg")) {
                throw ConfigurationError(path, "station '" + gs.id + "' needs lat_deg and lon_deg");
            }
            gs.lat_deg = number_or(s, "lat_deg", path, 0.0);
            gs.lon_deg = number_or(s, "lon_deg", path, 0.0);
            gs.alt_m = number_or(s, "alt_m", path, 0.0);
            config.stations.push_back(gs);
        }
    }

    require_object(ground, "ground");
    auto& v = config.visibility;
    v.min_elevation_deg = number_or(ground, "min_elevation_deg", "ground", v.min_elevation_deg);
    v.sample_step_s = number_or(ground, "sample_step_s", "ground", v.sample_step_s);
}

void ScenarioParser::parse_epidemic(const JsonValue& node, SimulationConfig& config) {
    require_object(node, "epidemic");
    const std::string path = "epidemic";
    auto& e = config.epidemic;
    e.beta_normal = number_or(node, "beta_normal", path, e.beta_normal);
    e.beta_eclipse = number_or(node, "beta_eclipse", path, e.beta_eclipse);
    e.eclipse_half_width_s = number_or(node, "eclipse_half_width_s", path, e.eclipse_half_width_s);
    e.c2_timeout_s = number_or(node, "c2_timeout_s", path, e.c2_timeout_s);
    e.exploit_hops = int_or(node, "exploit_hops", path, e.exploit_hops);

    const JsonValue& init = node["initial_infected"];
    require_object(init, "epidemic.initial_infected");
    const std::string ipath = "epidemic.initial_infected";
    auto& ii = config.initial_infected;
    std::string policy = string_or(init, "policy", ipath, "random");
    if (policy == "random") {
        ii.policy = SeedPolicy::RANDOM;
    } else if (policy == "ids") {
        ii.policy = SeedPolicy::IDS;
    } else {
        throw ConfigurationError(ipath + ".policy", "expected \"random\" or \"ids\"");
    }
    ii.count = int_or(init, "count", ipath, ii.count);
    ii.ids = int_list(init, "ids", ipath);
    if (ii.policy == SeedPolicy::IDS && ii.ids.empty()) {
        throw ConfigurationError(ipath + ".ids", "policy \"ids\" needs at least one id");
    }
}

void ScenarioParser::parse_defense(const JsonValue& node, SimulationConfig& config) {
    require_object(node, "defense");
    auto& d = config.defense;

    const JsonValue& ids = node["ids"];
    require_object(ids, "defense.ids");
    d.ids.p_detect = number_or(ids, "p_detect", "defense.ids", d.ids.p_detect);
    d.ids.coverage = number_or(ids, "coverage", "defense.ids", d.ids.coverage);
    d.ids.nodes = int_list(ids, "nodes", "defense.ids");

    const JsonValue& patch = node["patch"];
    require_object(patch, "defense.patch");
    d.patch.rate_per_hour = number_or(patch, "rate_per_hour", "defense.patch", d.patch.rate_per_hour);
    d.patch.slots_per_station = int_or(patch, "slots_per_station", "defense.patch",
                                       d.patch.slots_per_station);

    const JsonValue& seg = node["segmentation"];
    require_object(seg, "defense.segmentation");
    const std::string spath = "defense.segmentation";
    d.segmentation.zone_count = int_or(seg, "zone_count", spath, d.segmentation.zone_count);
    d.segmentation.firewall_rate = number_or(seg, "firewall_rate", spath,
                                             d.segmentation.firewall_rate);
    std::string by = string_or(seg, "by", spath, "plane");
    if (by == "plane") {
        d.segmentation.by = defense::ZoneScheme::PLANE;
    } else if (by == "geography") {
        d.segmentation.by = defense::ZoneScheme::GEOGRAPHY;
    } else {
        throw ConfigurationError(spath + ".by", "expected \"plane\" or \"geography\"");
    }
}

void ScenarioParser::parse_routing(const JsonValue& node, SimulationConfig& config) {
    require_object(node, "routing");
    const std::string path = "routing";
    int capacity = int_or(node, "buffer_capacity", path,
                          static_cast<int>(config.routing.buffer_capacity));
    if (capacity <= 0) {
        throw ConfigurationError("routing.buffer_capacity", "must be positive");
    }
    config.routing.buffer_capacity = static_cast<std::size_t>(capacity);
    config.routing.service_per_tick = int_or(node, "service_per_tick", path,
                                             config.routing.service_per_tick);

    auto& tr = config.traffic;
    tr.packets_per_step = int_or(node, "packets_per_step", path, tr.packets_per_step);
    tr.control_fraction = number_or(node, "control_fraction", path, tr.control_fraction);
    tr.packet_size = int_or(node, "packet_size", path, tr.packet_size);
}

void ScenarioParser::parse_monte_carlo(const JsonValue& node, SimulationConfig& config) {
    require_object(node, "monte_carlo");
    const std::string path = "monte_carlo";
    auto& mc = config.monte_carlo;
    mc.trials = int_or(node, "trials", path, mc.trials);
    double seed = number_or(node, "base_seed", path, static_cast<double>(mc.base_seed));
    if (seed < 0.0 || seed > 4294967295.0) {
        throw ConfigurationError("monte_carlo.base_seed", "must fit in 32 bits");
    }
    mc.base_seed = static_cast<uint32_t>(seed);
    mc.threads = int_or(node, "threads", path, mc.threads);
}

} // namespace wormsim::mc
