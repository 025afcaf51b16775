#include "montecarlo/simulation_config.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <set>

namespace wormsim::mc {

namespace {

void require_probability(double p, const char* parameter) {
    if (!(p >= 0.0 && p <= 1.0)) {
        throw ConfigurationError(parameter, "must be a probability in [0, 1]");
    }
}

void require_positive(double v, const char* parameter) {
    if (!(v > 0.0) || !std::isfinite(v)) {
        throw ConfigurationError(parameter, "must be positive");
    }
}

void require_non_negative(double v, const char* parameter) {
    if (!(v >= 0.0) || !std::isfinite(v)) {
        throw ConfigurationError(parameter, "must be non-negative");
    }
}

}  // anonymous namespace

void SimulationConfig::validate() const {
    require_positive(horizon_s, "horizon_s");
    require_positive(step_s, "step_s");
    if (epidemic_substeps < 1) {
        throw ConfigurationError("epidemic_substeps", "must be at least 1");
    }

    // ── Constellation ──
    std::size_t node_count = 0;
    if (constellation == ConstellationKind::WALKER) {
        if (walker.planes <= 0) {
            throw ConfigurationError("constellation.walker.planes", "must be positive");
        }
        if (walker.total <= 0 || walker.total % walker.planes != 0) {
            throw ConfigurationError("constellation.walker.total",
                                     "must be a positive multiple of planes");
        }
        if (walker.phasing < 0 || walker.phasing >= walker.planes) {
            throw ConfigurationError("constellation.walker.phasing", "must be in [0, planes)");
        }
        require_positive(walker.altitude_m, "constellation.walker.altitude_km");
        node_count = static_cast<std::size_t>(walker.total);
    } else {
        if (samples.empty()) {
            throw ConfigurationError("constellation.tabulated.samples", "no samples");
        }
        node_count = samples.front().satellites.size();
        if (node_count == 0) {
            throw ConfigurationError("constellation.tabulated.samples", "sample has no satellites");
        }
        std::set<int> planes;
        for (const auto& sample : samples) {
            for (const auto& sp : sample.satellites) {
                if (sp.plane_id < 0) {
                    throw ConfigurationError("constellation.tabulated.samples",
                                             "plane ids must be non-negative");
                }
                planes.insert(sp.plane_id);
            }
        }
        if (*planes.rbegin() + 1 != static_cast<int>(planes.size())) {
            throw ConfigurationError("constellation.tabulated.samples",
                                     "plane ids must be 0..P-1 with no empty plane");
        }
    }

    // ── Topology ──
    require_positive(topology.max_range_m, "topology.max_range_km");
    require_positive(topology.max_intra_plane_range_m, "topology.max_intra_plane_range_km");
    require_non_negative(topology.los_min_radius_m, "topology.los_min_radius_km");
    require_probability(topology.link_failure_prob, "topology.link_failure_prob");
    require_positive(classifier.inclination_bucket_rad, "topology.inclination_bucket_deg");
    require_positive(classifier.raan_bucket_rad, "topology.raan_bucket_deg");

    // ── Ground ──
    if (visibility.min_elevation_deg < -90.0 || visibility.min_elevation_deg > 90.0) {
        throw ConfigurationError("ground.min_elevation_deg", "must be in [-90, 90]");
    }
    require_positive(visibility.sample_step_s, "ground.sample_step_s");
    std::set<std::string> station_ids;
    for (const auto& gs : stations) {
        if (gs.lat_deg < -90.0 || gs.lat_deg > 90.0) {
            throw ConfigurationError("ground_stations.lat_deg",
                                     "station '" + gs.id + "' latitude out of range");
        }
        if (!station_ids.insert(gs.id).second) {
            throw ConfigurationError("ground_stations.id", "duplicate station '" + gs.id + "'");
        }
    }

    // ── Epidemic ──
    require_probability(epidemic.beta_normal, "epidemic.beta_normal");
    require_probability(epidemic.beta_eclipse, "epidemic.beta_eclipse");
    require_non_negative(epidemic.eclipse_half_width_s, "epidemic.eclipse_half_width_s");
    if (epidemic.exploit_hops < 1) {
        throw ConfigurationError("epidemic.exploit_hops", "must be at least 1");
    }
    if (initial_infected.policy == SeedPolicy::RANDOM) {
        if (initial_infected.count < 0 ||
            static_cast<std::size_t>(initial_infected.count) > node_count) {
            throw ConfigurationError("epidemic.initial_infected.count",
                                     "must be between 0 and the satellite count");
        }
    } else {
        for (int id : initial_infected.ids) {
            if (id < 0 || static_cast<std::size_t>(id) >= node_count) {
                throw ConfigurationError("epidemic.initial_infected.ids",
                                         "unknown satellite id " + std::to_string(id));
            }
        }
    }

    // ── Defense ──
    require_probability(defense.ids.p_detect, "defense.ids.p_detect");
    require_probability(defense.ids.coverage, "defense.ids.coverage");
    for (int id : defense.ids.nodes) {
        if (id < 0 || static_cast<std::size_t>(id) >= node_count) {
            throw ConfigurationError("defense.ids.nodes",
                                     "unknown satellite id " + std::to_string(id));
        }
    }
    require_non_negative(defense.patch.rate_per_hour, "defense.patch.rate_per_hour");
    if (defense.patch.slots_per_station < 0) {
        throw ConfigurationError("defense.patch.slots_per_station", "must be non-negative");
    }
    if (defense.segmentation.zone_count < 1) {
        throw ConfigurationError("defense.segmentation.zone_count", "must be at least 1");
    }
    require_probability(defense.segmentation.firewall_rate, "defense.segmentation.firewall_rate");

    // ── Routing / traffic ──
    if (routing.buffer_capacity == 0) {
        throw ConfigurationError("routing.buffer_capacity", "must be positive");
    }
    if (routing.service_per_tick < 0) {
        throw ConfigurationError("routing.service_per_tick", "must be non-negative");
    }
    if (traffic.packets_per_step < 0) {
        throw ConfigurationError("routing.packets_per_step", "must be non-negative");
    }
    require_probability(traffic.control_fraction, "routing.control_fraction");
    if (traffic.packet_size <= 0) {
        throw ConfigurationError("routing.packet_size", "must be positive");
    }

    // ── Monte Carlo ──
    if (monte_carlo.trials < 1) {
        throw ConfigurationError("monte_carlo.trials", "must be at least 1");
    }
    if (monte_carlo.threads < 1) {
        throw ConfigurationError("monte_carlo.threads", "must be at least 1");
    }
}

std::unique_ptr<orbit::PositionProvider> SimulationConfig::make_provider() const {
    if (constellation == ConstellationKind::WALKER) {
        return std::make_unique<orbit::WalkerConstellation>(walker);
    }
    return std::make_unique<orbit::TabulatedPositions>(samples);
}

int SimulationConfig::step_count() const {
    return static_cast<int>(std::floor(horizon_s / step_s + 1e-9));
}

} // namespace wormsim::mc
