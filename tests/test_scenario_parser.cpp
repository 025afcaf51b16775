#include <catch2/catch.hpp>

#include "montecarlo/scenario_parser.hpp"
#include "core/errors.hpp"
#include "physics/constants.hpp"

using namespace wormsim;
using namespace wormsim::mc;

namespace {

SimulationConfig parse(const std::string& json) {
    return ScenarioParser::parse(JsonReader::parse(json));
}

// Parameter named by the ConfigurationError the scenario raises, "" if none
std::string rejected_parameter(const std::string& json) {
    try {
        parse(json);
    } catch (const ConfigurationError& e) {
        return e.parameter();
    }
    return "";
}

} // namespace

TEST_CASE("An empty scenario takes every default", "[scenario]") {
    SimulationConfig config = parse("{}");

    REQUIRE(config.constellation == ConstellationKind::WALKER);
    REQUIRE(config.walker.total == 66);
    REQUIRE(config.walker.planes == 6);
    REQUIRE(config.step_s == Approx(300.0));
    REQUIRE(config.horizon_s == Approx(86400.0));
    REQUIRE(config.step_count() == 288);
    REQUIRE(config.topology.max_range_m == Approx(2500e3));
    REQUIRE(config.topology.max_intra_plane_range_m == Approx(700e3));
    REQUIRE_FALSE(config.topology.link_failure_enabled);
    REQUIRE(config.sun_model == SunModel::EPHEMERIS);
    REQUIRE(config.stations.empty());
    REQUIRE(config.epidemic.beta_normal == Approx(0.1));
    REQUIRE(config.initial_infected.policy == SeedPolicy::RANDOM);
    REQUIRE(config.initial_infected.count == 1);
    REQUIRE(config.defense.segmentation.zone_count == 1);
    REQUIRE(config.monte_carlo.trials == 10);
    REQUIRE(config.monte_carlo.base_seed == 42u);

    auto provider = config.make_provider();
    REQUIRE(provider->satellite_count() == 66);
}

TEST_CASE("Scenario units are converted on load", "[scenario]") {
    SimulationConfig config = parse(R"({
        "horizon_s": 3600,
        "step_s": 600,
        "constellation": {"walker": {"total": 24, "planes": 4, "phasing": 1,
                                     "altitude_km": 550, "inclination_deg": 53}},
        "topology": {"max_range_km": 5000, "max_intra_plane_range_km": 3000,
                     "los_min_radius_km": 6500, "link_failure_enabled": true,
                     "link_failure_prob": 0.01, "raan_bucket_deg": 4},
        "sun": {"model": "fixed"},
        "ground_stations": [{"id": "SVALBARD", "lat_deg": 78.2, "lon_deg": 15.4, "alt_m": 500}],
        "ground": {"min_elevation_deg": 10},
        "epidemic": {"beta_normal": 0.2, "beta_eclipse": 0.6, "exploit_hops": 2,
                     "initial_infected": {"policy": "ids", "ids": [0, 5]}},
        "defense": {"ids": {"coverage": 0.25, "p_detect": 0.5},
                    "patch": {"rate_per_hour": 4, "slots_per_station": 2},
                    "segmentation": {"zone_count": 2, "by": "geography", "firewall_rate": 0.9}},
        "routing": {"buffer_capacity": 64, "packets_per_step": 10},
        "monte_carlo": {"trials": 5, "base_seed": 7, "threads": 2}
    })");

    REQUIRE(config.step_count() == 6);
    REQUIRE(config.walker.altitude_m == Approx(550e3));
    REQUIRE(config.walker.inclination_rad == Approx(53.0 * DEG_TO_RAD));
    REQUIRE(config.topology.max_range_m == Approx(5000e3));
    REQUIRE(config.topology.max_intra_plane_range_m == Approx(3000e3));
    REQUIRE(config.topology.los_min_radius_m == Approx(6500e3));
    REQUIRE(config.topology.link_failure_enabled);
    REQUIRE(config.classifier.raan_bucket_rad == Approx(4.0 * DEG_TO_RAD));
    REQUIRE(config.sun_model == SunModel::FIXED);

    REQUIRE(config.stations.size() == 1);
    REQUIRE(config.stations[0].id == "SVALBARD");
    REQUIRE(config.stations[0].alt_m == Approx(500.0));
    REQUIRE(config.visibility.min_elevation_deg == Approx(10.0));

    REQUIRE(config.epidemic.exploit_hops == 2);
    REQUIRE(config.initial_infected.policy == SeedPolicy::IDS);
    REQUIRE(config.initial_infected.ids == std::vector<int>{0, 5});

    REQUIRE(config.defense.ids.coverage == Approx(0.25));
    REQUIRE(config.defense.patch.slots_per_station == 2);
    REQUIRE(config.defense.segmentation.by == defense::ZoneScheme::GEOGRAPHY);
    REQUIRE(config.routing.buffer_capacity == 64);
    REQUIRE(config.traffic.packets_per_step == 10);
    REQUIRE(config.monte_carlo.base_seed == 7u);
    REQUIRE(config.monte_carlo.threads == 2);
}

TEST_CASE("Tabulated constellations are read sample by sample", "[scenario]") {
    SimulationConfig config = parse(R"({
        "constellation": {"tabulated": {"samples": [
            {"t": 0, "satellites": [
                {"id": 1, "plane": 0, "x": 0, "y": 7000000, "z": 0},
                {"id": 0, "plane": 0, "x": 7000000, "y": 0, "z": 0}]},
            {"t": 300, "satellites": [
                {"id": 0, "plane": 0, "x": 0, "y": 7000000, "z": 0},
                {"id": 1, "plane": 0, "x": -7000000, "y": 0, "z": 0}]}
        ]}}
    })");

    REQUIRE(config.constellation == ConstellationKind::TABULATED);
    REQUIRE(config.samples.size() == 2);

    auto provider = config.make_provider();
    REQUIRE(provider->satellite_count() == 2);
    REQUIRE(provider->plane_count() == 1);
    REQUIRE(provider->positions_at(0.0)[0].position.x == Approx(7e6));
}

TEST_CASE("Invalid scenarios name the offending parameter", "[scenario][errors]") {
    REQUIRE(rejected_parameter(R"({"epidemic": {"beta_normal": 1.5}})") == "epidemic.beta_normal");
    REQUIRE(rejected_parameter(R"({"step_s": 0})") == "step_s");
    REQUIRE(rejected_parameter(R"({"constellation": {"walker": {"planes": "six"}}})")
            == "constellation.walker.planes");
    REQUIRE(rejected_parameter(R"({"constellation": {"walker": {"total": 25, "planes": 4}}})")
            == "constellation.walker.total");
    REQUIRE(rejected_parameter(R"({"constellation": {"walker": {}, "tabulated": {}}})")
            == "constellation");
    REQUIRE(rejected_parameter(R"({"sun": {"model": "moon"}})") == "sun.model");
    REQUIRE(rejected_parameter(R"({"ground_stations": [{"id": "X", "lat_deg": 10}]})")
            == "ground_stations");
    REQUIRE(rejected_parameter(R"({"epidemic": {"initial_infected": {"policy": "ids"}}})")
            == "epidemic.initial_infected.ids");
    REQUIRE(rejected_parameter(R"({"epidemic": {"initial_infected": {"count": 100}}})")
            == "epidemic.initial_infected.count");
    REQUIRE(rejected_parameter(R"({"defense": {"ids": {"nodes": [66]}}})") == "defense.ids.nodes");
    REQUIRE(rejected_parameter(R"({"defense": {"segmentation": {"by": "color"}}})")
            == "defense.segmentation.by");
    REQUIRE(rejected_parameter(R"({"routing": {"buffer_capacity": 0}})") == "routing.buffer_capacity");
    REQUIRE(rejected_parameter(R"({"monte_carlo": {"base_seed": -1}})") == "monte_carlo.base_seed");
    REQUIRE(rejected_parameter(R"({"monte_carlo": {"trials": 2.5}})") == "monte_carlo.trials");
    REQUIRE(rejected_parameter(R"({"topology": {"link_failure_prob": 2}})")
            == "topology.link_failure_prob");
    REQUIRE(rejected_parameter(R"({"topology": 5})") == "topology");
    REQUIRE(rejected_parameter(R"({"constellation": {"tabulated": {"samples": [{"t": 0,
                "satellites": [{"id": 0, "plane": 0, "x": 7000000, "y": 0, "z": 0},
                               {"id": 1, "plane": 2, "x": 0, "y": 7000000, "z": 0}]}]}}})")
            == "constellation.tabulated.samples");

    REQUIRE_THROWS_AS(ScenarioParser::parse(JsonReader::parse("[]")), ConfigurationError);
}
