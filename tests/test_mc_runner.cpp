#include <catch2/catch.hpp>

#include "montecarlo/mc_runner.hpp"
#include "io/json_reader.hpp"

#include <algorithm>
#include <sstream>

using namespace wormsim;
using namespace wormsim::mc;

namespace {

SimulationConfig small_scenario() {
    SimulationConfig config;
    config.horizon_s = 3600.0;
    config.step_s = 300.0;

    config.walker.total = 48;
    config.walker.planes = 4;
    config.walker.phasing = 1;
    config.topology.max_range_m = 6000e3;
    config.topology.max_intra_plane_range_m = 4000e3;
    config.sun_model = SunModel::FIXED;

    ground::GroundStation station;
    station.id = "GS0";
    station.lat_deg = 0.0;
    station.lon_deg = 0.0;
    config.stations.push_back(station);
    config.visibility.min_elevation_deg = 10.0;

    config.epidemic.beta_normal = 0.3;
    config.epidemic.beta_eclipse = 0.6;
    config.initial_infected.count = 2;
    config.defense.patch.rate_per_hour = 12.0;
    config.traffic.packets_per_step = 5;

    config.monte_carlo.trials = 4;
    config.monte_carlo.base_seed = 100;
    return config;
}

void require_same_curves(const TrialResult& a, const TrialResult& b) {
    REQUIRE(a.seed == b.seed);
    REQUIRE(a.initial_infected == b.initial_infected);
    REQUIRE(a.curve.size() == b.curve.size());
    for (size_t i = 0; i < a.curve.size(); i++) {
        REQUIRE(a.curve[i].susceptible == b.curve[i].susceptible);
        REQUIRE(a.curve[i].infected == b.curve[i].infected);
        REQUIRE(a.curve[i].recovered == b.curve[i].recovered);
    }
    REQUIRE(a.events.size() == b.events.size());
    REQUIRE(a.routing.delivered == b.routing.delivered);
}

} // namespace

TEST_CASE("Trials are reproducible from their seed", "[mc][determinism]") {
    auto config = small_scenario();
    MCRunner first(config);
    MCRunner second(config);

    auto a = first.run();
    auto b = second.run();
    REQUIRE(a.size() == 4);
    for (size_t i = 0; i < a.size(); i++) {
        INFO("trial " << i);
        REQUIRE(a[i].completed());
        REQUIRE(a[i].seed == 100u + i);
        require_same_curves(a[i], b[i]);
    }

    SECTION("a single trial rerun alone matches") {
        require_same_curves(first.run_trial(2), a[2]);
    }
}

TEST_CASE("Thread count does not change results", "[mc][threads]") {
    auto config = small_scenario();
    auto serial = MCRunner(config).run();

    config.monte_carlo.threads = 4;
    auto parallel = MCRunner(config).run();

    REQUIRE(parallel.size() == serial.size());
    for (size_t i = 0; i < serial.size(); i++) {
        REQUIRE(parallel[i].trial_index == static_cast<int>(i));
        require_same_curves(serial[i], parallel[i]);
    }
}

TEST_CASE("Trial output covers the horizon and conserves nodes", "[mc]") {
    auto config = small_scenario();
    MCRunner runner(config);
    REQUIRE(runner.shared_timeline() != nullptr);
    REQUIRE(runner.contact_schedule().station_count() == 1);

    TrialResult r = runner.run_trial(0);
    REQUIRE(r.completed());
    REQUIRE(r.curve.size() == 13);
    REQUIRE(r.curve.front().t == Approx(0.0));
    REQUIRE(r.curve.back().t == Approx(3600.0));
    REQUIRE(r.sim_time_final == Approx(3600.0));
    REQUIRE(r.snapshots.size() + r.invalid_snapshots == 12);
    REQUIRE(r.initial_infected.size() == 2);
    REQUIRE(r.curve.front().infected == 2);
    REQUIRE(r.routing.injected == 60);

    for (size_t i = 0; i < r.curve.size(); i++) {
        const auto& p = r.curve[i];
        REQUIRE(p.susceptible + p.infected + p.recovered == 48);
        if (i > 0) {
            REQUIRE(p.susceptible <= r.curve[i - 1].susceptible);
            REQUIRE(p.recovered >= r.curve[i - 1].recovered);
        }
    }

    SECTION("environment flags cover every satellite") {
        auto env = runner.environment_at(0.0, 300.0);
        REQUIRE(env.in_contact.size() == 48);
        REQUIRE(env.eclipse_transition.size() == 48);
        REQUIRE(env.stations_in_view >= 0);
        REQUIRE(env.stations_in_view <= 1);
    }
}

TEST_CASE("Substeps refine the infection curve", "[mc]") {
    auto config = small_scenario();
    config.epidemic_substeps = 3;
    MCRunner runner(config);
    TrialResult r = runner.run_trial(0);
    REQUIRE(r.curve.size() == 37);
    REQUIRE(r.curve[1].t == Approx(100.0));
}

TEST_CASE("Cancelled trials are excluded from aggregates", "[mc][cancel]") {
    auto config = small_scenario();

    SECTION("cancelling one trial up front") {
        MCRunner runner(config);
        runner.cancel(2);
        auto results = runner.run();
        REQUIRE(results[2].cancelled);
        REQUIRE_FALSE(results[1].cancelled);

        auto agg = aggregate(results);
        REQUIRE(agg.trials_completed == 3);
        REQUIRE(agg.trials_cancelled == 1);
    }

    SECTION("cancelling everything from the progress callback") {
        MCRunner runner(config);
        int reports = 0;
        auto results = runner.run([&](const TrialResult&, int completed, int total) {
            reports++;
            REQUIRE(total == 4);
            if (completed == 1) runner.cancel_all();
        });

        REQUIRE(reports == 4);
        REQUIRE(results[0].completed());
        for (size_t i = 1; i < results.size(); i++) REQUIRE(results[i].cancelled);

        auto agg = aggregate(results);
        REQUIRE(agg.trials_completed == 1);
        REQUIRE(agg.trials_cancelled == 3);
        REQUIRE(agg.mean_final_infected == Approx(results[0].curve.back().infected));

        std::ostringstream csv;
        write_curve_csv(results, csv);
        std::string text = csv.str();
        REQUIRE(text.rfind("seed,t,S,I,R,dormant\n", 0) == 0);
        REQUIRE(std::count(text.begin(), text.end(), '\n')
                == static_cast<long>(1 + results[0].curve.size()));
    }
}

TEST_CASE("Stochastic link failure stays reproducible per trial", "[mc][determinism]") {
    auto config = small_scenario();
    config.topology.link_failure_enabled = true;
    config.topology.link_failure_prob = 0.05;
    config.monte_carlo.trials = 2;

    MCRunner runner(config);
    REQUIRE(runner.shared_timeline() == nullptr);

    TrialResult a = runner.run_trial(1);
    TrialResult b = runner.run_trial(1);
    require_same_curves(a, b);
    REQUIRE(a.snapshots.size() == b.snapshots.size());
    for (size_t i = 0; i < a.snapshots.size(); i++) {
        REQUIRE(a.snapshots[i].edge_count == b.snapshots[i].edge_count);
    }
}

TEST_CASE("Results JSON carries config, aggregate and trials", "[mc][output]") {
    auto config = small_scenario();
    config.monte_carlo.trials = 2;
    MCRunner runner(config);
    auto results = runner.run();

    std::ostringstream out;
    write_results_json(results, config, out);
    auto doc = JsonReader::parse(out.str());

    REQUIRE(doc["config"]["trials"].as_int() == 2);
    REQUIRE(doc["config"]["baseSeed"].as_int() == 100);
    REQUIRE(doc["aggregate"]["trialsCompleted"].as_int() == 2);
    REQUIRE(doc["aggregate"]["meanInfectedCurve"].size() == 13);
    REQUIRE(doc["trials"].size() == 2);

    const JsonValue& trial = doc["trials"][0];
    REQUIRE(trial["error"].is_null());
    REQUIRE(trial["curve"].size() == 13);
    REQUIRE(trial["curve"][0]["I"].as_int() == 2);
    REQUIRE(trial["events"].size() >= 2);
    REQUIRE(trial["events"][0]["cause"].as_string() == "seed");
    REQUIRE(trial["routing"]["injected"].as_int() == 60);
}
