#include <catch2/catch.hpp>

#include "epidemic/propagation_engine.hpp"
#include "defense/defense_layer.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

using namespace wormsim;
using namespace wormsim::epi;

namespace {

EpidemicParams certain_spread() {
    EpidemicParams p;
    p.beta_normal = 1.0;
    p.beta_eclipse = 1.0;
    return p;
}

// Steps the engine on a fixed graph until nothing changes or max_steps pass
int run_until_stable(PropagationEngine& engine, const topo::TopologySnapshot& snap,
                     mc::SimRNG& rng, int max_steps, double dt = 300.0) {
    auto env = NodeEnvironment::quiet(engine.node_count());
    for (int k = 0; k < max_steps; k++) {
        auto events = engine.step(snap, env, k * dt, dt, nullptr, rng);
        if (events.empty()) return k;
    }
    return max_steps;
}

} // namespace

TEST_CASE("Certain exploitation floods a ring within its radius", "[epidemic][propagation]") {
    auto ring = test::make_graph(10, test::ring_edges(10));
    PropagationEngine engine(ring.positions(), certain_spread());
    mc::SimRNG rng(1);
    engine.seed_infections({0}, 0.0);

    auto env = NodeEnvironment::quiet(10);
    int steps = 0;
    while (engine.counts().infected < 10 && steps < 20) {
        engine.step(ring, env, steps * 300.0, 300.0, nullptr, rng);
        steps++;
    }

    REQUIRE(engine.counts().infected == 10);
    REQUIRE(steps <= 9);
    REQUIRE(steps == 5);

    SECTION("infection times follow hop distance") {
        REQUIRE(engine.node(1).infected_at == Approx(300.0));
        REQUIRE(engine.node(9).infected_at == Approx(300.0));
        REQUIRE(engine.node(5).infected_at == Approx(1500.0));
        REQUIRE(engine.node(1).infected_by == 0);
    }
}

TEST_CASE("A chain seeded at one end takes one step per hop", "[epidemic][propagation]") {
    auto chain = test::make_graph(10, test::chain_edges(10));
    PropagationEngine engine(chain.positions(), certain_spread());
    mc::SimRNG rng(1);
    engine.seed_infections({0}, 0.0);

    // One hop per step: no node is infected and infectious in the same step
    auto env = NodeEnvironment::quiet(10);
    for (int k = 0; k < 9; k++) {
        REQUIRE(engine.counts().infected == k + 1);
        engine.step(chain, env, k * 300.0, 300.0, nullptr, rng);
    }
    REQUIRE(engine.counts().infected == 10);
}

TEST_CASE("Infection never crosses into a disconnected component", "[epidemic][propagation]") {
    auto edges = test::ring_edges(5);
    auto second = test::ring_edges(5, 5);
    edges.insert(edges.end(), second.begin(), second.end());
    auto snap = test::make_graph(10, edges);

    PropagationEngine engine(snap.positions(), certain_spread());
    mc::SimRNG rng(3);
    engine.seed_infections({2}, 0.0);
    run_until_stable(engine, snap, rng, 50);

    for (int id = 0; id < 5; id++) REQUIRE(engine.node(id).state == HealthState::INFECTED);
    for (int id = 5; id < 10; id++) REQUIRE(engine.node(id).state == HealthState::SUSCEPTIBLE);
}

TEST_CASE("Identical seeds give identical event streams", "[epidemic][rng]") {
    auto ring = test::make_graph(30, test::ring_edges(30));
    EpidemicParams p;
    p.beta_normal = 0.3;

    auto run = [&](uint32_t seed) {
        PropagationEngine engine(ring.positions(), p);
        mc::SimRNG rng(seed);
        engine.seed_infections({0, 15}, 0.0);
        auto env = NodeEnvironment::quiet(30);
        for (int k = 0; k < 20; k++) engine.step(ring, env, k * 300.0, 300.0, nullptr, rng);
        return engine.events();
    };

    auto a = run(11);
    auto b = run(11);
    REQUIRE(a.size() == b.size());
    for (size_t i = 0; i < a.size(); i++) {
        REQUIRE(a[i].node == b[i].node);
        REQUIRE(a[i].source == b[i].source);
        REQUIRE(a[i].timestamp == b[i].timestamp);
    }
}

TEST_CASE("Node states only move forward", "[epidemic][invariants]") {
    auto ring = test::make_graph(40, test::ring_edges(40));
    EpidemicParams p;
    p.beta_normal = 0.5;
    PropagationEngine engine(ring.positions(), p);

    mc::SimRNG rng(5);
    defense::DefenseParams dp;
    dp.patch.rate_per_hour = 24.0;     // two patches per 300 s step
    defense::DefenseLayer defense(dp, ring.positions(), 1, 2451545.0, rng);

    NodeEnvironment env = NodeEnvironment::quiet(40);
    for (int i = 0; i < 40; i += 3) env.in_contact[i] = true;
    env.stations_in_view = 1;

    engine.seed_infections({0, 20}, 0.0);
    HealthCounts prev = engine.counts();
    for (int k = 0; k < 40; k++) {
        auto events = engine.step(ring, env, k * 300.0, 300.0, &defense, rng);
        HealthCounts now = engine.counts();
        REQUIRE(now.susceptible <= prev.susceptible);
        REQUIRE(now.recovered >= prev.recovered);
        REQUIRE(now.susceptible + now.infected + now.recovered == 40);
        for (const auto& e : events) {
            REQUIRE(e.to != HealthState::SUSCEPTIBLE);
            if (e.from == HealthState::RECOVERED) FAIL("recovered node changed state");
        }
        prev = now;
    }
}

TEST_CASE("Without patching the infected count never falls", "[epidemic][invariants]") {
    auto ring = test::make_graph(40, test::ring_edges(40));
    EpidemicParams p;
    p.beta_normal = 0.4;
    PropagationEngine engine(ring.positions(), p);

    mc::SimRNG rng(17);
    defense::DefenseParams dp;
    dp.patch.rate_per_hour = 0.0;
    defense::DefenseLayer defense(dp, ring.positions(), 1, 2451545.0, rng);

    NodeEnvironment env = NodeEnvironment::quiet(40);
    for (int i = 0; i < 40; i++) env.in_contact[i] = true;
    env.stations_in_view = 1;

    engine.seed_infections({7}, 0.0);
    int prev_infected = engine.counts().infected;
    int k = 0;
    while (engine.counts().susceptible > 0 && k < 500) {
        engine.step(ring, env, k * 300.0, 300.0, &defense, rng);
        HealthCounts now = engine.counts();
        REQUIRE(now.infected >= prev_infected);
        REQUIRE(now.recovered == 0);
        prev_infected = now.infected;
        k++;
    }
    REQUIRE(engine.counts().susceptible == 0);
    REQUIRE(engine.counts().infected == 40);
}

TEST_CASE("Eclipse transitions modulate the victim's susceptibility", "[epidemic][eclipse]") {
    auto chain = test::make_graph(4, test::chain_edges(4));
    EpidemicParams p;
    p.beta_normal = 0.0;
    p.beta_eclipse = 1.0;
    PropagationEngine engine(chain.positions(), p);
    mc::SimRNG rng(8);
    engine.seed_infections({1}, 0.0);

    auto env = NodeEnvironment::quiet(4);
    env.eclipse_transition[2] = true;
    auto events = engine.step(chain, env, 0.0, 300.0, nullptr, rng);

    REQUIRE(events.size() == 1);
    REQUIRE(events[0].node == 2);
    REQUIRE(events[0].cause == EventCause::EXPLOIT);
    REQUIRE(engine.node(0).state == HealthState::SUSCEPTIBLE);
}

TEST_CASE("Multi-hop exploits reach nodes within the hop limit", "[epidemic][multihop]") {
    auto chain = test::make_graph(6, test::chain_edges(6));
    EpidemicParams p = certain_spread();
    p.exploit_hops = 3;
    PropagationEngine engine(chain.positions(), p);
    mc::SimRNG rng(2);
    engine.seed_infections({0}, 0.0);

    engine.step(chain, NodeEnvironment::quiet(6), 0.0, 300.0, nullptr, rng);
    REQUIRE(engine.node(1).state == HealthState::INFECTED);
    REQUIRE(engine.node(3).state == HealthState::INFECTED);
    REQUIRE(engine.node(3).infected_by == 0);
    REQUIRE(engine.node(4).state == HealthState::SUSCEPTIBLE);
}

TEST_CASE("Lost C2 contact makes an infection dormant until contact returns",
          "[epidemic][dormancy]") {
    auto isolated = test::make_graph(3, {});
    auto chain = test::make_graph(3, test::chain_edges(3));
    EpidemicParams p = certain_spread();
    p.c2_timeout_s = 600.0;
    PropagationEngine engine(isolated.positions(), p);
    mc::SimRNG rng(4);
    engine.seed_infections({0}, 0.0);

    auto quiet = NodeEnvironment::quiet(3);
    for (double t : {0.0, 300.0, 600.0}) {
        engine.step(isolated, quiet, t, 300.0, nullptr, rng);
        REQUIRE(engine.counts().dormant == 0);
    }

    auto events = engine.step(chain, quiet, 900.0, 300.0, nullptr, rng);
    REQUIRE(engine.node(0).dormant());
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].cause == EventCause::DORMANT);
    REQUIRE(engine.node(1).state == HealthState::SUSCEPTIBLE);
    REQUIRE(engine.counts().dormant == 1);

    auto contact = NodeEnvironment::quiet(3);
    contact.in_contact[0] = true;
    events = engine.step(chain, contact, 1200.0, 300.0, nullptr, rng);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].cause == EventCause::REACTIVATED);
    REQUIRE(events[1].cause == EventCause::EXPLOIT);
    REQUIRE(engine.node(1).state == HealthState::INFECTED);
    REQUIRE_FALSE(engine.node(0).dormant());
}

TEST_CASE("Invalid snapshots carry no infection attempts", "[epidemic][errors]") {
    auto ring = test::make_graph(4, test::ring_edges(4));
    PropagationEngine engine(ring.positions(), certain_spread());
    mc::SimRNG rng(1);
    engine.seed_infections({0}, 0.0);

    auto bad = topo::TopologySnapshot::make_invalid(1, 300.0, ring.positions(), "NaN position");
    auto events = engine.step(bad, NodeEnvironment::quiet(4), 300.0, 300.0, nullptr, rng);
    REQUIRE(events.empty());
    REQUIRE(engine.counts().infected == 1);
}

TEST_CASE("Seeding and parameter validation", "[epidemic][errors]") {
    auto positions = test::dummy_positions(4);
    PropagationEngine engine(positions, EpidemicParams());

    engine.seed_infections({1, 1, 2}, 0.0);
    REQUIRE(engine.counts().infected == 2);
    REQUIRE(engine.events().size() == 2);
    REQUIRE(engine.events()[0].cause == EventCause::SEED);

    REQUIRE_THROWS_AS(engine.seed_infections({4}, 0.0), std::out_of_range);

    REQUIRE(engine.recover(1, 10.0));
    REQUIRE_FALSE(engine.recover(1, 20.0));
    engine.seed_infections({1}, 30.0);
    REQUIRE(engine.node(1).state == HealthState::RECOVERED);

    EpidemicParams bad;
    bad.beta_normal = 1.5;
    REQUIRE_THROWS_AS(PropagationEngine(positions, bad), ConfigurationError);
    bad = EpidemicParams();
    bad.exploit_hops = 0;
    REQUIRE_THROWS_AS(PropagationEngine(positions, bad), ConfigurationError);
}
