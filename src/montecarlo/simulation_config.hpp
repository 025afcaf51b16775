/**
 * SimulationConfig — every parameter of one Monte Carlo sweep.
 *
 * Built by ScenarioParser (or directly in tests) and checked by
 * validate() before any step runs. validate() throws ConfigurationError
 * naming the offending parameter by its scenario key path.
 */

#ifndef WORMSIM_MC_SIMULATION_CONFIG_HPP
#define WORMSIM_MC_SIMULATION_CONFIG_HPP

#include "orbit/walker_constellation.hpp"
#include "orbit/tabulated_positions.hpp"
#include "topology/topology_builder.hpp"
#include "topology/plane_classifier.hpp"
#include "physics/eclipse_model.hpp"
#include "ground/ground_visibility.hpp"
#include "epidemic/epidemic_state.hpp"
#include "defense/defense_layer.hpp"
#include "routing/routing_engine.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace wormsim::mc {

enum class ConstellationKind {
    WALKER,
    TABULATED
};

enum class SeedPolicy {
    RANDOM,       // count distinct nodes drawn from the trial RNG
    IDS           // explicit ids
};

struct InitialInfection {
    SeedPolicy policy = SeedPolicy::RANDOM;
    int count = 1;
    std::vector<int> ids;
};

struct TrafficParams {
    int packets_per_step = 0;
    double control_fraction = 0.1;
    int packet_size = 1024;             // bytes
};

struct MonteCarloParams {
    int trials = 10;
    uint32_t base_seed = 42;
    int threads = 1;
    bool verbose = false;
    bool progress = false;
};

struct SimulationConfig {
    double epoch_jd = 2451545.0;        // J2000
    double horizon_s = 86400.0;
    double step_s = 300.0;
    int epidemic_substeps = 1;

    ConstellationKind constellation = ConstellationKind::WALKER;
    orbit::WalkerParams walker;
    std::vector<orbit::PositionSample> samples;

    topo::TopologyParams topology;
    topo::ClassifierParams classifier;

    SunModel sun_model = SunModel::EPHEMERIS;

    std::vector<ground::GroundStation> stations;
    ground::VisibilityParams visibility;

    epi::EpidemicParams epidemic;
    InitialInfection initial_infected;

    defense::DefenseParams defense;
    routing::RoutingParams routing;
    TrafficParams traffic;

    MonteCarloParams monte_carlo;

    /** @throws ConfigurationError */
    void validate() const;

    /** Position source described by the constellation section. */
    std::unique_ptr<orbit::PositionProvider> make_provider() const;

    /** Number of topology steps after t = 0 within the horizon. */
    int step_count() const;
};

} // namespace wormsim::mc

#endif // WORMSIM_MC_SIMULATION_CONFIG_HPP
