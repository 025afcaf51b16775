/**
 * TrialState — everything one Monte Carlo trial mutates.
 *
 * Passed explicitly through the step loop; trials never share an
 * instance. Members are declared so that the RNG exists before the
 * components that draw from it during construction.
 */

#ifndef WORMSIM_MC_TRIAL_STATE_HPP
#define WORMSIM_MC_TRIAL_STATE_HPP

#include "montecarlo/sim_rng.hpp"
#include "montecarlo/simulation_config.hpp"
#include "epidemic/propagation_engine.hpp"
#include "defense/defense_layer.hpp"
#include "routing/routing_engine.hpp"
#include "metrics/metrics_collector.hpp"
#include <cstdint>
#include <vector>

namespace wormsim::mc {

struct TrialState {
    /**
     * Draw order at construction: IDS subset (coverage policy), then the
     * random initial-infected set.
     */
    TrialState(const SimulationConfig& config,
               const orbit::PositionSet& epoch_positions,
               int plane_count,
               uint32_t seed);

    TrialState(const TrialState&) = delete;
    TrialState& operator=(const TrialState&) = delete;

    SimRNG rng;
    epi::PropagationEngine epidemic;
    defense::DefenseLayer defense;
    routing::RoutingEngine routing;
    metrics::MetricsCollector metrics;

    std::vector<int> initial_infected;
    double t = 0.0;
    int step = 0;

private:
    static std::vector<int> choose_initial(const InitialInfection& policy,
                                           std::size_t node_count, SimRNG& rng);
};

} // namespace wormsim::mc

#endif // WORMSIM_MC_TRIAL_STATE_HPP
