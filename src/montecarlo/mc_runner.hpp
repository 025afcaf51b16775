/**
 * MCRunner — parallel Monte Carlo sweep over independent trials.
 *
 * Shared, read-only inputs (position provider, eclipse schedule, contact
 * schedule and, without stochastic link failure, the topology timeline)
 * are prepared once. Each trial then owns its TrialState and SimRNG
 * (seed = base_seed + trial index) and runs on a worker thread pulling
 * trial indices from an atomic counter.
 *
 * cancel(i) / cancel_all() may be called from any thread, including the
 * progress callback; flags are polled once per step. Cancelled trials
 * keep their partial data, are marked cancelled and are left out of the
 * aggregate.
 */

#ifndef WORMSIM_MC_MC_RUNNER_HPP
#define WORMSIM_MC_MC_RUNNER_HPP

#include "montecarlo/simulation_config.hpp"
#include "montecarlo/mc_results.hpp"
#include "montecarlo/trial_state.hpp"
#include "topology/topology_timeline.hpp"
#include "physics/eclipse_model.hpp"
#include "ground/ground_visibility.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace wormsim::mc {

class MCRunner {
public:
    using ProgressCallback = std::function<void(const TrialResult& result,
                                                int completed, int total)>;

    /** @throws ConfigurationError when config does not validate */
    explicit MCRunner(const SimulationConfig& config);

    /** Run every trial; results are ordered by trial index. */
    std::vector<TrialResult> run(ProgressCallback on_progress = nullptr);

    /** Run one trial on the calling thread. */
    TrialResult run_trial(int trial_index);

    void cancel(int trial_index);
    void cancel_all();

    /** Environment flags for the epidemic step [t, t + dt). */
    epi::NodeEnvironment environment_at(double t, double dt) const;

    const SimulationConfig& config() const { return config_; }
    const orbit::PositionProvider& provider() const { return *provider_; }
    const topo::TopologyTimeline* shared_timeline() const { return shared_timeline_.get(); }
    const EclipseSchedule& eclipse_schedule() const { return eclipse_; }
    const ground::ContactSchedule& contact_schedule() const { return contacts_; }

private:
    SimulationConfig config_;
    std::unique_ptr<orbit::PositionProvider> provider_;
    topo::TopologyBuilder builder_;
    std::unique_ptr<topo::TopologyTimeline> shared_timeline_;
    EclipseSchedule eclipse_;
    ground::ContactSchedule contacts_;

    std::unique_ptr<std::atomic<bool>[]> cancel_flags_;
    std::atomic<bool> cancel_all_{false};
    std::mutex report_mutex_;

    bool cancelled(int trial_index) const;

    /** One topology step: routing tick, then the epidemic substeps. */
    void advance(TrialState& state, const topo::TopologySnapshot& snapshot);
};

} // namespace wormsim::mc

#endif // WORMSIM_MC_MC_RUNNER_HPP
