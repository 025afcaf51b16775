/**
 * PropagationEngine — S/I/R worm state machine over the ISL graph.
 *
 * Infected nodes carry an Active/Dormant flag driven by ground (C2)
 * contact. Every step is evaluated against the state frozen at the
 * start of the step and applied in one batch: new infections first,
 * then recoveries, so Recovered always wins and nothing chains within a
 * step. All draws come from the trial RNG in a fixed order.
 *
 * Step order:
 *   1. C2 contact bookkeeping, reactivation, dormancy
 *   2. infection attempts (firewall draws, IDS draws, infection draw)
 *   3. patch selection by the DefenseLayer
 *   4. apply infections, then recoveries
 */

#ifndef WORMSIM_PROPAGATION_ENGINE_HPP
#define WORMSIM_PROPAGATION_ENGINE_HPP

#include "epidemic/epidemic_state.hpp"
#include "topology/topology_snapshot.hpp"
#include "orbit/position_provider.hpp"
#include "montecarlo/sim_rng.hpp"
#include <vector>

namespace wormsim::defense {
class DefenseLayer;
}

namespace wormsim::epi {

class PropagationEngine {
public:
    /**
     * @param positions  Initial constellation state (ids dense 0..N-1)
     * @throws ConfigurationError on out-of-range parameters
     */
    PropagationEngine(const orbit::PositionSet& positions, const EpidemicParams& params);

    /**
     * Infect the given nodes at time t (SEED events).
     * Already infected or recovered ids are skipped.
     * @throws std::out_of_range on an unknown id
     */
    void seed_infections(const std::vector<int>& ids, double t);

    /**
     * Advance the epidemic from t to t + dt on one snapshot.
     * @param defense  Optional defense layer (IDS, firewall, patching)
     * @return Events produced by this step, in application order
     */
    std::vector<EpidemicEvent> step(const topo::TopologySnapshot& snapshot,
                                    const NodeEnvironment& environment,
                                    double t, double dt,
                                    defense::DefenseLayer* defense,
                                    mc::SimRNG& rng);

    /**
     * Move a non-recovered node to RECOVERED. The only I->R / S->R entry
     * point; used by the DefenseLayer's patching.
     * @return false when the node was already recovered
     */
    bool recover(int id, double t);

    HealthCounts counts() const;

    const std::vector<SatelliteNode>& nodes() const { return nodes_; }
    const SatelliteNode& node(int id) const { return nodes_.at(id); }
    std::size_t node_count() const { return nodes_.size(); }

    const std::vector<EpidemicEvent>& events() const { return events_; }
    const EpidemicParams& params() const { return params_; }

private:
    struct Attempt {
        int attacker;
        int target;
        std::vector<int> path;         // attacker .. target
    };

    std::vector<SatelliteNode> nodes_;
    EpidemicParams params_;
    std::vector<EpidemicEvent> events_;

    void refresh_positions(const topo::TopologySnapshot& snapshot);
    void update_c2(const NodeEnvironment& environment, double t,
                   std::vector<EpidemicEvent>& out);
    std::vector<Attempt> attempts_from(const topo::TopologySnapshot& snapshot, int attacker) const;
    void record(const EpidemicEvent& event, std::vector<EpidemicEvent>& out);
};

} // namespace wormsim::epi

#endif // WORMSIM_PROPAGATION_ENGINE_HPP
