/**
 * DefenseLayer — IDS detection, rate-limited patching, zone segmentation.
 *
 * IDS nodes log a detection with probability p_detect for every attack
 * path they sit on. A path with any IDS node scales the attempt's
 * success probability by (1 - p_detect)^h over its h hops; detection
 * itself never blocks. Zone-crossing links
 * carry a firewall that blocks each traversal with firewall_rate.
 * Patching moves nodes to RECOVERED only through
 * PropagationEngine::recover().
 */

#ifndef WORMSIM_DEFENSE_LAYER_HPP
#define WORMSIM_DEFENSE_LAYER_HPP

#include "epidemic/epidemic_state.hpp"
#include "orbit/position_provider.hpp"
#include "montecarlo/sim_rng.hpp"
#include <vector>

namespace wormsim::epi {
class PropagationEngine;
}

namespace wormsim::defense {

struct IdsParams {
    double p_detect = 0.3;
    double coverage = 0.0;             // fraction of nodes, used when nodes is empty
    std::vector<int> nodes;            // explicit IDS-enabled ids
};

struct PatchParams {
    double rate_per_hour = 0.0;
    int slots_per_station = 0;         // patches per station in view per step, 0 = unlimited
};

enum class ZoneScheme {
    PLANE,
    GEOGRAPHY
};

struct SegmentationParams {
    int zone_count = 1;
    ZoneScheme by = ZoneScheme::PLANE;
    double firewall_rate = 0.7;
};

struct DefenseParams {
    IdsParams ids;
    PatchParams patch;
    SegmentationParams segmentation;
};

struct DetectionEvent {
    int ids_node;
    int attacker;
    int target;
    double timestamp;
};

struct FirewallEvent {
    int link_a;
    int link_b;
    int attacker;
    int target;
    double timestamp;
};

class DefenseLayer {
public:
    /**
     * @param epoch_positions  Constellation at t = 0 (zones, node count)
     * @param plane_count      Number of provider plane ids
     * @param epoch_jd         Scenario epoch, for geographic zones
     * @param rng              Trial RNG; draws the IDS subset when coverage is used
     * @throws ConfigurationError on out-of-range parameters
     */
    DefenseLayer(const DefenseParams& params,
                 const orbit::PositionSet& epoch_positions,
                 int plane_count,
                 double epoch_jd,
                 mc::SimRNG& rng);

    // ── IDS ──

    bool is_ids(int id) const { return ids_flag_.at(id); }
    const std::vector<int>& ids_nodes() const { return ids_nodes_; }

    /**
     * Draw one detection per IDS node on an attack path (attacker
     * included) and return the success factor: (1 - p_detect)^h for a
     * path of h hops with any IDS node on it, 1 otherwise.
     */
    double detection_factor(const std::vector<int>& path, int attacker, int target,
                            double t, mc::SimRNG& rng);

    // ── Segmentation ──

    int zone_of(int id) const { return zones_.at(id); }
    int zone_count() const { return params_.segmentation.zone_count; }
    bool crosses_zone(int a, int b) const { return zones_.at(a) != zones_.at(b); }

    /**
     * One firewall draw per zone-crossing link on the path, in path order.
     * @return true when any draw blocks the attempt
     */
    bool firewall_blocks(const std::vector<int>& path, int attacker, int target,
                         double t, mc::SimRNG& rng);

    // ── Patching ──

    /**
     * Nodes to patch this step, read from the engine's current state.
     * Candidates are non-recovered nodes in contact; infected (active,
     * then dormant) before susceptible, then by id. The budget is the
     * whole part of rate * dt plus the carried fraction, capped by
     * contact capacity.
     */
    std::vector<int> select_patches(const epi::PropagationEngine& engine,
                                    const epi::NodeEnvironment& environment,
                                    double dt);

    double patch_carry() const { return patch_carry_; }

    const std::vector<DetectionEvent>& detections() const { return detections_; }
    const std::vector<FirewallEvent>& firewall_blocks_log() const { return firewall_log_; }
    const DefenseParams& params() const { return params_; }

private:
    DefenseParams params_;
    std::vector<bool> ids_flag_;
    std::vector<int> ids_nodes_;
    std::vector<int> zones_;
    double patch_carry_ = 0.0;

    std::vector<DetectionEvent> detections_;
    std::vector<FirewallEvent> firewall_log_;

    void validate(std::size_t node_count) const;
    void select_ids(std::size_t node_count, mc::SimRNG& rng);
    void assign_zones(const orbit::PositionSet& positions, int plane_count, double epoch_jd);
};

} // namespace wormsim::defense

#endif // WORMSIM_DEFENSE_LAYER_HPP
