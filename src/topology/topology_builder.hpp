/**
 * TopologyBuilder — derives the ISL graph from one constellation state.
 *
 * +Grid rules:
 *   1. distance:  |a - b| <= max_range (intra-plane also <= max_intra_plane_range)
 *   2. line of sight: the segment a-b stays outside los_min_radius
 *   3. intra-plane: ring neighbours in phase order within each plane group
 *   4. inter-plane: one link per side toward each RAAN-adjacent group,
 *      nearest available partner first
 *   5. optional independent per-link failure drawn from the trial RNG
 *
 * Deterministic for fixed inputs and RNG state.
 */

#ifndef WORMSIM_TOPOLOGY_BUILDER_HPP
#define WORMSIM_TOPOLOGY_BUILDER_HPP

#include "topology/topology_snapshot.hpp"
#include "physics/constants.hpp"
#include "montecarlo/sim_rng.hpp"
#include <vector>

namespace wormsim::topo {

struct TopologyParams {
    double max_range_m = 2500000.0;
    double max_intra_plane_range_m = 700000.0;
    double los_min_radius_m = DEFAULT_LOS_MIN_RADIUS;
    bool link_failure_enabled = false;
    double link_failure_prob = 1e-4;
};

class TopologyBuilder {
public:
    explicit TopologyBuilder(const TopologyParams& params = TopologyParams());

    /**
     * Build the snapshot for one timestamp.
     * @param rng  Trial RNG for stochastic link failure; may be null when
     *             link failure is disabled
     * @throws GeometryError on NaN/inf or zero-vector positions, or ids
     *         that are not dense 0..N-1
     */
    TopologySnapshot build(int sequence, double timestamp,
                           const orbit::PositionSet& positions,
                           const std::vector<PlaneGroup>& plane_groups,
                           mc::SimRNG* rng = nullptr) const;

    bool passes_distance(double distance_m, LinkType type) const;
    bool has_line_of_sight(const Vec3& a, const Vec3& b) const;

    const TopologyParams& params() const { return params_; }

    static void validate_positions(const orbit::PositionSet& positions);

private:
    TopologyParams params_;

    Link make_link(const orbit::PositionSet& positions, int u, int v, LinkType type) const;

    void add_intra_plane_links(const orbit::PositionSet& positions,
                               const PlaneGroup& group,
                               std::vector<Link>& links) const;

    void add_inter_plane_links(const orbit::PositionSet& positions,
                               const std::vector<PlaneGroup>& plane_groups,
                               std::vector<Link>& links) const;
};

} // namespace wormsim::topo

#endif // WORMSIM_TOPOLOGY_BUILDER_HPP
