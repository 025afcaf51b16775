#include "topology/topology_builder.hpp"
#include "core/errors.hpp"
#include "physics/constants.hpp"
#include "physics/vec3_ops.hpp"
#include <algorithm>
#include <map>
#include <tuple>

namespace wormsim::topo {

TopologyBuilder::TopologyBuilder(const TopologyParams& params)
    : params_(params) {}

void TopologyBuilder::validate_positions(const orbit::PositionSet& positions) {
    for (size_t i = 0; i < positions.size(); i++) {
        const auto& sp = positions[i];
        if (sp.id != static_cast<int>(i)) {
            throw GeometryError(sp.id, "satellite ids must be dense and sorted");
        }
        if (!sp.position.is_finite()) {
            throw GeometryError(sp.id, "non-finite position");
        }
        if (sp.position.norm() < 1.0) {
            throw GeometryError(sp.id, "zero position vector");
        }
    }
}

bool TopologyBuilder::passes_distance(double distance_m, LinkType type) const {
    if (distance_m > params_.max_range_m) return false;
    if (type == LinkType::INTRA_PLANE && distance_m > params_.max_intra_plane_range_m) {
        return false;
    }
    return true;
}

bool TopologyBuilder::has_line_of_sight(const Vec3& a, const Vec3& b) const {
    return segment_min_radius(a, b) >= params_.los_min_radius_m;
}

Link TopologyBuilder::make_link(const orbit::PositionSet& positions,
                                int u, int v, LinkType type) const {
    Link link;
    link.a = std::min(u, v);
    link.b = std::max(u, v);
    link.type = type;
    link.distance_m = distance(positions[u].position, positions[v].position);
    link.latency_s = link.distance_m / SPEED_OF_LIGHT;
    return link;
}

void TopologyBuilder::add_intra_plane_links(const orbit::PositionSet& positions,
                                            const PlaneGroup& group,
                                            std::vector<Link>& links) const {
    const auto& ring = group.satellites;
    const size_t n = ring.size();
    if (n < 2) return;

    // A pair of satellites has a single link; larger groups close the ring
    const size_t pairs = (n == 2) ? 1 : n;
    for (size_t i = 0; i < pairs; i++) {
        int u = ring[i];
        int v = ring[(i + 1) % n];
        Link link = make_link(positions, u, v, LinkType::INTRA_PLANE);
        if (!passes_distance(link.distance_m, LinkType::INTRA_PLANE)) continue;
        if (!has_line_of_sight(positions[u].position, positions[v].position)) continue;
        links.push_back(link);
    }
}

void TopologyBuilder::add_inter_plane_links(const orbit::PositionSet& positions,
                                            const std::vector<PlaneGroup>& plane_groups,
                                            std::vector<Link>& links) const {
    // Groups are adjacent by RAAN order within one inclination bucket
    std::map<int, std::vector<size_t>> shells;
    for (size_t g = 0; g < plane_groups.size(); g++) {
        if (plane_groups[g].satellites.empty()) continue;
        shells[plane_groups[g].inclination_bucket].push_back(g);
    }

    const size_t n_sat = positions.size();
    std::vector<bool> right_used(n_sat, false);   // slot toward the next group
    std::vector<bool> left_used(n_sat, false);    // slot toward the previous group

    for (auto& [bucket, order] : shells) {
        std::sort(order.begin(), order.end(), [&](size_t x, size_t y) {
            return plane_groups[x].raan_rad < plane_groups[y].raan_rad;
        });

        const size_t m = order.size();
        if (m < 2) continue;
        const size_t adjacent_pairs = (m == 2) ? 1 : m;

        for (size_t k = 0; k < adjacent_pairs; k++) {
            const PlaneGroup& left = plane_groups[order[k]];
            const PlaneGroup& right = plane_groups[order[(k + 1) % m]];

            // Candidate pairs passing both tests, nearest first
            std::vector<Link> candidates;
            for (int u : left.satellites) {
                for (int v : right.satellites) {
                    Link link = make_link(positions, u, v, LinkType::INTER_PLANE);
                    if (!passes_distance(link.distance_m, LinkType::INTER_PLANE)) continue;
                    if (!has_line_of_sight(positions[u].position, positions[v].position)) continue;
                    candidates.push_back(link);
                }
            }
            std::sort(candidates.begin(), candidates.end(), [](const Link& x, const Link& y) {
                return std::tie(x.distance_m, x.a, x.b) < std::tie(y.distance_m, y.a, y.b);
            });

            std::vector<bool> in_left(n_sat, false);
            for (int u : left.satellites) in_left[u] = true;

            // Greedy matching: u uses its right slot, v its left slot
            for (const auto& link : candidates) {
                bool u_is_a = in_left[link.a];
                int u = u_is_a ? link.a : link.b;
                int v = u_is_a ? link.b : link.a;
                if (right_used[u] || left_used[v]) continue;
                right_used[u] = true;
                left_used[v] = true;
                links.push_back(link);
            }
        }
    }
}

TopologySnapshot TopologyBuilder::build(int sequence, double timestamp,
                                        const orbit::PositionSet& positions,
                                        const std::vector<PlaneGroup>& plane_groups,
                                        mc::SimRNG* rng) const {
    validate_positions(positions);

    std::vector<Link> links;
    for (const auto& group : plane_groups) {
        add_intra_plane_links(positions, group, links);
    }
    add_inter_plane_links(positions, plane_groups, links);

    std::sort(links.begin(), links.end(), [](const Link& x, const Link& y) {
        return std::tie(x.a, x.b) < std::tie(y.a, y.b);
    });

    if (params_.link_failure_enabled && rng != nullptr && params_.link_failure_prob > 0.0) {
        std::vector<Link> surviving;
        surviving.reserve(links.size());
        for (const auto& link : links) {
            if (!rng->bernoulli(params_.link_failure_prob)) {
                surviving.push_back(link);
            }
        }
        links = std::move(surviving);
    }

    return TopologySnapshot(sequence, timestamp, positions, plane_groups, std::move(links));
}

} // namespace wormsim::topo
