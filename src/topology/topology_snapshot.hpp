/**
 * TopologySnapshot — the ISL graph at one instant.
 *
 * Immutable once built. Links are stored sorted by (a, b) with a < b;
 * adjacency lists are sorted by neighbour id so every traversal visits
 * neighbours in a reproducible order. Snapshots are shared read-only
 * between the timeline, the routing engine and concurrent trials.
 */

#ifndef WORMSIM_TOPOLOGY_SNAPSHOT_HPP
#define WORMSIM_TOPOLOGY_SNAPSHOT_HPP

#include "orbit/position_provider.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace wormsim::topo {

enum class LinkType {
    INTRA_PLANE,
    INTER_PLANE
};

struct Link {
    int a = 0;                 // lower satellite id
    int b = 0;                 // higher satellite id
    LinkType type = LinkType::INTRA_PLANE;
    double distance_m = 0.0;
    double latency_s = 0.0;
};

/** Order-independent 64-bit key of an unordered satellite pair. */
inline uint64_t link_key(int u, int v) {
    uint32_t lo = static_cast<uint32_t>(u < v ? u : v);
    uint32_t hi = static_cast<uint32_t>(u < v ? v : u);
    return (static_cast<uint64_t>(lo) << 32) | hi;
}

/**
 * Satellites sharing an orbital plane, ordered by in-plane phase.
 * The order defines intra-plane ring adjacency.
 */
struct PlaneGroup {
    int inclination_bucket = 0;
    int raan_bucket = 0;
    double inclination_rad = 0.0;
    double raan_rad = 0.0;
    std::vector<int> satellites;
};

struct Neighbor {
    int id;
    double latency_s;
    LinkType type;
};

class TopologySnapshot {
public:
    TopologySnapshot(int sequence, double timestamp,
                     orbit::PositionSet positions,
                     std::vector<PlaneGroup> plane_groups,
                     std::vector<Link> links);

    /** Snapshot whose build failed; carries no links. */
    static TopologySnapshot make_invalid(int sequence, double timestamp,
                                         orbit::PositionSet positions,
                                         const std::string& error);

    int sequence() const { return sequence_; }
    double timestamp() const { return timestamp_; }
    bool valid() const { return valid_; }
    const std::string& error() const { return error_; }

    const orbit::PositionSet& positions() const { return positions_; }
    const std::vector<PlaneGroup>& plane_groups() const { return plane_groups_; }
    const std::vector<Link>& links() const { return links_; }

    std::size_t node_count() const { return positions_.size(); }
    std::size_t edge_count() const { return links_.size(); }

    const std::vector<Neighbor>& neighbors(int id) const { return adjacency_.at(id); }

    bool has_link(int u, int v) const;

    int degree(int id) const;
    int degree(int id, LinkType type) const;

    /** Sorted keys of every link, for set comparisons between snapshots. */
    const std::vector<uint64_t>& link_keys() const { return keys_; }

private:
    int sequence_ = 0;
    double timestamp_ = 0.0;
    bool valid_ = true;
    std::string error_;

    orbit::PositionSet positions_;
    std::vector<PlaneGroup> plane_groups_;
    std::vector<Link> links_;
    std::vector<uint64_t> keys_;
    std::vector<std::vector<Neighbor>> adjacency_;
};

using SnapshotPtr = std::shared_ptr<const TopologySnapshot>;

} // namespace wormsim::topo

#endif // WORMSIM_TOPOLOGY_SNAPSHOT_HPP
