#include "topology/topology_snapshot.hpp"
#include <algorithm>

namespace wormsim::topo {

TopologySnapshot::TopologySnapshot(int sequence, double timestamp,
                                   orbit::PositionSet positions,
                                   std::vector<PlaneGroup> plane_groups,
                                   std::vector<Link> links)
    : sequence_(sequence),
      timestamp_(timestamp),
      positions_(std::move(positions)),
      plane_groups_(std::move(plane_groups)),
      links_(std::move(links)),
      adjacency_(positions_.size())
{
    std::sort(links_.begin(), links_.end(), [](const Link& x, const Link& y) {
        if (x.a != y.a) return x.a < y.a;
        return x.b < y.b;
    });

    keys_.reserve(links_.size());
    for (const auto& link : links_) {
        keys_.push_back(link_key(link.a, link.b));
        adjacency_[link.a].push_back(Neighbor{link.b, link.latency_s, link.type});
        adjacency_[link.b].push_back(Neighbor{link.a, link.latency_s, link.type});
    }

    for (auto& list : adjacency_) {
        std::sort(list.begin(), list.end(), [](const Neighbor& x, const Neighbor& y) {
            return x.id < y.id;
        });
    }
}

TopologySnapshot TopologySnapshot::make_invalid(int sequence, double timestamp,
                                                orbit::PositionSet positions,
                                                const std::string& error) {
    TopologySnapshot snap(sequence, timestamp, std::move(positions), {}, {});
    snap.valid_ = false;
    snap.error_ = error;
    return snap;
}

bool TopologySnapshot::has_link(int u, int v) const {
    return std::binary_search(keys_.begin(), keys_.end(), link_key(u, v));
}

int TopologySnapshot::degree(int id) const {
    return static_cast<int>(adjacency_.at(id).size());
}

int TopologySnapshot::degree(int id, LinkType type) const {
    const auto& list = adjacency_.at(id);
    return static_cast<int>(std::count_if(list.begin(), list.end(),
                                          [type](const Neighbor& n) { return n.type == type; }));
}

} // namespace wormsim::topo
