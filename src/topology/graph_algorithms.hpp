/**
 * Graph algorithms over a TopologySnapshot.
 *
 * Dijkstra on link latency with deterministic tie-breaking (lowest
 * satellite id wins at every decision point), BFS hop distances and
 * union-find connected components.
 */

#ifndef WORMSIM_GRAPH_ALGORITHMS_HPP
#define WORMSIM_GRAPH_ALGORITHMS_HPP

#include "topology/topology_snapshot.hpp"
#include <vector>

namespace wormsim::topo {

struct ShortestPathTree {
    int source = -1;
    std::vector<double> latency;   // +inf when unreachable
    std::vector<int> hops;         // -1 when unreachable
    std::vector<int> parent;       // -1 for source / unreachable

    bool reachable(int node) const { return hops[node] >= 0; }

    /** Node sequence source..target, empty when unreachable. */
    std::vector<int> path_to(int target) const;

    /** First hop from the source toward target, -1 when none. */
    int next_hop(int target) const;
};

/**
 * Latency-weighted shortest paths from source.
 * Among equal-latency predecessors the lowest id is kept; the frontier
 * is ordered by (latency, id).
 */
ShortestPathTree dijkstra(const TopologySnapshot& snapshot, int source);

/** Hop distance from source to every node, -1 when unreachable. */
std::vector<int> bfs_hops(const TopologySnapshot& snapshot, int source);

class UnionFind {
public:
    explicit UnionFind(std::size_t n);

    int find(int x);
    bool unite(int a, int b);
    std::size_t set_count() const { return sets_; }

private:
    std::vector<int> parent_;
    std::vector<int> rank_;
    std::size_t sets_;
};

/** Component label per node; labels are the lowest node id in the component. */
std::vector<int> component_labels(const TopologySnapshot& snapshot);

std::size_t component_count(const TopologySnapshot& snapshot);

} // namespace wormsim::topo

#endif // WORMSIM_GRAPH_ALGORITHMS_HPP
