#include "topology/graph_algorithms.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <queue>
#include <utility>

namespace wormsim::topo {

static constexpr double LATENCY_EPS = 1e-12;

std::vector<int> ShortestPathTree::path_to(int target) const {
    std::vector<int> path;
    if (target < 0 || static_cast<size_t>(target) >= hops.size() || hops[target] < 0) {
        return path;
    }
    for (int n = target; n != -1; n = parent[n]) {
        path.push_back(n);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

int ShortestPathTree::next_hop(int target) const {
    std::vector<int> path = path_to(target);
    return path.size() >= 2 ? path[1] : -1;
}

ShortestPathTree dijkstra(const TopologySnapshot& snapshot, int source) {
    const size_t n = snapshot.node_count();

    ShortestPathTree tree;
    tree.source = source;
    tree.latency.assign(n, std::numeric_limits<double>::infinity());
    tree.hops.assign(n, -1);
    tree.parent.assign(n, -1);
    if (source < 0 || static_cast<size_t>(source) >= n) return tree;

    using Entry = std::pair<double, int>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> frontier;
    std::vector<bool> done(n, false);

    tree.latency[source] = 0.0;
    tree.hops[source] = 0;
    frontier.push({0.0, source});

    while (!frontier.empty()) {
        auto [d, u] = frontier.top();
        frontier.pop();
        if (done[u]) continue;
        done[u] = true;

        for (const auto& nb : snapshot.neighbors(u)) {
            int v = nb.id;
            if (done[v]) continue;
            double nd = d + nb.latency_s;

            bool better = nd < tree.latency[v] - LATENCY_EPS;
            bool tie = !better && std::abs(nd - tree.latency[v]) <= LATENCY_EPS
                       && u < tree.parent[v];
            if (better || tie) {
                tree.latency[v] = nd;
                tree.parent[v] = u;
                tree.hops[v] = tree.hops[u] + 1;
                frontier.push({nd, v});
            }
        }
    }
    return tree;
}

std::vector<int> bfs_hops(const TopologySnapshot& snapshot, int source) {
    std::vector<int> hops(snapshot.node_count(), -1);
    if (source < 0 || static_cast<size_t>(source) >= hops.size()) return hops;

    std::queue<int> q;
    hops[source] = 0;
    q.push(source);
    while (!q.empty()) {
        int u = q.front();
        q.pop();
        for (const auto& nb : snapshot.neighbors(u)) {
            if (hops[nb.id] < 0) {
                hops[nb.id] = hops[u] + 1;
                q.push(nb.id);
            }
        }
    }
    return hops;
}

// ── UnionFind ──

UnionFind::UnionFind(std::size_t n)
    : parent_(n), rank_(n, 0), sets_(n)
{
    for (size_t i = 0; i < n; i++) parent_[i] = static_cast<int>(i);
}

int UnionFind::find(int x) {
    while (parent_[x] != x) {
        parent_[x] = parent_[parent_[x]];
        x = parent_[x];
    }
    return x;
}

bool UnionFind::unite(int a, int b) {
    int ra = find(a);
    int rb = find(b);
    if (ra == rb) return false;
    if (rank_[ra] < rank_[rb]) std::swap(ra, rb);
    parent_[rb] = ra;
    if (rank_[ra] == rank_[rb]) rank_[ra]++;
    sets_--;
    return true;
}

std::vector<int> component_labels(const TopologySnapshot& snapshot) {
    const size_t n = snapshot.node_count();
    UnionFind uf(n);
    for (const auto& link : snapshot.links()) {
        uf.unite(link.a, link.b);
    }

    std::vector<int> lowest(n, -1);
    std::vector<int> labels(n);
    for (size_t i = 0; i < n; i++) {
        int root = uf.find(static_cast<int>(i));
        if (lowest[root] < 0) lowest[root] = static_cast<int>(i);
        labels[i] = lowest[root];
    }
    return labels;
}

std::size_t component_count(const TopologySnapshot& snapshot) {
    UnionFind uf(snapshot.node_count());
    for (const auto& link : snapshot.links()) {
        uf.unite(link.a, link.b);
    }
    return uf.set_count();
}

} // namespace wormsim::topo
