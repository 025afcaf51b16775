#include "metrics/metrics_collector.hpp"
#include "topology/graph_algorithms.hpp"
#include <algorithm>

namespace wormsim::metrics {

SnapshotMetrics MetricsCollector::snapshot_metrics(const topo::TopologySnapshot& snapshot,
                                                   std::optional<double> churn) {
    SnapshotMetrics m;
    m.sequence = snapshot.sequence();
    m.timestamp = snapshot.timestamp();
    m.node_count = snapshot.node_count();
    m.edge_count = snapshot.edge_count();
    m.churn_rate = churn;

    for (const auto& link : snapshot.links()) {
        if (link.type == topo::LinkType::INTRA_PLANE) m.intra_plane_edges++;
        else m.inter_plane_edges++;
    }
    if (m.node_count > 0) {
        m.avg_degree = 2.0 * static_cast<double>(m.edge_count) / static_cast<double>(m.node_count);
    }
    m.component_count = topo::component_count(snapshot);

    // All-pairs hop distances by BFS from every node
    long long pairs = 0;
    long long hop_sum = 0;
    int max_hops = 0;
    const int n = static_cast<int>(m.node_count);
    for (int src = 0; src < n; src++) {
        auto hops = topo::bfs_hops(snapshot, src);
        for (int dst = src + 1; dst < n; dst++) {
            if (hops[dst] <= 0) continue;
            pairs++;
            hop_sum += hops[dst];
            max_hops = std::max(max_hops, hops[dst]);
        }
    }
    if (pairs > 0) {
        m.avg_path_length = static_cast<double>(hop_sum) / static_cast<double>(pairs);
        m.diameter = max_hops;
    }
    return m;
}

void MetricsCollector::record_snapshot(const topo::TopologySnapshot& snapshot,
                                       std::optional<double> churn) {
    if (!snapshot.valid()) {
        invalid_snapshots_++;
        return;
    }
    snapshots_.push_back(snapshot_metrics(snapshot, churn));
}

void MetricsCollector::record_counts(double t, const epi::HealthCounts& counts) {
    curve_.push_back({t, counts.susceptible, counts.infected, counts.recovered, counts.dormant});
}

std::optional<double> MetricsCollector::mean_churn() const {
    double sum = 0.0;
    int n = 0;
    for (const auto& m : snapshots_) {
        if (!m.churn_rate) continue;
        sum += *m.churn_rate;
        n++;
    }
    if (n == 0) return std::nullopt;
    return sum / n;
}

int MetricsCollector::peak_infected() const {
    int peak = 0;
    for (const auto& p : curve_) peak = std::max(peak, p.infected);
    return peak;
}

} // namespace wormsim::metrics
