/**
 * MetricsCollector — topology and infection time series for one trial.
 *
 * Snapshot metrics cover degree, components and hop-count path
 * statistics over connected pairs; invalid snapshots are counted but
 * contribute no metrics. The infection curve records (t, S, I, R,
 * dormant) after every epidemic step.
 */

#ifndef WORMSIM_METRICS_COLLECTOR_HPP
#define WORMSIM_METRICS_COLLECTOR_HPP

#include "topology/topology_snapshot.hpp"
#include "epidemic/epidemic_state.hpp"
#include <optional>
#include <vector>

namespace wormsim::metrics {

struct SnapshotMetrics {
    int sequence = 0;
    double timestamp = 0.0;
    std::size_t node_count = 0;
    std::size_t edge_count = 0;
    std::size_t intra_plane_edges = 0;
    std::size_t inter_plane_edges = 0;
    double avg_degree = 0.0;
    std::size_t component_count = 0;
    std::optional<double> avg_path_length;   // hops, over connected pairs
    std::optional<int> diameter;             // hops
    std::optional<double> churn_rate;
};

struct CurvePoint {
    double t = 0.0;
    int susceptible = 0;
    int infected = 0;
    int recovered = 0;
    int dormant = 0;
};

class MetricsCollector {
public:
    /** Metrics of one valid snapshot; churn is passed through as given. */
    static SnapshotMetrics snapshot_metrics(const topo::TopologySnapshot& snapshot,
                                            std::optional<double> churn = std::nullopt);

    /** Append metrics for snapshot; invalid snapshots are only counted. */
    void record_snapshot(const topo::TopologySnapshot& snapshot, std::optional<double> churn);

    void record_counts(double t, const epi::HealthCounts& counts);

    const std::vector<SnapshotMetrics>& snapshot_series() const { return snapshots_; }
    const std::vector<CurvePoint>& infection_curve() const { return curve_; }
    int invalid_snapshots() const { return invalid_snapshots_; }

    /** Mean churn over snapshots where it is defined, nullopt if none. */
    std::optional<double> mean_churn() const;

    /** Largest infected count on the curve. */
    int peak_infected() const;

private:
    std::vector<SnapshotMetrics> snapshots_;
    std::vector<CurvePoint> curve_;
    int invalid_snapshots_ = 0;
};

} // namespace wormsim::metrics

#endif // WORMSIM_METRICS_COLLECTOR_HPP
