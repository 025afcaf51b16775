/**
 * TopologyTimeline — ordered sequence of ISL snapshots at a fixed step.
 *
 * Each advance asks the PositionProvider for the constellation state,
 * classifies planes and builds the snapshot. A GeometryError marks that
 * one snapshot invalid (no links, error text kept) and the timeline
 * carries on. Snapshots are append-only and shared read-only.
 */

#ifndef WORMSIM_TOPOLOGY_TIMELINE_HPP
#define WORMSIM_TOPOLOGY_TIMELINE_HPP

#include "topology/topology_builder.hpp"
#include "topology/plane_classifier.hpp"
#include "orbit/position_provider.hpp"
#include "montecarlo/sim_rng.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace wormsim::topo {

struct ChurnSample {
    int sequence = 0;          // sequence of the later snapshot
    double timestamp = 0.0;
    double churn = 0.0;
};

class TopologyTimeline {
public:
    /**
     * @param rng      Trial RNG used for stochastic link failure (may be null)
     * @param verbose  Echo invalid snapshots to stderr
     */
    TopologyTimeline(const orbit::PositionProvider& provider,
                     const TopologyBuilder& builder,
                     const ClassifierParams& classifier,
                     double step_s,
                     mc::SimRNG* rng = nullptr,
                     bool verbose = false);

    /**
     * Build the snapshot for timestamp t and append it.
     * @throws std::invalid_argument if t precedes the last snapshot
     */
    SnapshotPtr advance(double t);

    /** Build the snapshot one step after the last (or at t = 0). */
    SnapshotPtr advance();

    /** Pre-build every snapshot with timestamp <= horizon. */
    void build_all(double horizon);

    /**
     * Fraction of links changed between two snapshots:
     * (|added| + |removed|) / |edges(prev)|, capped at 1.
     * nullopt when prev has no edges or either snapshot is invalid.
     */
    static std::optional<double> churn(const TopologySnapshot& prev,
                                       const TopologySnapshot& curr);

    /** Churn of every valid snapshot against the preceding valid one. */
    std::vector<ChurnSample> churn_series() const;

    /** Churn of snapshot index i against the preceding valid snapshot. */
    std::optional<double> churn_at(std::size_t index) const;

    /** Latest snapshot with timestamp <= t, null before the first. */
    SnapshotPtr at(double t) const;

    const std::vector<SnapshotPtr>& snapshots() const { return snapshots_; }
    std::size_t size() const { return snapshots_.size(); }
    bool empty() const { return snapshots_.empty(); }
    SnapshotPtr latest() const { return snapshots_.empty() ? nullptr : snapshots_.back(); }

    double step() const { return step_s_; }
    int invalid_count() const { return invalid_count_; }

private:
    const orbit::PositionProvider& provider_;
    const TopologyBuilder& builder_;
    ClassifierParams classifier_;
    double step_s_;
    mc::SimRNG* rng_;
    bool verbose_;

    std::vector<SnapshotPtr> snapshots_;
    int invalid_count_ = 0;
};

} // namespace wormsim::topo

#endif // WORMSIM_TOPOLOGY_TIMELINE_HPP
