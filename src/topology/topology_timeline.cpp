#include "topology/topology_timeline.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <stdexcept>

namespace wormsim::topo {

TopologyTimeline::TopologyTimeline(const orbit::PositionProvider& provider,
                                   const TopologyBuilder& builder,
                                   const ClassifierParams& classifier,
                                   double step_s,
                                   mc::SimRNG* rng,
                                   bool verbose)
    : provider_(provider), builder_(builder), classifier_(classifier),
      step_s_(step_s), rng_(rng), verbose_(verbose) {
    if (!(step_s_ > 0.0)) {
        throw ConfigurationError("step_s", "topology step must be positive");
    }
}

SnapshotPtr TopologyTimeline::advance(double t) {
    if (!snapshots_.empty() && t < snapshots_.back()->timestamp()) {
        throw std::invalid_argument("timeline timestamps must be non-decreasing");
    }
    int sequence = static_cast<int>(snapshots_.size());

    orbit::PositionSet positions = provider_.positions_at(t);

    SnapshotPtr snap;
    try {
        TopologyBuilder::validate_positions(positions);
        auto groups = PlaneClassifier::classify(positions, classifier_);
        snap = std::make_shared<const TopologySnapshot>(
            builder_.build(sequence, t, positions, groups, rng_));
    } catch (const GeometryError& e) {
        invalid_count_++;
        if (verbose_) {
            std::cerr << "  Snapshot " << sequence << " (t=" << t
                      << "s) invalid: " << e.what() << "\n";
        }
        snap = std::make_shared<const TopologySnapshot>(
            TopologySnapshot::make_invalid(sequence, t, std::move(positions), e.what()));
    }

    snapshots_.push_back(snap);
    return snap;
}

SnapshotPtr TopologyTimeline::advance() {
    double t = snapshots_.empty() ? 0.0 : snapshots_.back()->timestamp() + step_s_;
    return advance(t);
}

void TopologyTimeline::build_all(double horizon) {
    // Integer step count avoids drift from repeated addition
    double t0 = snapshots_.empty() ? 0.0 : snapshots_.back()->timestamp() + step_s_;
    for (int k = 0; ; k++) {
        double t = t0 + k * step_s_;
        if (t > horizon + 1e-9) break;
        advance(t);
    }
}

std::optional<double> TopologyTimeline::churn(const TopologySnapshot& prev,
                                              const TopologySnapshot& curr) {
    if (!prev.valid() || !curr.valid()) return std::nullopt;
    if (prev.edge_count() == 0) return std::nullopt;

    const auto& a = prev.link_keys();
    const auto& b = curr.link_keys();

    std::vector<uint64_t> diff;
    std::set_symmetric_difference(a.begin(), a.end(), b.begin(), b.end(),
                                  std::back_inserter(diff));
    double rate = static_cast<double>(diff.size()) / static_cast<double>(prev.edge_count());
    return std::min(rate, 1.0);
}

std::optional<double> TopologyTimeline::churn_at(std::size_t index) const {
    if (index >= snapshots_.size() || !snapshots_[index]->valid()) return std::nullopt;
    for (std::size_t j = index; j-- > 0; ) {
        if (snapshots_[j]->valid()) {
            return churn(*snapshots_[j], *snapshots_[index]);
        }
    }
    return std::nullopt;
}

std::vector<ChurnSample> TopologyTimeline::churn_series() const {
    std::vector<ChurnSample> series;
    const TopologySnapshot* prev = nullptr;
    for (const auto& snap : snapshots_) {
        if (!snap->valid()) continue;
        if (prev) {
            auto c = churn(*prev, *snap);
            if (c) {
                series.push_back({snap->sequence(), snap->timestamp(), *c});
            }
        }
        prev = snap.get();
    }
    return series;
}

SnapshotPtr TopologyTimeline::at(double t) const {
    auto it = std::upper_bound(snapshots_.begin(), snapshots_.end(), t,
        [](double value, const SnapshotPtr& s) { return value < s->timestamp(); });
    if (it == snapshots_.begin()) return nullptr;
    return *std::prev(it);
}

} // namespace wormsim::topo
