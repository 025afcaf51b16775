#include "orbit/tabulated_positions.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iterator>
#include <set>

namespace wormsim::orbit {

TabulatedPositions::TabulatedPositions(std::vector<PositionSample> samples)
    : samples_(std::move(samples))
{
    if (samples_.empty()) {
        throw ConfigurationError("constellation.tabulated.samples", "no samples");
    }

    count_ = samples_.front().satellites.size();
    if (count_ == 0) {
        throw ConfigurationError("constellation.tabulated.samples", "sample has no satellites");
    }

    std::set<int> planes;
    for (size_t s = 0; s < samples_.size(); s++) {
        auto& sample = samples_[s];
        if (s > 0 && sample.time <= samples_[s - 1].time) {
            throw ConfigurationError("constellation.tabulated.samples",
                                     "sample times must be strictly increasing");
        }
        if (sample.satellites.size() != count_) {
            throw ConfigurationError("constellation.tabulated.samples",
                                     "every sample must list the same satellites");
        }

        std::sort(sample.satellites.begin(), sample.satellites.end(),
                  [](const SatellitePosition& a, const SatellitePosition& b) {
                      return a.id < b.id;
                  });
        for (size_t i = 0; i < sample.satellites.size(); i++) {
            if (sample.satellites[i].id != static_cast<int>(i)) {
                throw ConfigurationError("constellation.tabulated.samples",
                                         "satellite ids must be 0..N-1");
            }
            if (sample.satellites[i].plane_id < 0) {
                throw ConfigurationError("constellation.tabulated.samples",
                                         "plane ids must be non-negative");
            }
            planes.insert(sample.satellites[i].plane_id);
        }
    }
    // Plane ids must be dense so that every plane group has members
    planes_ = *planes.rbegin() + 1;
    if (static_cast<int>(planes.size()) != planes_) {
        throw ConfigurationError("constellation.tabulated.samples",
                                 "plane ids must be 0..P-1 with no empty plane");
    }
}

TabulatedPositions TabulatedPositions::fixed(PositionSet satellites) {
    std::vector<PositionSample> samples(1);
    samples[0].time = 0.0;
    samples[0].satellites = std::move(satellites);
    return TabulatedPositions(std::move(samples));
}

PositionSet TabulatedPositions::positions_at(double t) const {
    // Last sample with time <= t
    auto it = std::upper_bound(samples_.begin(), samples_.end(), t,
                               [](double value, const PositionSample& s) {
                                   return value < s.time;
                               });
    if (it == samples_.begin()) return samples_.front().satellites;
    return std::prev(it)->satellites;
}

} // namespace wormsim::orbit
