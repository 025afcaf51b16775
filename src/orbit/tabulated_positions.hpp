/**
 * TabulatedPositions — externally supplied ephemeris tables.
 *
 * Holds a time-ordered list of constellation samples produced by an
 * external propagator (or hand-placed for tests). positions_at(t) returns
 * the latest sample at or before t; queries before the first sample get
 * the first sample. A single sample describes a static network.
 */

#ifndef WORMSIM_ORBIT_TABULATED_POSITIONS_HPP
#define WORMSIM_ORBIT_TABULATED_POSITIONS_HPP

#include "orbit/position_provider.hpp"
#include <vector>

namespace wormsim::orbit {

struct PositionSample {
    double time = 0.0;
    PositionSet satellites;
};

class TabulatedPositions : public PositionProvider {
public:
    /**
     * @throws ConfigurationError on empty tables, unsorted times, or
     *         samples whose satellite ids are not 0..N-1
     */
    explicit TabulatedPositions(std::vector<PositionSample> samples);

    /** Convenience: a single time-invariant sample. */
    static TabulatedPositions fixed(PositionSet satellites);

    PositionSet positions_at(double t) const override;
    std::size_t satellite_count() const override { return count_; }
    int plane_count() const override { return planes_; }

    const std::vector<PositionSample>& samples() const { return samples_; }

private:
    std::vector<PositionSample> samples_;
    std::size_t count_ = 0;
    int planes_ = 0;
};

} // namespace wormsim::orbit

#endif // WORMSIM_ORBIT_TABULATED_POSITIONS_HPP
