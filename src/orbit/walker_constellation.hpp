/**
 * WalkerConstellation — analytic circular-orbit position provider.
 *
 * Walker T/P/F pattern: T satellites in P equally spaced planes with
 * inter-plane phasing F. Each satellite follows an unperturbed circular
 * Kepler orbit, so positions are a closed-form function of time.
 */

#ifndef WORMSIM_ORBIT_WALKER_CONSTELLATION_HPP
#define WORMSIM_ORBIT_WALKER_CONSTELLATION_HPP

#include "orbit/position_provider.hpp"
#include "physics/orbital_elements.hpp"
#include <vector>

namespace wormsim::orbit {

struct WalkerParams {
    int total = 66;
    int planes = 6;
    int phasing = 1;
    double altitude_m = 780000.0;
    double inclination_rad = 1.5137;     // 86.4 deg
    double raan_spread_rad = 3.14159265358979323846;  // pi: star, 2*pi: delta
};

class WalkerConstellation : public PositionProvider {
public:
    /**
     * @throws ConfigurationError if the pattern is not realisable
     *         (planes must divide total, altitude must be positive)
     */
    explicit WalkerConstellation(const WalkerParams& params);

    PositionSet positions_at(double t) const override;
    std::size_t satellite_count() const override { return elements_.size(); }
    int plane_count() const override { return params_.planes; }

    const WalkerParams& params() const { return params_; }

    /** Elements at the epoch, indexed by satellite id. */
    const std::vector<OrbitalElements>& epoch_elements() const { return elements_; }

private:
    WalkerParams params_;
    std::vector<OrbitalElements> elements_;
    std::vector<int> plane_of_;
};

} // namespace wormsim::orbit

#endif // WORMSIM_ORBIT_WALKER_CONSTELLATION_HPP
