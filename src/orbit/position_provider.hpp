/**
 * PositionProvider — source of satellite positions per timestamp.
 *
 * The simulation never propagates orbits itself; it asks a provider for
 * the constellation state at each topology step. Implementations must be
 * deterministic per timestamp and return satellites sorted by id, with
 * ids dense in [0, satellite_count()).
 */

#ifndef WORMSIM_ORBIT_POSITION_PROVIDER_HPP
#define WORMSIM_ORBIT_POSITION_PROVIDER_HPP

#include "core/state_vector.hpp"
#include <cstddef>
#include <vector>

namespace wormsim::orbit {

struct SatellitePosition {
    int id = 0;
    int plane_id = 0;
    Vec3 position;          // ECI [m]
    Vec3 velocity;          // ECI [m/s], zero when unknown

    bool has_velocity() const { return velocity.norm_squared() > 0.0; }
};

using PositionSet = std::vector<SatellitePosition>;

class PositionProvider {
public:
    virtual ~PositionProvider() = default;

    /** Constellation state at t seconds since the scenario epoch. */
    virtual PositionSet positions_at(double t) const = 0;

    virtual std::size_t satellite_count() const = 0;

    /** Plane ids lie in [0, plane_count()). */
    virtual int plane_count() const = 0;
};

} // namespace wormsim::orbit

#endif // WORMSIM_ORBIT_POSITION_PROVIDER_HPP
