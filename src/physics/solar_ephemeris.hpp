/**
 * Solar Ephemeris
 *
 * Low-precision analytical Sun position in ECI using the Meeus algorithm.
 * Accuracy ~0.01 degrees, far finer than the Earth-shadow model needs.
 */

#ifndef WORMSIM_SOLAR_EPHEMERIS_HPP
#define WORMSIM_SOLAR_EPHEMERIS_HPP

#include "core/state_vector.hpp"

namespace wormsim {

class SolarEphemeris {
public:
    /**
     * Get Sun position in Earth-Centered Inertial (ECI) frame
     * @param jd Julian Date
     * @return Sun position vector in ECI (meters)
     */
    static Vec3 get_sun_position_eci(double jd);

    /**
     * Unit vector from Earth's centre toward the Sun
     * @param jd Julian Date
     */
    static Vec3 get_sun_direction_eci(double jd);

    /**
     * Earth's mean anomaly in its orbit around the Sun
     * @return Mean anomaly in radians [0, 2pi)
     */
    static double get_earth_mean_anomaly(double jd);

    static constexpr double J2000_EPOCH = 2451545.0;
};

}  // namespace wormsim

#endif  // WORMSIM_SOLAR_EPHEMERIS_HPP
