/**
 * Solar Ephemeris Implementation
 *
 * Low-precision solar position using Meeus, "Astronomical Algorithms".
 * Computes ecliptic longitude via mean anomaly + equation of center,
 * then rotates to equatorial (ECI) coordinates via obliquity.
 */

#include "physics/solar_ephemeris.hpp"
#include "physics/constants.hpp"
#include "physics/vec3_ops.hpp"
#include <cmath>

namespace wormsim {

double SolarEphemeris::get_earth_mean_anomaly(double jd) {
    double T = (jd - J2000_EPOCH) / 36525.0;

    double M_deg = std::fmod(357.52911 + 35999.05029 * T - 0.0001537 * T * T, 360.0);
    if (M_deg < 0.0) M_deg += 360.0;

    return M_deg * DEG_TO_RAD;
}

Vec3 SolarEphemeris::get_sun_position_eci(double jd) {
    double T = (jd - J2000_EPOCH) / 36525.0;
    double M = get_earth_mean_anomaly(jd);

    // Mean longitude of Sun (degrees)
    double L0_deg = 280.46646 + 36000.76983 * T + 0.0003032 * T * T;

    // Equation of center (degrees)
    double C_deg = (1.914602 - 0.004817 * T - 0.000014 * T * T) * std::sin(M)
                 + (0.019993 - 0.000101 * T) * std::sin(2.0 * M)
                 + 0.000289 * std::sin(3.0 * M);

    double lambda = std::fmod(L0_deg + C_deg, 360.0) * DEG_TO_RAD;

    // Earth-Sun distance from eccentricity and true anomaly
    double e = 0.016708634 - 0.000042037 * T - 0.0000001267 * T * T;
    double v = M + C_deg * DEG_TO_RAD;
    double R = AU * 1.000001018 * (1.0 - e * e) / (1.0 + e * std::cos(v));

    // Ecliptic (latitude = 0) to equatorial via obliquity
    double x_ecl = R * std::cos(lambda);
    double y_ecl = R * std::sin(lambda);
    return Vec3{
        x_ecl,
        y_ecl * std::cos(OBLIQUITY_J2000),
        y_ecl * std::sin(OBLIQUITY_J2000)
    };
}

Vec3 SolarEphemeris::get_sun_direction_eci(double jd) {
    return normalized(get_sun_position_eci(jd));
}

}  // namespace wormsim
