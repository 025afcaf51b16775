/**
 * Physical Constants
 *
 * Earth and propagation constants shared by the geometry, visibility and
 * eclipse models.
 */

#ifndef WORMSIM_CONSTANTS_HPP
#define WORMSIM_CONSTANTS_HPP

namespace wormsim {

// Earth - WGS84 parameters
constexpr double EARTH_RADIUS = 6378137.0;        // m (equatorial)

// Sun
constexpr double AU = 1.495978707e11;             // Astronomical unit (m)
constexpr double OBLIQUITY_J2000 = 0.4090928;     // rad (23.4393° obliquity of ecliptic)

// Signal propagation
constexpr double SPEED_OF_LIGHT = 299792458.0;    // m/s

// Default ISL geometry (spherical Earth + 100 km atmosphere margin)
constexpr double DEFAULT_LOS_MIN_RADIUS = 6471000.0;  // m

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

}  // namespace wormsim

#endif  // WORMSIM_CONSTANTS_HPP
