#ifndef WORMSIM_GROUND_GEO_UTILS_HPP
#define WORMSIM_GROUND_GEO_UTILS_HPP

#include "core/state_vector.hpp"
#include "physics/constants.hpp"
#include "physics/vec3_ops.hpp"
#include <cmath>
#include <utility>

namespace wormsim {
namespace ground {

// WGS84 ellipsoid constants
inline constexpr double WGS84_A  = 6378137.0;          // semi-major axis (meters)
inline constexpr double WGS84_E2 = 0.00669437999014;   // first eccentricity squared

/**
 * Convert geodetic coordinates to ECEF (Earth-Centered Earth-Fixed).
 * @param lat_rad  Geodetic latitude in radians
 * @param lon_rad  Geodetic longitude in radians
 * @param alt_m    Altitude above ellipsoid in meters
 * @return ECEF position as Vec3 (meters)
 */
inline Vec3 geodetic_to_ecef(double lat_rad, double lon_rad, double alt_m) {
    const double sin_lat = std::sin(lat_rad);
    const double cos_lat = std::cos(lat_rad);
    const double sin_lon = std::sin(lon_rad);
    const double cos_lon = std::cos(lon_rad);

    const double N = WGS84_A / std::sqrt(1.0 - WGS84_E2 * sin_lat * sin_lat);

    return Vec3(
        (N + alt_m) * cos_lat * cos_lon,
        (N + alt_m) * cos_lat * sin_lon,
        (N * (1.0 - WGS84_E2) + alt_m) * sin_lat
    );
}

/**
 * Rotate an ECI position into ECEF about the z axis by GMST.
 */
inline Vec3 eci_to_ecef(const Vec3& eci, double gmst_rad) {
    const double c = std::cos(gmst_rad);
    const double s = std::sin(gmst_rad);
    return Vec3(
         c * eci.x + s * eci.y,
        -s * eci.x + c * eci.y,
         eci.z
    );
}

/**
 * Geocentric (spherical) latitude/longitude of an ECEF position.
 * @return {lat, lon} in radians, lon in (-pi, pi]
 */
inline std::pair<double, double> ecef_to_lat_lon(const Vec3& ecef) {
    const double r = ecef.norm();
    if (r < 1.0) return {0.0, 0.0};
    return {std::asin(ecef.z / r), std::atan2(ecef.y, ecef.x)};
}

/**
 * Elevation of a target above an observer's local horizon.
 * Uses the geodetic "up" direction of the observer.
 * @param observer_ecef  Observer ECEF position (meters)
 * @param lat_rad        Observer geodetic latitude
 * @param lon_rad        Observer geodetic longitude
 * @param target_ecef    Target ECEF position (meters)
 * @return Elevation angle in degrees, range [-90, 90]
 */
inline double elevation_angle(const Vec3& observer_ecef, double lat_rad, double lon_rad,
                              const Vec3& target_ecef) {
    const Vec3 up{std::cos(lat_rad) * std::cos(lon_rad),
                  std::cos(lat_rad) * std::sin(lon_rad),
                  std::sin(lat_rad)};
    const Vec3 rho = target_ecef - observer_ecef;
    const double range = rho.norm();
    if (range < 1.0) return 90.0;

    double s = dot(rho, up) / range;
    if (s > 1.0) s = 1.0;
    if (s < -1.0) s = -1.0;
    return std::asin(s) * RAD_TO_DEG;
}

} // namespace ground
} // namespace wormsim

#endif // WORMSIM_GROUND_GEO_UTILS_HPP
