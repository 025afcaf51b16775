/**
 * Vec3 Operations
 *
 * Free-function operator overloads and geometry helpers for Vec3.
 * Header-only; include wherever vector math is needed.
 */

#ifndef WORMSIM_VEC3_OPS_HPP
#define WORMSIM_VEC3_OPS_HPP

#include "core/state_vector.hpp"
#include "physics/constants.hpp"
#include <algorithm>
#include <cmath>

namespace wormsim {

// ═══════════════════════════════════════════════════════════════
// Vec3 operators
// ═══════════════════════════════════════════════════════════════

inline Vec3 operator+(const Vec3& a, const Vec3& b) {
    return Vec3{a.x + b.x, a.y + b.y, a.z + b.z};
}

inline Vec3 operator-(const Vec3& a, const Vec3& b) {
    return Vec3{a.x - b.x, a.y - b.y, a.z - b.z};
}

inline Vec3 operator-(const Vec3& a) {
    return Vec3{-a.x, -a.y, -a.z};
}

inline Vec3 operator*(double s, const Vec3& v) {
    return Vec3{s * v.x, s * v.y, s * v.z};
}

inline Vec3 operator*(const Vec3& v, double s) {
    return Vec3{v.x * s, v.y * s, v.z * s};
}

inline Vec3 operator/(const Vec3& v, double s) {
    double inv = 1.0 / s;
    return Vec3{v.x * inv, v.y * inv, v.z * inv};
}

// ═══════════════════════════════════════════════════════════════
// Vec3 functions
// ═══════════════════════════════════════════════════════════════

inline double dot(const Vec3& a, const Vec3& b) {
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

inline Vec3 cross(const Vec3& a, const Vec3& b) {
    return Vec3{
        a.y * b.z - a.z * b.y,
        a.z * b.x - a.x * b.z,
        a.x * b.y - a.y * b.x
    };
}

inline Vec3 normalized(const Vec3& v) {
    double n = v.norm();
    if (n < 1e-15) return Vec3::Zero();
    double inv = 1.0 / n;
    return Vec3{v.x * inv, v.y * inv, v.z * inv};
}

inline double distance(const Vec3& a, const Vec3& b) {
    return (a - b).norm();
}

// ═══════════════════════════════════════════════════════════════
// Segment geometry
// ═══════════════════════════════════════════════════════════════

/**
 * Closest approach of segment [a, b] to the origin.
 * Parametrises p(t) = a + t (b - a), projects the origin onto the line
 * and clamps t to [0, 1].
 * @return Minimum |p(t)| over the segment (metres)
 */
inline double segment_min_radius(const Vec3& a, const Vec3& b) {
    Vec3 d = b - a;
    double len2 = d.norm_squared();
    if (len2 < 1e-12) return a.norm();

    double t = -dot(a, d) / len2;
    t = std::clamp(t, 0.0, 1.0);
    return (a + t * d).norm();
}

/**
 * Signed angle of v about axis n measured from ref, range [0, 2*pi).
 * ref and v are expected to lie (approximately) in the plane normal to n.
 */
inline double angle_about_axis(const Vec3& ref, const Vec3& v, const Vec3& n) {
    Vec3 un = normalized(n);
    double angle = std::atan2(dot(un, cross(ref, v)), dot(ref, v));
    if (angle < 0.0) angle += TWO_PI;
    return angle;
}

}  // namespace wormsim

#endif  // WORMSIM_VEC3_OPS_HPP
