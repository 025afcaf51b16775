#ifndef WORMSIM_STATE_VECTOR_HPP
#define WORMSIM_STATE_VECTOR_HPP

#include <cmath>

namespace wormsim {

/**
 * @brief Simple 3D vector (ECI/ECEF positions in metres, velocities in m/s)
 */
struct Vec3 {
    double x, y, z;

    Vec3() : x(0), y(0), z(0) {}
    Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    double norm() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    double norm_squared() const {
        return x*x + y*y + z*z;
    }

    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }

    static Vec3 Zero() { return Vec3(0, 0, 0); }
};

/**
 * @brief Cartesian orbital state
 *
 * Position and velocity in the Earth-centred inertial frame.
 * Timestamp is seconds since the scenario epoch.
 */
struct StateVector {
    // Position [m]
    Vec3 position;

    // Velocity [m/s]
    Vec3 velocity;

    // Timestamp (seconds since epoch)
    double time;

    StateVector()
        : position(Vec3::Zero()),
          velocity(Vec3::Zero()),
          time(0.0) {}
};

} // namespace wormsim

#endif // WORMSIM_STATE_VECTOR_HPP
