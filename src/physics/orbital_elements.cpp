#include "physics/orbital_elements.hpp"
#include "physics/constants.hpp"
#include "physics/vec3_ops.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace wormsim {

static double wrap_two_pi(double angle) {
    angle = std::fmod(angle, TWO_PI);
    if (angle < 0.0) angle += TWO_PI;
    return angle;
}

double OrbitalElements::mean_motion() const {
    return std::sqrt(OrbitalMechanics::MU_EARTH / std::pow(semi_major_axis, 3));
}

double OrbitalElements::argument_of_latitude() const {
    return wrap_two_pi(arg_periapsis + true_anomaly);
}

StateVector OrbitalMechanics::elements_to_state(const OrbitalElements& elem, double mu) {
    StateVector state;

    double a = elem.semi_major_axis;
    double e = elem.eccentricity;
    double nu = elem.true_anomaly;

    // Semi-latus rectum and radius
    double p = a * (1.0 - e * e);
    double r = p / (1.0 + e * std::cos(nu));

    // Perifocal position and velocity
    double x_pf = r * std::cos(nu);
    double y_pf = r * std::sin(nu);
    double h = std::sqrt(mu * p);
    double vx_pf = -mu / h * std::sin(nu);
    double vy_pf = mu / h * (e + std::cos(nu));

    // R = R3(-raan) * R1(-i) * R3(-w)
    double cos_raan = std::cos(elem.raan);
    double sin_raan = std::sin(elem.raan);
    double cos_i = std::cos(elem.inclination);
    double sin_i = std::sin(elem.inclination);
    double cos_w = std::cos(elem.arg_periapsis);
    double sin_w = std::sin(elem.arg_periapsis);

    double r11 = cos_raan * cos_w - sin_raan * sin_w * cos_i;
    double r12 = -cos_raan * sin_w - sin_raan * cos_w * cos_i;
    double r21 = sin_raan * cos_w + cos_raan * sin_w * cos_i;
    double r22 = -sin_raan * sin_w + cos_raan * cos_w * cos_i;
    double r31 = sin_w * sin_i;
    double r32 = cos_w * sin_i;

    state.position = Vec3{r11 * x_pf + r12 * y_pf,
                          r21 * x_pf + r22 * y_pf,
                          r31 * x_pf + r32 * y_pf};
    state.velocity = Vec3{r11 * vx_pf + r12 * vy_pf,
                          r21 * vx_pf + r22 * vy_pf,
                          r31 * vx_pf + r32 * vy_pf};
    return state;
}

OrbitalElements OrbitalMechanics::state_to_elements(const StateVector& state, double mu) {
    OrbitalElements elem;

    const Vec3& r = state.position;
    const Vec3& v = state.velocity;
    double r_mag = r.norm();
    double v_mag = v.norm();

    Vec3 h = cross(r, v);
    double h_mag = h.norm();

    // Node vector n = k x h
    Vec3 n{-h.y, h.x, 0.0};
    double n_mag = n.norm();

    double rv_dot = dot(r, v);
    Vec3 e_vec = ((v_mag * v_mag - mu / r_mag) * r - rv_dot * v) / mu;
    double e = e_vec.norm();

    double energy = v_mag * v_mag / 2.0 - mu / r_mag;
    double a = (std::abs(e - 1.0) > 1e-10)
                   ? -mu / (2.0 * energy)
                   : std::numeric_limits<double>::infinity();

    double inc = std::acos(std::clamp(h.z / h_mag, -1.0, 1.0));

    double raan = 0.0;
    if (n_mag > 1e-10) {
        raan = std::acos(std::clamp(n.x / n_mag, -1.0, 1.0));
        if (n.y < 0) raan = TWO_PI - raan;
    }

    double arg_pe = 0.0;
    if (n_mag > 1e-10 && e > 1e-10) {
        arg_pe = std::acos(std::clamp(dot(n, e_vec) / (n_mag * e), -1.0, 1.0));
        if (e_vec.z < 0) arg_pe = TWO_PI - arg_pe;
    } else if (e > 1e-10) {
        arg_pe = wrap_two_pi(std::atan2(e_vec.y, e_vec.x));
    }

    double nu;
    if (e > 1e-10) {
        nu = std::acos(std::clamp(dot(e_vec, r) / (e * r_mag), -1.0, 1.0));
        if (rv_dot < 0) nu = TWO_PI - nu;
    } else if (n_mag > 1e-10) {
        // Circular inclined: argument of latitude from the node line
        nu = std::acos(std::clamp(dot(n, r) / (n_mag * r_mag), -1.0, 1.0));
        if (r.z < 0) nu = TWO_PI - nu;
    } else {
        // Circular equatorial: true longitude
        nu = wrap_two_pi(std::atan2(r.y, r.x));
    }

    elem.semi_major_axis = a;
    elem.eccentricity = e;
    elem.inclination = inc;
    elem.raan = raan;
    elem.arg_periapsis = arg_pe;
    elem.true_anomaly = nu;
    elem.mean_anomaly = true_to_mean_anomaly(nu, e);
    return elem;
}

double OrbitalMechanics::true_to_mean_anomaly(double nu, double e) {
    double E = 2.0 * std::atan2(std::sqrt(1.0 - e) * std::sin(nu / 2.0),
                                std::sqrt(1.0 + e) * std::cos(nu / 2.0));
    return wrap_two_pi(E - e * std::sin(E));
}

double OrbitalMechanics::propagate_mean_anomaly(double M0, double n, double dt) {
    return wrap_two_pi(M0 + n * dt);
}

} // namespace wormsim
