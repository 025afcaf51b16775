#ifndef WORMSIM_ORBITAL_ELEMENTS_HPP
#define WORMSIM_ORBITAL_ELEMENTS_HPP

#include "core/state_vector.hpp"

namespace wormsim {

/**
 * @brief Classical (Keplerian) orbital elements
 */
struct OrbitalElements {
    double semi_major_axis;    // a [m]
    double eccentricity;       // e [dimensionless]
    double inclination;        // i [rad]
    double raan;               // Right Ascension of Ascending Node [rad]
    double arg_periapsis;      // Argument of periapsis [rad]
    double true_anomaly;       // True anomaly [rad]
    double mean_anomaly;       // M [rad]

    double mean_motion() const; // Mean motion [rad/s]

    /// Argument of latitude u = omega + nu, range [0, 2*pi)
    double argument_of_latitude() const;

    OrbitalElements()
        : semi_major_axis(0), eccentricity(0), inclination(0),
          raan(0), arg_periapsis(0), true_anomaly(0), mean_anomaly(0) {}
};

/**
 * @brief Conversions between orbital elements and Cartesian state
 */
class OrbitalMechanics {
public:
    static constexpr double MU_EARTH = 3.986004418e14;  // m^3/s^2

    /**
     * @brief Convert orbital elements to ECI state vector
     * @param elements Classical orbital elements (true anomaly is used)
     * @param mu Gravitational parameter (default: Earth)
     */
    static StateVector elements_to_state(const OrbitalElements& elements,
                                         double mu = MU_EARTH);

    /**
     * @brief Convert ECI state vector to orbital elements
     *
     * Circular orbits report arg_periapsis = 0 and the argument of
     * latitude in true_anomaly, so argument_of_latitude() stays valid.
     */
    static OrbitalElements state_to_elements(const StateVector& state,
                                             double mu = MU_EARTH);

    static double true_to_mean_anomaly(double true_anomaly, double eccentricity);

    /**
     * @brief Propagate mean anomaly forward in time, wrapped to [0, 2*pi)
     */
    static double propagate_mean_anomaly(double M0, double n, double dt);
};

} // namespace wormsim

#endif // WORMSIM_ORBITAL_ELEMENTS_HPP
