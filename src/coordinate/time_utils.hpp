#ifndef WORMSIM_TIME_UTILS_HPP
#define WORMSIM_TIME_UTILS_HPP

#include <string>

namespace wormsim {

/**
 * @brief Time conversion utilities
 *
 * Scenario timestamps are seconds since an epoch given as a Julian Date.
 * Provides the Julian Date / GMST conversions needed to place the Sun
 * and rotate satellites into the Earth-fixed frame.
 */
class TimeUtils {
public:
    // J2000 epoch Julian Date (January 1, 2000, 12:00 TT)
    static constexpr double J2000_EPOCH_JD = 2451545.0;

    static constexpr double SECONDS_PER_DAY = 86400.0;

    /**
     * @brief Compute Greenwich Mean Sidereal Time (IAU 1982)
     * @param jd Julian Date
     * @return GMST in radians, range [0, 2*pi)
     */
    static double compute_gmst(double jd);

    /**
     * @brief Julian Date of a scenario timestamp
     * @param epoch_jd Scenario epoch
     * @param seconds Seconds since epoch
     */
    static double add_seconds_to_jd(double epoch_jd, double seconds);

    /**
     * @brief Convert Julian Date to ISO 8601 string ("2024-01-25T12:00:00Z")
     */
    static std::string jd_to_iso8601(double jd);
};

} // namespace wormsim

#endif // WORMSIM_TIME_UTILS_HPP
