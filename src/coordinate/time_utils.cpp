#include "coordinate/time_utils.hpp"
#include "physics/constants.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace wormsim {

double TimeUtils::compute_gmst(double jd) {
    double T = (jd - J2000_EPOCH_JD) / 36525.0;

    // GMST = 67310.54841 + (876600h + 8640184.812866)T + 0.093104T^2 - 6.2e-6T^3  [s]
    double gmst_seconds = 67310.54841
                        + (876600.0 * 3600.0 + 8640184.812866) * T
                        + 0.093104 * T * T
                        - 6.2e-6 * T * T * T;

    double gmst_rad = std::fmod(gmst_seconds * TWO_PI / SECONDS_PER_DAY, TWO_PI);
    if (gmst_rad < 0) gmst_rad += TWO_PI;
    return gmst_rad;
}

double TimeUtils::add_seconds_to_jd(double epoch_jd, double seconds) {
    return epoch_jd + seconds / SECONDS_PER_DAY;
}

std::string TimeUtils::jd_to_iso8601(double jd) {
    // Meeus, Astronomical Algorithms, ch. 7
    double jd_plus = jd + 0.5;
    int Z = static_cast<int>(jd_plus);
    double F = jd_plus - Z;

    int A = Z;
    if (Z >= 2299161) {
        int alpha = static_cast<int>((Z - 1867216.25) / 36524.25);
        A = Z + 1 + alpha - alpha / 4;
    }

    int B = A + 1524;
    int C = static_cast<int>((B - 122.1) / 365.25);
    int D = static_cast<int>(365.25 * C);
    int E = static_cast<int>((B - D) / 30.6001);

    double day_frac = B - D - static_cast<int>(30.6001 * E) + F;
    int day = static_cast<int>(day_frac);
    int month = (E < 14) ? E - 1 : E - 13;
    int year = (month > 2) ? C - 4716 : C - 4715;

    int total_seconds = static_cast<int>((day_frac - day) * SECONDS_PER_DAY + 0.5);
    if (total_seconds >= 86400) total_seconds = 86399;

    std::ostringstream oss;
    oss << std::setfill('0')
        << year << "-"
        << std::setw(2) << month << "-"
        << std::setw(2) << day << "T"
        << std::setw(2) << total_seconds / 3600 << ":"
        << std::setw(2) << (total_seconds % 3600) / 60 << ":"
        << std::setw(2) << total_seconds % 60 << "Z";
    return oss.str();
}

} // namespace wormsim
