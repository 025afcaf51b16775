/**
 * GroundVisibility — ground-station contact windows.
 *
 * A satellite is in contact with a station while its elevation above the
 * station's local horizon is at least min_elevation_deg. Windows are found
 * by sampling the provider at sample_step_s and bisecting each rise/set
 * edge to tolerance_s. ContactSchedule indexes the windows for the
 * per-step queries made by the epidemic and defense layers.
 */

#ifndef WORMSIM_GROUND_VISIBILITY_HPP
#define WORMSIM_GROUND_VISIBILITY_HPP

#include "orbit/position_provider.hpp"
#include <string>
#include <utility>
#include <vector>

namespace wormsim::ground {

struct GroundStation {
    std::string id;
    double lat_deg = 0.0;
    double lon_deg = 0.0;
    double alt_m = 0.0;
};

struct ContactWindow {
    int station_index = -1;
    std::string station_id;
    int satellite_id = -1;
    double start = 0.0;
    double end = 0.0;
    double max_elevation_deg = 0.0;
};

struct VisibilityParams {
    double min_elevation_deg = 25.0;
    double sample_step_s = 30.0;
    double tolerance_s = 1.0;
};

class GroundVisibility {
public:
    GroundVisibility(const orbit::PositionProvider& provider, double epoch_jd,
                     const VisibilityParams& params = VisibilityParams());

    /** Elevation (deg) of an ECI position seen from the station at time t. */
    double elevation_deg(const GroundStation& station, const Vec3& eci, double t) const;

    /** Contact windows of one satellite over one station in [t0, t1]. */
    std::vector<ContactWindow> contact_windows(const GroundStation& station,
                                               int satellite_id,
                                               double t0, double t1) const;

    /**
     * Contact windows of every satellite over every station in [t0, t1].
     * Samples the provider once per step for the whole constellation.
     */
    std::vector<ContactWindow> all_contact_windows(const std::vector<GroundStation>& stations,
                                                   double t0, double t1) const;

    const VisibilityParams& params() const { return params_; }

private:
    const orbit::PositionProvider& provider_;
    double epoch_jd_;
    VisibilityParams params_;

    double refine_edge(const GroundStation& station, int satellite_id,
                       double lo, double hi, bool visible_lo) const;
};

/**
 * Index of contact windows per satellite.
 */
class ContactSchedule {
public:
    ContactSchedule() = default;
    ContactSchedule(std::vector<ContactWindow> windows,
                    std::size_t satellite_count, std::size_t station_count);

    /** True if any window of the satellite overlaps [t0, t1). */
    bool in_contact(int satellite_id, double t0, double t1) const;

    /** (station_index, satellite_id) pairs with a window overlapping [t0, t1). */
    std::vector<std::pair<int, int>> contacts_in(double t0, double t1) const;

    /** Number of distinct stations with any window overlapping [t0, t1). */
    int stations_in_view(double t0, double t1) const;

    const std::vector<ContactWindow>& windows_for(int satellite_id) const;
    const std::vector<ContactWindow>& windows() const { return windows_; }

    std::size_t station_count() const { return station_count_; }

private:
    std::vector<ContactWindow> windows_;
    std::vector<std::vector<ContactWindow>> by_satellite_;
    std::size_t station_count_ = 0;
};

} // namespace wormsim::ground

#endif // WORMSIM_GROUND_VISIBILITY_HPP
