#include "ground/ground_visibility.hpp"
#include "ground/geo_utils.hpp"
#include "coordinate/time_utils.hpp"
#include "physics/constants.hpp"
#include <algorithm>
#include <cmath>

namespace wormsim::ground {

GroundVisibility::GroundVisibility(const orbit::PositionProvider& provider,
                                   double epoch_jd,
                                   const VisibilityParams& params)
    : provider_(provider), epoch_jd_(epoch_jd), params_(params) {}

double GroundVisibility::elevation_deg(const GroundStation& station,
                                       const Vec3& eci, double t) const {
    const double lat = station.lat_deg * DEG_TO_RAD;
    const double lon = station.lon_deg * DEG_TO_RAD;
    const double gmst = TimeUtils::compute_gmst(TimeUtils::add_seconds_to_jd(epoch_jd_, t));

    return elevation_angle(geodetic_to_ecef(lat, lon, station.alt_m), lat, lon,
                           eci_to_ecef(eci, gmst));
}

double GroundVisibility::refine_edge(const GroundStation& station, int satellite_id,
                                     double lo, double hi, bool visible_lo) const {
    while (hi - lo > params_.tolerance_s) {
        double mid = 0.5 * (lo + hi);
        orbit::PositionSet positions = provider_.positions_at(mid);
        bool visible = elevation_deg(station, positions[satellite_id].position, mid)
                       >= params_.min_elevation_deg;
        if (visible == visible_lo) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return 0.5 * (lo + hi);
}

// ── Sweep state for one (station, satellite) pair ──

namespace {

struct PassTracker {
    bool visible = false;
    ContactWindow current;
};

}  // namespace

std::vector<ContactWindow> GroundVisibility::all_contact_windows(
    const std::vector<GroundStation>& stations, double t0, double t1) const {

    std::vector<ContactWindow> out;
    const size_t n_sat = provider_.satellite_count();
    if (stations.empty() || n_sat == 0 || t1 < t0) return out;

    std::vector<PassTracker> trackers(stations.size() * n_sat);
    const double step = params_.sample_step_s > 0.0 ? params_.sample_step_s : (t1 - t0);

    double t_prev = t0;
    double t = t0;
    bool first = true;

    while (true) {
        orbit::PositionSet positions = provider_.positions_at(t);

        for (size_t s = 0; s < stations.size(); s++) {
            for (const auto& sp : positions) {
                PassTracker& tr = trackers[s * n_sat + sp.id];
                double el = elevation_deg(stations[s], sp.position, t);
                bool visible = el >= params_.min_elevation_deg;

                if (visible && !tr.visible) {
                    tr.current = ContactWindow{};
                    tr.current.station_index = static_cast<int>(s);
                    tr.current.station_id = stations[s].id;
                    tr.current.satellite_id = sp.id;
                    tr.current.start = first ? t
                        : refine_edge(stations[s], sp.id, t_prev, t, false);
                    tr.current.max_elevation_deg = el;
                } else if (visible) {
                    tr.current.max_elevation_deg = std::max(tr.current.max_elevation_deg, el);
                } else if (tr.visible) {
                    tr.current.end = refine_edge(stations[s], sp.id, t_prev, t, true);
                    out.push_back(tr.current);
                }
                tr.visible = visible;
            }
        }

        if (t >= t1) break;
        first = false;
        t_prev = t;
        t = std::min(t + step, t1);
    }

    // Close windows still open at the end of the range
    for (auto& tr : trackers) {
        if (tr.visible) {
            tr.current.end = t1;
            out.push_back(tr.current);
        }
    }

    std::sort(out.begin(), out.end(), [](const ContactWindow& a, const ContactWindow& b) {
        if (a.start != b.start) return a.start < b.start;
        if (a.station_index != b.station_index) return a.station_index < b.station_index;
        return a.satellite_id < b.satellite_id;
    });
    return out;
}

std::vector<ContactWindow> GroundVisibility::contact_windows(const GroundStation& station,
                                                             int satellite_id,
                                                             double t0, double t1) const {
    std::vector<ContactWindow> all = all_contact_windows({station}, t0, t1);
    std::vector<ContactWindow> out;
    for (auto& w : all) {
        if (w.satellite_id == satellite_id) out.push_back(std::move(w));
    }
    return out;
}

// ═══════════════════════════════════════════════════════════════
// ContactSchedule
// ═══════════════════════════════════════════════════════════════

ContactSchedule::ContactSchedule(std::vector<ContactWindow> windows,
                                 std::size_t satellite_count, std::size_t station_count)
    : windows_(std::move(windows)),
      by_satellite_(satellite_count),
      station_count_(station_count)
{
    for (const auto& w : windows_) {
        if (w.satellite_id >= 0 && static_cast<size_t>(w.satellite_id) < satellite_count) {
            by_satellite_[w.satellite_id].push_back(w);
        }
    }
    for (auto& list : by_satellite_) {
        std::sort(list.begin(), list.end(), [](const ContactWindow& a, const ContactWindow& b) {
            return a.start < b.start;
        });
    }
}

bool ContactSchedule::in_contact(int satellite_id, double t0, double t1) const {
    if (satellite_id < 0 || static_cast<size_t>(satellite_id) >= by_satellite_.size()) {
        return false;
    }
    for (const auto& w : by_satellite_[satellite_id]) {
        if (w.start >= t1) break;
        if (w.end >= t0) return true;
    }
    return false;
}

std::vector<std::pair<int, int>> ContactSchedule::contacts_in(double t0, double t1) const {
    std::vector<std::pair<int, int>> out;
    for (const auto& w : windows_) {
        if (w.start < t1 && w.end >= t0) {
            out.emplace_back(w.station_index, w.satellite_id);
        }
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

int ContactSchedule::stations_in_view(double t0, double t1) const {
    std::vector<bool> seen(station_count_, false);
    int count = 0;
    for (const auto& w : windows_) {
        if (w.start >= t1 || w.end < t0) continue;
        if (w.station_index < 0 || static_cast<size_t>(w.station_index) >= station_count_) continue;
        if (!seen[w.station_index]) {
            seen[w.station_index] = true;
            count++;
        }
    }
    return count;
}

const std::vector<ContactWindow>& ContactSchedule::windows_for(int satellite_id) const {
    return by_satellite_.at(satellite_id);
}

} // namespace wormsim::ground
