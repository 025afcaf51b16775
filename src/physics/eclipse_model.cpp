#include "physics/eclipse_model.hpp"
#include "physics/solar_ephemeris.hpp"
#include "physics/vec3_ops.hpp"
#include "coordinate/time_utils.hpp"
#include <algorithm>
#include <cmath>

namespace wormsim {

EclipseModel::EclipseModel(SunModel model, double epoch_jd, double shadow_radius_m)
    : model_(model), epoch_jd_(epoch_jd), shadow_radius_(shadow_radius_m) {}

Vec3 EclipseModel::sun_direction(double t) const {
    if (model_ == SunModel::FIXED) {
        return Vec3{1.0, 0.0, 0.0};
    }
    return SolarEphemeris::get_sun_direction_eci(
        TimeUtils::add_seconds_to_jd(epoch_jd_, t));
}

bool EclipseModel::in_shadow(const Vec3& eci_position, double t) const {
    Vec3 sun = sun_direction(t);
    double along = dot(eci_position, sun);
    if (along >= 0.0) return false;

    Vec3 perp = eci_position - along * sun;
    return perp.norm() < shadow_radius_;
}

// ═══════════════════════════════════════════════════════════════
// EclipseSchedule
// ═══════════════════════════════════════════════════════════════

static std::vector<bool> shadow_states(const orbit::PositionProvider& provider,
                                       const EclipseModel& model, double t) {
    orbit::PositionSet positions = provider.positions_at(t);
    std::vector<bool> states(positions.size(), false);
    for (const auto& sp : positions) {
        states[sp.id] = model.in_shadow(sp.position, t);
    }
    return states;
}

static double refine_crossing(const orbit::PositionProvider& provider,
                              const EclipseModel& model, int sat,
                              double lo, double hi, bool state_lo,
                              double tolerance) {
    while (hi - lo > tolerance) {
        double mid = 0.5 * (lo + hi);
        orbit::PositionSet positions = provider.positions_at(mid);
        bool state_mid = model.in_shadow(positions[sat].position, mid);
        if (state_mid == state_lo) {
            lo = mid;
        } else {
            hi = mid;
        }
    }
    return 0.5 * (lo + hi);
}

EclipseSchedule EclipseSchedule::compute(const orbit::PositionProvider& provider,
                                         const EclipseModel& model,
                                         double t_start, double t_end,
                                         double sample_step, double tolerance) {
    EclipseSchedule schedule;
    schedule.transitions_.assign(provider.satellite_count(), {});
    if (sample_step <= 0.0 || t_end <= t_start) return schedule;

    std::vector<bool> prev = shadow_states(provider, model, t_start);
    double t_prev = t_start;

    while (t_prev < t_end) {
        double t = std::min(t_prev + sample_step, t_end);
        std::vector<bool> cur = shadow_states(provider, model, t);

        for (size_t sat = 0; sat < cur.size(); sat++) {
            if (cur[sat] != prev[sat]) {
                schedule.transitions_[sat].push_back(
                    refine_crossing(provider, model, static_cast<int>(sat),
                                    t_prev, t, prev[sat], tolerance));
            }
        }

        prev = std::move(cur);
        t_prev = t;
    }
    return schedule;
}

const std::vector<double>& EclipseSchedule::transitions(int satellite_id) const {
    return transitions_.at(satellite_id);
}

bool EclipseSchedule::in_transition_window(int satellite_id, double t,
                                           double half_width) const {
    if (satellite_id < 0 || static_cast<size_t>(satellite_id) >= transitions_.size()) {
        return false;
    }
    const auto& times = transitions_[satellite_id];
    auto it = std::lower_bound(times.begin(), times.end(), t - half_width);
    return it != times.end() && *it <= t + half_width;
}

}  // namespace wormsim
