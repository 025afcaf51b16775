/**
 * Eclipse Model
 *
 * Cylindrical Earth-shadow test and per-satellite shadow transition
 * schedule. A satellite is eclipsed when it lies on the anti-Sun side of
 * Earth and within one Earth radius of the Earth-Sun axis.
 *
 * The Sun direction is either fixed along +X of the ECI frame or taken
 * from the analytical solar ephemeris at epoch_jd + t.
 */

#ifndef WORMSIM_ECLIPSE_MODEL_HPP
#define WORMSIM_ECLIPSE_MODEL_HPP

#include "core/state_vector.hpp"
#include "orbit/position_provider.hpp"
#include <vector>

namespace wormsim {

enum class SunModel {
    FIXED,        // Sun along +X ECI
    EPHEMERIS     // Meeus solar position
};

class EclipseModel {
public:
    EclipseModel(SunModel model, double epoch_jd,
                 double shadow_radius_m = 6378137.0);

    Vec3 sun_direction(double t) const;

    /** Cylindrical shadow test for an ECI position at time t. */
    bool in_shadow(const Vec3& eci_position, double t) const;

    SunModel model() const { return model_; }

private:
    SunModel model_;
    double epoch_jd_;
    double shadow_radius_;
};

/**
 * Shadow entry/exit times for every satellite over [t_start, t_end].
 *
 * Shadow state is sampled every sample_step seconds and each change is
 * refined by bisection to within tolerance seconds.
 */
class EclipseSchedule {
public:
    EclipseSchedule() = default;

    static EclipseSchedule compute(const orbit::PositionProvider& provider,
                                   const EclipseModel& model,
                                   double t_start, double t_end,
                                   double sample_step = 30.0,
                                   double tolerance = 1.0);

    /** Sorted shadow entry/exit times for one satellite. */
    const std::vector<double>& transitions(int satellite_id) const;

    /** True if a shadow entry or exit lies within [t - half_width, t + half_width]. */
    bool in_transition_window(int satellite_id, double t, double half_width) const;

    std::size_t satellite_count() const { return transitions_.size(); }

private:
    std::vector<std::vector<double>> transitions_;
};

}  // namespace wormsim

#endif  // WORMSIM_ECLIPSE_MODEL_HPP
