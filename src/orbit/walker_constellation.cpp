#include "orbit/walker_constellation.hpp"
#include "core/errors.hpp"
#include "physics/constants.hpp"
#include <cmath>

namespace wormsim::orbit {

WalkerConstellation::WalkerConstellation(const WalkerParams& params)
    : params_(params)
{
    if (params_.planes <= 0) {
        throw ConfigurationError("constellation.walker.planes", "must be positive");
    }
    if (params_.total <= 0 || params_.total % params_.planes != 0) {
        throw ConfigurationError("constellation.walker.total",
                                 "must be a positive multiple of planes");
    }
    if (params_.altitude_m <= 0.0) {
        throw ConfigurationError("constellation.walker.altitude_km", "must be positive");
    }

    const int per_plane = params_.total / params_.planes;
    const double sma = EARTH_RADIUS + params_.altitude_m;

    elements_.reserve(params_.total);
    plane_of_.reserve(params_.total);

    for (int p = 0; p < params_.planes; p++) {
        for (int k = 0; k < per_plane; k++) {
            OrbitalElements elem;
            elem.semi_major_axis = sma;
            elem.eccentricity = 0.0;
            elem.inclination = params_.inclination_rad;
            elem.raan = params_.raan_spread_rad * p / params_.planes;
            elem.arg_periapsis = 0.0;
            // Walker phasing: F * 360/T per plane step
            elem.mean_anomaly = std::fmod(
                TWO_PI * k / per_plane + TWO_PI * params_.phasing * p / params_.total,
                TWO_PI);
            elem.true_anomaly = elem.mean_anomaly;
            elements_.push_back(elem);
            plane_of_.push_back(p);
        }
    }
}

PositionSet WalkerConstellation::positions_at(double t) const {
    PositionSet out;
    out.reserve(elements_.size());

    for (size_t i = 0; i < elements_.size(); i++) {
        OrbitalElements elem = elements_[i];
        elem.mean_anomaly = OrbitalMechanics::propagate_mean_anomaly(
            elem.mean_anomaly, elem.mean_motion(), t);
        elem.true_anomaly = elem.mean_anomaly;  // circular

        StateVector sv = OrbitalMechanics::elements_to_state(elem);

        SatellitePosition sp;
        sp.id = static_cast<int>(i);
        sp.plane_id = plane_of_[i];
        sp.position = sv.position;
        sp.velocity = sv.velocity;
        out.push_back(sp);
    }
    return out;
}

} // namespace wormsim::orbit
