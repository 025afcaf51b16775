/**
 * PlaneClassifier — groups satellites into orbital planes.
 *
 * With velocities available every satellite's inclination and RAAN are
 * bucketed (key = (inclination bucket, RAAN bucket)) and members are
 * ordered by argument of latitude. Without velocities the provider's
 * plane ids define membership and the order is the in-plane angle about
 * the group's orbit normal.
 */

#ifndef WORMSIM_PLANE_CLASSIFIER_HPP
#define WORMSIM_PLANE_CLASSIFIER_HPP

#include "topology/topology_snapshot.hpp"
#include "orbit/position_provider.hpp"
#include <vector>

namespace wormsim::topo {

struct ClassifierParams {
    double inclination_bucket_rad = 0.034906585;   // 2 deg
    double raan_bucket_rad = 0.034906585;          // 2 deg
};

class PlaneClassifier {
public:
    /**
     * Classify one constellation state.
     * Groups are returned sorted by (inclination bucket, RAAN, first id).
     */
    static std::vector<PlaneGroup> classify(const orbit::PositionSet& positions,
                                            const ClassifierParams& params);

private:
    static std::vector<PlaneGroup> classify_by_elements(const orbit::PositionSet& positions,
                                                        const ClassifierParams& params);
    static std::vector<PlaneGroup> classify_by_plane_id(const orbit::PositionSet& positions,
                                                        const ClassifierParams& params);
};

} // namespace wormsim::topo

#endif // WORMSIM_PLANE_CLASSIFIER_HPP
