#include "topology/plane_classifier.hpp"
#include "physics/constants.hpp"
#include "physics/orbital_elements.hpp"
#include "physics/vec3_ops.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <utility>

namespace wormsim::topo {

namespace {

struct Member {
    int id;
    double phase;
};

int bucket_of(double angle, double width) {
    return static_cast<int>(std::lround(angle / width));
}

int raan_bucket_of(double raan, double width) {
    int n_buckets = std::max(1, static_cast<int>(std::lround(TWO_PI / width)));
    int b = bucket_of(raan, width) % n_buckets;
    return b < 0 ? b + n_buckets : b;
}

double circular_mean(const std::vector<double>& angles) {
    double s = 0.0, c = 0.0;
    for (double a : angles) {
        s += std::sin(a);
        c += std::cos(a);
    }
    double mean = std::atan2(s, c);
    return mean < 0.0 ? mean + TWO_PI : mean;
}

void order_members(PlaneGroup& group, std::vector<Member>& members) {
    std::sort(members.begin(), members.end(), [](const Member& x, const Member& y) {
        if (x.phase != y.phase) return x.phase < y.phase;
        return x.id < y.id;
    });
    group.satellites.clear();
    for (const auto& m : members) group.satellites.push_back(m.id);
}

void sort_groups(std::vector<PlaneGroup>& groups) {
    std::sort(groups.begin(), groups.end(), [](const PlaneGroup& x, const PlaneGroup& y) {
        if (x.inclination_bucket != y.inclination_bucket) {
            return x.inclination_bucket < y.inclination_bucket;
        }
        if (x.raan_rad != y.raan_rad) return x.raan_rad < y.raan_rad;
        return x.satellites.front() < y.satellites.front();
    });
}

}  // namespace

std::vector<PlaneGroup> PlaneClassifier::classify(const orbit::PositionSet& positions,
                                                  const ClassifierParams& params) {
    if (positions.empty()) return {};

    bool all_have_velocity = std::all_of(positions.begin(), positions.end(),
                                         [](const orbit::SatellitePosition& sp) {
                                             return sp.has_velocity();
                                         });
    if (all_have_velocity) {
        return classify_by_elements(positions, params);
    }
    return classify_by_plane_id(positions, params);
}

std::vector<PlaneGroup> PlaneClassifier::classify_by_elements(const orbit::PositionSet& positions,
                                                              const ClassifierParams& params) {
    struct Accum {
        PlaneGroup group;
        std::vector<Member> members;
        std::vector<double> raans;
        double inc_sum = 0.0;
    };
    std::map<std::pair<int, int>, Accum> buckets;

    for (const auto& sp : positions) {
        StateVector sv;
        sv.position = sp.position;
        sv.velocity = sp.velocity;
        OrbitalElements elem = OrbitalMechanics::state_to_elements(sv);

        int ib = bucket_of(elem.inclination, params.inclination_bucket_rad);
        // RAAN is undefined for equatorial orbits
        int rb = (std::sin(elem.inclination) < 1e-6)
                     ? 0
                     : raan_bucket_of(elem.raan, params.raan_bucket_rad);

        Accum& acc = buckets[{ib, rb}];
        acc.group.inclination_bucket = ib;
        acc.group.raan_bucket = rb;
        acc.members.push_back(Member{sp.id, elem.argument_of_latitude()});
        acc.raans.push_back(elem.raan);
        acc.inc_sum += elem.inclination;
    }

    std::vector<PlaneGroup> groups;
    groups.reserve(buckets.size());
    for (auto& [key, acc] : buckets) {
        acc.group.inclination_rad = acc.inc_sum / acc.members.size();
        acc.group.raan_rad = circular_mean(acc.raans);
        order_members(acc.group, acc.members);
        groups.push_back(std::move(acc.group));
    }
    sort_groups(groups);
    return groups;
}

std::vector<PlaneGroup> PlaneClassifier::classify_by_plane_id(const orbit::PositionSet& positions,
                                                              const ClassifierParams& params) {
    std::map<int, std::vector<const orbit::SatellitePosition*>> by_plane;
    for (const auto& sp : positions) {
        by_plane[sp.plane_id].push_back(&sp);
    }

    std::vector<PlaneGroup> groups;
    groups.reserve(by_plane.size());

    for (const auto& [plane_id, members] : by_plane) {
        PlaneGroup group;

        // Orbit normal from the most orthogonal pair with the first member
        const Vec3& ref = members.front()->position;
        Vec3 normal = Vec3::Zero();
        for (const auto* sp : members) {
            Vec3 c = cross(ref, sp->position);
            if (c.norm() > normal.norm()) normal = c;
        }
        normal = normalized(normal);
        if (normal.z < 0.0 || (normal.z == 0.0 && normal.x < 0.0)) normal = -normal;

        std::vector<Member> ordered;
        if (normal.norm() < 0.5) {
            // Single satellite or collinear members: id order
            for (const auto* sp : members) ordered.push_back(Member{sp->id, 0.0});
        } else {
            group.inclination_rad = std::acos(std::clamp(normal.z, -1.0, 1.0));
            Vec3 node{-normal.y, normal.x, 0.0};
            if (node.norm() > 1e-9) {
                group.raan_rad = std::atan2(normal.x, -normal.y);
                if (group.raan_rad < 0.0) group.raan_rad += TWO_PI;
            } else {
                node = ref;
            }
            for (const auto* sp : members) {
                ordered.push_back(Member{sp->id, angle_about_axis(node, sp->position, normal)});
            }
        }

        group.inclination_bucket = bucket_of(group.inclination_rad, params.inclination_bucket_rad);
        group.raan_bucket = plane_id;
        order_members(group, ordered);
        groups.push_back(std::move(group));
    }
    sort_groups(groups);
    return groups;
}

} // namespace wormsim::topo
