#include "defense/defense_layer.hpp"
#include "epidemic/propagation_engine.hpp"
#include "ground/geo_utils.hpp"
#include "coordinate/time_utils.hpp"
#include "physics/constants.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace wormsim::defense {

DefenseLayer::DefenseLayer(const DefenseParams& params,
                           const orbit::PositionSet& epoch_positions,
                           int plane_count,
                           double epoch_jd,
                           mc::SimRNG& rng)
    : params_(params) {
    validate(epoch_positions.size());
    select_ids(epoch_positions.size(), rng);
    assign_zones(epoch_positions, plane_count, epoch_jd);
}

void DefenseLayer::validate(std::size_t node_count) const {
    const auto& ids = params_.ids;
    if (ids.p_detect < 0.0 || ids.p_detect > 1.0) {
        throw ConfigurationError("defense.ids.p_detect", "must be in [0, 1]");
    }
    if (ids.coverage < 0.0 || ids.coverage > 1.0) {
        throw ConfigurationError("defense.ids.coverage", "must be in [0, 1]");
    }
    for (int id : ids.nodes) {
        if (id < 0 || static_cast<std::size_t>(id) >= node_count) {
            throw ConfigurationError("defense.ids.nodes",
                                     "unknown satellite id " + std::to_string(id));
        }
    }
    if (params_.patch.rate_per_hour < 0.0) {
        throw ConfigurationError("defense.patch.rate_per_hour", "must be non-negative");
    }
    if (params_.patch.slots_per_station < 0) {
        throw ConfigurationError("defense.patch.slots_per_station", "must be non-negative");
    }
    if (params_.segmentation.zone_count < 1) {
        throw ConfigurationError("defense.segmentation.zone_count", "must be at least 1");
    }
    if (params_.segmentation.firewall_rate < 0.0 || params_.segmentation.firewall_rate > 1.0) {
        throw ConfigurationError("defense.segmentation.firewall_rate", "must be in [0, 1]");
    }
}

void DefenseLayer::select_ids(std::size_t node_count, mc::SimRNG& rng) {
    ids_flag_.assign(node_count, false);

    if (!params_.ids.nodes.empty()) {
        for (int id : params_.ids.nodes) ids_flag_[id] = true;
    } else if (params_.ids.coverage > 0.0) {
        std::vector<int> order(node_count);
        for (std::size_t i = 0; i < node_count; i++) order[i] = static_cast<int>(i);
        rng.shuffle(order);
        auto k = static_cast<std::size_t>(std::llround(params_.ids.coverage * node_count));
        for (std::size_t i = 0; i < k && i < node_count; i++) ids_flag_[order[i]] = true;
    }

    for (std::size_t i = 0; i < node_count; i++) {
        if (ids_flag_[i]) ids_nodes_.push_back(static_cast<int>(i));
    }
}

void DefenseLayer::assign_zones(const orbit::PositionSet& positions, int plane_count,
                                double epoch_jd) {
    const int zones = params_.segmentation.zone_count;
    zones_.assign(positions.size(), 0);
    if (zones == 1) return;

    if (params_.segmentation.by == ZoneScheme::PLANE) {
        // Contiguous blocks of plane ids
        int planes = std::max(plane_count, 1);
        for (const auto& sp : positions) {
            int plane = std::clamp(sp.plane_id, 0, planes - 1);
            zones_[sp.id] = std::min(plane * zones / planes, zones - 1);
        }
        return;
    }

    // Longitude sectors at the epoch
    double gmst = TimeUtils::compute_gmst(epoch_jd);
    for (const auto& sp : positions) {
        Vec3 ecef = ground::eci_to_ecef(sp.position, gmst);
        double lon = ground::ecef_to_lat_lon(ecef).second;           // (-pi, pi]
        double frac = (lon + PI) / TWO_PI;
        int zone = static_cast<int>(std::floor(frac * zones));
        zones_[sp.id] = std::clamp(zone, 0, zones - 1);
    }
}

double DefenseLayer::detection_factor(const std::vector<int>& path, int attacker, int target,
                                      double t, mc::SimRNG& rng) {
    if (path.size() < 2) return 1.0;
    const double p = params_.ids.p_detect;

    bool inspected = false;
    for (int node : path) {
        if (!ids_flag_[node]) continue;
        inspected = true;
        if (rng.bernoulli(p)) {
            detections_.push_back({node, attacker, target, t});
        }
    }
    if (!inspected) return 1.0;

    // Per-hop detection applies to every hop once the path is watched
    int hops = static_cast<int>(path.size()) - 1;
    return std::pow(1.0 - p, hops);
}

bool DefenseLayer::firewall_blocks(const std::vector<int>& path, int attacker, int target,
                                   double t, mc::SimRNG& rng) {
    if (params_.segmentation.zone_count == 1) return false;
    for (std::size_t i = 1; i < path.size(); i++) {
        int a = path[i - 1];
        int b = path[i];
        if (!crosses_zone(a, b)) continue;
        if (rng.bernoulli(params_.segmentation.firewall_rate)) {
            firewall_log_.push_back({std::min(a, b), std::max(a, b), attacker, target, t});
            return true;
        }
    }
    return false;
}

std::vector<int> DefenseLayer::select_patches(const epi::PropagationEngine& engine,
                                              const epi::NodeEnvironment& environment,
                                              double dt) {
    std::vector<int> selected;

    double allowance = params_.patch.rate_per_hour * dt / 3600.0 + patch_carry_;
    double whole = std::floor(allowance + 1e-9);
    patch_carry_ = std::max(0.0, allowance - whole);
    if (whole < 1.0) return selected;

    std::size_t budget = static_cast<std::size_t>(whole);
    if (params_.patch.slots_per_station > 0) {
        std::size_t capacity = static_cast<std::size_t>(params_.patch.slots_per_station)
                             * static_cast<std::size_t>(std::max(environment.stations_in_view, 0));
        budget = std::min(budget, capacity);
    }

    // Priority: 0 = infected active, 1 = infected dormant, 2 = susceptible
    std::vector<std::pair<int, int>> candidates;
    for (const auto& n : engine.nodes()) {
        if (n.state == epi::HealthState::RECOVERED) continue;
        if (n.id >= static_cast<int>(environment.in_contact.size())) continue;
        if (!environment.in_contact[n.id]) continue;

        int rank = 2;
        if (n.state == epi::HealthState::INFECTED) rank = n.active ? 0 : 1;
        candidates.push_back({rank, n.id});
    }
    std::sort(candidates.begin(), candidates.end());

    for (std::size_t i = 0; i < candidates.size() && selected.size() < budget; i++) {
        selected.push_back(candidates[i].second);
    }
    return selected;
}

} // namespace wormsim::defense
