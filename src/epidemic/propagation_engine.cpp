#include "epidemic/propagation_engine.hpp"
#include "defense/defense_layer.hpp"
#include "routing/routing_engine.hpp"
#include "core/errors.hpp"
#include <stdexcept>
#include <string>

namespace wormsim::epi {

PropagationEngine::PropagationEngine(const orbit::PositionSet& positions,
                                     const EpidemicParams& params)
    : params_(params) {
    if (params_.beta_normal < 0.0 || params_.beta_normal > 1.0) {
        throw ConfigurationError("epidemic.beta_normal", "must be in [0, 1]");
    }
    if (params_.beta_eclipse < 0.0 || params_.beta_eclipse > 1.0) {
        throw ConfigurationError("epidemic.beta_eclipse", "must be in [0, 1]");
    }
    if (params_.eclipse_half_width_s < 0.0) {
        throw ConfigurationError("epidemic.eclipse_half_width_s", "must be non-negative");
    }
    if (params_.exploit_hops < 1) {
        throw ConfigurationError("epidemic.exploit_hops", "must be at least 1");
    }

    nodes_.reserve(positions.size());
    for (const auto& sp : positions) {
        SatelliteNode node;
        node.id = sp.id;
        node.plane_id = sp.plane_id;
        node.position = sp.position;
        nodes_.push_back(node);
    }
}

void PropagationEngine::record(const EpidemicEvent& event, std::vector<EpidemicEvent>& out) {
    out.push_back(event);
    events_.push_back(event);
}

void PropagationEngine::seed_infections(const std::vector<int>& ids, double t) {
    std::vector<EpidemicEvent> ignored;
    for (int id : ids) {
        if (id < 0 || id >= static_cast<int>(nodes_.size())) {
            throw std::out_of_range("seed id " + std::to_string(id) + " is not a satellite");
        }
        SatelliteNode& n = nodes_[id];
        if (n.state != HealthState::SUSCEPTIBLE) continue;

        n.state = HealthState::INFECTED;
        n.active = true;
        n.infected_at = t;
        n.last_c2_contact = t;
        record({id, HealthState::SUSCEPTIBLE, HealthState::INFECTED,
                EventCause::SEED, -1, t}, ignored);
    }
}

bool PropagationEngine::recover(int id, double t) {
    SatelliteNode& n = nodes_.at(id);
    if (n.state == HealthState::RECOVERED) return false;

    std::vector<EpidemicEvent> ignored;
    HealthState from = n.state;
    n.state = HealthState::RECOVERED;
    n.active = false;
    n.recovered_at = t;
    record({id, from, HealthState::RECOVERED, EventCause::PATCH, -1, t}, ignored);
    return true;
}

void PropagationEngine::refresh_positions(const topo::TopologySnapshot& snapshot) {
    const auto& positions = snapshot.positions();
    if (positions.size() != nodes_.size()) return;
    for (size_t i = 0; i < positions.size(); i++) {
        nodes_[i].position = positions[i].position;
    }
}

void PropagationEngine::update_c2(const NodeEnvironment& environment, double t,
                                  std::vector<EpidemicEvent>& out) {
    for (auto& n : nodes_) {
        bool contact = n.id < static_cast<int>(environment.in_contact.size())
                       && environment.in_contact[n.id];
        if (contact) {
            n.last_c2_contact = t;
        }
        if (n.state != HealthState::INFECTED) continue;

        if (!n.active && contact) {
            n.active = true;
            record({n.id, HealthState::INFECTED, HealthState::INFECTED,
                    EventCause::REACTIVATED, -1, t}, out);
        } else if (n.active && params_.c2_timeout_s > 0.0
                   && t - n.last_c2_contact > params_.c2_timeout_s) {
            n.active = false;
            record({n.id, HealthState::INFECTED, HealthState::INFECTED,
                    EventCause::DORMANT, -1, t}, out);
        }
    }
}

std::vector<PropagationEngine::Attempt>
PropagationEngine::attempts_from(const topo::TopologySnapshot& snapshot, int attacker) const {
    std::vector<Attempt> attempts;

    if (params_.exploit_hops == 1) {
        for (const auto& nb : snapshot.neighbors(attacker)) {
            attempts.push_back({attacker, nb.id, {attacker, nb.id}});
        }
        return attempts;
    }

    // Multi-hop delivery along latency-shortest routes, limited to h hops
    auto tree = routing::RoutingEngine::shortest_paths_from(snapshot, attacker);
    for (int v = 0; v < static_cast<int>(snapshot.node_count()); v++) {
        if (v == attacker || !tree.reachable(v)) continue;
        if (tree.hops[v] > params_.exploit_hops) continue;
        attempts.push_back({attacker, v, tree.path_to(v)});
    }
    return attempts;
}

std::vector<EpidemicEvent> PropagationEngine::step(const topo::TopologySnapshot& snapshot,
                                                   const NodeEnvironment& environment,
                                                   double t, double dt,
                                                   defense::DefenseLayer* defense,
                                                   mc::SimRNG& rng) {
    std::vector<EpidemicEvent> out;
    const double t_next = t + dt;

    refresh_positions(snapshot);
    update_c2(environment, t, out);

    // ── Infection attempts against the frozen state ──
    std::vector<HealthState> frozen(nodes_.size());
    std::vector<bool> attacking(nodes_.size(), false);
    for (size_t i = 0; i < nodes_.size(); i++) {
        frozen[i] = nodes_[i].state;
        attacking[i] = nodes_[i].state == HealthState::INFECTED && nodes_[i].active;
    }

    std::vector<int> infected_by(nodes_.size(), -1);
    std::vector<int> newly_infected;

    if (snapshot.valid() && snapshot.node_count() == nodes_.size()) {
        for (int u = 0; u < static_cast<int>(nodes_.size()); u++) {
            if (!attacking[u]) continue;

            for (const auto& attempt : attempts_from(snapshot, u)) {
                int v = attempt.target;
                if (frozen[v] != HealthState::SUSCEPTIBLE) continue;
                if (infected_by[v] >= 0) continue;

                double factor = 1.0;
                if (defense) {
                    if (defense->firewall_blocks(attempt.path, u, v, t, rng)) continue;
                    factor = defense->detection_factor(attempt.path, u, v, t, rng);
                }

                bool eclipse = v < static_cast<int>(environment.eclipse_transition.size())
                               && environment.eclipse_transition[v];
                double beta = eclipse ? params_.beta_eclipse : params_.beta_normal;

                if (rng.bernoulli(beta * factor)) {
                    infected_by[v] = u;
                    newly_infected.push_back(v);
                }
            }
        }
    }

    // ── Patching, also against the frozen state ──
    std::vector<int> patches;
    if (defense) {
        patches = defense->select_patches(*this, environment, dt);
    }

    // ── Apply: infections, then recoveries ──
    for (int v : newly_infected) {
        SatelliteNode& n = nodes_[v];
        n.state = HealthState::INFECTED;
        n.active = true;
        n.infected_at = t_next;
        n.last_c2_contact = t_next;
        n.infected_by = infected_by[v];
        record({v, HealthState::SUSCEPTIBLE, HealthState::INFECTED,
                EventCause::EXPLOIT, infected_by[v], t_next}, out);
    }

    for (int id : patches) {
        if (recover(id, t_next)) {
            out.push_back(events_.back());
        }
    }

    return out;
}

HealthCounts PropagationEngine::counts() const {
    HealthCounts c;
    for (const auto& n : nodes_) {
        switch (n.state) {
            case HealthState::SUSCEPTIBLE: c.susceptible++; break;
            case HealthState::INFECTED:
                c.infected++;
                if (!n.active) c.dormant++;
                break;
            case HealthState::RECOVERED: c.recovered++; break;
        }
    }
    return c;
}

} // namespace wormsim::epi
