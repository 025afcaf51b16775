/**
 * Epidemic state types — per-satellite health, audit events and the
 * environment flags that modulate transitions each step.
 */

#ifndef WORMSIM_EPIDEMIC_STATE_HPP
#define WORMSIM_EPIDEMIC_STATE_HPP

#include "core/state_vector.hpp"
#include <vector>

namespace wormsim::epi {

enum class HealthState {
    SUSCEPTIBLE,
    INFECTED,
    RECOVERED
};

enum class EventCause {
    SEED,
    EXPLOIT,
    PATCH,
    DORMANT,
    REACTIVATED
};

const char* health_state_to_string(HealthState state);
const char* event_cause_to_string(EventCause cause);

struct SatelliteNode {
    int id = 0;
    int plane_id = 0;
    Vec3 position;

    HealthState state = HealthState::SUSCEPTIBLE;
    bool active = false;               // meaningful while INFECTED
    double last_c2_contact = 0.0;
    double infected_at = -1.0;
    double recovered_at = -1.0;
    int infected_by = -1;

    bool dormant() const { return state == HealthState::INFECTED && !active; }
};

struct EpidemicEvent {
    int node = -1;
    HealthState from = HealthState::SUSCEPTIBLE;
    HealthState to = HealthState::SUSCEPTIBLE;
    EventCause cause = EventCause::SEED;
    int source = -1;                   // attacking node, -1 when none
    double timestamp = 0.0;
};

struct HealthCounts {
    int susceptible = 0;
    int infected = 0;
    int recovered = 0;
    int dormant = 0;                   // subset of infected
};

/**
 * Externally supplied per-node environment for one epidemic step.
 * Vectors are indexed by satellite id.
 */
struct NodeEnvironment {
    std::vector<bool> eclipse_transition;
    std::vector<bool> in_contact;
    int stations_in_view = 0;

    /** No eclipse transitions, no ground contact. */
    static NodeEnvironment quiet(std::size_t node_count) {
        NodeEnvironment env;
        env.eclipse_transition.assign(node_count, false);
        env.in_contact.assign(node_count, false);
        return env;
    }
};

struct EpidemicParams {
    double beta_normal = 0.1;
    double beta_eclipse = 0.2;
    double eclipse_half_width_s = 300.0;
    double c2_timeout_s = 7200.0;      // <= 0 disables dormancy
    int exploit_hops = 1;
};

} // namespace wormsim::epi

#endif // WORMSIM_EPIDEMIC_STATE_HPP
