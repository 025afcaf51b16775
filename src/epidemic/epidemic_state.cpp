#include "epidemic/epidemic_state.hpp"

namespace wormsim::epi {

const char* health_state_to_string(HealthState state) {
    switch (state) {
        case HealthState::SUSCEPTIBLE: return "S";
        case HealthState::INFECTED:    return "I";
        case HealthState::RECOVERED:   return "R";
    }
    return "?";
}

const char* event_cause_to_string(EventCause cause) {
    switch (cause) {
        case EventCause::SEED:        return "seed";
        case EventCause::EXPLOIT:     return "exploit";
        case EventCause::PATCH:       return "patch";
        case EventCause::DORMANT:     return "dormant";
        case EventCause::REACTIVATED: return "reactivated";
    }
    return "unknown";
}

} // namespace wormsim::epi
