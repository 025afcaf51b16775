#include "montecarlo/trial_state.hpp"
#include <algorithm>

namespace wormsim::mc {

TrialState::TrialState(const SimulationConfig& config,
                       const orbit::PositionSet& epoch_positions,
                       int plane_count,
                       uint32_t seed)
    : rng(seed),
      epidemic(epoch_positions, config.epidemic),
      defense(config.defense, epoch_positions, plane_count, config.epoch_jd, rng),
      routing(epoch_positions.size(), config.routing) {
    initial_infected = choose_initial(config.initial_infected, epoch_positions.size(), rng);
    epidemic.seed_infections(initial_infected, 0.0);
}

std::vector<int> TrialState::choose_initial(const InitialInfection& policy,
                                            std::size_t node_count, SimRNG& rng) {
    if (policy.policy == SeedPolicy::IDS) {
        return policy.ids;
    }

    std::vector<int> order(node_count);
    for (std::size_t i = 0; i < node_count; i++) order[i] = static_cast<int>(i);
    rng.shuffle(order);

    std::size_t k = std::min(node_count, static_cast<std::size_t>(std::max(policy.count, 0)));
    std::vector<int> chosen(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(k));
    std::sort(chosen.begin(), chosen.end());
    return chosen;
}

} // namespace wormsim::mc
