/**
 * MCResults — per-trial results, sweep aggregate, JSON and CSV output.
 *
 * JSON: { "config": {...}, "aggregate": {...}, "trials": [...] }
 * CSV:  one infection-curve row per (seed, t).
 */

#ifndef WORMSIM_MC_MC_RESULTS_HPP
#define WORMSIM_MC_MC_RESULTS_HPP

#include "montecarlo/simulation_config.hpp"
#include "metrics/metrics_collector.hpp"
#include "epidemic/epidemic_state.hpp"
#include "defense/defense_layer.hpp"
#include "routing/routing_engine.hpp"
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace wormsim::mc {

struct TrialResult {
    int trial_index = 0;
    uint32_t seed = 0;
    bool cancelled = false;
    std::string error;                 // empty = success
    double sim_time_final = 0.0;

    std::vector<int> initial_infected;
    std::vector<metrics::CurvePoint> curve;
    std::vector<metrics::SnapshotMetrics> snapshots;
    int invalid_snapshots = 0;

    std::vector<epi::EpidemicEvent> events;
    std::vector<defense::DetectionEvent> detections;
    std::vector<defense::FirewallEvent> firewall_blocks;
    routing::RoutingCounters routing;

    bool completed() const { return !cancelled && error.empty(); }
};

struct AggregateResult {
    int trials_completed = 0;
    int trials_cancelled = 0;
    int trials_failed = 0;

    double mean_final_susceptible = 0.0;
    double mean_final_infected = 0.0;
    double mean_final_recovered = 0.0;
    double mean_peak_infected = 0.0;
    std::optional<double> mean_churn;

    // Mean infected count per curve index over completed trials
    std::vector<double> curve_t;
    std::vector<double> mean_infected;
};

/** Aggregate over completed trials only; cancelled and failed trials are counted, not averaged. */
AggregateResult aggregate(const std::vector<TrialResult>& results);

void write_results_json(const std::vector<TrialResult>& results,
                        const SimulationConfig& config,
                        std::ostream& out);

/** Header: seed,t,S,I,R,dormant */
void write_curve_csv(const std::vector<TrialResult>& results, std::ostream& out);

} // namespace wormsim::mc

#endif // WORMSIM_MC_MC_RESULTS_HPP
