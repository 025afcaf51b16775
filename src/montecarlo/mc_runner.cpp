#include "montecarlo/mc_runner.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace wormsim::mc {

MCRunner::MCRunner(const SimulationConfig& config)
    : config_(config),
      builder_(config.topology) {
    config_.validate();
    provider_ = config_.make_provider();

    const int trials = config_.monte_carlo.trials;
    cancel_flags_ = std::make_unique<std::atomic<bool>[]>(static_cast<std::size_t>(trials));
    for (int i = 0; i < trials; i++) cancel_flags_[i] = false;

    const double horizon = config_.horizon_s;

    // Without stochastic failure every trial sees the same snapshots
    if (!config_.topology.link_failure_enabled) {
        shared_timeline_ = std::make_unique<topo::TopologyTimeline>(
            *provider_, builder_, config_.classifier, config_.step_s,
            nullptr, config_.monte_carlo.verbose);
        shared_timeline_->build_all(horizon);
        if (config_.monte_carlo.verbose) {
            std::cerr << "Topology: " << shared_timeline_->size() << " snapshots ("
                      << shared_timeline_->invalid_count() << " invalid)\n";
        }
    }

    EclipseModel eclipse_model(config_.sun_model, config_.epoch_jd);
    eclipse_ = EclipseSchedule::compute(*provider_, eclipse_model, 0.0,
                                        horizon + config_.epidemic.eclipse_half_width_s);

    if (!config_.stations.empty()) {
        ground::GroundVisibility visibility(*provider_, config_.epoch_jd, config_.visibility);
        auto windows = visibility.all_contact_windows(config_.stations, 0.0, horizon);
        if (config_.monte_carlo.verbose) {
            std::cerr << "Ground: " << windows.size() << " contact windows over "
                      << config_.stations.size() << " stations\n";
        }
        contacts_ = ground::ContactSchedule(std::move(windows), provider_->satellite_count(),
                                            config_.stations.size());
    } else {
        contacts_ = ground::ContactSchedule({}, provider_->satellite_count(), 0);
    }
}

void MCRunner::cancel(int trial_index) {
    if (trial_index < 0 || trial_index >= config_.monte_carlo.trials) return;
    cancel_flags_[trial_index] = true;
}

void MCRunner::cancel_all() {
    cancel_all_ = true;
}

bool MCRunner::cancelled(int trial_index) const {
    return cancel_all_.load() || cancel_flags_[trial_index].load();
}

epi::NodeEnvironment MCRunner::environment_at(double t, double dt) const {
    const std::size_t n = provider_->satellite_count();
    epi::NodeEnvironment env = epi::NodeEnvironment::quiet(n);

    const double half_width = config_.epidemic.eclipse_half_width_s;
    for (std::size_t i = 0; i < n; i++) {
        int id = static_cast<int>(i);
        env.eclipse_transition[i] = eclipse_.in_transition_window(id, t, half_width);
        env.in_contact[i] = contacts_.in_contact(id, t, t + dt);
    }

    env.stations_in_view = contacts_.stations_in_view(t, t + dt);
    return env;
}

std::vector<TrialResult> MCRunner::run(ProgressCallback on_progress) {
    const int total = config_.monte_carlo.trials;
    std::vector<TrialResult> results(static_cast<std::size_t>(total));

    std::atomic<int> next{0};
    int completed = 0;

    auto worker = [&]() {
        while (true) {
            int i = next.fetch_add(1);
            if (i >= total) break;

            TrialResult result = run_trial(i);

            std::lock_guard<std::mutex> lock(report_mutex_);
            results[i] = std::move(result);
            completed++;
            if (config_.monte_carlo.verbose) {
                const auto& r = results[i];
                std::cerr << "Trial " << (i + 1) << "/" << total
                          << " (seed=" << r.seed << ") "
                          << (r.cancelled ? "cancelled" : (r.error.empty() ? "done" : "failed"));
                if (!r.curve.empty()) {
                    std::cerr << " (t=" << r.sim_time_final
                              << "s, I=" << r.curve.back().infected
                              << ", R=" << r.curve.back().recovered << ")";
                }
                std::cerr << "\n";
            }
            if (on_progress) {
                on_progress(results[i], completed, total);
            }
        }
    };

    int threads = std::max(1, std::min(config_.monte_carlo.threads, total));
    if (threads == 1) {
        worker();
    } else {
        std::vector<std::thread> pool;
        pool.reserve(static_cast<std::size_t>(threads));
        for (int k = 0; k < threads; k++) pool.emplace_back(worker);
        for (auto& th : pool) th.join();
    }

    return results;
}

void MCRunner::advance(TrialState& state, const topo::TopologySnapshot& snapshot) {
    const double step = config_.step_s;
    const double t = state.t;

    // Background traffic over this snapshot
    if (config_.traffic.packets_per_step > 0) {
        state.routing.inject_background(config_.traffic.packets_per_step,
                                        config_.traffic.control_fraction,
                                        config_.traffic.packet_size, t, state.rng);
    }
    state.routing.tick(snapshot, t);
    state.routing.release_finished();

    const int substeps = config_.epidemic_substeps;
    const double dt = step / substeps;
    for (int j = 0; j < substeps; j++) {
        double ts = t + j * dt;
        epi::NodeEnvironment env = environment_at(ts, dt);
        state.epidemic.step(snapshot, env, ts, dt, &state.defense, state.rng);
        state.metrics.record_counts(ts + dt, state.epidemic.counts());
    }

    state.step++;
    state.t = state.step * step;
}

TrialResult MCRunner::run_trial(int trial_index) {
    TrialResult result;
    result.trial_index = trial_index;
    result.seed = config_.monte_carlo.base_seed + static_cast<uint32_t>(trial_index);

    try {
        orbit::PositionSet epoch_positions = provider_->positions_at(0.0);
        TrialState state(config_, epoch_positions, provider_->plane_count(), result.seed);
        result.initial_infected = state.initial_infected;
        state.metrics.record_counts(0.0, state.epidemic.counts());

        // Stochastic link failure draws from this trial's stream
        std::unique_ptr<topo::TopologyTimeline> own_timeline;
        if (!shared_timeline_) {
            own_timeline = std::make_unique<topo::TopologyTimeline>(
                *provider_, builder_, config_.classifier, config_.step_s, &state.rng, false);
        }

        const int steps = config_.step_count();
        for (int k = 0; k < steps; k++) {
            if (cancelled(trial_index)) {
                result.cancelled = true;
                break;
            }

            topo::SnapshotPtr snapshot;
            std::optional<double> churn;
            if (shared_timeline_) {
                snapshot = shared_timeline_->snapshots().at(static_cast<std::size_t>(k));
                churn = shared_timeline_->churn_at(static_cast<std::size_t>(k));
            } else {
                snapshot = own_timeline->advance(k * config_.step_s);
                churn = own_timeline->churn_at(static_cast<std::size_t>(k));
            }

            state.metrics.record_snapshot(*snapshot, churn);
            advance(state, *snapshot);
        }

        result.sim_time_final = state.t;
        result.curve = state.metrics.infection_curve();
        result.snapshots = state.metrics.snapshot_series();
        result.invalid_snapshots = state.metrics.invalid_snapshots();
        result.events = state.epidemic.events();
        result.detections = state.defense.detections();
        result.firewall_blocks = state.defense.firewall_blocks_log();
        result.routing = state.routing.counters();

    } catch (const std::exception& e) {
        result.error = std::string("Trial error: ") + e.what();
    }

    return result;
}

} // namespace wormsim::mc
