#include "montecarlo/mc_results.hpp"
#include "io/json_writer.hpp"
#include <algorithm>

namespace wormsim::mc {

AggregateResult aggregate(const std::vector<TrialResult>& results) {
    AggregateResult agg;

    double churn_sum = 0.0;
    int churn_n = 0;

    for (const auto& r : results) {
        if (r.cancelled) {
            agg.trials_cancelled++;
            continue;
        }
        if (!r.error.empty()) {
            agg.trials_failed++;
            continue;
        }
        agg.trials_completed++;

        if (!r.curve.empty()) {
            const auto& last = r.curve.back();
            agg.mean_final_susceptible += last.susceptible;
            agg.mean_final_infected += last.infected;
            agg.mean_final_recovered += last.recovered;
        }
        int peak = 0;
        for (const auto& p : r.curve) peak = std::max(peak, p.infected);
        agg.mean_peak_infected += peak;

        for (const auto& m : r.snapshots) {
            if (!m.churn_rate) continue;
            churn_sum += *m.churn_rate;
            churn_n++;
        }

        if (agg.curve_t.size() < r.curve.size()) {
            agg.curve_t.resize(r.curve.size());
            agg.mean_infected.resize(r.curve.size(), 0.0);
        }
        for (size_t i = 0; i < r.curve.size(); i++) {
            agg.curve_t[i] = r.curve[i].t;
            agg.mean_infected[i] += r.curve[i].infected;
        }
    }

    if (agg.trials_completed > 0) {
        double n = agg.trials_completed;
        agg.mean_final_susceptible /= n;
        agg.mean_final_infected /= n;
        agg.mean_final_recovered /= n;
        agg.mean_peak_infected /= n;
        for (auto& v : agg.mean_infected) v /= n;
    }
    if (churn_n > 0) {
        agg.mean_churn = churn_sum / churn_n;
    }
    return agg;
}

void write_results_json(const std::vector<TrialResult>& results,
                        const SimulationConfig& config,
                        std::ostream& out) {
    JsonWriter w(out);
    AggregateResult agg = aggregate(results);

    w.begin_object();

    // ── config ──
    w.key("config").begin_object();
    w.kv("trials", config.monte_carlo.trials);
    w.kv("baseSeed", config.monte_carlo.base_seed);
    w.kv("horizonS", config.horizon_s);
    w.kv("stepS", config.step_s);
    w.kv("epidemicSubsteps", config.epidemic_substeps);
    w.kv("betaNormal", config.epidemic.beta_normal);
    w.kv("betaEclipse", config.epidemic.beta_eclipse);
    w.kv("exploitHops", config.epidemic.exploit_hops);
    w.kv("pDetect", config.defense.ids.p_detect);
    w.kv("patchRatePerHour", config.defense.patch.rate_per_hour);
    w.kv("zoneCount", config.defense.segmentation.zone_count);
    w.kv("firewallRate", config.defense.segmentation.firewall_rate);
    w.kv("linkFailureEnabled", config.topology.link_failure_enabled);
    w.end_object();

    // ── aggregate ──
    w.key("aggregate").begin_object();
    w.kv("trialsCompleted", agg.trials_completed);
    w.kv("trialsCancelled", agg.trials_cancelled);
    w.kv("trialsFailed", agg.trials_failed);
    w.kv("meanFinalSusceptible", agg.mean_final_susceptible);
    w.kv("meanFinalInfected", agg.mean_final_infected);
    w.kv("meanFinalRecovered", agg.mean_final_recovered);
    w.kv("meanPeakInfected", agg.mean_peak_infected);
    w.kv("meanChurn", agg.mean_churn);
    w.key("meanInfectedCurve").begin_array();
    for (size_t i = 0; i < agg.curve_t.size(); i++) {
        w.begin_array().value(agg.curve_t[i]).value(agg.mean_infected[i]).end_array();
    }
    w.end_array();
    w.end_object();

    // ── trials ──
    w.key("trials").begin_array();
    for (const auto& r : results) {
        w.begin_object();
        w.kv("trialIndex", r.trial_index);
        w.kv("seed", r.seed);
        w.kv("cancelled", r.cancelled);
        if (r.error.empty()) {
            w.key("error").null_value();
        } else {
            w.kv("error", r.error);
        }
        w.kv("simTimeFinal", r.sim_time_final);
        w.kv("invalidSnapshots", r.invalid_snapshots);

        w.key("initialInfected").begin_array();
        for (int id : r.initial_infected) w.value(id);
        w.end_array();

        // ── S/I/R series ──
        w.key("curve").begin_array();
        for (const auto& p : r.curve) {
            w.begin_object();
            w.kv("t", p.t);
            w.kv("S", p.susceptible);
            w.kv("I", p.infected);
            w.kv("R", p.recovered);
            w.kv("dormant", p.dormant);
            w.end_object();
        }
        w.end_array();

        // ── topology metrics ──
        w.key("snapshots").begin_array();
        for (const auto& m : r.snapshots) {
            w.begin_object();
            w.kv("sequence", m.sequence);
            w.kv("t", m.timestamp);
            w.kv("nodes", m.node_count);
            w.kv("edges", m.edge_count);
            w.kv("intraPlaneEdges", m.intra_plane_edges);
            w.kv("interPlaneEdges", m.inter_plane_edges);
            w.kv("avgDegree", m.avg_degree);
            w.kv("components", m.component_count);
            w.kv("avgPathLength", m.avg_path_length);
            w.kv("diameter", m.diameter);
            w.kv("churn", m.churn_rate);
            w.end_object();
        }
        w.end_array();

        // ── event logs ──
        w.key("events").begin_array();
        for (const auto& e : r.events) {
            w.begin_object();
            w.kv("t", e.timestamp);
            w.kv("node", e.node);
            w.kv("from", epi::health_state_to_string(e.from));
            w.kv("to", epi::health_state_to_string(e.to));
            w.kv("cause", epi::event_cause_to_string(e.cause));
            w.kv("source", e.source);
            w.end_object();
        }
        w.end_array();

        w.key("detections").begin_array();
        for (const auto& d : r.detections) {
            w.begin_object();
            w.kv("t", d.timestamp);
            w.kv("idsNode", d.ids_node);
            w.kv("attacker", d.attacker);
            w.kv("target", d.target);
            w.end_object();
        }
        w.end_array();

        w.key("firewallBlocks").begin_array();
        for (const auto& f : r.firewall_blocks) {
            w.begin_object();
            w.kv("t", f.timestamp);
            w.key("link").begin_array().value(f.link_a).value(f.link_b).end_array();
            w.kv("attacker", f.attacker);
            w.kv("target", f.target);
            w.end_object();
        }
        w.end_array();

        // ── routing ──
        w.key("routing").begin_object();
        w.kv("injected", r.routing.injected);
        w.kv("delivered", r.routing.delivered);
        w.kv("droppedNoRoute", r.routing.dropped_no_route);
        w.kv("droppedOverflow", r.routing.dropped_overflow);
        w.kv("droppedLinkLost", r.routing.dropped_link_lost);
        w.kv("droppedPreempted", r.routing.dropped_preempted);
        w.kv("totalHops", r.routing.total_hops);
        w.end_object();

        w.end_object();
    }
    w.end_array();

    w.end_object();
    out << '\n';
}

void write_curve_csv(const std::vector<TrialResult>& results, std::ostream& out) {
    out << "seed,t,S,I,R,dormant\n";
    for (const auto& r : results) {
        if (r.cancelled) continue;
        for (const auto& p : r.curve) {
            out << r.seed << ',' << p.t << ',' << p.susceptible << ','
                << p.infected << ',' << p.recovered << ',' << p.dormant << '\n';
        }
    }
}

} // namespace wormsim::mc
