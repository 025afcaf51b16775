/**
 * worm_engine — Monte Carlo worm-propagation sweep over an ISL constellation.
 *
 * Reads a scenario JSON, builds the time-varying topology, runs N
 * independent seeded trials and writes results JSON (and optionally the
 * infection curve as CSV).
 *
 * Usage:
 *   worm_engine --scenario <path> [--runs N] [--seed S] [--threads K]
 *               [--horizon T] [--output <path>] [--csv <path>]
 *               [--verbose] [--progress]
 */

#include "montecarlo/mc_runner.hpp"
#include "montecarlo/mc_results.hpp"
#include "montecarlo/scenario_parser.hpp"
#include "io/json_writer.hpp"
#include "core/errors.hpp"
#include "coordinate/time_utils.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

struct CliOptions {
    std::string scenario_path;
    std::string output_path;        // empty = stdout
    std::string csv_path;           // empty = no CSV
    int runs = -1;                  // < 0 keeps the scenario value
    long long seed = -1;
    int threads = -1;
    double horizon = -1.0;
    bool verbose = false;
    bool progress = false;
};

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --scenario <path> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --scenario <path>    Scenario JSON file (required)\n"
              << "  --runs N             Number of trials (overrides monte_carlo.trials)\n"
              << "  --seed S             Base RNG seed (overrides monte_carlo.base_seed)\n"
              << "  --threads K          Worker threads (overrides monte_carlo.threads)\n"
              << "  --horizon T          Simulated seconds (overrides horizon_s)\n"
              << "  --output <path>      Results JSON file (default: stdout)\n"
              << "  --csv <path>         Infection curve CSV (seed,t,S,I,R,dormant)\n"
              << "  --verbose            Progress to stderr\n"
              << "  --progress           JSON-Lines progress to stderr\n"
              << "  --help               Show this message\n";
}

static void emit_progress(const wormsim::mc::TrialResult& r, int completed, int total) {
    std::ostringstream line;
    wormsim::JsonWriter w(line, 0);
    w.begin_object();
    w.kv("type", "trial_complete");
    w.kv("trial", r.trial_index);
    w.kv("seed", r.seed);
    w.kv("completed", completed);
    w.kv("total", total);
    w.kv("cancelled", r.cancelled);
    if (r.curve.empty()) {
        w.key("infected").null_value();
    } else {
        w.kv("infected", r.curve.back().infected);
    }
    w.end_object();
    std::cerr << line.str() << "\n" << std::flush;
}

int main(int argc, char* argv[]) {
    CliOptions opts;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--scenario" && i + 1 < argc) {
                opts.scenario_path = argv[++i];
            } else if (arg == "--runs" && i + 1 < argc) {
                opts.runs = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                opts.seed = std::stoll(argv[++i]);
            } else if (arg == "--threads" && i + 1 < argc) {
                opts.threads = std::stoi(argv[++i]);
            } else if (arg == "--horizon" && i + 1 < argc) {
                opts.horizon = std::stod(argv[++i]);
            } else if (arg == "--output" && i + 1 < argc) {
                opts.output_path = argv[++i];
            } else if (arg == "--csv" && i + 1 < argc) {
                opts.csv_path = argv[++i];
            } else if (arg == "--verbose" || arg == "-v") {
                opts.verbose = true;
            } else if (arg == "--progress") {
                opts.progress = true;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Error: malformed numeric argument (" << e.what() << ")\n";
        return 1;
    }

    if (opts.scenario_path.empty()) {
        std::cerr << "Error: --scenario is required\n\n";
        print_usage(argv[0]);
        return 1;
    }

    // Load, apply overrides, validate
    wormsim::mc::SimulationConfig config;
    try {
        config = wormsim::mc::ScenarioParser::parse_file(opts.scenario_path);
        if (opts.runs >= 0) config.monte_carlo.trials = opts.runs;
        if (opts.seed >= 0) {
            if (opts.seed > 4294967295LL) {
                throw wormsim::ConfigurationError("monte_carlo.base_seed", "must fit in 32 bits");
            }
            config.monte_carlo.base_seed = static_cast<uint32_t>(opts.seed);
        }
        if (opts.threads >= 0) config.monte_carlo.threads = opts.threads;
        if (opts.horizon >= 0.0) config.horizon_s = opts.horizon;
        config.monte_carlo.verbose = opts.verbose;
        config.monte_carlo.progress = opts.progress;
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (opts.verbose) {
        std::cerr << "=== Worm Engine ===\n"
                  << "Scenario: " << opts.scenario_path << "\n"
                  << "Epoch: " << wormsim::TimeUtils::jd_to_iso8601(config.epoch_jd) << "\n"
                  << "Trials: " << config.monte_carlo.trials << "\n"
                  << "Base seed: " << config.monte_carlo.base_seed << "\n"
                  << "Threads: " << config.monte_carlo.threads << "\n"
                  << "Horizon: " << config.horizon_s << "s\n"
                  << "Step: " << config.step_s << "s\n"
                  << "Output: " << (opts.output_path.empty() ? "stdout" : opts.output_path)
                  << "\n\n";
    }

    auto t_start = std::chrono::high_resolution_clock::now();

    std::vector<wormsim::mc::TrialResult> results;
    try {
        wormsim::mc::MCRunner runner(config);

        wormsim::mc::MCRunner::ProgressCallback progress_cb = nullptr;
        if (opts.progress) {
            progress_cb = emit_progress;
        }
        results = runner.run(progress_cb);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    auto t_end = std::chrono::high_resolution_clock::now();
    double elapsed = std::chrono::duration<double>(t_end - t_start).count();

    if (opts.verbose) {
        auto agg = wormsim::mc::aggregate(results);
        std::cerr << "\n=== Results ===\n"
                  << "Completed: " << agg.trials_completed << " trials in "
                  << elapsed << "s\n"
                  << "Errors: " << agg.trials_failed << "\n"
                  << "Mean final S/I/R: " << agg.mean_final_susceptible << " / "
                  << agg.mean_final_infected << " / " << agg.mean_final_recovered << "\n"
                  << "Mean peak infected: " << agg.mean_peak_infected << "\n";
    }

    // Write output
    if (opts.output_path.empty()) {
        wormsim::mc::write_results_json(results, config, std::cout);
    } else {
        std::ofstream out(opts.output_path);
        if (!out.is_open()) {
            std::cerr << "Error: cannot open output file: " << opts.output_path << "\n";
            return 1;
        }
        wormsim::mc::write_results_json(results, config, out);
        if (opts.verbose) {
            std::cerr << "Written to: " << opts.output_path << "\n";
        }
    }

    if (!opts.csv_path.empty()) {
        std::ofstream csv(opts.csv_path);
        if (!csv.is_open()) {
            std::cerr << "Error: cannot open CSV file: " << opts.csv_path << "\n";
            return 1;
        }
        wormsim::mc::write_curve_csv(results, csv);
    }

    if (opts.progress) {
        std::cerr << "{\"type\":\"done\",\"trials\":" << results.size()
                  << ",\"elapsed\":" << elapsed << "}\n" << std::flush;
    }

    return 0;
}
