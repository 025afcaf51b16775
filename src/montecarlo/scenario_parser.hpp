/**
 * ScenarioParser — scenario JSON into a SimulationConfig.
 *
 * Absent keys keep their defaults; present keys of the wrong type raise
 * ConfigurationError naming the full key path (e.g.
 * "defense.segmentation.zone_count"). Degree and kilometre inputs are
 * converted to radians and metres here.
 */

#ifndef WORMSIM_MC_SCENARIO_PARSER_HPP
#define WORMSIM_MC_SCENARIO_PARSER_HPP

#include "montecarlo/simulation_config.hpp"
#include "io/json_reader.hpp"
#include <string>

namespace wormsim::mc {

class ScenarioParser {
public:
    /** Parse and validate. @throws ConfigurationError */
    static SimulationConfig parse(const JsonValue& scenario);

    /** Read, parse and validate a scenario file. */
    static SimulationConfig parse_file(const std::string& path);

private:
    static void parse_constellation(const JsonValue& node, SimulationConfig& config);
    static void parse_topology(const JsonValue& node, SimulationConfig& config);
    static void parse_ground(const JsonValue& stations, const JsonValue& ground,
                             SimulationConfig& config);
    static void parse_epidemic(const JsonValue& node, SimulationConfig& config);
    static void parse_defense(const JsonValue& node, SimulationConfig& config);
    static void parse_routing(const JsonValue& node, SimulationConfig& config);
    static void parse_monte_carlo(const JsonValue& node, SimulationConfig& config);
};

} // namespace wormsim::mc

#endif // WORMSIM_MC_SCENARIO_PARSER_HPP
