/**
 * Error types
 *
 * ConfigurationError is fatal at setup and names the offending parameter.
 * GeometryError is fatal to a single topology snapshot only.
 */

#ifndef WORMSIM_ERRORS_HPP
#define WORMSIM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace wormsim {

class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(const std::string& parameter, const std::string& reason)
        : std::runtime_error("invalid configuration '" + parameter + "': " + reason),
          parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

class GeometryError : public std::runtime_error {
public:
    GeometryError(int satellite_id, const std::string& reason)
        : std::runtime_error("satellite " + std::to_string(satellite_id) + ": " + reason),
          satellite_id_(satellite_id) {}

    int satellite_id() const { return satellite_id_; }

private:
    int satellite_id_;
};

} // namespace wormsim

#endif // WORMSIM_ERRORS_HPP
