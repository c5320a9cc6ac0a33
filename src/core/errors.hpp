#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace degree_hours {

// Base for every structural failure of a (site, scenario) run
class DegreeHourError : public std::runtime_error {
public:
  explicit DegreeHourError(const std::string &msg) : std::runtime_error(msg) {}
};

// Record count outside {8760, 8784} or a record with an out-of-range field
class InputShapeError : public DegreeHourError {
public:
  explicit InputShapeError(const std::string &msg)
      : DegreeHourError("Input shape error: " + msg) {}
};

// Invalid or ambiguous scenario / application configuration
class ConfigError : public DegreeHourError {
public:
  explicit ConfigError(const std::string &msg)
      : DegreeHourError("Config error: " + msg) {}
};

} // namespace degree_hours

#endif // ERRORS_HPP
