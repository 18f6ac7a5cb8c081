#ifndef WEALTHSIM_IO_CONFIG_READER_HPP
#define WEALTHSIM_IO_CONFIG_READER_HPP

#include "../config.hpp"
#include <stdexcept>
#include <string>

namespace wealthsim {
namespace io {

/**
 * @brief Exception thrown when a configuration document cannot be read
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Parses a household configuration from a JSON file
 *
 * Keys are the snake_case SimulationConfig field names. Missing keys keep
 * their defaults; `events`, `passive_income_streams` and `spouse` are optional.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed and validated configuration
 * @throws ConfigParseError if the file cannot be read, the JSON is invalid,
 *         a field has the wrong type or an event is malformed
 * @throws ConfigError if the configuration is invalid
 */
SimulationConfig load_config_from_file(const std::string& file_path);

/**
 * @brief Parses a household configuration from a JSON string
 *
 * @param json_string JSON configuration as string
 * @return Parsed and validated configuration
 * @throws ConfigParseError if the JSON is invalid or malformed
 * @throws ConfigError if the configuration is invalid
 */
SimulationConfig load_config_from_string(const std::string& json_string);

} // namespace io
} // namespace wealthsim

#endif // WEALTHSIM_IO_CONFIG_READER_HPP
