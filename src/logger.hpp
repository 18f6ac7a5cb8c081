/**
 * @file logger.hpp
 * @brief Structured logging for the simulation engines and CLI
 *
 * Records go to stderr and/or a file, either as one JSON object per line
 * or as "timestamp [LEVEL] message {key=value, ...}".
 */

#ifndef WEALTHSIM_LOGGER_HPP
#define WEALTHSIM_LOGGER_HPP

#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace wealthsim {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-event detail (event application, schedule changes)
    INFO,    ///< Run start/end, config loading
    WARN,    ///< Non-fatal issues (non-finite results, ignored inputs)
    ERROR    ///< Failures that abort a run
};

inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

// Unrecognized names fall back to INFO
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

/**
 * @brief Identifies which run and which component emitted a record
 */
struct RunContext {
    std::string run_id;       ///< Caller-chosen identifier (e.g. config file name)
    std::string component;    ///< "stochastic", "cashflow", "cli"

    RunContext() = default;
    RunContext(const std::string& id, const std::string& comp)
        : run_id(id), component(comp) {}
};

/**
 * @brief Execution metrics for one engine call
 */
struct RunMetrics {
    double execution_time_ms;   ///< Wall time of the call
    size_t paths;               ///< Simulated paths
    size_t years;               ///< Simulated years (excluding year 0)
    size_t memory_used_mb;      ///< Size of the result matrices

    RunMetrics()
        : execution_time_ms(0.0), paths(0), years(0), memory_used_mb(0) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("wealthsim.log"),
          enable_json(false) {}
};

/**
 * @brief Process-wide structured logger
 *
 * Each record carries an "event" name, the run context and event-specific
 * fields. Records below the configured level are dropped before formatting.
 * Writes are serialized, so engines may log from worker threads.
 *
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *   Logger::get_instance().log_simulation_start(RunContext("household", "stochastic"),
 *                                               1000, 30, 4, 1, 42);
 *   @endcode
 */
class Logger {
public:
    using Fields = std::map<std::string, std::string>;

    static Logger& get_instance();

    // Replaces the whole configuration and reopens the log file if enabled
    void configure(const LoggerConfig& config);

    void log_simulation_start(const RunContext& ctx, size_t paths, size_t years,
                              size_t events, size_t passive_streams, uint64_t seed);

    // non_finite_values: NaN/Inf cells found in the result matrices
    void log_simulation_complete(const RunContext& ctx, const RunMetrics& metrics,
                                 size_t non_finite_values);

    void log_projection_complete(const RunContext& ctx, size_t rows,
                                 const std::string& year1_status);

    void log_config_loaded(const RunContext& ctx, const std::string& path,
                           size_t events, size_t passive_streams);

    // DEBUG level
    void log_event_applied(const RunContext& ctx, int year, const std::string& event_type,
                           const std::string& label);

    void log_error(const RunContext& ctx, const std::string& error_message);
    void log_warning(const RunContext& ctx, const std::string& warning_message);

    void flush();

    LogLevel get_min_level();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    std::mutex mutex_;

    static Fields record(const RunContext& ctx, const std::string& event);
    void emit(LogLevel level, const std::string& message, const Fields& fields);
    std::string render(LogLevel level, const std::string& message, const Fields& fields) const;
};

} // namespace wealthsim

#endif // WEALTHSIM_LOGGER_HPP
