#include "logger.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace wealthsim {

namespace {

// UTC, millisecond resolution: 2024-05-01T12:34:56.789Z
std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

} // anonymous namespace

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    file_stream_.reset();
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
            file_stream_.reset();
        }
    }
}

Logger::Fields Logger::record(const RunContext& ctx, const std::string& event) {
    Fields fields;
    fields["event"] = event;
    fields["run_id"] = ctx.run_id;
    fields["component"] = ctx.component;
    return fields;
}

void Logger::log_simulation_start(const RunContext& ctx, size_t paths, size_t years,
                                  size_t events, size_t passive_streams, uint64_t seed) {
    Fields fields = record(ctx, "simulation_start");
    fields["paths"] = std::to_string(paths);
    fields["years"] = std::to_string(years);
    fields["events"] = std::to_string(events);
    fields["passive_streams"] = std::to_string(passive_streams);
    fields["seed"] = std::to_string(seed);
    emit(LogLevel::INFO, "Starting simulation", fields);
}

void Logger::log_simulation_complete(const RunContext& ctx, const RunMetrics& metrics,
                                     size_t non_finite_values) {
    double cell_rate = metrics.execution_time_ms > 0.0
        ? static_cast<double>(metrics.paths * metrics.years) * 1000.0 / metrics.execution_time_ms
        : 0.0;

    Fields fields = record(ctx, "simulation_complete");
    fields["execution_time_ms"] = std::to_string(metrics.execution_time_ms);
    fields["paths"] = std::to_string(metrics.paths);
    fields["years"] = std::to_string(metrics.years);
    fields["memory_used_mb"] = std::to_string(metrics.memory_used_mb);
    fields["path_years_per_sec"] = std::to_string(cell_rate);
    fields["non_finite_values"] = std::to_string(non_finite_values);
    emit(LogLevel::INFO, "Simulation completed", fields);
}

void Logger::log_projection_complete(const RunContext& ctx, size_t rows,
                                     const std::string& year1_status) {
    Fields fields = record(ctx, "projection_complete");
    fields["rows"] = std::to_string(rows);
    fields["year1_status"] = year1_status;
    emit(LogLevel::INFO, "Cash flow projection completed", fields);
}

void Logger::log_config_loaded(const RunContext& ctx, const std::string& path,
                               size_t events, size_t passive_streams) {
    Fields fields = record(ctx, "config_loaded");
    fields["path"] = path;
    fields["events"] = std::to_string(events);
    fields["passive_streams"] = std::to_string(passive_streams);
    emit(LogLevel::INFO, "Loaded configuration", fields);
}

void Logger::log_event_applied(const RunContext& ctx, int year, const std::string& event_type,
                               const std::string& label) {
    Fields fields = record(ctx, "event_applied");
    fields["year"] = std::to_string(year);
    fields["event_type"] = event_type;
    fields["label"] = label;
    emit(LogLevel::DEBUG, "Applied event", fields);
}

void Logger::log_error(const RunContext& ctx, const std::string& error_message) {
    Fields fields = record(ctx, "error");
    fields["error_message"] = error_message;
    emit(LogLevel::ERROR, "Run failed", fields);
}

void Logger::log_warning(const RunContext& ctx, const std::string& warning_message) {
    Fields fields = record(ctx, "warning");
    fields["warning"] = warning_message;
    emit(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
    if (file_stream_) {
        file_stream_->flush();
    }
}

std::string Logger::render(LogLevel level, const std::string& message,
                           const Fields& fields) const {
    if (config_.enable_json) {
        nlohmann::json line(fields);
        line["timestamp"] = utc_timestamp();
        line["level"] = level_to_string(level);
        line["message"] = message;
        return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::ostringstream oss;
    oss << utc_timestamp() << " [" << level_to_string(level) << "] " << message;
    const char* separator = " {";
    for (const auto& [key, value] : fields) {
        oss << separator << key << "=" << value;
        separator = ", ";
    }
    if (!fields.empty()) {
        oss << "}";
    }
    return oss.str();
}

LogLevel Logger::get_min_level() {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::emit(LogLevel level, const std::string& message, const Fields& fields) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    std::string line = render(level, message, fields);
    if (config_.enable_console) {
        std::cerr << line << '\n';
    }
    if (file_stream_) {
        *file_stream_ << line << '\n';
    }
}

} // namespace wealthsim
