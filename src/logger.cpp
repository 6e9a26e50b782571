/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace valucalc {

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel string_to_level(const std::string& level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    throw ValidationError("Unknown log level '" + level_str +
                          "' (expected DEBUG, INFO, WARN or ERROR)");
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log_analysis_start(
    const AnalysisContext& ctx,
    const std::map<std::string, std::string>& parameters
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "analysis_start";
    add_context(ctx, fields);
    for (const auto& [key, value] : parameters) {
        fields["param." + key] = value;
    }

    log(LogLevel::INFO, "Starting " + ctx.analysis_type + " analysis", std::move(fields));
}

void Logger::log_analysis_complete(
    const AnalysisContext& ctx,
    const AnalysisStatus& status,
    const std::optional<double>& value
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "analysis_complete";
    add_context(ctx, fields);
    fields["success"] = status.success ? "true" : "false";
    fields["execution_time_ms"] = std::to_string(status.execution_time_ms);
    if (value) {
        fields["value"] = std::to_string(*value);
    }

    if (!status.warnings.empty()) {
        fields["warning_count"] = std::to_string(status.warnings.size());
        for (size_t i = 0; i < std::min(status.warnings.size(), size_t(5)); ++i) {
            fields["warning_" + std::to_string(i)] = status.warnings[i];
        }
    }

    if (!status.success) {
        fields["error_kind"] = error_kind_to_string(status.error_kind);
        fields["error"] = status.error_message;
    }

    log(status.success ? LogLevel::INFO : LogLevel::ERROR, "Analysis completed", std::move(fields));
}

void Logger::log_method_skipped(
    const AnalysisContext& ctx,
    const std::string& method,
    const std::string& reason
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "method_skipped";
    add_context(ctx, fields);
    fields["method"] = method;
    fields["reason"] = reason;

    log(LogLevel::WARN, "Skipped " + method, std::move(fields));
}

void Logger::log_error(
    const AnalysisContext& ctx,
    const std::string& error_message,
    ErrorKind kind
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(ctx, fields);
    fields["error_kind"] = error_kind_to_string(kind);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Analysis error", std::move(fields));
}

void Logger::log_warning(
    const AnalysisContext& ctx,
    const std::string& warning_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(ctx, fields);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, std::move(fields));
}

void Logger::log_result_stored(
    const AnalysisContext& ctx,
    const std::string& result_id,
    const std::string& location
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "result_stored";
    add_context(ctx, fields);
    fields["result_id"] = result_id;
    fields["location"] = location;

    log(LogLevel::INFO, "Stored result " + result_id, std::move(fields));
}

void Logger::log_debug(
    const AnalysisContext& ctx,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::map<std::string, std::string> all_fields = fields;
    all_fields["event"] = "debug";
    add_context(ctx, all_fields);

    log(LogLevel::DEBUG, message, std::move(all_fields));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::add_context(const AnalysisContext& ctx,
                         std::map<std::string, std::string>& fields) const {
    fields["analysis_id"] = ctx.analysis_id;
    fields["analysis_type"] = ctx.analysis_type;
    if (!ctx.company_name.empty()) {
        fields["company"] = ctx.company_name;
    }
    if (!ctx.industry.empty()) {
        fields["industry"] = ctx.industry;
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    std::map<std::string, std::string> fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        nlohmann::json record(fields);
        record["timestamp"] = get_timestamp();
        record["level"] = level_to_string(level);
        record["message"] = message;
        output = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace valucalc
