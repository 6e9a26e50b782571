/**
 * @file logger.hpp
 * @brief Structured logging for valuation runs with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (analysis ID, analysis type, company)
 *
 * Engine code never logs from inside a parallel region; the facade and the
 * CLI emit events before and after each analysis.
 */

#ifndef VALUCALC_LOGGER_HPP
#define VALUCALC_LOGGER_HPP

#include "analysis_status.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace valucalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Intermediate values (per-method details)
    INFO,    ///< Analysis start/end, stored results
    WARN,    ///< Skipped methods, capped or failed iterations
    ERROR    ///< Failed analyses
};

std::string level_to_string(LogLevel level);

/**
 * @brief Parse log level from string (case-insensitive)
 *
 * @throws ValidationError for an unknown level
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Analysis context attached to every event
 */
struct AnalysisContext {
    std::string analysis_id;     ///< Run identifier
    std::string analysis_type;   ///< relative, dcf, scenario, stress, montecarlo, sensitivity, full
    std::string company_name;
    std::string industry;

    AnalysisContext() = default;

    AnalysisContext(const std::string& id, const std::string& type)
        : analysis_id(id), analysis_type(type) {}
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
          log_file_path("valucalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   AnalysisContext ctx("run-1", "dcf");
 *   logger.log_analysis_start(ctx);
 *   ...
 *   logger.log_analysis_complete(ctx, outcome);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Reopens the log file when file output is enabled.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the start of an analysis
     *
     * @param ctx Analysis context
     * @param parameters Salient inputs (iterations, seed, horizon)
     */
    void log_analysis_start(
        const AnalysisContext& ctx,
        const std::map<std::string, std::string>& parameters = {}
    );

    /**
     * @brief Log analysis completion, successful or not
     *
     * @param ctx Analysis context
     * @param status Outcome metadata
     * @param value Headline value when the analysis produced one
     */
    void log_analysis_complete(
        const AnalysisContext& ctx,
        const AnalysisStatus& status,
        const std::optional<double>& value = std::nullopt
    );

    /**
     * @brief Log a relative method that was skipped for lack of data
     */
    void log_method_skipped(
        const AnalysisContext& ctx,
        const std::string& method,
        const std::string& reason
    );

    /**
     * @brief Log error with context
     */
    void log_error(
        const AnalysisContext& ctx,
        const std::string& error_message,
        ErrorKind kind = ErrorKind::Internal
    );

    /**
     * @brief Log warning message
     */
    void log_warning(
        const AnalysisContext& ctx,
        const std::string& warning_message
    );

    /**
     * @brief Log a result bundle handed to a ResultStore
     */
    void log_result_stored(
        const AnalysisContext& ctx,
        const std::string& result_id,
        const std::string& location
    );

    /**
     * @brief Log a free-form debug message
     */
    void log_debug(
        const AnalysisContext& ctx,
        const std::string& message,
        const std::map<std::string, std::string>& fields = {}
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields);
    void add_context(const AnalysisContext& ctx, std::map<std::string, std::string>& fields) const;
    std::string get_timestamp() const;
    void write_output(const std::string& output);
};

} // namespace valucalc

#endif // VALUCALC_LOGGER_HPP
