/**
 * @file Logger.hpp
 * @brief Centralized logging system with per-facility verbosity control
 *
 * Every component owns a Logger named after its facility. Output goes
 * through exactly one outputMessage() method, so verbosity filtering,
 * duplicate collapsing and file mirroring happen in one place.
 */

#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace hydromesh {

/**
 * @brief Log levels
 *
 * Level 1: Errors (disrupts execution)
 * Level 2: Warnings (disables functionality or drops input)
 * Level 3: Information (pipeline stages)
 * Level 4: Detailed information (per-entity results)
 * Level 5: Basic debugging (objects, methods)
 * Level 6: Detailed debugging (variable values)
 */
enum class LogLevel {
    ERROR = 1,
    WARNING = 2,
    INFO = 3,
    DETAILED = 4,
    DEBUG = 5,
    TRACE = 6
};

/**
 * @brief Facility logger with single point of output control
 *
 * Loggers are cheap to copy: a copy keeps the facility name and level but
 * starts with fresh duplicate-collapsing state.
 */
class Logger {
public:
    Logger();

    /**
     * @brief Constructor with facility name
     * @param component_name Facility used for level lookup and the output prefix
     */
    explicit Logger(const std::string& component_name);

    /**
     * @brief Constructor with explicit instance level
     * @param level Instance threshold, used when no facility level is set
     */
    explicit Logger(LogLevel level);

    Logger(const Logger& other);
    Logger& operator=(const Logger& other);

    /**
     * @brief Destructor - emits any pending repeat summary and flushes
     */
    ~Logger();

    /**
     * @brief Output a message if it meets the effective verbosity level
     *
     * Consecutive identical messages are held back and summarized as
     * "The previous message occurred N times." once a different message
     * arrives or the logger is flushed.
     */
    void outputMessage(LogLevel level, const std::string& message) const;

    void setLogLevel(LogLevel level) { current_level_ = level; }
    LogLevel getLogLevel() const { return current_level_; }

    const std::string& facility() const { return component_name_; }

    bool shouldOutput(LogLevel level) const {
        return static_cast<int>(level) <= static_cast<int>(getEffectiveLevel());
    }

    void error(const std::string& message) const { outputMessage(LogLevel::ERROR, message); }
    void warning(const std::string& message) const { outputMessage(LogLevel::WARNING, message); }
    void info(const std::string& message) const { outputMessage(LogLevel::INFO, message); }

    /**
     * @brief Level 4 - per-entity codepath details
     */
    void detailed(const std::string& message) const { outputMessage(LogLevel::DETAILED, message); }

    /**
     * @brief Level 5 - objects and methods
     */
    void debug(const std::string& message) const { outputMessage(LogLevel::DEBUG, message); }

    /**
     * @brief Level 6 - variable values; flushes after output
     */
    void trace(const std::string& message) const {
        outputMessage(LogLevel::TRACE, message);
        flush();
    }

    /**
     * @brief Flush pending repeat summary, console and log file
     */
    void flush() const;

    // ========================================================================
    // Facility-based logging control
    // ========================================================================

    static void setFacilityLevel(const std::string& facility, LogLevel level);
    static void setDefaultLevel(LogLevel level);

    /**
     * @brief Level for a facility, or the default level when none is set
     */
    static LogLevel getFacilityLevel(const std::string& facility);

    /**
     * @brief Parse and apply a log configuration string
     *
     * Supports:
     * - Simple level: "5" sets the default to DEBUG
     * - Facility-specific: "Triangulator=6,TopologyCleaner=4"
     * - Mixed: "4,Triangulator=6"
     * - "default=N" as an alias for a bare level
     *
     * Invalid levels are reported on stderr and skipped.
     */
    static void parseLogConfig(const std::string& config);

    static void clearFacilityLevels();

    /**
     * @brief Mirror every logger's output into a file (append mode)
     * @param log_file Path to the file, or nullopt to stop mirroring
     * @return false if the file could not be opened
     */
    static bool setLogFile(const std::optional<std::string>& log_file);

    /**
     * @brief Facility level if set, else a non-default instance level, else the global default
     */
    LogLevel getEffectiveLevel() const;

private:
    LogLevel current_level_;
    std::string component_name_;
    mutable std::mutex output_mutex_;

    // Message deduplication state
    mutable std::string last_message_;
    mutable LogLevel last_level_;
    mutable int repeat_count_;
    mutable bool has_last_message_;

    // Static facility-based logging registry
    static std::unordered_map<std::string, LogLevel> facility_levels_;
    static LogLevel default_level_;
    static std::mutex registry_mutex_;

    // Shared log file, guarded by file_mutex_
    static std::shared_ptr<std::ofstream> file_stream_;
    static std::mutex file_mutex_;

    void emitRepeatSummary() const;
    void doOutput(LogLevel level, const std::string& message) const;
};

} // namespace hydromesh
