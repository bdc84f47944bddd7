#pragma once

#include <atomic>
#include <string>
#include <iostream>
#include <sstream>
#include <chrono>
#include <cstdint>
#include <iomanip>

namespace modstat {
namespace utils {

/**
 * @brief Configurable tracing and logging utilities
 *
 * Provides:
 * - Configurable log levels (trace, debug, info, warn, error)
 * - Structured logging with timestamps and file/line info
 * - Performance timing measurements
 * - Environment variable control
 * - Thread-safe output
 *
 * Control via environment variable: MODSTAT_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 *
 * Example usage:
 *   MODSTAT_DEBUG("Fitting " << moderator << " x " << outcome);
 *   MODSTAT_TIMING_START();
 *   // ... do work ...
 *   MODSTAT_TIMING_END("Batch loop");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Initialize tracing system
	 *
	 * Reads MODSTAT_LOG_LEVEL environment variable
	 */
	static void Initialize();

	/**
	 * @brief Set global log level
	 *
	 * @param level Minimum level to output
	 */
	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	/**
	 * @brief Check if a message at given level should be logged
	 */
	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Log a message with location information
	 *
	 * @param level Message level
	 * @param file Source file name
	 * @param line Source line number
	 * @param message Message content
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	/**
	 * @brief Log a message without location information
	 */
	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @param name One of trace, debug, info, warn, error, none
	 * @param fallback Level returned for unrecognized names
	 */
	static LogLevel ParseLevel(const std::string &name, LogLevel fallback);

	/**
	 * @brief Get timestamp string for the current time
	 */
	static std::string GetTimestamp();

	/**
	 * @brief Format a point in time as "YYYY-mm-dd HH:MM:SS.mmm" (local time)
	 */
	static std::string FormatTime(std::chrono::system_clock::time_point time);

	/**
	 * @brief Start a timed operation
	 *
	 * @return Opaque handle for timing
	 */
	static uint64_t TimingStart();

	/**
	 * @brief End a timed operation and log duration at debug level
	 *
	 * @param handle Handle from TimingStart()
	 * @param operation_name Human-readable operation name
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static std::atomic<LogLevel> current_level_;
	static std::atomic<bool> initialized_;

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define MODSTAT_LOG_AT(level, msg)                                                                                     \
	do {                                                                                                               \
		if (modstat::utils::Tracer::ShouldLog(level)) {                                                                \
			std::ostringstream modstat_log_oss;                                                                        \
			modstat_log_oss << msg;                                                                                    \
			modstat::utils::Tracer::Log(level, __FILE__, __LINE__, modstat_log_oss.str());                             \
		}                                                                                                              \
	} while (0)

/**
 * @brief Trace-level logging with stream syntax
 *
 * Usage: MODSTAT_TRACE(message << stream << contents)
 */
#define MODSTAT_TRACE(msg) MODSTAT_LOG_AT(modstat::utils::LogLevel::TRACE, msg)

#define MODSTAT_DEBUG(msg) MODSTAT_LOG_AT(modstat::utils::LogLevel::DBG, msg)

#define MODSTAT_INFO(msg) MODSTAT_LOG_AT(modstat::utils::LogLevel::INFO, msg)

#define MODSTAT_WARN(msg) MODSTAT_LOG_AT(modstat::utils::LogLevel::WARN, msg)

#define MODSTAT_ERROR(msg) MODSTAT_LOG_AT(modstat::utils::LogLevel::ERR, msg)

/**
 * @brief Macros for timing operations
 *
 * Usage:
 *   MODSTAT_TIMING_START();
 *   // ... do work ...
 *   MODSTAT_TIMING_END("Operation name");
 */
#define MODSTAT_TIMING_START() uint64_t modstat_timing_handle = modstat::utils::Tracer::TimingStart()

#define MODSTAT_TIMING_END(operation_name) modstat::utils::Tracer::TimingEnd(modstat_timing_handle, operation_name)

} // namespace utils
} // namespace modstat
