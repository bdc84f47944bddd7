#pragma once

#include <chrono>
#include <string>

namespace modstat {
namespace pipeline {

/**
 * Job lifecycle: PENDING -> RUNNING -> {COMPLETED | FAILED | CANCELLED}
 *
 * FAILED and CANCELLED are also reachable directly from PENDING.
 */
enum class JobStatus { PENDING, RUNNING, COMPLETED, FAILED, CANCELLED };

const char *JobStatusName(JobStatus status);

/// True for COMPLETED, FAILED and CANCELLED
inline bool IsTerminal(JobStatus status) {
	return status == JobStatus::COMPLETED || status == JobStatus::FAILED || status == JobStatus::CANCELLED;
}

using Clock = std::chrono::system_clock;

/// Snapshot of a job's externally visible state
struct Job {
	std::string job_id;
	JobStatus status = JobStatus::PENDING;

	/// completed pairs / total pairs, in [0, 1]
	double progress = 0.0;

	Clock::time_point created_at;
	Clock::time_point updated_at;

	/// Human-readable description of the current step
	std::string message;

	/// Set only when status is FAILED
	std::string error_message;
};

} // namespace pipeline
} // namespace modstat
