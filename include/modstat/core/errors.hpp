#pragma once

#include <stdexcept>
#include <string>

namespace modstat {

/**
 * Rejected analysis configuration (bad variable mapping, overlapping roles,
 * out-of-range settings). Raised synchronously before any job starts.
 */
class ConfigurationError : public std::invalid_argument {
public:
	explicit ConfigurationError(const std::string &message) : std::invalid_argument(message) {
	}
};

/// Lookup of a job id that the registry does not know
class JobNotFoundError : public std::out_of_range {
public:
	explicit JobNotFoundError(const std::string &job_id)
	    : std::out_of_range("job not found: '" + job_id + "'"), job_id_(job_id) {
	}

	const std::string &job_id() const {
		return job_id_;
	}

private:
	std::string job_id_;
};

/// A lifecycle request that the job's current state does not allow
class JobStateError : public std::logic_error {
public:
	explicit JobStateError(const std::string &message) : std::logic_error(message) {
	}
};

} // namespace modstat
