#pragma once

#include "modstat/data/dataset.hpp"
#include "modstat/pipeline/analysis_result.hpp"
#include "modstat/pipeline/job.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace modstat {
namespace pipeline {

/**
 * Thread-safe status store keyed by job id
 *
 * Holds one Job record, its dataset and (once completed) its AnalysisResult.
 * All state transitions happen under one mutex; readers get value
 * snapshots. Transitions are monotonic: a terminal job never changes again.
 *
 * Unknown ids raise JobNotFoundError; transitions the current state does not
 * allow raise JobStateError unless documented as a no-op.
 */
class JobRegistry {
public:
	/**
	 * Register a new PENDING job
	 *
	 * @throws JobStateError if the id is already registered
	 * @throws std::invalid_argument for an empty id or null dataset
	 */
	Job Register(const std::string &job_id, std::shared_ptr<const data::Dataset> dataset);

	bool Contains(const std::string &job_id) const;

	Job Snapshot(const std::string &job_id) const;

	std::vector<Job> List() const;

	std::shared_ptr<const data::Dataset> GetDataset(const std::string &job_id) const;

	/**
	 * Reserve the job for one execution
	 *
	 * @return Snapshot of the claimed job
	 * @throws JobStateError if the job was already claimed, is running or is
	 *         terminal
	 */
	Job Claim(const std::string &job_id);

	/// Undo a claim that never started executing (PENDING jobs only)
	void ReleaseClaim(const std::string &job_id);

	/// PENDING -> RUNNING. Returns false if the job was cancelled meanwhile.
	bool MarkRunning(const std::string &job_id, const std::string &message);

	/**
	 * Update progress of a RUNNING job; progress never decreases
	 *
	 * Ignored for jobs that are no longer RUNNING or have a pending
	 * cancellation request, which freezes progress at the request.
	 */
	void UpdateProgress(const std::string &job_id, double progress, const std::string &message);

	/// RUNNING -> COMPLETED with progress 1.0; stores the result
	void Complete(const std::string &job_id, AnalysisResult result);

	/// PENDING/RUNNING -> FAILED; no-op for terminal jobs
	void Fail(const std::string &job_id, const std::string &error_message);

	/**
	 * Request cancellation
	 *
	 * PENDING jobs become CANCELLED immediately. RUNNING jobs get a flag
	 * observed at the next pair boundary. Terminal jobs are left unchanged.
	 *
	 * @return Snapshot after the request
	 */
	Job RequestCancel(const std::string &job_id);

	bool IsCancelRequested(const std::string &job_id) const;

	/// RUNNING -> CANCELLED, keeping the last progress value
	void MarkCancelled(const std::string &job_id, const std::string &message);

	/// @throws JobStateError unless the job is COMPLETED
	AnalysisResult Result(const std::string &job_id) const;

	/**
	 * Remove terminal jobs whose last update is older than max_age
	 *
	 * @param keep Ids that stay registered regardless of age
	 * @return Number of removed jobs
	 */
	size_t PurgeOlderThan(std::chrono::seconds max_age, Clock::time_point now = Clock::now(),
	                      const std::unordered_set<std::string> &keep = {});

private:
	struct Record {
		Job job;
		std::shared_ptr<const data::Dataset> dataset;
		bool claimed = false;
		bool cancel_requested = false;
		std::unique_ptr<AnalysisResult> result;
	};

	Record &Find(const std::string &job_id);
	const Record &Find(const std::string &job_id) const;

	static void Touch(Record &record, const std::string &message);

	mutable std::mutex mutex_;
	std::unordered_map<std::string, Record> records_;
};

} // namespace pipeline
} // namespace modstat
