#pragma once

#include "modstat/data/dataset.hpp"
#include "modstat/pipeline/analysis_result.hpp"
#include "modstat/pipeline/analysis_settings.hpp"
#include "modstat/pipeline/job_registry.hpp"
#include "modstat/pipeline/sensitivity_checker.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace modstat {
namespace pipeline {

/**
 * JobOrchestrator: lifecycle and batch loop of analysis jobs
 *
 * A job is registered with its dataset (PENDING), then submitted with its
 * settings. Submit validates synchronously and runs the batch on a worker
 * thread owned by the orchestrator; Run does the same on the calling thread.
 *
 * Batch loop, per (moderator, outcome) pair in mapping order:
 *   cancellation check -> RegressionEngine -> SimpleSlopeAnalyzer ->
 *   optional sensitivity check -> progress update
 * then, once: Benjamini-Hochberg correction -> FigureRegistry ->
 * ResultAggregator -> COMPLETED.
 *
 * Cancellation is cooperative and observed between pairs. A cancelled job
 * keeps the progress recorded when cancellation was requested and has no
 * result. Any exception escaping the batch moves the job to FAILED.
 *
 * Thread-safe. Destroying the orchestrator cancels running jobs and joins
 * their workers.
 */
class JobOrchestrator {
public:
	/// Called on the worker thread after every progress update
	using JobObserver = std::function<void(const Job &)>;

	/// Uses OrdinalSensitivityChecker for sensitivity re-fits
	JobOrchestrator();

	/// @param sensitivity Strategy for sensitivity re-fits (may be null to disable them)
	explicit JobOrchestrator(std::unique_ptr<ISensitivityChecker> sensitivity);

	~JobOrchestrator();

	JobOrchestrator(const JobOrchestrator &) = delete;
	JobOrchestrator &operator=(const JobOrchestrator &) = delete;

	/// Must be set before jobs are submitted
	void SetObserver(JobObserver observer);

	/**
	 * Register a dataset under a new job id (PENDING)
	 *
	 * @throws JobStateError if the id is taken
	 */
	Job RegisterJob(const std::string &job_id, std::shared_ptr<const data::Dataset> dataset);

	/**
	 * Validate settings and start the job asynchronously
	 *
	 * @return Snapshot taken when the job was claimed (still PENDING)
	 * @throws JobNotFoundError for an unknown id
	 * @throws ConfigurationError for invalid settings
	 * @throws JobStateError if the job is already running or finished
	 */
	Job Submit(const std::string &job_id, const AnalysisSettings &settings);

	/**
	 * Validate settings and execute the job on the calling thread
	 *
	 * @return Final snapshot
	 * @throws as Submit
	 */
	Job Run(const std::string &job_id, const AnalysisSettings &settings);

	/// @throws JobNotFoundError for an unknown id
	Job Status(const std::string &job_id) const;

	std::vector<Job> ListJobs() const;

	/**
	 * Request cancellation; a no-op for jobs already in a terminal state
	 *
	 * @throws JobNotFoundError for an unknown id
	 */
	Job Cancel(const std::string &job_id);

	/// @throws JobStateError unless the job is COMPLETED
	AnalysisResult Result(const std::string &job_id) const;

	/// @throws JobStateError unless the job is COMPLETED
	std::vector<FigureArtifact> ListFigures(const std::string &job_id) const;

	/**
	 * Look up one figure of a completed job by name
	 *
	 * @throws std::out_of_range if the job has no figure with that name
	 */
	FigureArtifact FetchFigure(const std::string &job_id, const std::string &name) const;

	/// Block until the job's worker (if any) has finished; returns the final snapshot
	Job Wait(const std::string &job_id);

	/**
	 * Forget terminal jobs last updated more than max_age ago
	 *
	 * Jobs whose worker thread has not returned yet are kept.
	 *
	 * @return Number of removed jobs
	 */
	size_t PurgeOlderThan(std::chrono::seconds max_age);

private:
	struct Worker {
		std::thread thread;
		std::shared_future<void> done;
	};

	/// Validate and reserve the job; returns the claimed snapshot
	Job Prepare(const std::string &job_id, const AnalysisSettings &settings);

	void Execute(const std::string &job_id, const AnalysisSettings &settings);

	void ExecuteBatch(const std::string &job_id, const AnalysisSettings &settings, const data::Dataset &dataset);

	void Notify(const std::string &job_id) const;

	JobRegistry registry_;
	std::unique_ptr<ISensitivityChecker> sensitivity_;
	JobObserver observer_;

	std::mutex workers_mutex_;
	std::unordered_map<std::string, Worker> workers_;
};

} // namespace pipeline
} // namespace modstat
