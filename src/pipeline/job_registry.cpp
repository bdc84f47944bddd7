#include "modstat/pipeline/job_registry.hpp"
#include "modstat/core/errors.hpp"
#include "modstat/utils/tracing.hpp"

#include <algorithm>
#include <stdexcept>

namespace modstat {
namespace pipeline {

const char *JobStatusName(JobStatus status) {
	switch (status) {
	case JobStatus::PENDING:
		return "pending";
	case JobStatus::RUNNING:
		return "running";
	case JobStatus::COMPLETED:
		return "completed";
	case JobStatus::FAILED:
		return "failed";
	case JobStatus::CANCELLED:
		return "cancelled";
	default:
		return "unknown";
	}
}

JobRegistry::Record &JobRegistry::Find(const std::string &job_id) {
	auto it = records_.find(job_id);
	if (it == records_.end()) {
		throw JobNotFoundError(job_id);
	}
	return it->second;
}

const JobRegistry::Record &JobRegistry::Find(const std::string &job_id) const {
	auto it = records_.find(job_id);
	if (it == records_.end()) {
		throw JobNotFoundError(job_id);
	}
	return it->second;
}

void JobRegistry::Touch(Record &record, const std::string &message) {
	record.job.updated_at = Clock::now();
	record.job.message = message;
}

Job JobRegistry::Register(const std::string &job_id, std::shared_ptr<const data::Dataset> dataset) {
	if (job_id.empty()) {
		throw std::invalid_argument("job id must not be empty");
	}
	if (!dataset) {
		throw std::invalid_argument("job '" + job_id + "' has no dataset");
	}

	std::lock_guard<std::mutex> lock(mutex_);
	if (records_.count(job_id) > 0) {
		throw JobStateError("job '" + job_id + "' is already registered");
	}

	Record record;
	record.job.job_id = job_id;
	record.job.status = JobStatus::PENDING;
	record.job.created_at = Clock::now();
	record.job.updated_at = record.job.created_at;
	record.job.message = "waiting for analysis settings";
	record.dataset = std::move(dataset);

	Job snapshot = record.job;
	records_.emplace(job_id, std::move(record));
	return snapshot;
}

bool JobRegistry::Contains(const std::string &job_id) const {
	std::lock_guard<std::mutex> lock(mutex_);
	return records_.count(job_id) > 0;
}

Job JobRegistry::Snapshot(const std::string &job_id) const {
	std::lock_guard<std::mutex> lock(mutex_);
	return Find(job_id).job;
}

std::vector<Job> JobRegistry::List() const {
	std::lock_guard<std::mutex> lock(mutex_);
	std::vector<Job> jobs;
	jobs.reserve(records_.size());
	for (const auto &kv : records_) {
		jobs.push_back(kv.second.job);
	}
	std::sort(jobs.begin(), jobs.end(), [](const Job &a, const Job &b) {
		return a.created_at < b.created_at || (a.created_at == b.created_at && a.job_id < b.job_id);
	});
	return jobs;
}

std::shared_ptr<const data::Dataset> JobRegistry::GetDataset(const std::string &job_id) const {
	std::lock_guard<std::mutex> lock(mutex_);
	return Find(job_id).dataset;
}

Job JobRegistry::Claim(const std::string &job_id) {
	std::lock_guard<std::mutex> lock(mutex_);
	Record &record = Find(job_id);
	if (record.job.status == JobStatus::RUNNING || record.claimed) {
		throw JobStateError("job '" + job_id + "' is already running");
	}
	if (IsTerminal(record.job.status)) {
		throw JobStateError("job '" + job_id + "' has already finished (" + JobStatusName(record.job.status) + ")");
	}
	record.claimed = true;
	return record.job;
}

void JobRegistry::ReleaseClaim(const std::string &job_id) {
	std::lock_guard<std::mutex> lock(mutex_);
	Record &record = Find(job_id);
	if (record.job.status == JobStatus::PENDING) {
		record.claimed = false;
	}
}

bool JobRegistry::MarkRunning(const std::string &job_id, const std::string &message) {
	std::lock_guard<std::mutex> lock(mutex_);
	Record &record = Find(job_id);
	if (record.job.status != JobStatus::PENDING) {
		return false;
	}
	record.job.status = JobStatus::RUNNING;
	record.job.progress = 0.0;
	Touch(record, message);
	return true;
}

void JobRegistry::UpdateProgress(const std::string &job_id, double progress, const std::string &message) {
	std::lock_guard<std::mutex> lock(mutex_);
	Record &record = Find(job_id);
	if (record.job.status != JobStatus::RUNNING || record.cancel_requested) {
		return;
	}
	progress = std::min(1.0, std::max(0.0, progress));
	record.job.progress = std::max(record.job.progress, progress);
	Touch(record, message);
}

void JobRegistry::Complete(const std::string &job_id, AnalysisResult result) {
	std::lock_guard<std::mutex> lock(mutex_);
	Record &record = Find(job_id);
	if (record.job.status != JobStatus::RUNNING) {
		throw JobStateError("job '" + job_id + "' cannot complete from state " + JobStatusName(record.job.status));
	}
	record.job.status = JobStatus::COMPLETED;
	record.job.progress = 1.0;
	Touch(record, "analysis completed");
	result.status = JobStatus::COMPLETED;
	record.result = std::make_unique<AnalysisResult>(std::move(result));
}

void JobRegistry::Fail(const std::string &job_id, const std::string &error_message) {
	std::lock_guard<std::mutex> lock(mutex_);
	Record &record = Find(job_id);
	if (IsTerminal(record.job.status)) {
		return;
	}
	record.job.status = JobStatus::FAILED;
	record.job.error_message = error_message;
	Touch(record, "analysis failed");
}

Job JobRegistry::RequestCancel(const std::string &job_id) {
	std::lock_guard<std::mutex> lock(mutex_);
	Record &record = Find(job_id);
	switch (record.job.status) {
	case JobStatus::PENDING:
		record.job.status = JobStatus::CANCELLED;
		Touch(record, "cancelled before start");
		break;
	case JobStatus::RUNNING:
		record.cancel_requested = true;
		Touch(record, "cancellation requested");
		break;
	default:
		break;
	}
	return record.job;
}

bool JobRegistry::IsCancelRequested(const std::string &job_id) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const Record &record = Find(job_id);
	return record.cancel_requested || record.job.status == JobStatus::CANCELLED;
}

void JobRegistry::MarkCancelled(const std::string &job_id, const std::string &message) {
	std::lock_guard<std::mutex> lock(mutex_);
	Record &record = Find(job_id);
	if (IsTerminal(record.job.status)) {
		return;
	}
	record.job.status = JobStatus::CANCELLED;
	Touch(record, message);
}

AnalysisResult JobRegistry::Result(const std::string &job_id) const {
	std::lock_guard<std::mutex> lock(mutex_);
	const Record &record = Find(job_id);
	if (record.job.status != JobStatus::COMPLETED || !record.result) {
		throw JobStateError("job '" + job_id + "' has no result (status " + JobStatusName(record.job.status) + ")");
	}
	return *record.result;
}

size_t JobRegistry::PurgeOlderThan(std::chrono::seconds max_age, Clock::time_point now,
                                   const std::unordered_set<std::string> &keep) {
	std::lock_guard<std::mutex> lock(mutex_);
	size_t removed = 0;
	for (auto it = records_.begin(); it != records_.end();) {
		const Job &job = it->second.job;
		if (IsTerminal(job.status) && now - job.updated_at > max_age && keep.count(job.job_id) == 0) {
			MODSTAT_DEBUG("purging job '" << job.job_id << "' (" << JobStatusName(job.status) << ")");
			it = records_.erase(it);
			removed++;
		} else {
			++it;
		}
	}
	return removed;
}

} // namespace pipeline
} // namespace modstat
