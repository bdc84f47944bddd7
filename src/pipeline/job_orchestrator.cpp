#include "modstat/pipeline/job_orchestrator.hpp"
#include "modstat/core/errors.hpp"
#include "modstat/inference/multiple_comparison.hpp"
#include "modstat/pipeline/figure_registry.hpp"
#include "modstat/pipeline/regression_engine.hpp"
#include "modstat/pipeline/result_aggregator.hpp"
#include "modstat/utils/tracing.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unordered_set>

namespace modstat {
namespace pipeline {

JobOrchestrator::JobOrchestrator() : sensitivity_(std::make_unique<OrdinalSensitivityChecker>()) {
}

JobOrchestrator::JobOrchestrator(std::unique_ptr<ISensitivityChecker> sensitivity)
    : sensitivity_(std::move(sensitivity)) {
}

JobOrchestrator::~JobOrchestrator() {
	std::unordered_map<std::string, Worker> workers;
	{
		std::lock_guard<std::mutex> lock(workers_mutex_);
		workers.swap(workers_);
	}
	for (auto &kv : workers) {
		if (registry_.Contains(kv.first)) {
			registry_.RequestCancel(kv.first);
		}
		if (kv.second.thread.joinable()) {
			kv.second.thread.join();
		}
	}
}

void JobOrchestrator::SetObserver(JobObserver observer) {
	observer_ = std::move(observer);
}

Job JobOrchestrator::RegisterJob(const std::string &job_id, std::shared_ptr<const data::Dataset> dataset) {
	Job job = registry_.Register(job_id, std::move(dataset));
	MODSTAT_INFO("registered job '" << job_id << "'");
	return job;
}

Job JobOrchestrator::Prepare(const std::string &job_id, const AnalysisSettings &settings) {
	auto dataset = registry_.GetDataset(job_id);
	settings.ValidateAgainst(*dataset);
	return registry_.Claim(job_id);
}

Job JobOrchestrator::Submit(const std::string &job_id, const AnalysisSettings &settings) {
	Job job = Prepare(job_id, settings);

	auto finished = std::make_shared<std::promise<void>>();
	Worker worker;
	worker.done = finished->get_future().share();
	{
		// Registered before the worker can finish; PurgeOlderThan keeps jobs with an unfinished worker
		std::lock_guard<std::mutex> lock(workers_mutex_);
		try {
			worker.thread = std::thread([this, job_id, settings, finished]() {
				Execute(job_id, settings);
				finished->set_value();
			});
		} catch (const std::system_error &) {
			registry_.ReleaseClaim(job_id);
			throw;
		}
		workers_[job_id] = std::move(worker);
	}
	MODSTAT_INFO("submitted job '" << job_id << "' (" << settings.PairCount() << " pairs)");
	return job;
}

Job JobOrchestrator::Run(const std::string &job_id, const AnalysisSettings &settings) {
	Prepare(job_id, settings);
	Execute(job_id, settings);
	return registry_.Snapshot(job_id);
}

Job JobOrchestrator::Status(const std::string &job_id) const {
	return registry_.Snapshot(job_id);
}

std::vector<Job> JobOrchestrator::ListJobs() const {
	return registry_.List();
}

Job JobOrchestrator::Cancel(const std::string &job_id) {
	Job job = registry_.RequestCancel(job_id);
	MODSTAT_INFO("cancel requested for job '" << job_id << "' (" << JobStatusName(job.status) << ")");
	return job;
}

AnalysisResult JobOrchestrator::Result(const std::string &job_id) const {
	return registry_.Result(job_id);
}

std::vector<FigureArtifact> JobOrchestrator::ListFigures(const std::string &job_id) const {
	return registry_.Result(job_id).figures;
}

FigureArtifact JobOrchestrator::FetchFigure(const std::string &job_id, const std::string &name) const {
	for (const auto &figure : ListFigures(job_id)) {
		if (figure.name == name) {
			return figure;
		}
	}
	throw std::out_of_range("job '" + job_id + "' has no figure named '" + name + "'");
}

Job JobOrchestrator::Wait(const std::string &job_id) {
	std::shared_future<void> done;
	{
		std::lock_guard<std::mutex> lock(workers_mutex_);
		auto it = workers_.find(job_id);
		if (it != workers_.end()) {
			done = it->second.done;
		}
	}
	if (done.valid()) {
		done.wait();
	}
	return registry_.Snapshot(job_id);
}

size_t JobOrchestrator::PurgeOlderThan(std::chrono::seconds max_age) {
	size_t removed = 0;
	std::vector<std::thread> finished;
	{
		std::lock_guard<std::mutex> lock(workers_mutex_);

		// Jobs stay registered until their worker has returned
		std::unordered_set<std::string> active;
		for (const auto &kv : workers_) {
			if (kv.second.done.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
				active.insert(kv.first);
			}
		}
		removed = registry_.PurgeOlderThan(max_age, Clock::now(), active);

		for (auto it = workers_.begin(); it != workers_.end();) {
			if (!registry_.Contains(it->first)) {
				finished.push_back(std::move(it->second.thread));
				it = workers_.erase(it);
			} else {
				++it;
			}
		}
	}
	for (auto &thread : finished) {
		if (thread.joinable()) {
			thread.join();
		}
	}

	if (removed > 0) {
		MODSTAT_INFO("purged " << removed << " finished jobs");
	}
	return removed;
}

void JobOrchestrator::Notify(const std::string &job_id) const {
	if (observer_) {
		observer_(registry_.Snapshot(job_id));
	}
}

void JobOrchestrator::Execute(const std::string &job_id, const AnalysisSettings &settings) {
	try {
		if (!registry_.MarkRunning(job_id, "starting analysis")) {
			MODSTAT_INFO("job '" << job_id << "' was cancelled before it started");
			return;
		}
		Notify(job_id);

		auto dataset = registry_.GetDataset(job_id);
		ExecuteBatch(job_id, settings, *dataset);
	} catch (const JobNotFoundError &) {
		MODSTAT_WARN("job '" << job_id << "' was purged before its run finished reporting");
	} catch (const std::exception &e) {
		MODSTAT_ERROR("job '" << job_id << "' failed: " << e.what());
		registry_.Fail(job_id, e.what());
	}
}

void JobOrchestrator::ExecuteBatch(const std::string &job_id, const AnalysisSettings &settings,
                                   const data::Dataset &dataset) {
	MODSTAT_TIMING_START();

	const auto &mapping = settings.variable_mapping;
	const size_t total = settings.PairCount();

	AggregationInput input;
	input.job_id = job_id;
	input.total_pairs = total;
	input.created_at = registry_.Snapshot(job_id).created_at;

	auto log = [&](const std::string &line) {
		input.logs.push_back("[" + utils::Tracer::GetTimestamp() + "] " + line);
		MODSTAT_INFO("[" << job_id << "] " << line);
	};

	log("analysis started: " + std::to_string(mapping.moderators.size()) + " moderators x " +
	    std::to_string(mapping.outcomes.size()) + " outcomes = " + std::to_string(total) +
	    " pairs, seed=" + std::to_string(settings.data_processing.seed));

	if (!dataset.IsBinaryCoded(mapping.intervention)) {
		input.pair_notes.push_back("intervention '" + mapping.intervention +
		                           "' is not coded 0/1; its values are used as-is");
	}

	size_t done = 0;
	for (const auto &moderator : mapping.moderators) {
		for (const auto &outcome : mapping.outcomes) {
			if (registry_.IsCancelRequested(job_id)) {
				registry_.MarkCancelled(job_id, "cancelled after " + std::to_string(done) + " of " +
				                                    std::to_string(total) + " pairs");
				log("analysis cancelled after " + std::to_string(done) + " of " + std::to_string(total) + " pairs");
				Notify(job_id);
				return;
			}

			const std::string label = moderator + " x " + outcome;
			registry_.UpdateProgress(job_id, static_cast<double>(done) / static_cast<double>(total),
			                         "analysing " + label + " (" + std::to_string(done + 1) + "/" +
			                             std::to_string(total) + ")");

			PairFit fit = RegressionEngine::FitPair(dataset, moderator, outcome, settings);
			if (fit.Fitted()) {
				std::ostringstream line;
				line << "completed: " << label << " (n=" << fit.result.n_used << ", p=" << std::fixed
				     << std::setprecision(4) << fit.result.p_interaction << ")";
				log(line.str());

				if (sensitivity_ && sensitivity_->AppliesTo(outcome, settings)) {
					const auto check = sensitivity_->Check(fit.model, fit.result, settings.fdr_alpha);
					input.pair_notes.push_back(check.note);
					log(check.note);
				}
				input.results.push_back(std::move(fit.result));
			} else {
				input.pair_notes.push_back(fit.note);
				log("skipped: " + fit.note);
			}

			// Progress reaches 1.0 only with the transition to COMPLETED
			done++;
			if (done < total) {
				registry_.UpdateProgress(job_id, static_cast<double>(done) / static_cast<double>(total),
				                         "finished " + label + " (" + std::to_string(done) + "/" +
				                             std::to_string(total) + ")");
			}
			Notify(job_id);
		}
	}

	// A request that arrived during the last pair is still honoured
	if (registry_.IsCancelRequested(job_id)) {
		registry_.MarkCancelled(job_id, "cancelled after " + std::to_string(done) + " of " + std::to_string(total) +
		                                    " pairs");
		log("analysis cancelled after all pairs were fitted");
		Notify(job_id);
		return;
	}

	if (!input.results.empty()) {
		std::vector<double> p_values;
		p_values.reserve(input.results.size());
		for (const auto &r : input.results) {
			p_values.push_back(r.p_interaction);
		}
		const auto correction = inference::BenjaminiHochberg(p_values, settings.fdr_alpha);
		for (size_t i = 0; i < input.results.size(); i++) {
			input.results[i].q_interaction = correction.q_values[i];
		}
		log("Benjamini-Hochberg correction over " + std::to_string(p_values.size()) + " tests: " +
		    std::to_string(correction.n_rejected) + " rejected");
	}

	const auto figures = FigureRegistry::Build(input.results, settings, input.pair_notes);
	input.figures = figures.Artifacts();
	if (settings.generate_plots) {
		log("registered " + std::to_string(figures.Size()) + " figures");
	}

	log("analysis completed: " + std::to_string(input.results.size()) + " of " + std::to_string(total) +
	    " pairs tested");
	input.completed_at = Clock::now();

	registry_.Complete(job_id, ResultAggregator::Aggregate(std::move(input), settings));
	Notify(job_id);

	MODSTAT_TIMING_END("job " + job_id);
}

} // namespace pipeline
} // namespace modstat
