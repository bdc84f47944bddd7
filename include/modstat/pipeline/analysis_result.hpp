#pragma once

#include "modstat/pipeline/figure_registry.hpp"
#include "modstat/pipeline/interaction_result.hpp"
#include "modstat/pipeline/job.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace modstat {
namespace pipeline {

/// Identity and headline statistics of a pair declared significant
struct SignificantPair {
	std::string moderator;
	std::string outcome;
	double beta_interaction = 0.0;
	double p_interaction = 1.0;
	double q_interaction = 1.0;
	double partial_eta2 = 0.0;
};

struct AnalysisSummary {
	/// Pairs visited (moderators x outcomes)
	size_t total_pairs = 0;

	/// Pairs with an InteractionResult
	size_t tested = 0;

	/// Tested pairs with q_interaction < fdr_alpha
	size_t significant = 0;

	/// total_pairs - tested
	size_t skipped = 0;

	double fdr_alpha = 0.05;

	std::vector<SignificantPair> significant_pairs;
};

/// Final report of a job
struct AnalysisResult {
	std::string job_id;
	JobStatus status = JobStatus::COMPLETED;

	/// One entry per tested pair, in visiting order
	std::vector<InteractionResult> results;

	AnalysisSummary summary;

	/// Human-readable caveats (skipped pairs, corrections, sensitivity checks)
	std::vector<std::string> notes;

	/// Append-only trace of the run
	std::vector<std::string> logs;

	std::vector<FigureArtifact> figures;

	std::string error_message;

	uint64_t seed = 0;

	Clock::time_point created_at;
	Clock::time_point completed_at;

	std::vector<std::string> FigureNames() const {
		std::vector<std::string> names;
		names.reserve(figures.size());
		for (const auto &figure : figures) {
			names.push_back(figure.name);
		}
		return names;
	}
};

} // namespace pipeline
} // namespace modstat
