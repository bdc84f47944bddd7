#pragma once

#include "modstat/pipeline/analysis_result.hpp"
#include "modstat/pipeline/analysis_settings.hpp"

#include <string>
#include <vector>

namespace modstat {
namespace pipeline {

/// Everything the batch loop accumulated for one job
struct AggregationInput {
	std::string job_id;
	size_t total_pairs = 0;

	/// Corrected results, in visiting order
	std::vector<InteractionResult> results;

	/// Per-pair notes in the order they were produced
	std::vector<std::string> pair_notes;

	std::vector<std::string> logs;
	std::vector<FigureArtifact> figures;

	Clock::time_point created_at;
	Clock::time_point completed_at;
};

/**
 * Builds the final AnalysisResult of a completed batch
 *
 * Pure and deterministic: no I/O, no clock reads, no logging.
 */
class ResultAggregator {
public:
	static AnalysisResult Aggregate(AggregationInput input, const AnalysisSettings &settings);

	/// Counts and significant pairs for a set of corrected results
	static AnalysisSummary Summarize(const std::vector<InteractionResult> &results, size_t total_pairs,
	                                 double fdr_alpha);

	/// Standard caveats: centering, correction method, test count, sensitivity
	static std::vector<std::string> StandardNotes(const AnalysisSettings &settings, size_t tested);
};

} // namespace pipeline
} // namespace modstat
