#include "modstat/pipeline/result_aggregator.hpp"

#include <iomanip>
#include <sstream>

namespace modstat {
namespace pipeline {

AnalysisSummary ResultAggregator::Summarize(const std::vector<InteractionResult> &results, size_t total_pairs,
                                            double fdr_alpha) {
	AnalysisSummary summary;
	summary.total_pairs = total_pairs;
	summary.tested = results.size();
	summary.skipped = total_pairs >= results.size() ? total_pairs - results.size() : 0;
	summary.fdr_alpha = fdr_alpha;

	for (const auto &r : results) {
		if (r.q_interaction < fdr_alpha) {
			SignificantPair pair;
			pair.moderator = r.moderator;
			pair.outcome = r.outcome;
			pair.beta_interaction = r.beta_interaction;
			pair.p_interaction = r.p_interaction;
			pair.q_interaction = r.q_interaction;
			pair.partial_eta2 = r.partial_eta2;
			summary.significant_pairs.push_back(std::move(pair));
		}
	}
	summary.significant = summary.significant_pairs.size();
	return summary;
}

std::vector<std::string> ResultAggregator::StandardNotes(const AnalysisSettings &settings, size_t tested) {
	std::vector<std::string> notes;
	if (settings.data_processing.center_moderators) {
		notes.emplace_back("moderators were mean-centered before fitting");
	}
	if (settings.data_processing.center_outcomes) {
		notes.emplace_back("outcomes were mean-centered before fitting");
	}

	std::ostringstream fdr;
	fdr << "multiple comparison correction: Benjamini-Hochberg (FDR " << std::fixed << std::setprecision(1)
	    << settings.fdr_alpha * 100.0 << "%)";
	notes.push_back(fdr.str());
	notes.push_back("number of tests performed: " + std::to_string(tested));

	if (settings.data_processing.run_sensitivity) {
		notes.emplace_back("sensitivity analysis: ordinal outcomes were also fitted with a proportional-odds model");
	}
	return notes;
}

AnalysisResult ResultAggregator::Aggregate(AggregationInput input, const AnalysisSettings &settings) {
	AnalysisResult out;
	out.job_id = std::move(input.job_id);
	out.status = JobStatus::COMPLETED;
	out.seed = settings.data_processing.seed;
	out.created_at = input.created_at;
	out.completed_at = input.completed_at;

	out.summary = Summarize(input.results, input.total_pairs, settings.fdr_alpha);

	out.notes = std::move(input.pair_notes);
	if (input.results.empty()) {
		out.notes.emplace_back("no pair produced an interaction result; multiplicity correction was not applied");
	}
	for (auto &note : StandardNotes(settings, input.results.size())) {
		out.notes.push_back(std::move(note));
	}

	out.results = std::move(input.results);
	out.logs = std::move(input.logs);
	out.figures = std::move(input.figures);
	return out;
}

} // namespace pipeline
} // namespace modstat
