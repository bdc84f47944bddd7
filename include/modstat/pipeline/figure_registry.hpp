#pragma once

#include "modstat/pipeline/analysis_settings.hpp"
#include "modstat/pipeline/interaction_result.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace modstat {
namespace pipeline {

enum class FigureKind { SIMPLE_SLOPES, BAR_CHART };

const char *FigureKindName(FigureKind kind);

/// Identity of one figure; rendering happens outside the library
struct FigureArtifact {
	std::string name;
	FigureKind kind = FigureKind::SIMPLE_SLOPES;
	std::string moderator;
	std::string outcome;

	/// Position of the source pair in AnalysisResult::results
	size_t result_index = 0;
};

/**
 * Deterministic, capped set of named figures for a finished batch
 *
 * Every selected pair yields a simple-slopes plot and a bar chart named
 * "<moderator>_<outcome>_<kind>.png". Characters outside [A-Za-z0-9-] are
 * replaced by '_' and a name already taken gets a "-2", "-3", ... suffix.
 */
class FigureRegistry {
public:
	/**
	 * Select pairs and register their figures
	 *
	 * Significance is q_interaction < settings.fdr_alpha. At most
	 * settings.max_plots pairs are kept; when more candidates exist a note
	 * explaining the truncation is appended to notes.
	 *
	 * @param results Corrected results of the batch
	 * @param settings generate_plots, max_plots, figure_selection, fdr_alpha
	 * @param notes Receives the truncation note, if any
	 */
	static FigureRegistry Build(const std::vector<InteractionResult> &results, const AnalysisSettings &settings,
	                            std::vector<std::string> &notes);

	const std::vector<FigureArtifact> &Artifacts() const {
		return artifacts_;
	}

	std::vector<std::string> Names() const;

	size_t Size() const {
		return artifacts_.size();
	}

	/// Artifact by name, or nullptr
	const FigureArtifact *Find(const std::string &name) const;

	/// Register one artifact, resolving name collisions; returns the final name
	std::string Add(FigureKind kind, const InteractionResult &result, size_t result_index);

	/// "<moderator>_<outcome>_<kind>.png" with unsafe characters replaced
	static std::string BaseName(FigureKind kind, const std::string &moderator, const std::string &outcome);

private:
	std::vector<FigureArtifact> artifacts_;
	std::unordered_map<std::string, size_t> by_name_;
};

} // namespace pipeline
} // namespace modstat
