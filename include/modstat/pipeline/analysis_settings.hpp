#pragma once

#include "modstat/data/dataset.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace modstat {
namespace pipeline {

/// Roles of the dataset columns in the analysis
struct VariableMapping {
	std::vector<std::string> moderators;
	std::vector<std::string> outcomes;
	std::string intervention;
};

struct DataProcessingSettings {
	bool center_moderators = true;
	bool center_outcomes = false;

	/// Outcomes to re-fit with the ordinal model (subset of outcomes)
	std::vector<std::string> ordinal_outcomes;

	bool run_sensitivity = false;

	/// Seed for stochastic steps; recorded with every run
	uint64_t seed = 123;
};

/// Which pairs receive figures when more candidates than max_plots exist
enum class FigureSelection {
	/// Significant pairs in result order, then the rest by ascending p
	SIGNIFICANT_FIRST,
	/// Significant pairs only
	SIGNIFICANT_ONLY
};

const char *FigureSelectionName(FigureSelection selection);

/**
 * Complete configuration of one analysis job
 */
struct AnalysisSettings {
	VariableMapping variable_mapping;
	DataProcessingSettings data_processing;

	/// FDR level for the Benjamini-Hochberg correction, in (0, 0.5]
	double fdr_alpha = 0.05;

	/// Pairs with fewer complete rows are skipped
	size_t min_sample_size = 30;

	bool generate_plots = true;

	/// Max number of visualized pairs
	size_t max_plots = 20;

	FigureSelection figure_selection = FigureSelection::SIGNIFICANT_FIRST;

	/**
	 * Check the settings on their own (non-empty, disjoint roles, ranges)
	 *
	 * @throws ConfigurationError describing the first violation
	 */
	void Validate() const;

	/**
	 * Validate() plus checks against the dataset: every mapped column exists
	 * and the intervention column is numeric
	 *
	 * @throws ConfigurationError describing the first violation
	 */
	void ValidateAgainst(const data::Dataset &dataset) const;

	/// Number of (moderator, outcome) pairs the job will visit
	size_t PairCount() const {
		return variable_mapping.moderators.size() * variable_mapping.outcomes.size();
	}

	bool IsOrdinalOutcome(const std::string &outcome) const;
};

} // namespace pipeline
} // namespace modstat
