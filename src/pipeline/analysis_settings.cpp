#include "modstat/pipeline/analysis_settings.hpp"
#include "modstat/core/errors.hpp"

#include <algorithm>
#include <set>

namespace modstat {
namespace pipeline {

const char *FigureSelectionName(FigureSelection selection) {
	switch (selection) {
	case FigureSelection::SIGNIFICANT_FIRST:
		return "significant_first";
	case FigureSelection::SIGNIFICANT_ONLY:
		return "significant_only";
	default:
		return "unknown";
	}
}

static void CheckRoleList(const std::vector<std::string> &names, const std::string &role) {
	if (names.empty()) {
		throw ConfigurationError("at least one " + role + " is required");
	}
	std::set<std::string> seen;
	for (const auto &name : names) {
		if (name.empty()) {
			throw ConfigurationError(role + " names must not be empty");
		}
		if (!seen.insert(name).second) {
			throw ConfigurationError(role + " '" + name + "' is listed twice");
		}
	}
}

void AnalysisSettings::Validate() const {
	const auto &mapping = variable_mapping;

	CheckRoleList(mapping.moderators, "moderator");
	CheckRoleList(mapping.outcomes, "outcome");
	if (mapping.intervention.empty()) {
		throw ConfigurationError("an intervention column is required");
	}

	for (const auto &moderator : mapping.moderators) {
		if (std::find(mapping.outcomes.begin(), mapping.outcomes.end(), moderator) != mapping.outcomes.end()) {
			throw ConfigurationError("column '" + moderator + "' cannot be both moderator and outcome");
		}
		if (moderator == mapping.intervention) {
			throw ConfigurationError("column '" + moderator + "' cannot be both moderator and intervention");
		}
	}
	for (const auto &outcome : mapping.outcomes) {
		if (outcome == mapping.intervention) {
			throw ConfigurationError("column '" + outcome + "' cannot be both outcome and intervention");
		}
	}

	for (const auto &ordinal : data_processing.ordinal_outcomes) {
		if (std::find(mapping.outcomes.begin(), mapping.outcomes.end(), ordinal) == mapping.outcomes.end()) {
			throw ConfigurationError("ordinal outcome '" + ordinal + "' is not one of the outcomes");
		}
	}

	if (!(fdr_alpha > 0.0 && fdr_alpha <= 0.5)) {
		throw ConfigurationError("fdr_alpha must be in (0, 0.5] (got " + std::to_string(fdr_alpha) + ")");
	}
	if (min_sample_size < 1) {
		throw ConfigurationError("min_sample_size must be at least 1");
	}
}

void AnalysisSettings::ValidateAgainst(const data::Dataset &dataset) const {
	Validate();

	auto require = [&](const std::string &name, const char *role) {
		if (!dataset.HasColumn(name)) {
			throw ConfigurationError(std::string(role) + " column '" + name + "' does not exist in the dataset");
		}
	};
	for (const auto &moderator : variable_mapping.moderators) {
		require(moderator, "moderator");
	}
	for (const auto &outcome : variable_mapping.outcomes) {
		require(outcome, "outcome");
	}
	require(variable_mapping.intervention, "intervention");

	const auto &intervention = dataset.GetColumn(variable_mapping.intervention);
	if (!intervention.HasNumericStorage()) {
		throw ConfigurationError("intervention column '" + intervention.Name() + "' must be numeric (inferred " +
		                         data::ColumnTypeName(intervention.Type()) + ")");
	}
}

bool AnalysisSettings::IsOrdinalOutcome(const std::string &outcome) const {
	const auto &ordinal = data_processing.ordinal_outcomes;
	return std::find(ordinal.begin(), ordinal.end(), outcome) != ordinal.end();
}

} // namespace pipeline
} // namespace modstat
