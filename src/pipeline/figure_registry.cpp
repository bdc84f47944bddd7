#include "modstat/pipeline/figure_registry.hpp"
#include "modstat/utils/tracing.hpp"

#include <algorithm>
#include <cctype>

namespace modstat {
namespace pipeline {

const char *FigureKindName(FigureKind kind) {
	switch (kind) {
	case FigureKind::SIMPLE_SLOPES:
		return "simple_slopes";
	case FigureKind::BAR_CHART:
		return "bar_chart";
	default:
		return "unknown";
	}
}

static std::string Sanitize(const std::string &text) {
	std::string out = text;
	for (auto &c : out) {
		if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
			c = '_';
		}
	}
	return out;
}

std::string FigureRegistry::BaseName(FigureKind kind, const std::string &moderator, const std::string &outcome) {
	return Sanitize(moderator) + "_" + Sanitize(outcome) + "_" + FigureKindName(kind) + ".png";
}

std::string FigureRegistry::Add(FigureKind kind, const InteractionResult &result, size_t result_index) {
	const std::string base = BaseName(kind, result.moderator, result.outcome);
	std::string name = base;
	const std::string stem = base.substr(0, base.size() - 4);
	for (size_t suffix = 2; by_name_.count(name) > 0; suffix++) {
		name = stem + "-" + std::to_string(suffix) + ".png";
	}

	FigureArtifact artifact;
	artifact.name = name;
	artifact.kind = kind;
	artifact.moderator = result.moderator;
	artifact.outcome = result.outcome;
	artifact.result_index = result_index;

	by_name_.emplace(name, artifacts_.size());
	artifacts_.push_back(std::move(artifact));
	return name;
}

FigureRegistry FigureRegistry::Build(const std::vector<InteractionResult> &results, const AnalysisSettings &settings,
                                     std::vector<std::string> &notes) {
	FigureRegistry registry;
	if (!settings.generate_plots || results.empty()) {
		return registry;
	}

	std::vector<size_t> significant;
	std::vector<size_t> rest;
	for (size_t i = 0; i < results.size(); i++) {
		if (results[i].q_interaction < settings.fdr_alpha) {
			significant.push_back(i);
		} else {
			rest.push_back(i);
		}
	}

	std::vector<size_t> candidates = significant;
	if (settings.figure_selection == FigureSelection::SIGNIFICANT_FIRST) {
		std::stable_sort(rest.begin(), rest.end(), [&](size_t a, size_t b) {
			return results[a].p_interaction < results[b].p_interaction;
		});
		candidates.insert(candidates.end(), rest.begin(), rest.end());
	}

	if (candidates.size() > settings.max_plots) {
		notes.push_back("figures truncated: " + std::to_string(settings.max_plots) + " of " +
		                std::to_string(candidates.size()) + " candidate pairs visualized (max_plots=" +
		                std::to_string(settings.max_plots) + ")");
		candidates.resize(settings.max_plots);
	}

	for (size_t idx : candidates) {
		registry.Add(FigureKind::SIMPLE_SLOPES, results[idx], idx);
		registry.Add(FigureKind::BAR_CHART, results[idx], idx);
	}

	MODSTAT_DEBUG("registered " << registry.Size() << " figures for " << candidates.size() << " pairs");
	return registry;
}

std::vector<std::string> FigureRegistry::Names() const {
	std::vector<std::string> names;
	names.reserve(artifacts_.size());
	for (const auto &artifact : artifacts_) {
		names.push_back(artifact.name);
	}
	return names;
}

const FigureArtifact *FigureRegistry::Find(const std::string &name) const {
	auto it = by_name_.find(name);
	if (it == by_name_.end()) {
		return nullptr;
	}
	return &artifacts_[it->second];
}

} // namespace pipeline
} // namespace modstat
