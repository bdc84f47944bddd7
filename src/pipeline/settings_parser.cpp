#include "modstat/pipeline/settings_parser.hpp"
#include "modstat/core/errors.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace modstat {
namespace pipeline {

using nlohmann::json;

static std::string JoinKeys(const std::vector<std::string> &keys) {
	std::string out;
	for (size_t i = 0; i < keys.size(); i++) {
		if (i > 0) {
			out += ", ";
		}
		out += keys[i];
	}
	return out;
}

static void CheckObject(const json &node, const std::string &path, const std::vector<std::string> &valid_keys) {
	if (!node.is_object()) {
		throw ConfigurationError("'" + path + "' must be an object");
	}
	const std::set<std::string> valid(valid_keys.begin(), valid_keys.end());
	for (auto it = node.begin(); it != node.end(); ++it) {
		if (valid.count(it.key()) == 0) {
			throw ConfigurationError("unknown setting '" + path + "." + it.key() +
			                         "' (valid keys: " + JoinKeys(valid_keys) + ")");
		}
	}
}

static bool ReadBool(const json &node, const std::string &key, bool fallback) {
	if (!node.contains(key)) {
		return fallback;
	}
	const json &value = node.at(key);
	if (!value.is_boolean()) {
		throw ConfigurationError("'" + key + "' must be a boolean");
	}
	return value.get<bool>();
}

static double ReadNumber(const json &node, const std::string &key, double fallback) {
	if (!node.contains(key)) {
		return fallback;
	}
	const json &value = node.at(key);
	if (!value.is_number()) {
		throw ConfigurationError("'" + key + "' must be a number");
	}
	return value.get<double>();
}

static uint64_t ReadCount(const json &node, const std::string &key, uint64_t fallback) {
	if (!node.contains(key)) {
		return fallback;
	}
	const json &value = node.at(key);
	if (value.is_number_unsigned()) {
		return value.get<uint64_t>();
	}
	if (value.is_number_integer()) {
		const int64_t signed_value = value.get<int64_t>();
		if (signed_value < 0) {
			throw ConfigurationError("'" + key + "' must not be negative");
		}
		return static_cast<uint64_t>(signed_value);
	}
	throw ConfigurationError("'" + key + "' must be a non-negative integer");
}

static std::string ReadString(const json &node, const std::string &key) {
	if (!node.contains(key)) {
		throw ConfigurationError("'" + key + "' is required");
	}
	const json &value = node.at(key);
	if (!value.is_string()) {
		throw ConfigurationError("'" + key + "' must be a string");
	}
	return value.get<std::string>();
}

static std::vector<std::string> ReadStringList(const json &node, const std::string &key, bool required) {
	std::vector<std::string> out;
	if (!node.contains(key)) {
		if (required) {
			throw ConfigurationError("'" + key + "' is required");
		}
		return out;
	}
	const json &value = node.at(key);
	if (!value.is_array()) {
		throw ConfigurationError("'" + key + "' must be a list of column names");
	}
	for (const auto &item : value) {
		if (!item.is_string()) {
			throw ConfigurationError("'" + key + "' must contain only strings");
		}
		out.push_back(item.get<std::string>());
	}
	return out;
}

static FigureSelection ParseFigureSelection(const std::string &name) {
	if (name == FigureSelectionName(FigureSelection::SIGNIFICANT_FIRST)) {
		return FigureSelection::SIGNIFICANT_FIRST;
	}
	if (name == FigureSelectionName(FigureSelection::SIGNIFICANT_ONLY)) {
		return FigureSelection::SIGNIFICANT_ONLY;
	}
	throw ConfigurationError("unknown figure_selection '" + name + "' (valid values: significant_first, significant_only)");
}

AnalysisSettings ParseAnalysisSettings(const json &document) {
	CheckObject(document, "settings",
	            {"variable_mapping", "data_processing", "fdr_alpha", "min_sample_size", "generate_plots", "max_plots",
	             "figure_selection"});

	AnalysisSettings settings;

	if (!document.contains("variable_mapping")) {
		throw ConfigurationError("'variable_mapping' is required");
	}
	const json &mapping = document.at("variable_mapping");
	CheckObject(mapping, "variable_mapping", {"moderators", "outcomes", "intervention"});
	settings.variable_mapping.moderators = ReadStringList(mapping, "moderators", true);
	settings.variable_mapping.outcomes = ReadStringList(mapping, "outcomes", true);
	settings.variable_mapping.intervention = ReadString(mapping, "intervention");

	if (document.contains("data_processing")) {
		const json &processing = document.at("data_processing");
		CheckObject(processing, "data_processing",
		            {"center_moderators", "center_outcomes", "ordinal_outcomes", "run_sensitivity", "seed"});
		auto &dp = settings.data_processing;
		dp.center_moderators = ReadBool(processing, "center_moderators", dp.center_moderators);
		dp.center_outcomes = ReadBool(processing, "center_outcomes", dp.center_outcomes);
		dp.ordinal_outcomes = ReadStringList(processing, "ordinal_outcomes", false);
		dp.run_sensitivity = ReadBool(processing, "run_sensitivity", dp.run_sensitivity);
		dp.seed = ReadCount(processing, "seed", dp.seed);
	}

	settings.fdr_alpha = ReadNumber(document, "fdr_alpha", settings.fdr_alpha);
	settings.min_sample_size = static_cast<size_t>(ReadCount(document, "min_sample_size", settings.min_sample_size));
	settings.generate_plots = ReadBool(document, "generate_plots", settings.generate_plots);
	settings.max_plots = static_cast<size_t>(ReadCount(document, "max_plots", settings.max_plots));
	if (document.contains("figure_selection")) {
		settings.figure_selection = ParseFigureSelection(ReadString(document, "figure_selection"));
	}

	settings.Validate();
	return settings;
}

json SettingsToJson(const AnalysisSettings &settings) {
	const auto &dp = settings.data_processing;
	json out;
	out["variable_mapping"] = {{"moderators", settings.variable_mapping.moderators},
	                           {"outcomes", settings.variable_mapping.outcomes},
	                           {"intervention", settings.variable_mapping.intervention}};
	out["data_processing"] = {{"center_moderators", dp.center_moderators},
	                          {"center_outcomes", dp.center_outcomes},
	                          {"ordinal_outcomes", dp.ordinal_outcomes},
	                          {"run_sensitivity", dp.run_sensitivity},
	                          {"seed", dp.seed}};
	out["fdr_alpha"] = settings.fdr_alpha;
	out["min_sample_size"] = settings.min_sample_size;
	out["generate_plots"] = settings.generate_plots;
	out["max_plots"] = settings.max_plots;
	out["figure_selection"] = FigureSelectionName(settings.figure_selection);
	return out;
}

} // namespace pipeline
} // namespace modstat
