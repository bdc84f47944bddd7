#pragma once

#include "modstat/pipeline/analysis_settings.hpp"

#include <nlohmann/json.hpp>

namespace modstat {
namespace pipeline {

/**
 * Build AnalysisSettings from a settings document
 *
 * Recognized layout (every key except variable_mapping is optional and
 * falls back to the AnalysisSettings default):
 *
 *   {
 *     "variable_mapping": {"moderators": [...], "outcomes": [...], "intervention": "..."},
 *     "data_processing": {"center_moderators": true, "center_outcomes": false,
 *                         "ordinal_outcomes": [...], "run_sensitivity": false, "seed": 123},
 *     "fdr_alpha": 0.05, "min_sample_size": 30, "generate_plots": true,
 *     "max_plots": 20, "figure_selection": "significant_first"
 *   }
 *
 * The parsed settings are validated with AnalysisSettings::Validate().
 *
 * @throws ConfigurationError for unknown keys (the message lists the valid
 *         ones), wrongly typed values and invalid settings
 */
AnalysisSettings ParseAnalysisSettings(const nlohmann::json &document);

/// Inverse of ParseAnalysisSettings
nlohmann::json SettingsToJson(const AnalysisSettings &settings);

} // namespace pipeline
} // namespace modstat
