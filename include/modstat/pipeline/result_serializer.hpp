#pragma once

#include "modstat/data/dataset.hpp"
#include "modstat/pipeline/analysis_result.hpp"
#include "modstat/pipeline/job.hpp"

#include <nlohmann/json.hpp>

#include <ostream>
#include <vector>

namespace modstat {
namespace pipeline {

// ============================================================================
// JSON documents
// ============================================================================
// Non-finite numbers are written as null. Time points are local
// "YYYY-MM-DD HH:MM:SS.mmm" strings.

nlohmann::json ToJson(const Job &job);

nlohmann::json ToJson(const InteractionResult &result);

nlohmann::json ToJson(const AnalysisResult &result);

/// Column overview of an ingested dataset (name, type, missing counts, samples)
nlohmann::json ToJson(const data::Dataset &dataset);

// ============================================================================
// interaction_summary table
// ============================================================================

/// Header row of the interaction_summary table, in column order
const std::vector<std::string> &InteractionSummaryColumns();

/**
 * Write one CSV row per result, preceded by the header
 *
 * Numbers use up to 10 significant digits; NaN cells are left empty.
 * Text cells containing ',', '"' or a newline are quoted.
 */
void WriteInteractionSummaryCsv(std::ostream &out, const std::vector<InteractionResult> &results);

} // namespace pipeline
} // namespace modstat
