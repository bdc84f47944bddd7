#pragma once

#include "modstat/core/regression_options.hpp"
#include "modstat/pipeline/analysis_settings.hpp"
#include "modstat/pipeline/interaction_result.hpp"
#include "modstat/pipeline/regression_engine.hpp"

#include <string>

namespace modstat {
namespace pipeline {

/// What a sensitivity re-fit contributes to the report
struct SensitivityOutcome {
	/// False when the alternative model could not be fitted
	bool completed = false;

	/// Note for AnalysisResult::notes (always set)
	std::string note;

	/// Interaction estimate and p-value of the alternative model
	double beta_interaction = 0.0;
	double p_interaction = 1.0;

	bool sign_agrees = false;
	bool significance_agrees = false;
};

/**
 * ISensitivityChecker: pluggable cross-check of a fitted pair
 *
 * Implementations re-fit the same predictor structure with another model
 * family and report agreement with the linear result. They never change the
 * InteractionResult; they only contribute a note. Failures are reported
 * through SensitivityOutcome::completed, not by throwing.
 */
class ISensitivityChecker {
public:
	virtual ~ISensitivityChecker() = default;

	/// Short name used in logs (e.g., "ordinal")
	virtual std::string GetName() const = 0;

	/// Whether the pair's outcome is eligible under the given settings
	virtual bool AppliesTo(const std::string &outcome, const AnalysisSettings &settings) const = 0;

	/**
	 * Re-fit and compare
	 *
	 * @param model Fitted linear model of the pair
	 * @param linear Linear result of the pair
	 * @param alpha Significance level for the agreement comparison
	 */
	virtual SensitivityOutcome Check(const InteractionModel &model, const InteractionResult &linear,
	                                 double alpha) const = 0;
};

/**
 * Proportional-odds re-fit of ordinal outcomes
 *
 * Applies when run_sensitivity is set and the outcome is listed in
 * ordinal_outcomes. Levels are the sorted distinct raw outcome values.
 */
class OrdinalSensitivityChecker : public ISensitivityChecker {
public:
	explicit OrdinalSensitivityChecker(core::RegressionOptions options = core::RegressionOptions::Ordinal());

	std::string GetName() const override {
		return "ordinal";
	}

	bool AppliesTo(const std::string &outcome, const AnalysisSettings &settings) const override;

	SensitivityOutcome Check(const InteractionModel &model, const InteractionResult &linear,
	                         double alpha) const override;

private:
	core::RegressionOptions options_;
};

} // namespace pipeline
} // namespace modstat
