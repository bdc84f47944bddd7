#pragma once

#include "modstat/core/regression_result.hpp"
#include "modstat/data/dataset.hpp"
#include "modstat/pipeline/analysis_settings.hpp"
#include "modstat/pipeline/interaction_result.hpp"

#include <Eigen/Dense>
#include <cstddef>
#include <string>

namespace modstat {
namespace pipeline {

/// Outcome of processing one (moderator, outcome) pair
enum class PairStatus {
	FITTED,
	/// Moderator or outcome has no numeric storage
	NON_NUMERIC,
	/// n_used < min_sample_size
	INSUFFICIENT_SAMPLE,
	/// Constant intervention or moderator, or a collinear interaction
	SINGULAR_DESIGN,
	/// Too few rows left for residual degrees of freedom
	NO_RESIDUAL_DF
};

const char *PairStatusName(PairStatus status);

/**
 * Fitted moderated-regression model, on the scale used for fitting
 *
 * Design columns (no intercept column): [intervention, moderator,
 * intervention * moderator]. The fit carries the intercept at position 0.
 */
struct InteractionModel {
	core::RegressionResult fit;

	/// Response as fitted (centered when requested)
	Eigen::VectorXd y;

	/// Design matrix as fitted
	Eigen::MatrixXd X;

	/// Outcome on its original scale (level codes for ordinal refits)
	Eigen::VectorXd raw_outcome;

	/// Moderator mean and sample SD on the model scale
	double moderator_mean = 0.0;
	double moderator_sd = 0.0;

	/// Sample SD of the outcome over the used rows
	double outcome_sd = 0.0;
};

struct PairFit {
	PairStatus status = PairStatus::FITTED;

	/// Explanation for a skipped pair (empty when fitted)
	std::string note;

	/// Valid only when status is FITTED
	InteractionResult result;
	InteractionModel model;

	bool Fitted() const {
		return status == PairStatus::FITTED;
	}
};

/**
 * Moderated regression for one pair: outcome ~ I + M + I:M
 *
 * Per-pair degeneracies are reported through PairFit::status and a note;
 * FitPair never throws for them.
 */
class RegressionEngine {
public:
	/// Coefficient positions in InteractionModel::fit
	static constexpr size_t INTERCEPT = 0;
	static constexpr size_t INTERVENTION = 1;
	static constexpr size_t MODERATOR = 2;
	static constexpr size_t INTERACTION = 3;

	/**
	 * Fit the moderated regression for one pair
	 *
	 * @param dataset Typed dataset
	 * @param moderator Moderator column name
	 * @param outcome Outcome column name
	 * @param settings Variable mapping (intervention), centering, min_sample_size
	 * @return PairFit with the result or the reason the pair was skipped
	 * @throws std::out_of_range if a column does not exist
	 */
	static PairFit FitPair(const data::Dataset &dataset, const std::string &moderator, const std::string &outcome,
	                       const AnalysisSettings &settings);

	/**
	 * Partial eta squared of one design column
	 *
	 * SS_term = RSS(model without the column) - RSS(full model);
	 * result = SS_term / (SS_term + RSS(full model)), 0 when undefined.
	 */
	static double PartialEtaSquared(const Eigen::VectorXd &y, const Eigen::MatrixXd &X, double rss_full,
	                                size_t column);

	/// Median of the values (copy sorted with nth_element)
	static double Median(Eigen::VectorXd values);

	/// Sample standard deviation (n - 1 denominator), 0 for fewer than two values
	static double SampleStdDev(const Eigen::VectorXd &values);
};

} // namespace pipeline
} // namespace modstat
