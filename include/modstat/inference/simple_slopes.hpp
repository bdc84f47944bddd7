#pragma once

#include "modstat/core/regression_result.hpp"
#include "modstat/utils/distributions.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>

namespace modstat {
namespace inference {

/**
 * Conditional effect of the intervention at one moderator value
 */
struct SimpleSlope {
	/// Moderator value (model scale) the slope is evaluated at
	double moderator_value = 0.0;

	double slope = 0.0;
	double std_error = 0.0;
	double t_statistic = 0.0;

	/// Two-tailed p-value with the model's residual degrees of freedom
	double p_value = 1.0;

	double ci_lower = 0.0;
	double ci_upper = 0.0;

	/// slope / SD(outcome); 0 when the outcome has no spread
	double cohens_d = 0.0;
};

/// Slopes at moderator = mean - 1 SD and mean + 1 SD
struct SimpleSlopes {
	SimpleSlope low;
	SimpleSlope high;
};

/// Positions of the two terms entering slope(m) = b_main + b_interaction * m
struct SlopeTerms {
	size_t main_effect = 1;
	size_t interaction = 3;
};

/**
 * Simple-slopes decomposition of a fitted two-way interaction
 *
 * For outcome ~ I + M + I:M the effect of I at M = m is
 *   slope(m) = b_I + b_IM * m
 * with delta-method variance
 *   Var(slope) = V_II + m² V_IMIM + 2 m V_I,IM
 * taken from the coefficient covariance of the fit.
 */
class SimpleSlopeAnalyzer {
public:
	/**
	 * Evaluate the conditional slope at one moderator value
	 *
	 * @param fit OLS fit carrying covariance (FitWithStdErrors)
	 * @param terms Coefficient positions of the main effect and interaction
	 * @param moderator_value Moderator value on the model scale
	 * @param outcome_sd SD of the outcome over the used rows
	 * @param confidence_level Confidence level for the interval
	 * @throws std::invalid_argument if the fit has no usable covariance
	 */
	static SimpleSlope Evaluate(const core::RegressionResult &fit, const SlopeTerms &terms, double moderator_value,
	                            double outcome_sd, double confidence_level = 0.95);

	/**
	 * Evaluate the slopes at mean ± 1 SD of the moderator
	 */
	static SimpleSlopes Analyze(const core::RegressionResult &fit, const SlopeTerms &terms, double moderator_mean,
	                            double moderator_sd, double outcome_sd, double confidence_level = 0.95);

private:
	static void CheckFit(const core::RegressionResult &fit, const SlopeTerms &terms);
};

// ============================================================================
// Implementation
// ============================================================================

inline void SimpleSlopeAnalyzer::CheckFit(const core::RegressionResult &fit, const SlopeTerms &terms) {
	if (!fit.has_std_errors || fit.covariance.rows() != static_cast<Eigen::Index>(fit.n_params)) {
		throw std::invalid_argument("simple slopes require a fit with coefficient covariance");
	}
	if (terms.main_effect >= fit.n_params || terms.interaction >= fit.n_params) {
		throw std::invalid_argument("slope term index out of range (n_params = " + std::to_string(fit.n_params) +
		                            ")");
	}
	if (fit.is_aliased[terms.main_effect] || fit.is_aliased[terms.interaction]) {
		throw std::invalid_argument("simple slopes are undefined for aliased terms");
	}
	if (fit.df_residual() == 0) {
		throw std::invalid_argument("simple slopes require residual degrees of freedom");
	}
}

inline SimpleSlope SimpleSlopeAnalyzer::Evaluate(const core::RegressionResult &fit, const SlopeTerms &terms,
                                                 double moderator_value, double outcome_sd,
                                                 double confidence_level) {
	CheckFit(fit, terms);

	const auto i = static_cast<Eigen::Index>(terms.main_effect);
	const auto k = static_cast<Eigen::Index>(terms.interaction);
	const double m = moderator_value;
	const double df = static_cast<double>(fit.df_residual());

	SimpleSlope s;
	s.moderator_value = m;
	s.slope = fit.coefficients[i] + fit.coefficients[k] * m;

	const double variance =
	    fit.covariance(i, i) + m * m * fit.covariance(k, k) + 2.0 * m * fit.covariance(i, k);
	s.std_error = std::sqrt(std::max(variance, 0.0));

	if (s.std_error > 0.0) {
		s.t_statistic = s.slope / s.std_error;
		s.p_value = utils::student_t_pvalue(s.t_statistic, df);
	} else {
		// Degenerate exact fit: a zero slope is not significant, any other is
		s.t_statistic = 0.0;
		s.p_value = s.slope == 0.0 ? 1.0 : 0.0;
	}

	const double t_crit = utils::student_t_critical(1.0 - confidence_level, df);
	s.ci_lower = s.slope - t_crit * s.std_error;
	s.ci_upper = s.slope + t_crit * s.std_error;

	s.cohens_d = outcome_sd > 0.0 ? s.slope / outcome_sd : 0.0;

	return s;
}

inline SimpleSlopes SimpleSlopeAnalyzer::Analyze(const core::RegressionResult &fit, const SlopeTerms &terms,
                                                 double moderator_mean, double moderator_sd, double outcome_sd,
                                                 double confidence_level) {
	SimpleSlopes slopes;
	slopes.low = Evaluate(fit, terms, moderator_mean - moderator_sd, outcome_sd, confidence_level);
	slopes.high = Evaluate(fit, terms, moderator_mean + moderator_sd, outcome_sd, confidence_level);
	return slopes;
}

} // namespace inference
} // namespace modstat
