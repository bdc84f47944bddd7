#pragma once

#include "modstat/core/regression_result.hpp"
#include "modstat/core/inference_result.hpp"
#include "modstat/utils/distributions.hpp"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace modstat {
namespace inference {

/**
 * CoefficientInference: Statistical inference for regression coefficients
 *
 * The inference is based on the standard OLS theory:
 * - t_j = β_j / SE(β_j)  ~ t(n - rank)
 * - p_j = 2 * P(|T| > |t_j|)
 * - CI_j = β_j ± t_{α/2} * SE(β_j)
 *
 * Standard errors come from the fit (OLSSolver::FitWithStdErrors).
 */
class CoefficientInference {
public:
	/**
	 * Compute coefficient inference from a regression result
	 *
	 * @param result Regression result carrying std_errors
	 * @param confidence_level Confidence level for intervals (default: 0.95)
	 * @return InferenceResult with t-statistics, p-values, and confidence intervals
	 * @throws std::invalid_argument if the result has no standard errors or
	 *         no residual degrees of freedom
	 */
	static core::InferenceResult ComputeInference(const core::RegressionResult &result,
	                                              double confidence_level = 0.95);

	/**
	 * Compute t-statistics for coefficients
	 *
	 * t_j = β_j / SE(β_j); NaN when either is NaN or SE is zero
	 */
	static Eigen::VectorXd ComputeTStatistics(const Eigen::VectorXd &coefficients, const Eigen::VectorXd &std_errors);

	/**
	 * Compute two-tailed p-values from t-statistics
	 *
	 * @param t_statistics Vector of t-statistics
	 * @param df Degrees of freedom
	 */
	static Eigen::VectorXd ComputePValues(const Eigen::VectorXd &t_statistics, size_t df);

	/**
	 * Compute confidence intervals for coefficients
	 *
	 * CI_j = β_j ± t_{α/2, df} * SE(β_j)
	 *
	 * @return Pair of (lower_bounds, upper_bounds)
	 */
	static std::pair<Eigen::VectorXd, Eigen::VectorXd> ComputeConfidenceIntervals(const Eigen::VectorXd &coefficients,
	                                                                             const Eigen::VectorXd &std_errors,
	                                                                             size_t df, double confidence_level);
};

// ============================================================================
// Implementation
// ============================================================================

inline Eigen::VectorXd CoefficientInference::ComputeTStatistics(const Eigen::VectorXd &coefficients,
                                                                const Eigen::VectorXd &std_errors) {
	const Eigen::Index p = coefficients.size();
	Eigen::VectorXd t_stats(p);

	for (Eigen::Index j = 0; j < p; j++) {
		if (std::isnan(coefficients(j)) || std::isnan(std_errors(j)) || std_errors(j) == 0.0) {
			t_stats(j) = std::numeric_limits<double>::quiet_NaN();
		} else {
			t_stats(j) = coefficients(j) / std_errors(j);
		}
	}

	return t_stats;
}

inline Eigen::VectorXd CoefficientInference::ComputePValues(const Eigen::VectorXd &t_statistics, size_t df) {
	const Eigen::Index p = t_statistics.size();
	Eigen::VectorXd p_values(p);

	for (Eigen::Index j = 0; j < p; j++) {
		p_values(j) = utils::student_t_pvalue(t_statistics(j), static_cast<double>(df));
	}

	return p_values;
}

inline std::pair<Eigen::VectorXd, Eigen::VectorXd>
CoefficientInference::ComputeConfidenceIntervals(const Eigen::VectorXd &coefficients,
                                                 const Eigen::VectorXd &std_errors, size_t df,
                                                 double confidence_level) {
	const Eigen::Index p = coefficients.size();
	const double t_crit = utils::student_t_critical(1.0 - confidence_level, static_cast<double>(df));

	Eigen::VectorXd ci_lower(p);
	Eigen::VectorXd ci_upper(p);

	for (Eigen::Index j = 0; j < p; j++) {
		if (std::isnan(coefficients(j)) || std::isnan(std_errors(j))) {
			ci_lower(j) = std::numeric_limits<double>::quiet_NaN();
			ci_upper(j) = std::numeric_limits<double>::quiet_NaN();
		} else {
			ci_lower(j) = coefficients(j) - t_crit * std_errors(j);
			ci_upper(j) = coefficients(j) + t_crit * std_errors(j);
		}
	}

	return {ci_lower, ci_upper};
}

inline core::InferenceResult CoefficientInference::ComputeInference(const core::RegressionResult &result,
                                                                    double confidence_level) {
	if (!result.has_std_errors) {
		throw std::invalid_argument("inference requires a fit with standard errors");
	}
	if (confidence_level <= 0.0 || confidence_level >= 1.0) {
		throw std::invalid_argument("confidence_level must be in (0, 1)");
	}

	const size_t df = result.df_residual();
	if (df == 0) {
		throw std::invalid_argument("Insufficient observations for inference: n <= rank");
	}

	core::InferenceResult inference(result.n_params, confidence_level);

	inference.std_errors = result.std_errors;
	inference.t_statistics = ComputeTStatistics(result.coefficients, result.std_errors);
	inference.p_values = ComputePValues(inference.t_statistics, df);

	auto [ci_lower, ci_upper] =
	    ComputeConfidenceIntervals(result.coefficients, result.std_errors, df, confidence_level);
	inference.ci_lower = ci_lower;
	inference.ci_upper = ci_upper;

	inference.degrees_of_freedom = df;
	inference.has_inference = true;

	return inference;
}

} // namespace inference
} // namespace modstat
