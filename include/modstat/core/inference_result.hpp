#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <limits>

namespace modstat {
namespace core {

/**
 * Statistical inference results for regression coefficients
 *
 * NaN values indicate unavailable results (e.g., for aliased coefficients).
 * Vectors follow the coefficient layout of the RegressionResult they were
 * computed from (intercept at position 0 when fitted).
 */
struct InferenceResult {
	/// Standard errors of coefficients (length = n_params)
	Eigen::VectorXd std_errors;

	/// t-statistics: coef / std_error
	Eigen::VectorXd t_statistics;

	/// Two-tailed p-values for H0: coef = 0
	Eigen::VectorXd p_values;

	/// Lower bounds of confidence intervals: coef - t_critical * std_error
	Eigen::VectorXd ci_lower;

	/// Upper bounds of confidence intervals: coef + t_critical * std_error
	Eigen::VectorXd ci_upper;

	/// Confidence level used (e.g., 0.95 for 95% CI)
	double confidence_level = 0.95;

	/// Degrees of freedom used for t-distribution
	size_t degrees_of_freedom = 0;

	bool has_inference = false;

	InferenceResult() = default;

	InferenceResult(size_t n_params, double conf_level = 0.95) : confidence_level(conf_level) {
		const auto p = static_cast<Eigen::Index>(n_params);
		const double nan = std::numeric_limits<double>::quiet_NaN();
		std_errors = Eigen::VectorXd::Constant(p, nan);
		t_statistics = Eigen::VectorXd::Constant(p, nan);
		p_values = Eigen::VectorXd::Constant(p, nan);
		ci_lower = Eigen::VectorXd::Constant(p, nan);
		ci_upper = Eigen::VectorXd::Constant(p, nan);
	}
};

} // namespace core
} // namespace modstat
