#pragma once

#include <cstddef>
#include <string>
#include <stdexcept>

namespace modstat {
namespace core {

/**
 * Configuration options for the regression solvers
 *
 * One structure configures both the OLS solver used for the moderated
 * regression and the iterative ordinal-logit solver used by the sensitivity
 * check. All options have defaults and can be overridden as needed.
 */
struct RegressionOptions {
	// ========================================================================
	// Common regression options
	// ========================================================================

	/// Include intercept term in regression
	/// Default: true
	bool intercept = true;

	// ========================================================================
	// Statistical inference parameters
	// ========================================================================

	/// Confidence level for confidence intervals
	/// Default: 0.95 (95% confidence intervals)
	double confidence_level = 0.95;

	// ========================================================================
	// Computational parameters
	// ========================================================================

	/// Maximum iterations for iterative algorithms (ordinal logit)
	/// Default: 100
	size_t max_iterations = 100;

	/// Convergence tolerance for iterative algorithms
	/// Default: 1e-8
	double tolerance = 1e-8;

	/// QR decomposition rank tolerance (-1 = auto, use Eigen default)
	/// Default: -1.0 (auto)
	double qr_tolerance = -1.0;

	// ========================================================================
	// Constructors
	// ========================================================================

	RegressionOptions() = default;

	/// Convenience constructor for OLS
	static RegressionOptions OLS(bool intercept_ = true) {
		RegressionOptions opts;
		opts.intercept = intercept_;
		return opts;
	}

	/// Convenience constructor for the proportional-odds model
	/// (thresholds replace the intercept)
	static RegressionOptions Ordinal(size_t max_iterations_ = 100, double tolerance_ = 1e-8) {
		RegressionOptions opts;
		opts.intercept = false;
		opts.max_iterations = max_iterations_;
		opts.tolerance = tolerance_;
		return opts;
	}

	// ========================================================================
	// Validation
	// ========================================================================

	/**
	 * Validate option values
	 *
	 * @throws std::invalid_argument if validation fails
	 */
	void Validate() const {
		// Confidence level must be in (0, 1)
		if (confidence_level <= 0.0 || confidence_level >= 1.0) {
			throw std::invalid_argument("confidence_level must be in (0, 1) (got " +
			                            std::to_string(confidence_level) + ")");
		}

		if (tolerance <= 0.0) {
			throw std::invalid_argument("tolerance must be positive (got " + std::to_string(tolerance) + ")");
		}

		if (max_iterations == 0) {
			throw std::invalid_argument("max_iterations must be positive");
		}
	}
};

} // namespace core
} // namespace modstat
