#pragma once

#include <Eigen/Dense>
#include <vector>
#include <cstddef>
#include <cmath>
#include <limits>

namespace modstat {
namespace core {

/**
 * Result of a regression fit operation
 *
 * Contains coefficients, residuals, fit statistics and, when requested,
 * standard errors and the coefficient covariance matrix.
 *
 * Layout:
 * - When fitted with an intercept, position 0 of every per-parameter vector
 *   is the intercept and positions 1..p are the design columns
 * - Aliased (rank-deficient) coefficients are NaN and flagged in is_aliased
 */
struct RegressionResult {
	// ========================================================================
	// Core regression outputs
	// ========================================================================

	/// Estimated regression coefficients (length = n_params)
	Eigen::VectorXd coefficients;

	/// Intercept term (only valid if has_intercept is true)
	double intercept = 0.0;

	bool has_intercept = false;

	/// Residuals: y - X*beta (length = n_obs)
	Eigen::VectorXd residuals;

	// ========================================================================
	// Rank and aliasing information
	// ========================================================================

	/// Rank of the model including the intercept (0 < rank <= n_params)
	size_t rank;

	/// Number of parameters (design columns plus intercept)
	size_t n_params;

	/// Number of observations (rows in design matrix)
	size_t n_obs;

	/// True if coefficient is aliased (set to NaN), false if estimated
	std::vector<bool> is_aliased;

	/// Column permutation indices from QR decomposition (length = n_params)
	std::vector<size_t> permutation_indices;

	/// Tolerance used for rank determination in QR decomposition
	double tolerance_used = -1.0;

	// ========================================================================
	// Fit quality statistics
	// ========================================================================

	/// Coefficient of determination: 1 - RSS/TSS
	double r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Adjusted R²: 1 - (1-R²)*(n-1)/(n-rank)
	double adj_r_squared = std::numeric_limits<double>::quiet_NaN();

	/// Residual sum of squares
	double rss = std::numeric_limits<double>::quiet_NaN();

	/// Total sum of squares around the mean of y
	double tss = std::numeric_limits<double>::quiet_NaN();

	/// Mean squared error: RSS / df_residual
	double mse = std::numeric_limits<double>::quiet_NaN();

	/// Root mean squared error: sqrt(MSE)
	double rmse = std::numeric_limits<double>::quiet_NaN();

	// ========================================================================
	// Optional: Statistical inference outputs
	// ========================================================================

	/// Standard errors of coefficients (length = n_params, NaN when aliased)
	Eigen::VectorXd std_errors;

	/// Standard error of intercept term
	double intercept_std_error = std::numeric_limits<double>::quiet_NaN();

	/// Coefficient covariance matrix (n_params x n_params, same layout as
	/// coefficients). Rows and columns of aliased coefficients are NaN.
	Eigen::MatrixXd covariance;

	bool has_std_errors = false;

	// ========================================================================
	// Degrees of freedom (for inference)
	// ========================================================================

	size_t df_model() const {
		return rank;
	}

	/// Degrees of freedom for residuals: n - rank
	size_t df_residual() const {
		if (n_obs <= rank) return 0;
		return n_obs - rank;
	}

	// ========================================================================
	// Constructors
	// ========================================================================

	RegressionResult()
		: rank(0), n_params(0), n_obs(0) {}

	RegressionResult(size_t n_obs_, size_t n_params_, size_t rank_)
		: rank(rank_), n_params(n_params_), n_obs(n_obs_) {
		coefficients = Eigen::VectorXd::Constant(static_cast<Eigen::Index>(n_params_),
		                                         std::numeric_limits<double>::quiet_NaN());
		residuals = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(n_obs_));
		is_aliased.resize(n_params_, true);
		permutation_indices.resize(n_params_);
	}

	// ========================================================================
	// Utility methods
	// ========================================================================

	/// Check if result is valid (has finite coefficients for non-aliased params)
	bool is_valid() const {
		if (rank == 0 || n_params == 0 || n_obs == 0) return false;

		for (size_t i = 0; i < n_params; i++) {
			if (!is_aliased[i] && !std::isfinite(coefficients[static_cast<Eigen::Index>(i)])) {
				return false;
			}
		}
		return true;
	}

	size_t n_estimated_params() const {
		size_t count = 0;
		for (bool aliased : is_aliased) {
			if (!aliased) count++;
		}
		return count;
	}

	/// True if any parameter was dropped for rank deficiency
	bool has_aliased_terms() const {
		return n_estimated_params() < n_params;
	}
};

} // namespace core
} // namespace modstat
