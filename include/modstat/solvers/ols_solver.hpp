#pragma once

#include "modstat/core/regression_result.hpp"
#include "modstat/core/regression_options.hpp"
#include <Eigen/Dense>
#include <vector>
#include <limits>
#include <cmath>
#include <stdexcept>
#include <string>

namespace modstat {
namespace solvers {

/**
 * Ordinary Least Squares (OLS) Regression Solver
 *
 * Uses Eigen's ColPivHouseholderQR decomposition to handle rank-deficient
 * design matrices:
 * - Constant features return NaN coefficients (aliased)
 * - Perfectly collinear features return NaN coefficients (aliased)
 * - Non-aliased features compute correctly
 *
 * Algorithm:
 * 1. Center y and X when an intercept is requested (the intercept column is
 *    never part of the decomposition, so it can never be aliased)
 * 2. QR decomposition with column pivoting: X*P = Q*R
 * 3. Determine numerical rank from R diagonal
 * 4. Solve rank-r triangular system: R_r * beta_r = (Q^T * y)_r
 * 5. Map reduced coefficients back to original column order via permutation
 * 6. Compute residuals and fit statistics
 *
 * Stateless: all methods are static.
 */
class OLSSolver {
public:
	/**
	 * Fit OLS regression with automatic rank-deficiency handling
	 *
	 * @param y Response vector (length n)
	 * @param X Design matrix (n × p), without an intercept column
	 * @param options Regression options (intercept, tolerance, etc.)
	 * @return RegressionResult with coefficients (NaN for aliased)
	 * @throws std::invalid_argument on dimension mismatch or invalid options
	 */
	static core::RegressionResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                                  const core::RegressionOptions &options = core::RegressionOptions::OLS());

	/**
	 * Fit OLS regression with standard errors and coefficient covariance
	 *
	 * Aliased coefficients get NaN standard errors and NaN covariance rows.
	 * A saturated model (n <= rank) has NaN MSE and therefore NaN errors.
	 *
	 * @param y Response vector (length n)
	 * @param X Design matrix (n × p)
	 * @param options Regression options
	 * @return RegressionResult with coefficients, std_errors and covariance
	 */
	static core::RegressionResult FitWithStdErrors(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                                               const core::RegressionOptions &options =
	                                                   core::RegressionOptions::OLS());

	/**
	 * Detect columns with (numerically) zero variance
	 *
	 * Cheap pre-check used to name the degenerate term before the QR
	 * decomposition reports the rank loss.
	 *
	 * @param X Design matrix
	 * @param tol Variance threshold, relative to the column's squared largest magnitude
	 * @return Vector of bools, true if column is constant
	 */
	static std::vector<bool> DetectConstantColumns(const Eigen::MatrixXd &X, double tol = 1e-10);

private:
	/// Build the working design (centered when an intercept is fitted)
	static void PrepareWorkingData(const Eigen::VectorXd &y, const Eigen::MatrixXd &X, bool intercept,
	                               Eigen::VectorXd &y_work, Eigen::MatrixXd &X_work, Eigen::VectorXd &x_means);

	/**
	 * Compute fit quality statistics (RSS, TSS, R², adjusted R², MSE, RMSE)
	 */
	static void ComputeStatistics(const Eigen::VectorXd &y, const Eigen::VectorXd &residuals, size_t rank,
	                              size_t n, bool intercept, core::RegressionResult &result);

	/**
	 * Compute standard errors and covariance using MSE and (X'X)^-1 of the
	 * non-aliased columns of the working design
	 */
	static void ComputeCovariance(const Eigen::MatrixXd &X_work,
	                              const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> &qr, size_t feature_rank,
	                              const Eigen::VectorXd &x_means, bool intercept, core::RegressionResult &result);
};

// ============================================================================
// Implementation (header-only)
// ============================================================================

inline void OLSSolver::PrepareWorkingData(const Eigen::VectorXd &y, const Eigen::MatrixXd &X, bool intercept,
                                          Eigen::VectorXd &y_work, Eigen::MatrixXd &X_work,
                                          Eigen::VectorXd &x_means) {
	if (intercept) {
		x_means = X.colwise().mean().transpose();
		y_work = y.array() - y.mean();
		X_work = X.rowwise() - x_means.transpose();
	} else {
		x_means = Eigen::VectorXd::Zero(X.cols());
		y_work = y;
		X_work = X;
	}
}

inline core::RegressionResult OLSSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                             const core::RegressionOptions &options) {
	options.Validate();

	if (y.size() != X.rows()) {
		throw std::invalid_argument("response length (" + std::to_string(y.size()) +
		                            ") does not match design rows (" + std::to_string(X.rows()) + ")");
	}
	if (X.rows() == 0) {
		throw std::invalid_argument("cannot fit a regression on zero observations");
	}

	const size_t n = static_cast<size_t>(X.rows());
	const size_t p = static_cast<size_t>(X.cols());
	const size_t coef_offset = options.intercept ? 1 : 0;

	Eigen::VectorXd y_work;
	Eigen::MatrixXd X_work;
	Eigen::VectorXd x_means;
	PrepareWorkingData(y, X, options.intercept, y_work, X_work, x_means);

	core::RegressionResult result(n, p + coef_offset, 0);

	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X_work);
	if (options.qr_tolerance > 0.0) {
		qr.setThreshold(options.qr_tolerance);
	}
	result.tolerance_used = qr.threshold();

	// Feature rank from QR; the intercept adds one when present
	const size_t feature_rank = p == 0 ? 0 : static_cast<size_t>(qr.rank());
	result.rank = feature_rank + coef_offset;

	if (options.intercept) {
		result.permutation_indices[0] = 0;
	}
	if (p > 0) {
		const auto &P = qr.colsPermutation();
		for (size_t i = 0; i < p; i++) {
			result.permutation_indices[i + coef_offset] =
			    static_cast<size_t>(P.indices()[static_cast<Eigen::Index>(i)]) + coef_offset;
		}
	}

	if (feature_rank > 0) {
		const auto r = static_cast<Eigen::Index>(feature_rank);
		Eigen::VectorXd QtY = qr.matrixQ().transpose() * y_work;
		Eigen::MatrixXd R_reduced = qr.matrixQR().topLeftCorner(r, r);
		Eigen::VectorXd coef_reduced = R_reduced.triangularView<Eigen::Upper>().solve(QtY.head(r));

		const auto &P = qr.colsPermutation();
		for (Eigen::Index i = 0; i < r; i++) {
			const size_t original_idx = static_cast<size_t>(P.indices()[i]) + coef_offset;
			result.coefficients[static_cast<Eigen::Index>(original_idx)] = coef_reduced[i];
			result.is_aliased[original_idx] = false;
		}
	}

	if (options.intercept) {
		// intercept = mean(y) - sum(beta_j * mean(x_j)) over non-aliased features
		double intercept = y.mean();
		for (size_t j = 0; j < p; j++) {
			if (!result.is_aliased[j + 1]) {
				intercept -= result.coefficients[static_cast<Eigen::Index>(j + 1)] * x_means[static_cast<Eigen::Index>(j)];
			}
		}
		result.coefficients[0] = intercept;
		result.is_aliased[0] = false;
		result.intercept = intercept;
		result.has_intercept = true;
	}

	Eigen::VectorXd y_pred = Eigen::VectorXd::Constant(static_cast<Eigen::Index>(n),
	                                                   options.intercept ? result.intercept : 0.0);
	for (size_t j = 0; j < p; j++) {
		const auto coef_idx = static_cast<Eigen::Index>(j + coef_offset);
		if (!result.is_aliased[j + coef_offset]) {
			y_pred += result.coefficients[coef_idx] * X.col(static_cast<Eigen::Index>(j));
		}
	}
	result.residuals = y - y_pred;

	ComputeStatistics(y, result.residuals, result.rank, n, options.intercept, result);

	return result;
}

inline core::RegressionResult OLSSolver::FitWithStdErrors(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                                          const core::RegressionOptions &options) {
	auto result = Fit(y, X, options);

	Eigen::VectorXd y_work;
	Eigen::MatrixXd X_work;
	Eigen::VectorXd x_means;
	PrepareWorkingData(y, X, options.intercept, y_work, X_work, x_means);

	const auto n_coeffs = static_cast<Eigen::Index>(result.n_params);
	result.std_errors = Eigen::VectorXd::Constant(n_coeffs, std::numeric_limits<double>::quiet_NaN());
	result.covariance =
	    Eigen::MatrixXd::Constant(n_coeffs, n_coeffs, std::numeric_limits<double>::quiet_NaN());
	result.has_std_errors = true;

	if (!std::isfinite(result.mse)) {
		return result;
	}

	Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(X_work);
	if (options.qr_tolerance > 0.0) {
		qr.setThreshold(options.qr_tolerance);
	}
	const size_t feature_rank = X_work.cols() == 0 ? 0 : static_cast<size_t>(qr.rank());

	ComputeCovariance(X_work, qr, feature_rank, x_means, options.intercept, result);

	return result;
}

inline std::vector<bool> OLSSolver::DetectConstantColumns(const Eigen::MatrixXd &X, double tol) {
	const size_t p = static_cast<size_t>(X.cols());
	std::vector<bool> is_constant(p, false);

	if (X.rows() < 2) {
		is_constant.assign(p, true);
		return is_constant;
	}

	for (size_t j = 0; j < p; j++) {
		const auto col = X.col(static_cast<Eigen::Index>(j));
		const double mean = col.mean();
		const double variance = (col.array() - mean).square().sum() / static_cast<double>(X.rows() - 1);
		// Relative to the column's magnitude, so small-scale measurements are not constant
		const double scale = col.cwiseAbs().maxCoeff();
		if (variance <= tol * scale * scale) {
			is_constant[j] = true;
		}
	}

	return is_constant;
}

inline void OLSSolver::ComputeStatistics(const Eigen::VectorXd &y, const Eigen::VectorXd &residuals, size_t rank,
                                         size_t n, bool intercept, core::RegressionResult &result) {
	result.rss = residuals.squaredNorm();
	result.tss = intercept ? (y.array() - y.mean()).square().sum() : y.squaredNorm();

	result.r_squared = (result.tss > 1e-12) ? (1.0 - result.rss / result.tss) : 0.0;
	if (result.r_squared < 0.0) {
		result.r_squared = 0.0;
	} else if (result.r_squared > 1.0) {
		result.r_squared = 1.0;
	}

	// Classical adjustment; may fall below zero for weak fits
	if (n > rank) {
		const double adj_factor = static_cast<double>(n - 1) / static_cast<double>(n - rank);
		result.adj_r_squared = 1.0 - (1.0 - result.r_squared) * adj_factor;

		result.mse = result.rss / static_cast<double>(n - rank);
		constexpr double min_mse = 1e-20;
		if (result.mse < min_mse) {
			result.mse = min_mse;
		}
	} else {
		// Saturated model: no residual degrees of freedom
		result.adj_r_squared = std::numeric_limits<double>::quiet_NaN();
		result.mse = std::numeric_limits<double>::quiet_NaN();
	}

	result.rmse = std::sqrt(result.mse);
}

inline void OLSSolver::ComputeCovariance(const Eigen::MatrixXd &X_work,
                                         const Eigen::ColPivHouseholderQR<Eigen::MatrixXd> &qr, size_t feature_rank,
                                         const Eigen::VectorXd &x_means, bool intercept,
                                         core::RegressionResult &result) {
	const double mse = result.mse;
	const double n_obs = static_cast<double>(result.n_obs);
	const size_t coef_offset = intercept ? 1 : 0;

	if (feature_rank == 0) {
		if (intercept) {
			result.std_errors[0] = std::sqrt(mse / n_obs);
			result.covariance(0, 0) = mse / n_obs;
			result.intercept_std_error = result.std_errors[0];
		}
		return;
	}

	const auto r = static_cast<Eigen::Index>(feature_rank);
	const auto &P = qr.colsPermutation();

	// Non-aliased columns in pivoted order
	std::vector<Eigen::Index> kept(static_cast<size_t>(r));
	Eigen::MatrixXd X_reduced(X_work.rows(), r);
	for (Eigen::Index i = 0; i < r; i++) {
		kept[static_cast<size_t>(i)] = P.indices()[i];
		X_reduced.col(i) = X_work.col(P.indices()[i]);
	}

	Eigen::MatrixXd XtX = X_reduced.transpose() * X_reduced;
	Eigen::LDLT<Eigen::MatrixXd> ldlt(XtX);
	if (ldlt.info() != Eigen::Success) {
		return;
	}
	Eigen::MatrixXd XtX_inv = ldlt.solve(Eigen::MatrixXd::Identity(r, r));
	Eigen::MatrixXd V = mse * XtX_inv;

	for (Eigen::Index a = 0; a < r; a++) {
		const Eigen::Index ia = kept[static_cast<size_t>(a)] + static_cast<Eigen::Index>(coef_offset);
		for (Eigen::Index b = 0; b < r; b++) {
			const Eigen::Index ib = kept[static_cast<size_t>(b)] + static_cast<Eigen::Index>(coef_offset);
			result.covariance(ia, ib) = V(a, b);
		}
		result.std_errors[ia] = std::sqrt(V(a, a));
	}

	if (intercept) {
		// Var(b0) = MSE/n + m' V m, Cov(b0, b) = -V m
		Eigen::VectorXd m_reduced(r);
		for (Eigen::Index i = 0; i < r; i++) {
			m_reduced[i] = x_means[kept[static_cast<size_t>(i)]];
		}
		Eigen::VectorXd Vm = V * m_reduced;
		const double var_intercept = mse / n_obs + m_reduced.dot(Vm);

		result.covariance(0, 0) = var_intercept;
		for (Eigen::Index i = 0; i < r; i++) {
			const Eigen::Index ii = kept[static_cast<size_t>(i)] + 1;
			result.covariance(0, ii) = -Vm[i];
			result.covariance(ii, 0) = -Vm[i];
		}
		result.std_errors[0] = std::sqrt(var_intercept);
		result.intercept_std_error = result.std_errors[0];
	}
}

} // namespace solvers
} // namespace modstat
