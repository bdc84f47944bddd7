#pragma once

#include "modstat/core/regression_options.hpp"
#include "modstat/utils/distributions.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace modstat {
namespace solvers {

/**
 * Result of a proportional-odds (cumulative logit) fit
 *
 * Model: P(Y <= level_j | x) = logistic(theta_j - x'beta), j = 1..K-1
 */
struct OrdinalLogitResult {
	/// Sorted distinct response values (K levels)
	std::vector<double> levels;

	/// Cut points theta_1 < ... < theta_{K-1}
	Eigen::VectorXd thresholds;

	/// Slope coefficients (length = p, same order as design columns)
	Eigen::VectorXd coefficients;

	/// Wald inference for the slopes (NaN when the information matrix is singular)
	Eigen::VectorXd std_errors;
	Eigen::VectorXd z_statistics;
	Eigen::VectorXd p_values;

	double log_likelihood = -std::numeric_limits<double>::infinity();

	size_t iterations = 0;

	bool converged = false;

	bool has_std_errors = false;

	/// Reason the fit did not converge (empty on success)
	std::string failure_reason;

	size_t n_obs = 0;
};

/**
 * Cumulative-logit (proportional odds) solver
 *
 * Maximum likelihood by Newton-Raphson on (thresholds, slopes) with step
 * halving. A step is accepted only when it keeps the thresholds strictly
 * increasing and does not decrease the log-likelihood. Standard errors come
 * from the inverse observed information at the optimum.
 *
 * Failure to converge (separation, singular information, iteration limit) is
 * reported through converged/failure_reason, not by throwing.
 */
class OrdinalLogitSolver {
public:
	/**
	 * Fit the proportional-odds model
	 *
	 * @param y Ordinal response (any real codes; ordering defines the levels)
	 * @param X Design matrix (n × p) without an intercept column
	 * @param options max_iterations and tolerance drive the iteration
	 * @throws std::invalid_argument on dimension mismatch, non-finite input
	 *         or fewer than two response levels
	 */
	static OrdinalLogitResult Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
	                              const core::RegressionOptions &options = core::RegressionOptions::Ordinal());

	/// Sorted distinct values of y
	static std::vector<double> DistinctLevels(const Eigen::VectorXd &y);

private:
	/// Log-likelihood, gradient and Hessian at gamma = (thresholds, beta)
	static double Evaluate(const Eigen::VectorXd &gamma, const std::vector<size_t> &category, const Eigen::MatrixXd &X,
	                       size_t n_thresholds, Eigen::VectorXd *gradient, Eigen::MatrixXd *hessian);

	static bool ThresholdsIncreasing(const Eigen::VectorXd &gamma, size_t n_thresholds);
};

// ============================================================================
// Implementation
// ============================================================================

inline std::vector<double> OrdinalLogitSolver::DistinctLevels(const Eigen::VectorXd &y) {
	std::vector<double> levels(y.data(), y.data() + y.size());
	std::sort(levels.begin(), levels.end());
	levels.erase(std::unique(levels.begin(), levels.end()), levels.end());
	return levels;
}

inline bool OrdinalLogitSolver::ThresholdsIncreasing(const Eigen::VectorXd &gamma, size_t n_thresholds) {
	for (size_t j = 1; j < n_thresholds; j++) {
		if (!(gamma[static_cast<Eigen::Index>(j)] > gamma[static_cast<Eigen::Index>(j - 1)])) {
			return false;
		}
	}
	return true;
}

inline double OrdinalLogitSolver::Evaluate(const Eigen::VectorXd &gamma, const std::vector<size_t> &category,
                                           const Eigen::MatrixXd &X, size_t n_thresholds,
                                           Eigen::VectorXd *gradient, Eigen::MatrixXd *hessian) {
	const Eigen::Index q = gamma.size();
	const Eigen::Index p = X.cols();
	const Eigen::VectorXd beta = gamma.tail(p);

	if (gradient) {
		gradient->setZero(q);
	}
	if (hessian) {
		hessian->setZero(q, q);
	}

	double loglik = 0.0;
	Eigen::VectorXd u(q);
	Eigen::VectorXd v(q);

	for (Eigen::Index i = 0; i < X.rows(); i++) {
		const size_t c = category[static_cast<size_t>(i)];
		const double eta = X.row(i).dot(beta);

		// Upper cut point theta_c (absent for the top level), lower theta_{c-1}
		const bool has_upper = c < n_thresholds;
		const bool has_lower = c > 0;
		const double F_a = has_upper ? utils::logistic(gamma[static_cast<Eigen::Index>(c)] - eta) : 1.0;
		const double F_b = has_lower ? utils::logistic(gamma[static_cast<Eigen::Index>(c) - 1] - eta) : 0.0;
		const double prob = F_a - F_b;
		if (!(prob > 0.0)) {
			return -std::numeric_limits<double>::infinity();
		}
		loglik += std::log(prob);

		if (!gradient && !hessian) {
			continue;
		}

		const double f_a = has_upper ? F_a * (1.0 - F_a) : 0.0;
		const double f_b = has_lower ? F_b * (1.0 - F_b) : 0.0;
		const double df_a = f_a * (1.0 - 2.0 * F_a);
		const double df_b = f_b * (1.0 - 2.0 * F_b);

		// u = d(theta_c - eta)/d gamma, v = d(theta_{c-1} - eta)/d gamma
		u.setZero();
		v.setZero();
		if (has_upper) {
			u[static_cast<Eigen::Index>(c)] = 1.0;
		}
		if (has_lower) {
			v[static_cast<Eigen::Index>(c) - 1] = 1.0;
		}
		u.tail(p) = -X.row(i).transpose();
		v.tail(p) = -X.row(i).transpose();

		const Eigen::VectorXd grad_p = f_a * u - f_b * v;
		if (gradient) {
			*gradient += grad_p / prob;
		}
		if (hessian) {
			*hessian += (df_a * u * u.transpose() - df_b * v * v.transpose()) / prob -
			            grad_p * grad_p.transpose() / (prob * prob);
		}
	}
	return loglik;
}

inline OrdinalLogitResult OrdinalLogitSolver::Fit(const Eigen::VectorXd &y, const Eigen::MatrixXd &X,
                                                  const core::RegressionOptions &options) {
	options.Validate();

	if (y.size() != X.rows()) {
		throw std::invalid_argument("response length (" + std::to_string(y.size()) +
		                            ") does not match design rows (" + std::to_string(X.rows()) + ")");
	}
	if (!y.allFinite() || !X.allFinite()) {
		throw std::invalid_argument("ordinal fit requires finite response and design values");
	}

	OrdinalLogitResult result;
	result.n_obs = static_cast<size_t>(y.size());
	result.levels = DistinctLevels(y);

	const size_t K = result.levels.size();
	if (K < 2) {
		throw std::invalid_argument("ordinal fit requires at least two response levels (got " + std::to_string(K) +
		                            ")");
	}

	const size_t n_thresholds = K - 1;
	const Eigen::Index p = X.cols();
	const Eigen::Index q = static_cast<Eigen::Index>(n_thresholds) + p;
	const double nan = std::numeric_limits<double>::quiet_NaN();

	std::vector<size_t> category(result.n_obs);
	std::vector<size_t> counts(K, 0);
	for (Eigen::Index i = 0; i < y.size(); i++) {
		const auto it = std::lower_bound(result.levels.begin(), result.levels.end(), y[i]);
		const auto c = static_cast<size_t>(it - result.levels.begin());
		category[static_cast<size_t>(i)] = c;
		counts[c]++;
	}

	// Start: thresholds at the logits of the marginal cumulative proportions
	Eigen::VectorXd gamma = Eigen::VectorXd::Zero(q);
	size_t cumulative = 0;
	for (size_t j = 0; j < n_thresholds; j++) {
		cumulative += counts[j];
		const double prop = static_cast<double>(cumulative) / static_cast<double>(result.n_obs);
		gamma[static_cast<Eigen::Index>(j)] = std::log(prop / (1.0 - prop));
	}

	Eigen::VectorXd gradient;
	Eigen::MatrixXd hessian;
	double loglik = Evaluate(gamma, category, X, n_thresholds, &gradient, &hessian);

	for (size_t iter = 1; iter <= options.max_iterations; iter++) {
		result.iterations = iter;

		Eigen::LDLT<Eigen::MatrixXd> ldlt(-hessian);
		if (ldlt.info() != Eigen::Success || !ldlt.isPositive() ||
		    ldlt.vectorD().minCoeff() <= 1e-12 * std::max(1.0, ldlt.vectorD().maxCoeff())) {
			result.failure_reason = "singular information matrix";
			break;
		}
		const Eigen::VectorXd step = ldlt.solve(gradient);

		double scale = 1.0;
		Eigen::VectorXd candidate;
		double candidate_loglik = -std::numeric_limits<double>::infinity();
		bool accepted = false;
		for (int halving = 0; halving < 40; halving++) {
			candidate = gamma + scale * step;
			if (ThresholdsIncreasing(candidate, n_thresholds)) {
				candidate_loglik = Evaluate(candidate, category, X, n_thresholds, nullptr, nullptr);
				if (candidate_loglik >= loglik - 1e-12 * std::fabs(loglik)) {
					accepted = true;
					break;
				}
			}
			scale *= 0.5;
		}
		if (!accepted) {
			result.failure_reason = "step halving failed to improve the likelihood";
			break;
		}

		const double change = std::fabs(candidate_loglik - loglik);
		const double max_step = (scale * step).cwiseAbs().maxCoeff();
		gamma = candidate;
		loglik = Evaluate(gamma, category, X, n_thresholds, &gradient, &hessian);

		if (max_step < options.tolerance || change < options.tolerance * (std::fabs(loglik) + options.tolerance)) {
			result.converged = true;
			break;
		}
	}

	if (!result.converged && result.failure_reason.empty()) {
		result.failure_reason = "no convergence after " + std::to_string(options.max_iterations) + " iterations";
	}

	result.thresholds = gamma.head(static_cast<Eigen::Index>(n_thresholds));
	result.coefficients = gamma.tail(p);
	result.log_likelihood = loglik;
	result.std_errors = Eigen::VectorXd::Constant(p, nan);
	result.z_statistics = Eigen::VectorXd::Constant(p, nan);
	result.p_values = Eigen::VectorXd::Constant(p, nan);

	if (result.converged) {
		Eigen::LDLT<Eigen::MatrixXd> info(-hessian);
		if (info.info() == Eigen::Success && info.isPositive()) {
			const Eigen::MatrixXd covariance = info.solve(Eigen::MatrixXd::Identity(q, q));
			for (Eigen::Index j = 0; j < p; j++) {
				const Eigen::Index idx = static_cast<Eigen::Index>(n_thresholds) + j;
				const double var = covariance(idx, idx);
				if (var > 0.0 && std::isfinite(var)) {
					result.std_errors[j] = std::sqrt(var);
					result.z_statistics[j] = result.coefficients[j] / result.std_errors[j];
					result.p_values[j] = utils::normal_pvalue(result.z_statistics[j]);
				}
			}
			result.has_std_errors = true;
		} else {
			result.converged = false;
			result.failure_reason = "singular information matrix at the optimum";
		}
	}

	return result;
}

} // namespace solvers
} // namespace modstat
