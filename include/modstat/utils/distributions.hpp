#pragma once

#include <cmath>
#include <limits>
#include <algorithm>

namespace modstat {
namespace utils {

/**
 * Probability distribution helpers used by the inference layer
 *
 * Provides:
 * - log-gamma / log-beta
 * - Regularized incomplete beta function I_x(a, b)
 * - Student's t CDF, two-tailed p-values and critical values
 * - Standard normal CDF and two-tailed p-values (Wald tests)
 *
 * All functions are stateless and header-only.
 */

/// log(Γ(x)) for x > 0
inline double log_gamma(double x) {
	return std::lgamma(x);
}

/// log(B(a, b)) = log Γ(a) + log Γ(b) - log Γ(a+b)
inline double log_beta(double a, double b) {
	return log_gamma(a) + log_gamma(b) - log_gamma(a + b);
}

namespace detail {

/**
 * Continued fraction for the incomplete beta function (modified Lentz)
 *
 * Converges rapidly for x < (a + 1) / (a + b + 2).
 */
inline double beta_continued_fraction(double x, double a, double b) {
	constexpr int max_iterations = 300;
	constexpr double epsilon = 1e-15;
	constexpr double tiny = 1e-300;

	const double qab = a + b;
	const double qap = a + 1.0;
	const double qam = a - 1.0;

	double c = 1.0;
	double d = 1.0 - qab * x / qap;
	if (std::fabs(d) < tiny) {
		d = tiny;
	}
	d = 1.0 / d;
	double h = d;

	for (int m = 1; m <= max_iterations; m++) {
		const double m2 = 2.0 * m;

		// Even step
		double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
		d = 1.0 + aa * d;
		if (std::fabs(d) < tiny) {
			d = tiny;
		}
		c = 1.0 + aa / c;
		if (std::fabs(c) < tiny) {
			c = tiny;
		}
		d = 1.0 / d;
		h *= d * c;

		// Odd step
		aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
		d = 1.0 + aa * d;
		if (std::fabs(d) < tiny) {
			d = tiny;
		}
		c = 1.0 + aa / c;
		if (std::fabs(c) < tiny) {
			c = tiny;
		}
		d = 1.0 / d;
		const double delta = d * c;
		h *= delta;

		if (std::fabs(delta - 1.0) < epsilon) {
			break;
		}
	}
	return h;
}

} // namespace detail

/**
 * Regularized incomplete beta function I_x(a, b)
 *
 * @param x Evaluation point in [0, 1]
 * @param a Shape parameter (> 0)
 * @param b Shape parameter (> 0)
 * @return I_x(a, b), NaN for invalid input
 */
inline double beta_inc_reg(double x, double a, double b) {
	if (std::isnan(x) || a <= 0.0 || b <= 0.0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (x <= 0.0) {
		return 0.0;
	}
	if (x >= 1.0) {
		return 1.0;
	}

	const double log_front = a * std::log(x) + b * std::log1p(-x) - log_beta(a, b);
	const double front = std::exp(log_front);

	// Use the symmetry relation where the continued fraction converges faster
	if (x < (a + 1.0) / (a + b + 2.0)) {
		return front * detail::beta_continued_fraction(x, a, b) / a;
	}
	return 1.0 - front * detail::beta_continued_fraction(1.0 - x, b, a) / b;
}

/**
 * Cumulative distribution function of Student's t
 *
 * @param t Evaluation point
 * @param df Degrees of freedom (> 0)
 * @return P(T <= t)
 */
inline double student_t_cdf(double t, double df) {
	if (std::isnan(t) || df <= 0.0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (std::isinf(t)) {
		return t > 0.0 ? 1.0 : 0.0;
	}
	const double x = df / (df + t * t);
	const double tail = 0.5 * beta_inc_reg(x, df / 2.0, 0.5);
	return t > 0.0 ? 1.0 - tail : tail;
}

/**
 * Two-tailed p-value for a t-statistic
 *
 * p = P(|T| > |t|) = I_{df/(df+t²)}(df/2, 1/2)
 *
 * @param t t-statistic
 * @param df Degrees of freedom (> 0)
 * @return Two-tailed p-value in [0, 1]
 */
inline double student_t_pvalue(double t, double df) {
	if (std::isnan(t) || df <= 0.0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (std::isinf(t)) {
		return 0.0;
	}
	const double x = df / (df + t * t);
	const double p = beta_inc_reg(x, df / 2.0, 0.5);
	return std::min(1.0, std::max(0.0, p));
}

/**
 * Two-tailed critical value of Student's t
 *
 * Returns c such that P(|T| > c) = alpha. Solved by bisection on
 * student_t_pvalue(), which is monotonically decreasing in |t|.
 *
 * @param alpha Two-tailed significance level in (0, 1)
 * @param df Degrees of freedom (> 0)
 * @return Critical value c > 0
 */
inline double student_t_critical(double alpha, double df) {
	if (!(alpha > 0.0 && alpha < 1.0) || df <= 0.0) {
		return std::numeric_limits<double>::quiet_NaN();
	}

	double lo = 0.0;
	double hi = 1.0;
	while (student_t_pvalue(hi, df) > alpha && hi < 1e8) {
		hi *= 2.0;
	}

	for (int iter = 0; iter < 200; iter++) {
		const double mid = 0.5 * (lo + hi);
		if (student_t_pvalue(mid, df) > alpha) {
			lo = mid;
		} else {
			hi = mid;
		}
		if (hi - lo < 1e-12 * std::max(1.0, hi)) {
			break;
		}
	}
	return 0.5 * (lo + hi);
}

/// Standard normal CDF Φ(z)
inline double normal_cdf(double z) {
	return 0.5 * std::erfc(-z / std::sqrt(2.0));
}

/// Two-tailed p-value for a Wald z-statistic: 2·(1 - Φ(|z|))
inline double normal_pvalue(double z) {
	if (std::isnan(z)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return std::erfc(std::fabs(z) / std::sqrt(2.0));
}

/// Logistic function 1 / (1 + exp(-x)), stable for large |x|
inline double logistic(double x) {
	if (x >= 0.0) {
		return 1.0 / (1.0 + std::exp(-x));
	}
	const double e = std::exp(x);
	return e / (1.0 + e);
}

} // namespace utils
} // namespace modstat
