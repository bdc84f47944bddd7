#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>
#include <stdexcept>
#include <string>
#include <vector>

namespace modstat {
namespace inference {

/**
 * Outcome of a false-discovery-rate correction
 *
 * All vectors are in the SAME order as the input p-values.
 */
struct FdrCorrection {
	/// Adjusted p-values (q-values), each in [0, 1]
	std::vector<double> q_values;

	/// True where the hypothesis is rejected at the requested alpha
	std::vector<bool> rejected;

	size_t n_rejected = 0;

	double alpha = 0.05;
};

/**
 * Benjamini-Hochberg step-up correction
 *
 * q_(i) = min over j >= i of min(1, p_(j) * m / j), ranks taken in ascending
 * p order. Hypotheses with rank <= k are rejected, k being the largest rank
 * with p_(k) <= k/m * alpha. Ties keep their input order, so the result is
 * deterministic and repeated application to the same input is identical.
 *
 * @param p_values Raw p-values in [0, 1]; an empty input yields an empty result
 * @param alpha FDR level in (0, 1)
 * @throws std::invalid_argument for p-values outside [0, 1] (or NaN) or an
 *         invalid alpha
 */
inline FdrCorrection BenjaminiHochberg(const std::vector<double> &p_values, double alpha = 0.05) {
	if (!(alpha > 0.0 && alpha < 1.0)) {
		throw std::invalid_argument("FDR alpha must be in (0, 1) (got " + std::to_string(alpha) + ")");
	}

	const size_t m = p_values.size();
	FdrCorrection out;
	out.alpha = alpha;
	out.q_values.assign(m, 0.0);
	out.rejected.assign(m, false);
	if (m == 0) {
		return out;
	}

	for (size_t i = 0; i < m; i++) {
		const double p = p_values[i];
		if (!(p >= 0.0 && p <= 1.0)) {
			throw std::invalid_argument("p-value at position " + std::to_string(i) + " is outside [0, 1] (" +
			                            std::to_string(p) + ")");
		}
	}

	// Index array sorted by ascending raw p-value
	std::vector<size_t> order(m);
	std::iota(order.begin(), order.end(), 0);
	std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) { return p_values[a] < p_values[b]; });

	const double md = static_cast<double>(m);

	// Step-up threshold: largest rank k with p_(k) <= k/m * alpha
	size_t k_max = 0;
	for (size_t rank = 1; rank <= m; rank++) {
		if (p_values[order[rank - 1]] <= static_cast<double>(rank) / md * alpha) {
			k_max = rank;
		}
	}

	// Walk from the largest p-value down, keeping a running minimum
	double running_min = 1.0;
	for (size_t rank = m; rank >= 1; rank--) {
		const size_t idx = order[rank - 1];
		const double adjusted = std::min(1.0, p_values[idx] * md / static_cast<double>(rank));
		running_min = std::min(running_min, adjusted);
		out.q_values[idx] = running_min;
		if (rank <= k_max) {
			out.rejected[idx] = true;
		}
	}
	out.n_rejected = k_max;

	return out;
}

} // namespace inference
} // namespace modstat
