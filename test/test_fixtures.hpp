#pragma once

#include "modstat/data/dataset.hpp"
#include "modstat/pipeline/analysis_settings.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace modstat {
namespace test_fixtures {

/// Reproducible pseudo-random stream (64-bit LCG, Box-Muller normals)
class Lcg {
public:
	explicit Lcg(uint64_t seed) : state_(seed) {
	}

	double Uniform() {
		state_ = state_ * 6364136223846793005ULL + 1442695040888963407ULL;
		return (static_cast<double>(state_ >> 11) + 0.5) / 9007199254740992.0;
	}

	double Normal() {
		const double u1 = Uniform();
		const double u2 = Uniform();
		return std::sqrt(-2.0 * std::log(u1)) * std::cos(6.283185307179586 * u2);
	}

private:
	uint64_t state_;
};

using NumericColumns = std::vector<std::pair<std::string, std::vector<double>>>;

/**
 * Two-arm moderation data: treatment alternates 0/1, each moderator is
 * standard normal and each outcome is
 *   1 + 0.5 * treatment + 0.3 * M1 + beta * treatment * M1 + noise_sd * e
 */
inline NumericColumns MakeModerationColumns(size_t n, size_t n_moderators, const std::vector<double> &betas,
                                            double noise_sd = 0.5, uint64_t seed = 2024) {
	Lcg rng(seed);
	NumericColumns columns;

	std::vector<double> treatment(n);
	for (size_t i = 0; i < n; i++) {
		treatment[i] = static_cast<double>(i % 2);
	}
	columns.emplace_back("treatment", treatment);

	std::vector<std::vector<double>> moderators(n_moderators, std::vector<double>(n));
	for (size_t k = 0; k < n_moderators; k++) {
		for (size_t i = 0; i < n; i++) {
			moderators[k][i] = rng.Normal();
		}
		columns.emplace_back("M" + std::to_string(k + 1), moderators[k]);
	}

	for (size_t j = 0; j < betas.size(); j++) {
		std::vector<double> y(n);
		for (size_t i = 0; i < n; i++) {
			const double m = moderators[0][i];
			y[i] = 1.0 + 0.5 * treatment[i] + 0.3 * m + betas[j] * treatment[i] * m + noise_sd * rng.Normal();
		}
		columns.emplace_back("O" + std::to_string(j + 1), y);
	}
	return columns;
}

/// Set the last (n - keep) cells of a column to missing
inline void TruncateColumn(NumericColumns &columns, const std::string &name, size_t keep) {
	for (auto &col : columns) {
		if (col.first == name) {
			for (size_t i = keep; i < col.second.size(); i++) {
				col.second[i] = std::numeric_limits<double>::quiet_NaN();
			}
		}
	}
}

inline pipeline::AnalysisSettings MakeSettings(const std::vector<std::string> &moderators,
                                               const std::vector<std::string> &outcomes,
                                               const std::string &intervention = "treatment") {
	pipeline::AnalysisSettings settings;
	settings.variable_mapping.moderators = moderators;
	settings.variable_mapping.outcomes = outcomes;
	settings.variable_mapping.intervention = intervention;
	return settings;
}

} // namespace test_fixtures
} // namespace modstat
