#pragma once

#include "modstat/inference/simple_slopes.hpp"

#include <cstddef>
#include <string>

namespace modstat {
namespace pipeline {

/**
 * Moderated-regression result for one (moderator, outcome) pair
 *
 * Created once by the regression engine. q_interaction is the only field
 * written afterwards, by the batch-wide multiplicity correction.
 */
struct InteractionResult {
	std::string moderator;
	std::string outcome;

	/// Complete rows used in the fit
	size_t n_used = 0;

	/// Outcome statistics over the used rows (raw scale, sample SD)
	double median = 0.0;
	double mean = 0.0;
	double std = 0.0;

	double beta_interaction = 0.0;
	double p_interaction = 1.0;

	/// BH-adjusted p-value; equals p_interaction until the correction runs
	double q_interaction = 1.0;

	double partial_eta2 = 0.0;

	inference::SimpleSlope simple_slope_low;
	inference::SimpleSlope simple_slope_high;

	double r_squared = 0.0;
	double adj_r_squared = 0.0;

	std::string PairLabel() const {
		return moderator + " x " + outcome;
	}
};

} // namespace pipeline
} // namespace modstat
