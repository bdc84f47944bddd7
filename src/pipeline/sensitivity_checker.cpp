#include "modstat/pipeline/sensitivity_checker.hpp"
#include "modstat/solvers/ordinal_logit_solver.hpp"
#include "modstat/utils/tracing.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace modstat {
namespace pipeline {

// Position of the interaction slope in the ordinal design [I, M, I:M]
static constexpr Eigen::Index ORDINAL_INTERACTION = 2;

OrdinalSensitivityChecker::OrdinalSensitivityChecker(core::RegressionOptions options) : options_(options) {
	options_.intercept = false;
	options_.Validate();
}

bool OrdinalSensitivityChecker::AppliesTo(const std::string &outcome, const AnalysisSettings &settings) const {
	return settings.data_processing.run_sensitivity && settings.IsOrdinalOutcome(outcome);
}

SensitivityOutcome OrdinalSensitivityChecker::Check(const InteractionModel &model, const InteractionResult &linear,
                                                    double alpha) const {
	SensitivityOutcome out;
	const std::string prefix = linear.PairLabel() + ": ordinal sensitivity check";

	const auto levels = solvers::OrdinalLogitSolver::DistinctLevels(model.raw_outcome);
	if (levels.size() < 2) {
		out.note = prefix + " skipped: outcome has fewer than two levels";
		return out;
	}

	const auto fit = solvers::OrdinalLogitSolver::Fit(model.raw_outcome, model.X, options_);
	if (!fit.converged || !fit.has_std_errors || !std::isfinite(fit.p_values[ORDINAL_INTERACTION])) {
		const std::string reason = fit.failure_reason.empty() ? "interaction standard error is undefined"
		                                                      : fit.failure_reason;
		out.note = prefix + " did not converge (" + reason + "); linear result kept";
		MODSTAT_WARN(out.note);
		return out;
	}

	out.completed = true;
	out.beta_interaction = fit.coefficients[ORDINAL_INTERACTION];
	out.p_interaction = fit.p_values[ORDINAL_INTERACTION];

	const bool linear_positive = linear.beta_interaction > 0.0;
	const bool ordinal_positive = out.beta_interaction > 0.0;
	out.sign_agrees = linear_positive == ordinal_positive;
	out.significance_agrees = (linear.p_interaction < alpha) == (out.p_interaction < alpha);

	std::ostringstream oss;
	oss << std::setprecision(4);
	oss << prefix << " (proportional odds, " << levels.size() << " levels): beta=" << out.beta_interaction
	    << ", p=" << out.p_interaction << "; sign " << (out.sign_agrees ? "agrees" : "differs")
	    << ", significance at " << alpha << " " << (out.significance_agrees ? "agrees" : "differs")
	    << " with the linear model (beta=" << linear.beta_interaction << ", p=" << linear.p_interaction << ")";
	out.note = oss.str();

	MODSTAT_DEBUG(out.note << " after " << fit.iterations << " iterations");
	return out;
}

} // namespace pipeline
} // namespace modstat
