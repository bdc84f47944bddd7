#include "modstat/pipeline/regression_engine.hpp"
#include "modstat/inference/coefficient_inference.hpp"
#include "modstat/inference/simple_slopes.hpp"
#include "modstat/solvers/ols_solver.hpp"
#include "modstat/utils/tracing.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace modstat {
namespace pipeline {

// Confidence level of the simple-slope intervals
static constexpr double SLOPE_CONFIDENCE = 0.95;

// Parameters of the full model: intercept, I, M, I:M
static constexpr size_t MODEL_PARAMS = 4;

const char *PairStatusName(PairStatus status) {
	switch (status) {
	case PairStatus::FITTED:
		return "fitted";
	case PairStatus::NON_NUMERIC:
		return "non_numeric";
	case PairStatus::INSUFFICIENT_SAMPLE:
		return "insufficient_sample";
	case PairStatus::SINGULAR_DESIGN:
		return "singular_design";
	case PairStatus::NO_RESIDUAL_DF:
		return "no_residual_df";
	default:
		return "unknown";
	}
}

static PairFit Skip(PairStatus status, const std::string &moderator, const std::string &outcome,
                    const std::string &reason) {
	PairFit out;
	out.status = status;
	out.note = moderator + " x " + outcome + ": pair skipped: " + reason;
	return out;
}

double RegressionEngine::Median(Eigen::VectorXd values) {
	const Eigen::Index n = values.size();
	if (n == 0) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	double *begin = values.data();
	double *mid = begin + n / 2;
	std::nth_element(begin, mid, begin + n);
	const double upper = *mid;
	if (n % 2 == 1) {
		return upper;
	}
	const double lower = *std::max_element(begin, mid);
	return 0.5 * (lower + upper);
}

double RegressionEngine::SampleStdDev(const Eigen::VectorXd &values) {
	if (values.size() < 2) {
		return 0.0;
	}
	const double mean = values.mean();
	return std::sqrt((values.array() - mean).square().sum() / static_cast<double>(values.size() - 1));
}

double RegressionEngine::PartialEtaSquared(const Eigen::VectorXd &y, const Eigen::MatrixXd &X, double rss_full,
                                           size_t column) {
	const auto dropped = static_cast<Eigen::Index>(column);
	Eigen::MatrixXd reduced(X.rows(), X.cols() - 1);
	for (Eigen::Index j = 0, k = 0; j < X.cols(); j++) {
		if (j != dropped) {
			reduced.col(k++) = X.col(j);
		}
	}

	const auto reduced_fit = solvers::OLSSolver::Fit(y, reduced);
	const double ss_term = std::max(reduced_fit.rss - rss_full, 0.0);
	const double denom = ss_term + rss_full;
	if (!(denom > 0.0)) {
		return 0.0;
	}
	return std::min(1.0, ss_term / denom);
}

PairFit RegressionEngine::FitPair(const data::Dataset &dataset, const std::string &moderator,
                                  const std::string &outcome, const AnalysisSettings &settings) {
	const auto &mod_col = dataset.GetColumn(moderator);
	const auto &out_col = dataset.GetColumn(outcome);
	const auto &int_col = dataset.GetColumn(settings.variable_mapping.intervention);

	// Column types decide whether the pair can enter a linear model at all
	for (const data::Column *col : {&mod_col, &out_col, &int_col}) {
		if (!col->HasNumericStorage()) {
			return Skip(PairStatus::NON_NUMERIC, moderator, outcome,
			            "column '" + col->Name() + "' is " + data::ColumnTypeName(col->Type()) + ", not numeric");
		}
	}

	// Complete-case rows
	std::vector<size_t> rows;
	rows.reserve(dataset.RowCount());
	for (size_t r = 0; r < dataset.RowCount(); r++) {
		if (!mod_col.IsMissing(r) && !out_col.IsMissing(r) && !int_col.IsMissing(r)) {
			rows.push_back(r);
		}
	}
	const size_t n = rows.size();

	if (n < settings.min_sample_size) {
		return Skip(PairStatus::INSUFFICIENT_SAMPLE, moderator, outcome,
		            "n=" + std::to_string(n) + " < min_sample_size=" + std::to_string(settings.min_sample_size));
	}
	if (n <= MODEL_PARAMS) {
		return Skip(PairStatus::NO_RESIDUAL_DF, moderator, outcome,
		            "n=" + std::to_string(n) + " leaves no residual degrees of freedom");
	}

	const auto nn = static_cast<Eigen::Index>(n);
	Eigen::VectorXd m(nn);
	Eigen::VectorXd y(nn);
	Eigen::VectorXd treat(nn);
	for (Eigen::Index i = 0; i < nn; i++) {
		const size_t r = rows[static_cast<size_t>(i)];
		m[i] = mod_col.NumericAt(r);
		y[i] = out_col.NumericAt(r);
		treat[i] = int_col.NumericAt(r);
	}

	PairFit out;
	InteractionResult &result = out.result;
	InteractionModel &model = out.model;

	result.moderator = moderator;
	result.outcome = outcome;
	result.n_used = n;
	result.median = Median(y);
	result.mean = y.mean();
	result.std = SampleStdDev(y);

	model.raw_outcome = y;
	model.outcome_sd = result.std;

	const auto &processing = settings.data_processing;
	if (processing.center_moderators) {
		m.array() -= m.mean();
	}
	if (processing.center_outcomes) {
		y.array() -= y.mean();
	}
	model.moderator_mean = m.mean();
	model.moderator_sd = SampleStdDev(m);

	Eigen::MatrixXd X(nn, 3);
	X.col(0) = treat;
	X.col(1) = m;
	X.col(2) = treat.cwiseProduct(m);

	const auto constant = solvers::OLSSolver::DetectConstantColumns(X);
	if (constant[0]) {
		return Skip(PairStatus::SINGULAR_DESIGN, moderator, outcome,
		            "singular design: intervention '" + int_col.Name() + "' is constant within the used rows");
	}
	if (constant[1]) {
		return Skip(PairStatus::SINGULAR_DESIGN, moderator, outcome,
		            "singular design: moderator '" + moderator + "' is constant within the used rows");
	}

	model.fit = solvers::OLSSolver::FitWithStdErrors(y, X);
	if (model.fit.has_aliased_terms()) {
		return Skip(PairStatus::SINGULAR_DESIGN, moderator, outcome,
		            "singular design: interaction term is collinear with the main effects");
	}

	const auto tests = inference::CoefficientInference::ComputeInference(model.fit, SLOPE_CONFIDENCE);
	const auto k = static_cast<Eigen::Index>(INTERACTION);
	if (!std::isfinite(tests.p_values[k])) {
		return Skip(PairStatus::SINGULAR_DESIGN, moderator, outcome,
		            "singular design: interaction standard error is undefined");
	}

	result.beta_interaction = model.fit.coefficients[k];
	result.p_interaction = tests.p_values[k];
	result.q_interaction = result.p_interaction;
	result.r_squared = model.fit.r_squared;
	result.adj_r_squared = model.fit.adj_r_squared;
	result.partial_eta2 = PartialEtaSquared(y, X, model.fit.rss, INTERACTION - 1);

	inference::SlopeTerms terms;
	terms.main_effect = INTERVENTION;
	terms.interaction = INTERACTION;
	const auto slopes = inference::SimpleSlopeAnalyzer::Analyze(model.fit, terms, model.moderator_mean,
	                                                            model.moderator_sd, model.outcome_sd,
	                                                            SLOPE_CONFIDENCE);
	result.simple_slope_low = slopes.low;
	result.simple_slope_high = slopes.high;

	model.y = std::move(y);
	model.X = std::move(X);

	MODSTAT_DEBUG(result.PairLabel() << ": n=" << n << " beta=" << result.beta_interaction
	                                 << " p=" << result.p_interaction << " eta2=" << result.partial_eta2);
	return out;
}

} // namespace pipeline
} // namespace modstat
