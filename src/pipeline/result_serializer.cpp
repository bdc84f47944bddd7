#include "modstat/pipeline/result_serializer.hpp"
#include "modstat/utils/tracing.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace modstat {
namespace pipeline {

using nlohmann::json;

static json Number(double value) {
	if (!std::isfinite(value)) {
		return json(nullptr);
	}
	return json(value);
}

static json ToJson(const inference::SimpleSlope &slope) {
	return json {{"moderator_value", Number(slope.moderator_value)},
	             {"slope", Number(slope.slope)},
	             {"std_error", Number(slope.std_error)},
	             {"t_statistic", Number(slope.t_statistic)},
	             {"p_value", Number(slope.p_value)},
	             {"ci_lower", Number(slope.ci_lower)},
	             {"ci_upper", Number(slope.ci_upper)},
	             {"cohens_d", Number(slope.cohens_d)}};
}

json ToJson(const Job &job) {
	json out {{"job_id", job.job_id},
	          {"status", JobStatusName(job.status)},
	          {"progress", job.progress},
	          {"created_at", utils::Tracer::FormatTime(job.created_at)},
	          {"updated_at", utils::Tracer::FormatTime(job.updated_at)},
	          {"message", job.message}};
	if (job.status == JobStatus::FAILED) {
		out["error_message"] = job.error_message;
	} else {
		out["error_message"] = nullptr;
	}
	return out;
}

json ToJson(const InteractionResult &result) {
	return json {{"moderator", result.moderator},
	             {"outcome", result.outcome},
	             {"n_used", result.n_used},
	             {"median", Number(result.median)},
	             {"mean", Number(result.mean)},
	             {"std", Number(result.std)},
	             {"beta_interaction", Number(result.beta_interaction)},
	             {"p_interaction", Number(result.p_interaction)},
	             {"q_interaction", Number(result.q_interaction)},
	             {"partial_eta2", Number(result.partial_eta2)},
	             {"simple_slope_low", ToJson(result.simple_slope_low)},
	             {"simple_slope_high", ToJson(result.simple_slope_high)},
	             {"r_squared", Number(result.r_squared)},
	             {"adj_r_squared", Number(result.adj_r_squared)}};
}

json ToJson(const AnalysisResult &result) {
	json results = json::array();
	for (const auto &r : result.results) {
		results.push_back(ToJson(r));
	}

	json significant = json::array();
	for (const auto &pair : result.summary.significant_pairs) {
		significant.push_back({{"moderator", pair.moderator},
		                       {"outcome", pair.outcome},
		                       {"beta_interaction", Number(pair.beta_interaction)},
		                       {"p_interaction", Number(pair.p_interaction)},
		                       {"q_interaction", Number(pair.q_interaction)},
		                       {"partial_eta2", Number(pair.partial_eta2)}});
	}

	json figures = json::array();
	for (const auto &figure : result.figures) {
		figures.push_back({{"name", figure.name},
		                   {"kind", FigureKindName(figure.kind)},
		                   {"moderator", figure.moderator},
		                   {"outcome", figure.outcome},
		                   {"result_index", figure.result_index}});
	}

	const auto &summary = result.summary;
	return json {{"job_id", result.job_id},
	             {"status", JobStatusName(result.status)},
	             {"results", results},
	             {"summary",
	              {{"total_pairs", summary.total_pairs},
	               {"tested", summary.tested},
	               {"significant", summary.significant},
	               {"skipped", summary.skipped},
	               {"fdr_alpha", summary.fdr_alpha},
	               {"significant_pairs", significant}}},
	             {"notes", result.notes},
	             {"logs", result.logs},
	             {"figures", figures},
	             {"seed", result.seed},
	             {"created_at", utils::Tracer::FormatTime(result.created_at)},
	             {"completed_at", utils::Tracer::FormatTime(result.completed_at)}};
}

json ToJson(const data::Dataset &dataset) {
	const auto summary = dataset.Summary();

	json columns = json::array();
	for (const auto &column : dataset.Columns()) {
		columns.push_back({{"name", column.Name()},
		                   {"type", data::ColumnTypeName(column.Type())},
		                   {"missing_count", column.MissingCount()},
		                   {"missing_rate", column.MissingRate()},
		                   {"unique_count", column.UniqueCount()},
		                   {"sample_values", column.SampleValues()}});
	}

	return json {{"total_rows", summary.total_rows},
	             {"total_columns", summary.total_columns},
	             {"missing_values", summary.missing_values},
	             {"missing_rate", summary.missing_rate},
	             {"numeric_columns", summary.numeric_columns},
	             {"categorical_columns", summary.categorical_columns},
	             {"columns", columns}};
}

const std::vector<std::string> &InteractionSummaryColumns() {
	static const std::vector<std::string> columns {
	    "moderator",       "outcome",         "n_used",          "median",          "mean",
	    "std",             "beta_interaction", "p_interaction",  "q_interaction",   "partial_eta2",
	    "simple_slope_low", "p_low",          "ci95_low_lower",  "ci95_low_upper",  "d_low",
	    "simple_slope_high", "p_high",        "ci95_high_lower", "ci95_high_upper", "d_high",
	    "r_squared",       "adj_r_squared"};
	return columns;
}

static std::string CsvText(const std::string &text) {
	if (text.find_first_of(",\"\n\r") == std::string::npos) {
		return text;
	}
	std::string quoted = "\"";
	for (char c : text) {
		if (c == '"') {
			quoted += '"';
		}
		quoted += c;
	}
	quoted += '"';
	return quoted;
}

static std::string CsvNumber(double value) {
	if (std::isnan(value)) {
		return "";
	}
	std::ostringstream oss;
	oss << std::setprecision(10) << value;
	return oss.str();
}

void WriteInteractionSummaryCsv(std::ostream &out, const std::vector<InteractionResult> &results) {
	const auto &columns = InteractionSummaryColumns();
	for (size_t i = 0; i < columns.size(); i++) {
		out << (i > 0 ? "," : "") << columns[i];
	}
	out << '\n';

	for (const auto &r : results) {
		const auto &low = r.simple_slope_low;
		const auto &high = r.simple_slope_high;
		out << CsvText(r.moderator) << ',' << CsvText(r.outcome) << ',' << r.n_used << ',' << CsvNumber(r.median)
		    << ',' << CsvNumber(r.mean) << ',' << CsvNumber(r.std) << ',' << CsvNumber(r.beta_interaction) << ','
		    << CsvNumber(r.p_interaction) << ',' << CsvNumber(r.q_interaction) << ',' << CsvNumber(r.partial_eta2)
		    << ',' << CsvNumber(low.slope) << ',' << CsvNumber(low.p_value) << ',' << CsvNumber(low.ci_lower) << ','
		    << CsvNumber(low.ci_upper) << ',' << CsvNumber(low.cohens_d) << ',' << CsvNumber(high.slope) << ','
		    << CsvNumber(high.p_value) << ',' << CsvNumber(high.ci_lower) << ',' << CsvNumber(high.ci_upper) << ','
		    << CsvNumber(high.cohens_d) << ',' << CsvNumber(r.r_squared) << ',' << CsvNumber(r.adj_r_squared)
		    << '\n';
	}
}

} // namespace pipeline
} // namespace modstat
