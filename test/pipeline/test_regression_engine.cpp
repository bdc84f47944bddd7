#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "modstat/pipeline/regression_engine.hpp"
#include "modstat/solvers/ols_solver.hpp"
#include "test_fixtures.hpp"

#include <cmath>
#include <limits>

using namespace modstat;
using namespace modstat::pipeline;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

TEST_CASE("RegressionEngine: Fits a true interaction", "[engine]") {
	auto ds = data::Dataset::FromNumeric(test_fixtures::MakeModerationColumns(80, 1, {1.0}));
	auto settings = test_fixtures::MakeSettings({"M1"}, {"O1"});

	auto fit = RegressionEngine::FitPair(*ds, "M1", "O1", settings);
	REQUIRE(fit.Fitted());
	REQUIRE(fit.note.empty());

	const auto &r = fit.result;
	REQUIRE(r.moderator == "M1");
	REQUIRE(r.outcome == "O1");
	REQUIRE(r.PairLabel() == "M1 x O1");
	REQUIRE(r.n_used == 80);
	REQUIRE_THAT(r.beta_interaction, WithinAbs(1.0, 0.3));
	REQUIRE(r.p_interaction < 0.001);
	REQUIRE(r.q_interaction == r.p_interaction);
	REQUIRE(r.partial_eta2 > 0.0);
	REQUIRE(r.partial_eta2 < 1.0);
	REQUIRE(r.r_squared >= 0.0);
	REQUIRE(r.r_squared <= 1.0);
	REQUIRE(r.adj_r_squared <= r.r_squared);

	SECTION("Outcome statistics are on the raw scale") {
		const auto &y = ds->GetColumn("O1").NumericValues();
		double sum = 0.0;
		for (double v : y) {
			sum += v;
		}
		REQUIRE_THAT(r.mean, WithinAbs(sum / 80.0, 1e-9));
		REQUIRE(r.std > 0.0);
	}

	SECTION("Simple slopes bracket the moderator mean") {
		REQUIRE(r.simple_slope_high.slope > r.simple_slope_low.slope);
		REQUIRE_THAT(r.simple_slope_low.moderator_value, WithinAbs(-fit.model.moderator_sd, 1e-9));
		REQUIRE_THAT(r.simple_slope_high.moderator_value, WithinAbs(fit.model.moderator_sd, 1e-9));
	}

	SECTION("Model keeps the design used for fitting") {
		REQUIRE(fit.model.X.rows() == 80);
		REQUIRE(fit.model.X.cols() == 3);
		REQUIRE(fit.model.raw_outcome.size() == 80);
		REQUIRE_THAT(fit.model.moderator_mean, WithinAbs(0.0, 1e-12));
	}
}

TEST_CASE("RegressionEngine: Centering does not change the interaction", "[engine][centering]") {
	auto ds = data::Dataset::FromNumeric(test_fixtures::MakeModerationColumns(60, 1, {0.8}));
	auto centered = test_fixtures::MakeSettings({"M1"}, {"O1"});
	auto raw = centered;
	raw.data_processing.center_moderators = false;
	auto both = centered;
	both.data_processing.center_outcomes = true;

	auto a = RegressionEngine::FitPair(*ds, "M1", "O1", centered);
	auto b = RegressionEngine::FitPair(*ds, "M1", "O1", raw);
	auto c = RegressionEngine::FitPair(*ds, "M1", "O1", both);

	REQUIRE_THAT(a.result.beta_interaction, WithinAbs(b.result.beta_interaction, 1e-9));
	REQUIRE_THAT(a.result.p_interaction, WithinAbs(b.result.p_interaction, 1e-9));
	REQUIRE_THAT(a.result.beta_interaction, WithinAbs(c.result.beta_interaction, 1e-9));

	SECTION("Simple slopes are evaluated at the same raw moderator levels") {
		REQUIRE_THAT(a.result.simple_slope_low.slope, WithinAbs(b.result.simple_slope_low.slope, 1e-9));
		REQUIRE_THAT(a.result.simple_slope_high.slope, WithinAbs(b.result.simple_slope_high.slope, 1e-9));
	}

	SECTION("Raw outcome statistics ignore outcome centering") {
		REQUIRE_THAT(a.result.mean, WithinAbs(c.result.mean, 1e-12));
		REQUIRE(std::fabs(b.model.moderator_mean) > 1e-6);
	}
}

TEST_CASE("RegressionEngine: Complete-case rows", "[engine][missing]") {
	auto columns = test_fixtures::MakeModerationColumns(50, 1, {1.0});
	columns[1].second[3] = std::numeric_limits<double>::quiet_NaN();
	columns[2].second[7] = std::numeric_limits<double>::quiet_NaN();
	auto ds = data::Dataset::FromNumeric(columns);

	auto fit = RegressionEngine::FitPair(*ds, "M1", "O1", test_fixtures::MakeSettings({"M1"}, {"O1"}));
	REQUIRE(fit.Fitted());
	REQUIRE(fit.result.n_used == 48);
}

TEST_CASE("RegressionEngine: Small-scale moderators are fitted", "[engine][scale]") {
	auto columns = test_fixtures::MakeModerationColumns(80, 1, {1.0});
	auto settings = test_fixtures::MakeSettings({"M1"}, {"O1"});
	const auto unit = RegressionEngine::FitPair(*data::Dataset::FromNumeric(columns), "M1", "O1", settings);

	for (auto &value : columns[1].second) {
		value *= 1.0e-6;
	}
	const auto scaled = RegressionEngine::FitPair(*data::Dataset::FromNumeric(columns), "M1", "O1", settings);

	REQUIRE(unit.Fitted());
	REQUIRE(scaled.Fitted());
	REQUIRE_THAT(scaled.result.p_interaction, WithinAbs(unit.result.p_interaction, 1e-8));
	REQUIRE_THAT(scaled.result.beta_interaction * 1.0e-6, WithinAbs(unit.result.beta_interaction, 1e-6));
	REQUIRE_THAT(scaled.result.simple_slope_high.slope, WithinAbs(unit.result.simple_slope_high.slope, 1e-6));
}

TEST_CASE("RegressionEngine: Skipped pairs", "[engine][skip]") {
	auto settings = test_fixtures::MakeSettings({"M1"}, {"O1"});

	SECTION("Insufficient sample") {
		auto columns = test_fixtures::MakeModerationColumns(45, 1, {1.0});
		test_fixtures::TruncateColumn(columns, "O1", 20);
		auto ds = data::Dataset::FromNumeric(columns);

		auto fit = RegressionEngine::FitPair(*ds, "M1", "O1", settings);
		REQUIRE(fit.status == PairStatus::INSUFFICIENT_SAMPLE);
		REQUIRE(fit.note == "M1 x O1: pair skipped: n=20 < min_sample_size=30");
	}

	SECTION("No residual degrees of freedom") {
		auto columns = test_fixtures::MakeModerationColumns(10, 1, {1.0});
		test_fixtures::TruncateColumn(columns, "O1", 4);
		auto ds = data::Dataset::FromNumeric(columns);
		settings.min_sample_size = 1;

		auto fit = RegressionEngine::FitPair(*ds, "M1", "O1", settings);
		REQUIRE(fit.status == PairStatus::NO_RESIDUAL_DF);
		REQUIRE_THAT(fit.note, ContainsSubstring("n=4 leaves no residual degrees of freedom"));
	}

	SECTION("Non-numeric moderator") {
		std::vector<std::string> treatment;
		std::vector<std::string> group;
		std::vector<std::string> outcome;
		for (int i = 0; i < 40; i++) {
			treatment.push_back(std::to_string(i % 2));
			group.push_back(i % 3 == 0 ? "low" : "high");
			outcome.push_back(std::to_string(0.25 * i));
		}
		auto ds = data::Dataset::FromRaw({{"treatment", treatment}, {"M1", group}, {"O1", outcome}});

		auto fit = RegressionEngine::FitPair(*ds, "M1", "O1", settings);
		REQUIRE(fit.status == PairStatus::NON_NUMERIC);
		REQUIRE(fit.note == "M1 x O1: pair skipped: column 'M1' is categorical, not numeric");
	}

	SECTION("Constant intervention") {
		auto columns = test_fixtures::MakeModerationColumns(40, 1, {1.0});
		for (auto &v : columns[0].second) {
			v = 1.0;
		}
		auto ds = data::Dataset::FromNumeric(columns);

		auto fit = RegressionEngine::FitPair(*ds, "M1", "O1", settings);
		REQUIRE(fit.status == PairStatus::SINGULAR_DESIGN);
		REQUIRE_THAT(fit.note, ContainsSubstring("intervention 'treatment' is constant"));
	}

	SECTION("Constant moderator") {
		auto columns = test_fixtures::MakeModerationColumns(40, 1, {1.0});
		for (auto &v : columns[1].second) {
			v = 2.5;
		}
		auto ds = data::Dataset::FromNumeric(columns);

		auto fit = RegressionEngine::FitPair(*ds, "M1", "O1", settings);
		REQUIRE(fit.status == PairStatus::SINGULAR_DESIGN);
		REQUIRE_THAT(fit.note, ContainsSubstring("moderator 'M1' is constant"));
	}

	SECTION("Moderator identical to the intervention") {
		auto columns = test_fixtures::MakeModerationColumns(40, 1, {1.0});
		columns[1].second = columns[0].second;
		auto ds = data::Dataset::FromNumeric(columns);

		auto fit = RegressionEngine::FitPair(*ds, "M1", "O1", settings);
		REQUIRE(fit.status == PairStatus::SINGULAR_DESIGN);
		REQUIRE_THAT(fit.note, ContainsSubstring("singular design"));
	}

	SECTION("Unknown column") {
		auto ds = data::Dataset::FromNumeric(test_fixtures::MakeModerationColumns(40, 1, {1.0}));
		REQUIRE_THROWS_AS(RegressionEngine::FitPair(*ds, "M9", "O1", settings), std::out_of_range);
	}
}

TEST_CASE("RegressionEngine: Descriptive helpers", "[engine][helpers]") {
	SECTION("Median") {
		Eigen::VectorXd odd(3);
		odd << 3.0, 1.0, 2.0;
		REQUIRE(RegressionEngine::Median(odd) == 2.0);

		Eigen::VectorXd even(4);
		even << 4.0, 1.0, 3.0, 2.0;
		REQUIRE(RegressionEngine::Median(even) == 2.5);

		REQUIRE(std::isnan(RegressionEngine::Median(Eigen::VectorXd(0))));
	}

	SECTION("Sample standard deviation") {
		Eigen::VectorXd v(8);
		v << 2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0;
		REQUIRE_THAT(RegressionEngine::SampleStdDev(v), WithinAbs(std::sqrt(32.0 / 7.0), 1e-12));
		REQUIRE(RegressionEngine::SampleStdDev(Eigen::VectorXd::Constant(1, 3.0)) == 0.0);
	}

	SECTION("Partial eta squared of an irrelevant column is small") {
		Eigen::MatrixXd X(6, 2);
		X << 1.0, 0.3,
		     2.0, -0.1,
		     3.0, 0.2,
		     4.0, -0.3,
		     5.0, 0.1,
		     6.0, -0.2;
		Eigen::VectorXd y(6);
		y << 1.1, 2.0, 2.9, 4.2, 5.0, 5.8;
		auto fit = solvers::OLSSolver::Fit(y, X);

		const double eta_x = RegressionEngine::PartialEtaSquared(y, X, fit.rss, 0);
		const double eta_noise = RegressionEngine::PartialEtaSquared(y, X, fit.rss, 1);
		REQUIRE(eta_x > 0.99);
		REQUIRE(eta_noise >= 0.0);
		REQUIRE(eta_noise < eta_x);
	}
}
