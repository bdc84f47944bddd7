#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "modstat/pipeline/sensitivity_checker.hpp"
#include "test_fixtures.hpp"

#include <cmath>

using namespace modstat;
using namespace modstat::pipeline;
using Catch::Matchers::ContainsSubstring;

// Five-level outcome cut from a latent moderated response
static std::shared_ptr<const data::Dataset> MakeOrdinalDataset(size_t n) {
	test_fixtures::Lcg rng(99);
	std::vector<double> treatment(n);
	std::vector<double> m(n);
	std::vector<double> rating(n);
	for (size_t i = 0; i < n; i++) {
		treatment[i] = static_cast<double>(i % 2);
		m[i] = rng.Normal();
		const double u = rng.Uniform();
		const double latent = 0.5 * treatment[i] + 0.3 * m[i] + 1.5 * treatment[i] * m[i] + std::log(u / (1.0 - u));
		rating[i] = latent < -1.5 ? 1.0 : latent < -0.5 ? 2.0 : latent < 0.5 ? 3.0 : latent < 1.5 ? 4.0 : 5.0;
	}
	return data::Dataset::FromNumeric({{"treatment", treatment}, {"M1", m}, {"rating", rating}});
}

TEST_CASE("SensitivityChecker: Eligibility", "[sensitivity]") {
	OrdinalSensitivityChecker checker;
	auto settings = test_fixtures::MakeSettings({"M1"}, {"rating", "score"});
	settings.data_processing.ordinal_outcomes = {"rating"};

	REQUIRE(checker.GetName() == "ordinal");
	REQUIRE(!checker.AppliesTo("rating", settings));

	settings.data_processing.run_sensitivity = true;
	REQUIRE(checker.AppliesTo("rating", settings));
	REQUIRE(!checker.AppliesTo("score", settings));
}

TEST_CASE("SensitivityChecker: Ordinal re-fit agrees with the linear model", "[sensitivity][ordinal]") {
	auto ds = MakeOrdinalDataset(200);
	REQUIRE(ds->GetColumn("rating").Type() == data::ColumnType::ORDINAL);

	auto settings = test_fixtures::MakeSettings({"M1"}, {"rating"});
	settings.data_processing.ordinal_outcomes = {"rating"};
	settings.data_processing.run_sensitivity = true;

	auto fit = RegressionEngine::FitPair(*ds, "M1", "rating", settings);
	REQUIRE(fit.Fitted());

	OrdinalSensitivityChecker checker;
	auto outcome = checker.Check(fit.model, fit.result, settings.fdr_alpha);

	REQUIRE(outcome.completed);
	REQUIRE(outcome.beta_interaction > 0.0);
	REQUIRE(outcome.sign_agrees);
	REQUIRE(outcome.significance_agrees);
	REQUIRE_THAT(outcome.note, ContainsSubstring("M1 x rating: ordinal sensitivity check"));
	REQUIRE_THAT(outcome.note, ContainsSubstring("5 levels"));
	REQUIRE_THAT(outcome.note, ContainsSubstring("sign agrees"));

	SECTION("The linear result is left untouched") {
		auto again = RegressionEngine::FitPair(*ds, "M1", "rating", settings);
		REQUIRE(again.result.beta_interaction == fit.result.beta_interaction);
	}
}

TEST_CASE("SensitivityChecker: Failures become notes", "[sensitivity][edge]") {
	const Eigen::Index n = 40;
	InteractionModel model;
	model.X.resize(n, 3);
	model.raw_outcome.resize(n);
	for (Eigen::Index i = 0; i < n; i++) {
		const double treat = static_cast<double>(i % 2);
		const double m = -1.0 + 2.0 * static_cast<double>(i) / static_cast<double>(n - 1);
		model.X(i, 0) = treat;
		model.X(i, 1) = m;
		model.X(i, 2) = treat * m;
	}

	InteractionResult linear;
	linear.moderator = "M1";
	linear.outcome = "rating";
	linear.beta_interaction = 0.4;
	linear.p_interaction = 0.01;

	SECTION("Single level") {
		model.raw_outcome.setConstant(3.0);
		auto outcome = OrdinalSensitivityChecker().Check(model, linear, 0.05);
		REQUIRE(!outcome.completed);
		REQUIRE(outcome.note == "M1 x rating: ordinal sensitivity check skipped: outcome has fewer than two levels");
	}

	SECTION("Separated outcome does not converge") {
		for (Eigen::Index i = 0; i < n; i++) {
			model.raw_outcome[i] = model.X(i, 0) + 1.0;
		}
		OrdinalSensitivityChecker checker(core::RegressionOptions::Ordinal(25));
		auto outcome = checker.Check(model, linear, 0.05);
		REQUIRE(!outcome.completed);
		REQUIRE_THAT(outcome.note, ContainsSubstring("did not converge"));
		REQUIRE_THAT(outcome.note, ContainsSubstring("linear result kept"));
	}
}
