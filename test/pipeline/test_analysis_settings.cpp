#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "modstat/core/errors.hpp"
#include "modstat/pipeline/analysis_settings.hpp"
#include "test_fixtures.hpp"

using namespace modstat;
using namespace modstat::pipeline;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("AnalysisSettings: Defaults", "[settings]") {
	AnalysisSettings settings;
	REQUIRE(settings.fdr_alpha == 0.05);
	REQUIRE(settings.min_sample_size == 30);
	REQUIRE(settings.generate_plots);
	REQUIRE(settings.max_plots == 20);
	REQUIRE(settings.figure_selection == FigureSelection::SIGNIFICANT_FIRST);
	REQUIRE(settings.data_processing.center_moderators);
	REQUIRE(!settings.data_processing.center_outcomes);
	REQUIRE(!settings.data_processing.run_sensitivity);
	REQUIRE(settings.data_processing.seed == 123);
	REQUIRE(std::string(FigureSelectionName(FigureSelection::SIGNIFICANT_ONLY)) == "significant_only");
}

TEST_CASE("AnalysisSettings: Role validation", "[settings][validation]") {
	auto settings = test_fixtures::MakeSettings({"M1", "M2"}, {"O1"});
	REQUIRE_NOTHROW(settings.Validate());
	REQUIRE(settings.PairCount() == 2);

	SECTION("Empty moderator list") {
		settings.variable_mapping.moderators.clear();
		REQUIRE_THROWS_AS(settings.Validate(), ConfigurationError);
	}

	SECTION("Empty outcome list") {
		settings.variable_mapping.outcomes.clear();
		REQUIRE_THROWS_AS(settings.Validate(), ConfigurationError);
	}

	SECTION("Missing intervention") {
		settings.variable_mapping.intervention.clear();
		REQUIRE_THROWS_WITH(settings.Validate(), ContainsSubstring("intervention"));
	}

	SECTION("Duplicate moderator") {
		settings.variable_mapping.moderators.push_back("M1");
		REQUIRE_THROWS_WITH(settings.Validate(), ContainsSubstring("listed twice"));
	}

	SECTION("Moderator used as outcome") {
		settings.variable_mapping.outcomes.push_back("M2");
		REQUIRE_THROWS_WITH(settings.Validate(), ContainsSubstring("both moderator and outcome"));
	}

	SECTION("Outcome used as intervention") {
		settings.variable_mapping.intervention = "O1";
		REQUIRE_THROWS_AS(settings.Validate(), ConfigurationError);
	}

	SECTION("Ordinal outcome outside the outcome list") {
		settings.data_processing.ordinal_outcomes = {"O9"};
		REQUIRE_THROWS_WITH(settings.Validate(), ContainsSubstring("'O9'"));
	}
}

TEST_CASE("AnalysisSettings: Range validation", "[settings][validation]") {
	auto settings = test_fixtures::MakeSettings({"M1"}, {"O1"});

	SECTION("fdr_alpha bounds") {
		settings.fdr_alpha = 0.0;
		REQUIRE_THROWS_AS(settings.Validate(), ConfigurationError);
		settings.fdr_alpha = 0.51;
		REQUIRE_THROWS_AS(settings.Validate(), ConfigurationError);
		settings.fdr_alpha = 0.5;
		REQUIRE_NOTHROW(settings.Validate());
	}

	SECTION("min_sample_size must be positive") {
		settings.min_sample_size = 0;
		REQUIRE_THROWS_AS(settings.Validate(), ConfigurationError);
	}
}

TEST_CASE("AnalysisSettings: Validation against a dataset", "[settings][validation]") {
	auto ds = data::Dataset::FromRaw({
	    {"treatment", {"0", "1", "0", "1"}},
	    {"arm", {"a", "b", "a", "b"}},
	    {"M1", {"0.1", "0.5", "0.9", "1.3"}},
	    {"O1", {"2.5", "3.5", "1.5", "4.5"}},
	});

	auto settings = test_fixtures::MakeSettings({"M1"}, {"O1"});
	REQUIRE_NOTHROW(settings.ValidateAgainst(*ds));

	SECTION("Unknown column") {
		settings.variable_mapping.outcomes = {"O2"};
		REQUIRE_THROWS_WITH(settings.ValidateAgainst(*ds), ContainsSubstring("'O2' does not exist"));
	}

	SECTION("Non-numeric intervention") {
		settings.variable_mapping.intervention = "arm";
		REQUIRE_THROWS_WITH(settings.ValidateAgainst(*ds), ContainsSubstring("must be numeric"));
	}
}

TEST_CASE("AnalysisSettings: Ordinal outcome lookup", "[settings]") {
	auto settings = test_fixtures::MakeSettings({"M1"}, {"O1", "O2"});
	settings.data_processing.ordinal_outcomes = {"O2"};
	REQUIRE(settings.IsOrdinalOutcome("O2"));
	REQUIRE(!settings.IsOrdinalOutcome("O1"));
}
