#include <catch2/catch_test_macros.hpp>

#include "modstat/pipeline/figure_registry.hpp"
#include "test_fixtures.hpp"

using namespace modstat;
using namespace modstat::pipeline;

static InteractionResult MakeResult(const std::string &moderator, const std::string &outcome, double p, double q) {
	InteractionResult r;
	r.moderator = moderator;
	r.outcome = outcome;
	r.p_interaction = p;
	r.q_interaction = q;
	return r;
}

TEST_CASE("FigureRegistry: Naming", "[figures]") {
	REQUIRE(FigureRegistry::BaseName(FigureKind::SIMPLE_SLOPES, "age", "wellbeing") ==
	        "age_wellbeing_simple_slopes.png");
	REQUIRE(FigureRegistry::BaseName(FigureKind::BAR_CHART, "Age (years)", "score/total") ==
	        "Age__years__score_total_bar_chart.png");

	SECTION("Collisions get a numeric suffix") {
		FigureRegistry registry;
		auto a = MakeResult("a b", "y", 0.01, 0.01);
		auto b = MakeResult("a_b", "y", 0.02, 0.02);
		const std::string first = registry.Add(FigureKind::SIMPLE_SLOPES, a, 0);
		REQUIRE(registry.Add(FigureKind::SIMPLE_SLOPES, b, 1) == "a_b_y_simple_slopes-2.png");
		for (size_t i = 0; i < 32; i++) {
			registry.Add(FigureKind::BAR_CHART, b, 1);
		}
		REQUIRE(first == "a_b_y_simple_slopes.png");
		REQUIRE(registry.Add(FigureKind::BAR_CHART, a, 0) == "a_b_y_bar_chart-33.png");
		REQUIRE(registry.Size() == 35);
		REQUIRE(registry.Find("a_b_y_simple_slopes-2.png")->moderator == "a_b");
		REQUIRE(registry.Find("missing.png") == nullptr);
	}
}

TEST_CASE("FigureRegistry: Selection", "[figures]") {
	// Significant: M2 x O1 and M4 x O1 (q < 0.05)
	std::vector<InteractionResult> results = {
	    MakeResult("M1", "O1", 0.30, 0.40),
	    MakeResult("M2", "O1", 0.001, 0.004),
	    MakeResult("M3", "O1", 0.06, 0.08),
	    MakeResult("M4", "O1", 0.01, 0.02),
	};
	auto settings = test_fixtures::MakeSettings({"M1", "M2", "M3", "M4"}, {"O1"});
	std::vector<std::string> notes;

	SECTION("Two figures per pair, significant pairs first") {
		auto registry = FigureRegistry::Build(results, settings, notes);
		REQUIRE(registry.Size() == 8);
		const auto &artifacts = registry.Artifacts();
		REQUIRE(artifacts[0].moderator == "M2");
		REQUIRE(artifacts[0].kind == FigureKind::SIMPLE_SLOPES);
		REQUIRE(artifacts[1].kind == FigureKind::BAR_CHART);
		REQUIRE(artifacts[2].moderator == "M4");
		REQUIRE(artifacts[4].moderator == "M3");
		REQUIRE(artifacts[6].moderator == "M1");
		REQUIRE(artifacts[6].result_index == 0);
		REQUIRE(notes.empty());
	}

	SECTION("Truncation to max_plots pairs") {
		settings.max_plots = 3;
		auto registry = FigureRegistry::Build(results, settings, notes);
		REQUIRE(registry.Size() == 6);
		REQUIRE(registry.Find("M1_O1_simple_slopes.png") == nullptr);
		REQUIRE(notes.size() == 1);
		REQUIRE(notes[0] == "figures truncated: 3 of 4 candidate pairs visualized (max_plots=3)");
	}

	SECTION("Significant pairs only") {
		settings.figure_selection = FigureSelection::SIGNIFICANT_ONLY;
		auto registry = FigureRegistry::Build(results, settings, notes);
		REQUIRE(registry.Names() == std::vector<std::string>({"M2_O1_simple_slopes.png", "M2_O1_bar_chart.png",
		                                                      "M4_O1_simple_slopes.png", "M4_O1_bar_chart.png"}));
	}

	SECTION("Plots disabled") {
		settings.generate_plots = false;
		REQUIRE(FigureRegistry::Build(results, settings, notes).Size() == 0);
	}

	SECTION("Deterministic") {
		auto first = FigureRegistry::Build(results, settings, notes);
		auto second = FigureRegistry::Build(results, settings, notes);
		REQUIRE(first.Names() == second.Names());
	}
}
