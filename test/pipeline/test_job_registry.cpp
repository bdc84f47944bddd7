#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "modstat/core/errors.hpp"
#include "modstat/pipeline/job_registry.hpp"

using namespace modstat;
using namespace modstat::pipeline;
using Catch::Matchers::ContainsSubstring;

static std::shared_ptr<const data::Dataset> TinyDataset() {
	return data::Dataset::FromNumeric({{"x", {1.0, 2.0}}});
}

TEST_CASE("JobRegistry: Registration", "[jobs][registry]") {
	JobRegistry registry;
	auto job = registry.Register("job-1", TinyDataset());

	REQUIRE(job.job_id == "job-1");
	REQUIRE(job.status == JobStatus::PENDING);
	REQUIRE(job.progress == 0.0);
	REQUIRE(registry.Contains("job-1"));
	REQUIRE(registry.GetDataset("job-1")->RowCount() == 2);

	SECTION("Duplicate id") {
		REQUIRE_THROWS_AS(registry.Register("job-1", TinyDataset()), JobStateError);
	}

	SECTION("Invalid arguments") {
		REQUIRE_THROWS_AS(registry.Register("", TinyDataset()), std::invalid_argument);
		REQUIRE_THROWS_AS(registry.Register("job-2", nullptr), std::invalid_argument);
	}

	SECTION("Unknown id") {
		REQUIRE_THROWS_AS(registry.Snapshot("nope"), JobNotFoundError);
		REQUIRE_THROWS_WITH(registry.RequestCancel("nope"), "job not found: 'nope'");
	}
}

TEST_CASE("JobRegistry: Successful lifecycle", "[jobs][registry]") {
	JobRegistry registry;
	registry.Register("job-1", TinyDataset());

	registry.Claim("job-1");
	REQUIRE(registry.MarkRunning("job-1", "starting"));
	REQUIRE(registry.Snapshot("job-1").status == JobStatus::RUNNING);

	SECTION("Progress is monotone and clamped") {
		registry.UpdateProgress("job-1", 0.5, "half");
		registry.UpdateProgress("job-1", 0.25, "back");
		REQUIRE(registry.Snapshot("job-1").progress == 0.5);
		registry.UpdateProgress("job-1", 7.0, "over");
		REQUIRE(registry.Snapshot("job-1").progress == 1.0);
	}

	SECTION("Completion stores the result") {
		REQUIRE_THROWS_AS(registry.Result("job-1"), JobStateError);

		AnalysisResult result;
		result.job_id = "job-1";
		registry.Complete("job-1", result);

		const auto job = registry.Snapshot("job-1");
		REQUIRE(job.status == JobStatus::COMPLETED);
		REQUIRE(job.progress == 1.0);
		REQUIRE(registry.Result("job-1").job_id == "job-1");
	}

	SECTION("Terminal jobs never change") {
		registry.Complete("job-1", AnalysisResult());
		registry.Fail("job-1", "late failure");
		registry.RequestCancel("job-1");
		registry.MarkCancelled("job-1", "late cancel");
		REQUIRE(registry.Snapshot("job-1").status == JobStatus::COMPLETED);
		REQUIRE(registry.Snapshot("job-1").error_message.empty());
		REQUIRE_THROWS_AS(registry.Complete("job-1", AnalysisResult()), JobStateError);
	}

	SECTION("A running job cannot be claimed again") {
		REQUIRE_THROWS_WITH(registry.Claim("job-1"), ContainsSubstring("already running"));
	}
}

TEST_CASE("JobRegistry: Claims", "[jobs][registry]") {
	JobRegistry registry;
	registry.Register("job-1", TinyDataset());
	const auto claimed = registry.Claim("job-1");
	REQUIRE(claimed.job_id == "job-1");
	REQUIRE(claimed.status == JobStatus::PENDING);

	SECTION("Second claim is rejected") {
		REQUIRE_THROWS_AS(registry.Claim("job-1"), JobStateError);
	}

	SECTION("Released claims can be taken again") {
		registry.ReleaseClaim("job-1");
		REQUIRE_NOTHROW(registry.Claim("job-1"));
	}
}

TEST_CASE("JobRegistry: Cancellation", "[jobs][registry][cancel]") {
	JobRegistry registry;
	registry.Register("job-1", TinyDataset());

	SECTION("Pending jobs are cancelled immediately") {
		auto job = registry.RequestCancel("job-1");
		REQUIRE(job.status == JobStatus::CANCELLED);
		REQUIRE(!registry.MarkRunning("job-1", "starting"));
		REQUIRE_THROWS_AS(registry.Claim("job-1"), JobStateError);
	}

	SECTION("Running jobs get a flag and keep their progress") {
		registry.Claim("job-1");
		registry.MarkRunning("job-1", "starting");
		registry.UpdateProgress("job-1", 0.2, "pair 2");

		auto job = registry.RequestCancel("job-1");
		REQUIRE(job.status == JobStatus::RUNNING);
		REQUIRE(registry.IsCancelRequested("job-1"));

		registry.UpdateProgress("job-1", 0.3, "pair 3");
		registry.MarkCancelled("job-1", "cancelled");

		job = registry.Snapshot("job-1");
		REQUIRE(job.status == JobStatus::CANCELLED);
		REQUIRE(job.progress == 0.2);
		REQUIRE_THROWS_AS(registry.Result("job-1"), JobStateError);
	}
}

TEST_CASE("JobRegistry: Failure", "[jobs][registry]") {
	JobRegistry registry;
	registry.Register("job-1", TinyDataset());
	registry.Claim("job-1");
	registry.MarkRunning("job-1", "starting");
	registry.Fail("job-1", "design matrix exploded");

	const auto job = registry.Snapshot("job-1");
	REQUIRE(job.status == JobStatus::FAILED);
	REQUIRE(job.error_message == "design matrix exploded");
}

TEST_CASE("JobRegistry: Listing and purging", "[jobs][registry]") {
	JobRegistry registry;
	registry.Register("b", TinyDataset());
	registry.Register("a", TinyDataset());
	registry.RequestCancel("a");

	const auto jobs = registry.List();
	REQUIRE(jobs.size() == 2);

	SECTION("Only old terminal jobs are purged") {
		const auto later = Clock::now() + std::chrono::hours(2);
		REQUIRE(registry.PurgeOlderThan(std::chrono::hours(1), later) == 1);
		REQUIRE(!registry.Contains("a"));
		REQUIRE(registry.Contains("b"));
	}

	SECTION("Kept ids survive regardless of age") {
		const auto later = Clock::now() + std::chrono::hours(2);
		REQUIRE(registry.PurgeOlderThan(std::chrono::hours(1), later, {"a"}) == 0);
		REQUIRE(registry.Contains("a"));
	}

	SECTION("Recent jobs are kept") {
		REQUIRE(registry.PurgeOlderThan(std::chrono::hours(1)) == 0);
	}
}
