#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "modstat/solvers/ordinal_logit_solver.hpp"

#include <cmath>

using namespace modstat;
using namespace modstat::solvers;
using Catch::Matchers::WithinAbs;

// Deterministic ordinal data: latent x*beta plus a fixed logistic-like
// perturbation, cut into four levels
static void MakeOrdinalData(double beta, Eigen::VectorXd &y, Eigen::MatrixXd &X) {
	const Eigen::Index n = 120;
	X.resize(n, 1);
	y.resize(n);
	for (Eigen::Index i = 0; i < n; i++) {
		const double x = -2.0 + 4.0 * static_cast<double>(i) / static_cast<double>(n - 1);
		const double u = (static_cast<double>((i * 37) % 101) + 0.5) / 101.0;
		const double noise = std::log(u / (1.0 - u));
		const double latent = beta * x + noise;
		X(i, 0) = x;
		if (latent < -1.0) {
			y[i] = 1.0;
		} else if (latent < 0.0) {
			y[i] = 2.0;
		} else if (latent < 1.0) {
			y[i] = 3.0;
		} else {
			y[i] = 4.0;
		}
	}
}

TEST_CASE("OrdinalLogit: Recovers the sign of the effect", "[ordinal]") {
	Eigen::VectorXd y;
	Eigen::MatrixXd X;

	SECTION("Positive effect") {
		MakeOrdinalData(1.5, y, X);
		auto result = OrdinalLogitSolver::Fit(y, X);
		REQUIRE(result.converged);
		REQUIRE(result.failure_reason.empty());
		REQUIRE(result.has_std_errors);
		REQUIRE(result.levels.size() == 4);
		REQUIRE(result.thresholds.size() == 3);
		REQUIRE(result.coefficients[0] > 0.5);
		REQUIRE(result.p_values[0] < 0.001);
		REQUIRE(result.thresholds[0] < result.thresholds[1]);
		REQUIRE(result.thresholds[1] < result.thresholds[2]);
		REQUIRE(result.n_obs == 120);
	}

	SECTION("Negative effect") {
		MakeOrdinalData(-1.5, y, X);
		auto result = OrdinalLogitSolver::Fit(y, X);
		REQUIRE(result.converged);
		REQUIRE(result.coefficients[0] < -0.5);
	}
}

TEST_CASE("OrdinalLogit: Two levels match logistic regression", "[ordinal]") {
	// With K = 2 and no predictors the threshold is the logit of P(y = low)
	Eigen::VectorXd y(10);
	y << 1, 1, 1, 2, 2, 2, 2, 2, 2, 2;
	Eigen::MatrixXd X(10, 0);

	auto result = OrdinalLogitSolver::Fit(y, X);
	REQUIRE(result.converged);
	REQUIRE_THAT(result.thresholds[0], WithinAbs(std::log(0.3 / 0.7), 1e-6));
	REQUIRE_THAT(result.log_likelihood, WithinAbs(3.0 * std::log(0.3) + 7.0 * std::log(0.7), 1e-6));
}

TEST_CASE("OrdinalLogit: Complete separation does not converge", "[ordinal][edge]") {
	Eigen::VectorXd y(8);
	y << 1, 1, 1, 1, 2, 2, 2, 2;
	Eigen::MatrixXd X(8, 1);
	X << 1, 2, 3, 4, 5, 6, 7, 8;

	auto result = OrdinalLogitSolver::Fit(y, X, core::RegressionOptions::Ordinal(30));
	REQUIRE(!result.converged);
	REQUIRE(!result.failure_reason.empty());
	REQUIRE(std::isnan(result.p_values[0]));
}

TEST_CASE("OrdinalLogit: Input validation", "[ordinal][errors]") {
	Eigen::MatrixXd X(4, 1);
	X << 1, 2, 3, 4;

	SECTION("Single level") {
		Eigen::VectorXd y = Eigen::VectorXd::Constant(4, 3.0);
		REQUIRE_THROWS_AS(OrdinalLogitSolver::Fit(y, X), std::invalid_argument);
	}

	SECTION("Dimension mismatch") {
		Eigen::VectorXd y(3);
		y << 1, 2, 1;
		REQUIRE_THROWS_AS(OrdinalLogitSolver::Fit(y, X), std::invalid_argument);
	}

	SECTION("Distinct levels are sorted") {
		Eigen::VectorXd y(5);
		y << 3, 1, 3, 2, 1;
		REQUIRE(OrdinalLogitSolver::DistinctLevels(y) == std::vector<double>({1.0, 2.0, 3.0}));
	}
}
