#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "glamcast/optimization/lbfgs_optimizer.hpp"

#include <stdexcept>

using glamcast::optimization::LBFGSOptimizer;
using Catch::Approx;

namespace {

double rosenbrock(const Eigen::VectorXd &x, Eigen::VectorXd &grad) {
	const double a = 1.0 - x[0];
	const double b = x[1] - x[0] * x[0];
	grad.resize(2);
	grad[0] = -2.0 * a - 400.0 * x[0] * b;
	grad[1] = 200.0 * b;
	return a * a + 100.0 * b * b;
}

} // namespace

TEST_CASE("LBFGS minimizes the Rosenbrock function", "[optimization][lbfgs]") {
	Eigen::VectorXd x0(2);
	x0 << -1.2, 1.0;
	const auto result = LBFGSOptimizer::minimize(rosenbrock, x0);
	REQUIRE(result.converged);
	REQUIRE(result.x[0] == Approx(1.0).margin(1e-3));
	REQUIRE(result.x[1] == Approx(1.0).margin(1e-3));
	REQUIRE(result.fx == Approx(0.0).margin(1e-6));
}

TEST_CASE("LBFGS respects box constraints", "[optimization][lbfgs]") {
	const auto quadratic = [](const Eigen::VectorXd &x, Eigen::VectorXd &grad) {
		grad = 2.0 * (x.array() - 3.0).matrix();
		return (x.array() - 3.0).square().sum();
	};
	const Eigen::VectorXd x0 = Eigen::VectorXd::Zero(2);
	const Eigen::VectorXd lower = Eigen::VectorXd::Constant(2, -1.0);
	Eigen::VectorXd upper(2);
	upper << 2.0, 10.0;
	const auto result = LBFGSOptimizer::minimize(quadratic, x0, lower, upper);
	REQUIRE(result.x[0] == Approx(2.0).margin(1e-6));
	REQUIRE(result.x[1] == Approx(3.0).margin(1e-5));

	REQUIRE_THROWS_AS(LBFGSOptimizer::minimize(quadratic, x0, Eigen::VectorXd::Zero(1), upper),
	                  std::invalid_argument);
}

TEST_CASE("LBFGS reports exhausted iterations as not converged", "[optimization][lbfgs]") {
	Eigen::VectorXd x0(2);
	x0 << -1.2, 1.0;
	LBFGSOptimizer::Options options;
	options.max_iterations = 2;
	const auto result = LBFGSOptimizer::minimize(rosenbrock, x0, options);
	REQUIRE_FALSE(result.converged);
	REQUIRE(result.x.size() == 2);
}
