#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "glamcast/design/changepoints.hpp"
#include "glamcast/design/scaling.hpp"
#include "glamcast/trend/piecewise_linear.hpp"

#include <stdexcept>

using namespace glamcast;
using Catch::Approx;

namespace {

trend::TrendParameters sampleParameters() {
	trend::TrendParameters params;
	params.k = 0.4;
	params.m = 0.1;
	params.delta.resize(3);
	params.delta << 0.5, -1.2, 0.3;
	params.changepoints.resize(3);
	params.changepoints << 0.2, 0.5, 0.7;
	return params;
}

} // namespace

TEST_CASE("Piecewise-linear trend bends at changepoints without jumps", "[trend]") {
	const auto params = sampleParameters();
	const double eps = 1e-9;
	for (Eigen::Index j = 0; j < params.changepoints.size(); ++j) {
		Eigen::VectorXd around(2);
		around << params.changepoints[j] - eps, params.changepoints[j];
		const auto values = trend::piecewiseLinear(around, params);
		REQUIRE(values[0] == Approx(values[1]).margin(1e-7));
	}

	Eigen::VectorXd t(3);
	t << 0.0, 0.1, 0.9;
	const auto values = trend::piecewiseLinear(t, params);
	REQUIRE(values[0] == Approx(0.1));
	REQUIRE(values[1] == Approx(0.14));
	// Slope after the last changepoint is k + sum(delta).
	Eigen::VectorXd tail(2);
	tail << 0.8, 0.9;
	const auto tail_values = trend::piecewiseLinear(tail, params);
	REQUIRE((tail_values[1] - tail_values[0]) / 0.1 == Approx(0.4 + 0.5 - 1.2 + 0.3));
}

TEST_CASE("Indicator-matrix evaluation matches the direct form", "[trend]") {
	const auto params = sampleParameters();
	const Eigen::VectorXd t = Eigen::VectorXd::LinSpaced(31, -0.2, 1.3);
	const auto basis = design::makeTrendBasis(t, params.changepoints);
	const auto direct = trend::piecewiseLinear(t, params);
	const auto via_matrix = trend::piecewiseLinear(t, params.k, params.m, params.delta, params.changepoints,
	                                               basis.indicator);
	REQUIRE(direct.isApprox(via_matrix, 1e-12));

	REQUIRE_THROWS_AS(trend::piecewiseLinear(t, params.k, params.m, Eigen::VectorXd::Zero(2), params.changepoints),
	                  std::invalid_argument);
}

TEST_CASE("Denormalized trend reproduces the rescaled normalized trend", "[trend]") {
	const auto params = sampleParameters();
	const design::TimeScaling time{1.7e9, 86400.0 * 120.0};
	const design::LinkScaling link{3.5, 12.0};

	const auto original = trend::denormalizeTrend(params, time, link);
	REQUIRE(original.changepoints.size() == params.changepoints.size());

	const Eigen::VectorXd t = Eigen::VectorXd::LinSpaced(50, 0.0, 1.5);
	Eigen::VectorXd seconds(t.size());
	for (Eigen::Index i = 0; i < t.size(); ++i) {
		seconds[i] = time.denormalize(t[i]);
	}
	const auto normalized_values = trend::piecewiseLinear(t, params);
	const auto original_values = trend::piecewiseLinear(seconds, original);
	for (Eigen::Index i = 0; i < t.size(); ++i) {
		REQUIRE(original_values[i] == Approx(link.toLinked(normalized_values[i])).epsilon(1e-9));
	}
}
