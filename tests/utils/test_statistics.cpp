#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "glamcast/utils/statistics.hpp"

#include <stdexcept>
#include <vector>

using namespace glamcast::utils;
using Catch::Approx;

TEST_CASE("Percentile interpolates between order statistics", "[utils][statistics]") {
	std::vector<double> data = {4.0, 1.0, 3.0, 2.0};
	REQUIRE(Statistics::percentile(data, 0.0) == 1.0);
	REQUIRE(Statistics::percentile(data, 1.0) == 4.0);
	REQUIRE(Statistics::percentile(data, 0.5) == Approx(2.5));
	REQUIRE(Statistics::percentile(data, 0.25) == Approx(1.75));
	REQUIRE(Statistics::percentile(data, 0.9) == Approx(3.7));

	std::vector<double> single = {7.0};
	REQUIRE(Statistics::percentile(single, 0.3) == 7.0);

	std::vector<double> empty;
	REQUIRE_THROWS_AS(Statistics::percentile(empty, 0.5), std::invalid_argument);
	REQUIRE_THROWS_AS(Statistics::percentile(data, 1.5), std::invalid_argument);
}

TEST_CASE("Row percentiles treat each row as a sample set", "[utils][statistics]") {
	Eigen::MatrixXd samples(2, 5);
	samples << 5, 1, 4, 2, 3, 10, 10, 10, 10, 10;
	const auto lower = Statistics::rowPercentile(samples, 0.25);
	REQUIRE(lower[0] == Approx(2.0));
	REQUIRE(lower[1] == Approx(10.0));
}

TEST_CASE("Mean absolute value", "[utils][statistics]") {
	Eigen::VectorXd values(3);
	values << -1.0, 2.0, -3.0;
	REQUIRE(Statistics::meanAbsolute(values) == Approx(2.0));
	REQUIRE(Statistics::meanAbsolute(Eigen::VectorXd()) == 0.0);
}
