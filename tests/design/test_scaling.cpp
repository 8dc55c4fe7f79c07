#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "glamcast/core/errors.hpp"
#include "glamcast/design/features.hpp"
#include "glamcast/design/scaling.hpp"
#include "glamcast/families/family.hpp"
#include "common/time_series_helpers.hpp"

#include <chrono>
#include <cmath>
#include <vector>

using namespace glamcast;
using Catch::Approx;
using core::ConfigErrorKind;
using core::ConfigurationError;
using tests::helpers::makeTimestamps;

TEST_CASE("Time scaling maps the training span onto [0, 1]", "[design][scaling]") {
	const auto timestamps = makeTimestamps(11);
	const auto scaling = design::computeTimeScaling(timestamps);
	const auto t = scaling.normalize(timestamps);
	REQUIRE(t[0] == Approx(0.0));
	REQUIRE(t[5] == Approx(0.5));
	REQUIRE(t[10] == Approx(1.0));

	const auto future = timestamps.back() + std::chrono::hours{24 * 5};
	REQUIRE(scaling.normalize(future) == Approx(1.5));
	REQUIRE(scaling.denormalize(1.5) == Approx(core::toSeconds(future)));
}

TEST_CASE("Degenerate series are configuration errors", "[design][scaling]") {
	const auto single = makeTimestamps(1);
	try {
		design::computeTimeScaling(single);
		FAIL("single observation accepted");
	} catch (const ConfigurationError &error) {
		REQUIRE(error.kind() == ConfigErrorKind::DegenerateSeries);
	}

	const auto normal = families::makeFamily(families::FamilyKind::Normal);
	REQUIRE_THROWS_AS(design::computeLinkScaling({3.0, 3.0, 3.0}, *normal), ConfigurationError);
	REQUIRE_THROWS_AS(design::computeRegressorScale("flat", {1.0, 1.0}), ConfigurationError);
}

TEST_CASE("Link scaling uses the range of the linked data", "[design][scaling]") {
	const auto normal = families::makeFamily(families::FamilyKind::Normal);
	const auto link = design::computeLinkScaling({2.0, 6.0, 4.0}, *normal);
	REQUIRE(link.offset == Approx(2.0));
	REQUIRE(link.scale == Approx(4.0));
	REQUIRE(link.toLinked(0.5) == Approx(4.0));
	REQUIRE(link.toNormalized(6.0) == Approx(1.0));

	const auto poisson = families::makeFamily(families::FamilyKind::Poisson);
	const auto log_link = design::computeLinkScaling({1.0, std::exp(2.0)}, *poisson);
	REQUIRE(log_link.offset == Approx(0.0).margin(1e-12));
	REQUIRE(log_link.scale == Approx(2.0));
}

TEST_CASE("Scaling context requires every configured regressor", "[design][scaling]") {
	const auto normal = families::makeFamily(families::FamilyKind::Normal);
	const core::TimeSeries ts(makeTimestamps(3), {1.0, 2.0, 4.0}, {{"price", {10.0, 20.0, 30.0}}});

	const auto context = design::buildScalingContext(ts, *normal, {design::RegressorSpec{"price", {}}});
	REQUIRE(context.regressors.at("price").apply(20.0) == Approx(0.5));

	try {
		design::buildScalingContext(ts, *normal, {design::RegressorSpec{"promo", {}}});
		FAIL("missing regressor accepted");
	} catch (const ConfigurationError &error) {
		REQUIRE(error.kind() == ConfigErrorKind::MissingRegressor);
	}
}
