#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "glamcast/core/errors.hpp"
#include "glamcast/families/link.hpp"
#include "glamcast/model/glam.hpp"
#include "common/time_series_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <random>
#include <vector>

using namespace glamcast;
using Catch::Approx;
using model::GlamBuilder;
using tests::helpers::makeDailySeries;

namespace {

void requireInside(const core::Prediction &prediction, double lower, double upper) {
	for (const auto *column : {&prediction.yhat, &prediction.observed_lower, &prediction.observed_upper,
	                           &prediction.yhat_lower, &prediction.yhat_upper, &prediction.trend}) {
		for (double value : *column) {
			REQUIRE(value >= lower);
			REQUIRE(value <= upper);
		}
	}
}

void requireIntegerBounds(const core::Prediction &prediction) {
	for (std::size_t i = 0; i < prediction.size(); ++i) {
		REQUIRE(families::isNonNegativeInteger(prediction.observed_lower[i]));
		REQUIRE(families::isNonNegativeInteger(prediction.observed_upper[i]));
	}
}

std::vector<double> boundedProportions(std::size_t count, std::uint64_t seed) {
	std::mt19937_64 rng(seed);
	std::normal_distribution<double> noise(0.0, 0.03);
	std::vector<double> values;
	values.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		const double day = static_cast<double>(i);
		const double value = 0.85 + 0.13 * std::sin(2.0 * M_PI * day / 7.0) + noise(rng);
		values.push_back(std::clamp(value, 0.01, 0.99));
	}
	return values;
}

} // namespace

TEST_CASE("Poisson model recovers a constant rate", "[model][families][poisson]") {
	const double rate = 20.0;
	const double interval_width = 0.8;
	std::size_t covered = 0;
	std::size_t total = 0;
	for (std::uint64_t trial = 0; trial < 5; ++trial) {
		auto model = GlamBuilder()
		                 .withFamily(families::FamilyKind::Poisson)
		                 .withChangepoints(0)
		                 .withIntervalWidth(interval_width)
		                 .withTrendSamples(0)
		                 .build();
		const auto training = makeDailySeries(tests::helpers::poissonCounts(100, rate, 100 + trial));
		model->fit(training);

		const auto prediction = model->predict(model->makeFutureTimestamps(100, std::nullopt, true));
		for (double linked : prediction.trend_linked) {
			REQUIRE(linked == Approx(std::log(rate)).margin(0.1));
		}
		requireIntegerBounds(prediction);
		requireInside(prediction, 0.0, std::numeric_limits<double>::infinity());

		const auto held_out = tests::helpers::poissonCounts(prediction.size(), rate, 900 + trial);
		for (std::size_t i = 0; i < prediction.size(); ++i) {
			if (prediction.observed_lower[i] <= held_out[i] && held_out[i] <= prediction.observed_upper[i]) {
				++covered;
			}
			++total;
		}
	}
	REQUIRE(static_cast<double>(covered) / static_cast<double>(total) >= interval_width);
}

TEST_CASE("Beta forecasts stay in [0, 1] where normal forecasts may not", "[model][families][beta]") {
	const auto training = makeDailySeries(boundedProportions(84, 21));
	const auto weekly = design::SeasonalitySpec{"weekly", 7.0, 3, {}};

	auto normal = GlamBuilder().withSeasonality(weekly).withIntervalWidth(0.95).withTrendSamples(100).build();
	normal->fit(training);
	const auto normal_prediction = normal->predict(normal->makeFutureTimestamps(28, std::nullopt, true));

	auto beta = GlamBuilder()
	                .withFamily(families::FamilyKind::Beta)
	                .withSeasonality(weekly)
	                .withIntervalWidth(0.95)
	                .withTrendSamples(100)
	                .build();
	beta->fit(training);
	const auto beta_prediction = beta->predict(beta->makeFutureTimestamps(28, std::nullopt, true));

	requireInside(beta_prediction, 0.0, 1.0);
	for (double value : beta_prediction.trend_upper) {
		REQUIRE(value <= 1.0);
	}
	const auto &upper = normal_prediction.observed_upper;
	REQUIRE(std::any_of(upper.begin(), upper.end(), [](double value) { return value > 1.0; }));
}

TEST_CASE("Binomial-type forecasts respect the capacity", "[model][families][binomial]") {
	const int capacity = 30;
	std::mt19937_64 rng(8);
	std::vector<double> values;
	for (int i = 0; i < 90; ++i) {
		const double p = 0.5 + 0.35 * std::sin(2.0 * M_PI * i / 7.0);
		std::binomial_distribution<int> draw(capacity, p);
		values.push_back(static_cast<double>(draw(rng)));
	}
	const auto training = makeDailySeries(values);

	for (auto family : {families::FamilyKind::Binomial, families::FamilyKind::BetaBinomial}) {
		auto model = GlamBuilder()
		                 .withFamily(family)
		                 .withCapacity(capacity)
		                 .withSeasonality(design::SeasonalitySpec{"weekly", 7.0, 2, {}})
		                 .withTrendSamples(50)
		                 .build();
		model->fit(training);
		const auto prediction = model->predict(model->makeFutureTimestamps(21, std::nullopt, true));
		INFO("family " << model->family().name());
		requireInside(prediction, 0.0, static_cast<double>(capacity));
		requireIntegerBounds(prediction);
	}

	std::vector<double> too_large = values;
	too_large[3] = capacity + 1.0;
	auto model = GlamBuilder().withFamily(families::FamilyKind::Binomial).withCapacity(capacity).build();
	REQUIRE_THROWS_AS(model->fit(makeDailySeries(too_large)), core::ConfigurationError);
	REQUIRE_FALSE(model->isFitted());
}

TEST_CASE("Count and positive families fit overdispersed data", "[model][families]") {
	std::mt19937_64 rng(13);
	std::vector<double> counts;
	std::vector<double> positive;
	for (int i = 0; i < 80; ++i) {
		const double mean = 15.0 + 0.1 * i;
		std::negative_binomial_distribution<int> nb(5, 5.0 / (5.0 + mean));
		counts.push_back(static_cast<double>(nb(rng)));
		std::gamma_distribution<double> gamma(4.0, mean / 4.0);
		positive.push_back(gamma(rng));
	}

	auto negative_binomial =
	    GlamBuilder().withFamily(families::FamilyKind::NegativeBinomial).withChangepoints(3).withTrendSamples(0).build();
	negative_binomial->fit(makeDailySeries(counts));
	const auto nb_prediction = negative_binomial->predict(10);
	requireInside(nb_prediction, 0.0, std::numeric_limits<double>::infinity());
	requireIntegerBounds(nb_prediction);
	REQUIRE(nb_prediction.yhat.front() == Approx(15.0 + 0.1 * 80).margin(6.0));

	auto poisson =
	    GlamBuilder().withFamily(families::FamilyKind::Poisson).withChangepoints(3).withTrendSamples(0).build();
	poisson->fit(makeDailySeries(counts));
	const auto poisson_prediction = poisson->predict(10);
	// Overdispersion shows up as a wider negative-binomial band.
	REQUIRE(nb_prediction.observed_upper.front() - nb_prediction.observed_lower.front() >
	        poisson_prediction.observed_upper.front() - poisson_prediction.observed_lower.front());

	auto gamma = GlamBuilder().withFamily(families::FamilyKind::Gamma).withChangepoints(3).withTrendSamples(0).build();
	gamma->fit(makeDailySeries(positive));
	const auto gamma_prediction = gamma->predict(10);
	for (std::size_t i = 0; i < gamma_prediction.size(); ++i) {
		REQUIRE(gamma_prediction.observed_lower[i] > 0.0);
		REQUIRE(gamma_prediction.observed_lower[i] < gamma_prediction.yhat[i]);
		REQUIRE(gamma_prediction.observed_upper[i] > gamma_prediction.yhat[i]);
	}
	// kappa^2 is the gamma shape; the data were drawn with shape 4.
	REQUIRE(gamma->dispersion() == Approx(2.0).margin(0.6));
}
