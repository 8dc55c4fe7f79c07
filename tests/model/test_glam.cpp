#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "glamcast/core/errors.hpp"
#include "glamcast/model/glam.hpp"
#include "common/time_series_helpers.hpp"

#include <chrono>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using namespace glamcast;
using Catch::Approx;
using model::GlamBuilder;
using tests::helpers::makeDailySeries;

namespace {

design::SeasonalitySpec weekly() {
	return design::SeasonalitySpec{"weekly", 7.0, 3, {}};
}

core::TimeSeries weeklyTraining() {
	return makeDailySeries(tests::helpers::weeklySeries(70, 50.0, 0.3, 5.0, 1.0, 42));
}

} // namespace

TEST_CASE("Predicting before fitting is reported distinctly", "[model][glam]") {
	auto model = GlamBuilder().withSeasonality(weekly()).build();
	REQUIRE_FALSE(model->isFitted());
	REQUIRE(model->getName() == "Glam");
	REQUIRE_THROWS_AS(model->predict(5), core::NotFittedError);
	REQUIRE_THROWS_AS(model->predict(tests::helpers::makeTimestamps(3)), core::NotFittedError);
	REQUIRE_THROWS_AS(model->fitResult(), core::NotFittedError);
	REQUIRE_THROWS_AS(model->denormalizedTrend(), core::NotFittedError);
}

TEST_CASE("Builder validates the configuration up front", "[model][glam][builder]") {
	REQUIRE_THROWS_AS(GlamBuilder().withFamily("binomial").build(), core::ConfigurationError);
	REQUIRE_NOTHROW(GlamBuilder().withFamily("binomial").withCapacity(10).build());
	REQUIRE_THROWS_AS(GlamBuilder().withFamily("lognormal"), core::ConfigurationError);
	REQUIRE_THROWS_AS(GlamBuilder().withChangepoints(-2).build(), core::ConfigurationError);
	REQUIRE_THROWS_AS(GlamBuilder().withIntervalWidth(1.2).build(), core::ConfigurationError);
	REQUIRE_THROWS_AS(GlamBuilder().withSeasonality(weekly()).withSeasonality(weekly()).build(),
	                  core::ConfigurationError);

	config::PartialModelConfig layer;
	layer.trend_samples = 10;
	layer.family = families::FamilyKind::Poisson;
	auto model = GlamBuilder().withConfig(layer).build();
	REQUIRE(model->config().trend_samples == 10);
	REQUIRE(model->family().kind() == families::FamilyKind::Poisson);
}

TEST_CASE("Glam fits a weekly series and forecasts every column", "[model][glam]") {
	auto model = GlamBuilder().withSeasonality(weekly()).withTrendSamples(200).withSeed(7).build();
	const auto training = weeklyTraining();
	model->fit(training);
	REQUIRE(model->isFitted());
	REQUIRE(model->dispersion() == Approx(1.0).margin(0.4));

	const auto prediction = model->predict(14);
	REQUIRE(prediction.size() == 14);
	REQUIRE(prediction.timestamps.front() == training.getTimestamps().back() + std::chrono::hours{24});
	for (const auto &name : core::Prediction::columnNames()) {
		INFO("column " << name);
		REQUIRE(prediction.column(name).size() == 14);
	}
	REQUIRE(prediction.components.count("weekly") == 1);
	REQUIRE_THROWS_AS(prediction.column("monthly"), std::out_of_range);

	// Trend continues at about 0.3 per day from roughly 50 + 0.3 * 70.
	REQUIRE(prediction.trend.front() == Approx(50.0 + 0.3 * 70.0).margin(2.5));
	for (std::size_t i = 0; i < prediction.size(); ++i) {
		REQUIRE(prediction.observed_lower[i] < prediction.yhat[i]);
		REQUIRE(prediction.observed_upper[i] > prediction.yhat[i]);
		REQUIRE(prediction.yhat[i] == Approx(prediction.trend[i] + prediction.components.at("weekly")[i]));
	}
}

TEST_CASE("Without Laplace sampling confidence bounds equal the point forecast", "[model][glam]") {
	auto model = GlamBuilder().withSeasonality(weekly()).withTrendSamples(50).build();
	model->fit(weeklyTraining());
	const auto future = model->makeFutureTimestamps(10, std::nullopt, true);
	const auto prediction = model->predict(future);
	for (std::size_t i = 0; i < prediction.size(); ++i) {
		REQUIRE(prediction.yhat_upper[i] == prediction.yhat[i]);
		REQUIRE(prediction.yhat_lower[i] == prediction.yhat[i]);
		REQUIRE(prediction.yhat_upper_linked[i] == prediction.yhat_linked[i]);
		REQUIRE(prediction.yhat_lower_linked[i] == prediction.yhat_linked[i]);
	}
}

TEST_CASE("Laplace sampling produces a confidence band", "[model][glam][laplace]") {
	auto model =
	    GlamBuilder().withSeasonality(weekly()).withChangepoints(5).withLaplace(true, 200).withTrendSamples(100).build();
	model->fit(weeklyTraining());
	REQUIRE(model->fitResult().draws.size() == 200);

	const auto prediction = model->predict(10);
	std::size_t contained = 0;
	for (std::size_t i = 0; i < prediction.size(); ++i) {
		REQUIRE(prediction.yhat_upper[i] > prediction.yhat_lower[i]);
		if (prediction.yhat_lower[i] <= prediction.yhat[i] && prediction.yhat[i] <= prediction.yhat_upper[i]) {
			++contained;
		}
	}
	REQUIRE(contained == prediction.size());
}

TEST_CASE("Trend band collapses without samples and widens with the horizon", "[model][glam][trend]") {
	const auto training = weeklyTraining();

	auto no_samples = GlamBuilder().withSeasonality(weekly()).withTrendSamples(0).build();
	no_samples->fit(training);
	const auto flat = no_samples->predict(20);
	for (std::size_t i = 0; i < flat.size(); ++i) {
		REQUIRE(flat.trend_upper[i] == flat.trend[i]);
		REQUIRE(flat.trend_lower[i] == flat.trend[i]);
	}

	auto sampled = GlamBuilder().withSeasonality(weekly()).withTrendSamples(1000).withSeed(3).build();
	sampled->fit(training);
	const auto band = sampled->predict(40);
	const auto width = [&band](std::size_t i) {
		return band.trend_upper_linked[i] - band.trend_lower_linked[i];
	};
	REQUIRE(width(39) > 0.0);
	REQUIRE(width(13) >= width(0));
	REQUIRE(width(26) >= width(13));
	REQUIRE(width(39) >= width(26));
}

TEST_CASE("Variability band widens with interval_width", "[model][glam]") {
	auto model = GlamBuilder().withSeasonality(weekly()).withTrendSamples(0).build();
	model->fit(weeklyTraining());
	const auto timestamps = model->makeFutureTimestamps(7);
	const auto narrow = model->predict(timestamps, {}, 0.8);
	const auto wide = model->predict(timestamps, {}, 0.95);
	for (std::size_t i = 0; i < timestamps.size(); ++i) {
		REQUIRE(wide.observed_upper[i] - wide.observed_lower[i] >=
		        narrow.observed_upper[i] - narrow.observed_lower[i]);
		REQUIRE(wide.yhat[i] == narrow.yhat[i]);
	}
	REQUIRE_THROWS_AS(model->predict(timestamps, {}, 1.0), core::ConfigurationError);
}

TEST_CASE("Denormalized trend parameters reproduce the linked trend", "[model][glam]") {
	auto model = GlamBuilder().withChangepoints(5).withTrendSamples(0).build();
	model->fit(weeklyTraining());
	const auto prediction = model->predict(model->makeFutureTimestamps(5, std::nullopt, true));
	const auto params = model->denormalizedTrend();
	REQUIRE(params.delta.size() == 5);
	REQUIRE(model->changepointTimes().size() == 5);

	Eigen::VectorXd seconds(static_cast<Eigen::Index>(prediction.size()));
	for (std::size_t i = 0; i < prediction.size(); ++i) {
		seconds[static_cast<Eigen::Index>(i)] = core::toSeconds(prediction.timestamps[i]);
	}
	const auto trend = trend::piecewiseLinear(seconds, params);
	for (std::size_t i = 0; i < prediction.size(); ++i) {
		REQUIRE(trend[static_cast<Eigen::Index>(i)] == Approx(prediction.trend_linked[i]).epsilon(1e-8));
	}
}

TEST_CASE("A failed refit leaves the model unfitted", "[model][glam]") {
	auto model = GlamBuilder().withSeasonality(weekly()).withTrendSamples(0).build();
	model->fit(weeklyTraining());
	REQUIRE(model->isFitted());

	const auto constant = makeDailySeries(std::vector<double>(30, 4.0));
	REQUIRE_THROWS_AS(model->fit(constant), core::ConfigurationError);
	REQUIRE_FALSE(model->isFitted());
	REQUIRE_THROWS_AS(model->predict(5), core::NotFittedError);
	REQUIRE_THROWS_AS(model->fitResult(), core::NotFittedError);

	model->fit(weeklyTraining());
	REQUIRE(model->isFitted());
	REQUIRE(model->predict(5).size() == 5);
}

TEST_CASE("External regressors are required at prediction time", "[model][glam][regressors]") {
	const std::size_t n = 60;
	std::vector<double> price(n);
	std::vector<double> values(n);
	std::mt19937_64 rng(9);
	std::normal_distribution<double> noise(0.0, 0.5);
	for (std::size_t i = 0; i < n; ++i) {
		price[i] = 10.0 + static_cast<double>(i % 5);
		values[i] = 100.0 - 3.0 * price[i] + 0.1 * static_cast<double>(i) + noise(rng);
	}
	auto model = GlamBuilder().withRegressor(design::RegressorSpec{"price", {}}).withTrendSamples(0).build();
	model->fit(makeDailySeries(values, {{"price", price}}));

	try {
		model->predict(3);
		FAIL("prediction without regressor values accepted");
	} catch (const core::ConfigurationError &error) {
		REQUIRE(error.kind() == core::ConfigErrorKind::MissingRegressor);
	}

	const auto timestamps = model->makeFutureTimestamps(2);
	const auto prediction = model->predict(timestamps, {{"price", {10.0, 14.0}}});
	REQUIRE(prediction.components.count("price") == 1);
	// Raising the price by 4 lowers the forecast by about 12.
	REQUIRE(prediction.yhat[1] - prediction.yhat[0] == Approx(-12.0 + 0.1).margin(1.0));
}

TEST_CASE("Future timestamps follow the training frequency", "[model][glam]") {
	auto model = GlamBuilder().withTrendSamples(0).build();
	REQUIRE_THROWS_AS(model->makeFutureTimestamps(3), core::NotFittedError);
	const auto training = weeklyTraining();
	model->fit(training);

	const auto future = model->makeFutureTimestamps(3);
	REQUIRE(future.size() == 3);
	REQUIRE(future[2] - training.getTimestamps().back() == std::chrono::hours{72});

	const auto hourly = model->makeFutureTimestamps(2, std::chrono::hours{1});
	REQUIRE(hourly[1] - training.getTimestamps().back() == std::chrono::hours{2});

	const auto with_history = model->makeFutureTimestamps(3, std::nullopt, true);
	REQUIRE(with_history.size() == training.size() + 3);
	REQUIRE_THROWS_AS(model->predict(0), std::invalid_argument);
}
