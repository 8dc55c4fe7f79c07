#include "glamcast/core/errors.hpp"
#include "glamcast/core/time_series.hpp"
#include "glamcast/model/glam.hpp"
#include "glamcast/utils/logging.hpp"
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace glamcast;

namespace {

// Daily visitor counts with a weekly cycle and a mild upward trend.
core::TimeSeries generateVisits(std::size_t days, std::uint64_t seed) {
	std::mt19937_64 rng(seed);
	std::vector<core::TimePoint> timestamps;
	std::vector<double> values;
	timestamps.reserve(days);
	values.reserve(days);
	const auto start = core::TimePoint{} + std::chrono::hours(24 * 19723);
	for (std::size_t i = 0; i < days; ++i) {
		const double day = static_cast<double>(i);
		const double rate = 12.0 + 0.05 * day + 4.0 * std::sin(2.0 * M_PI * day / 7.0);
		std::poisson_distribution<int> draw(rate);
		timestamps.push_back(start + std::chrono::hours(24 * static_cast<int>(i)));
		values.push_back(static_cast<double>(draw(rng)));
	}
	return core::TimeSeries(std::move(timestamps), std::move(values));
}

void printHeader(const std::string &title) {
	std::cout << "\n=== " << title << " ===\n\n";
}

void printPrediction(const core::Prediction &prediction, std::size_t first) {
	std::cout << "  " << std::setw(4) << "row" << std::setw(10) << "yhat" << std::setw(10) << "lower"
	          << std::setw(10) << "upper" << std::setw(10) << "obs_lo" << std::setw(10) << "obs_hi"
	          << std::setw(10) << "trend" << "\n";
	std::cout << std::fixed << std::setprecision(2);
	for (std::size_t i = first; i < prediction.size(); ++i) {
		std::cout << "  " << std::setw(4) << i << std::setw(10) << prediction.yhat[i] << std::setw(10)
		          << prediction.yhat_lower[i] << std::setw(10) << prediction.yhat_upper[i] << std::setw(10)
		          << prediction.observed_lower[i] << std::setw(10) << prediction.observed_upper[i] << std::setw(10)
		          << prediction.trend[i] << "\n";
	}
	std::cout.unsetf(std::ios::floatfield);
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::info);

	const auto history = generateVisits(120, 42);
	printHeader("Poisson forecast of daily visits");

	try {
		auto model = model::GlamBuilder()
		                 .withFamily("poisson")
		                 .withChangepoints(10)
		                 .withSeasonality(design::SeasonalitySpec{"weekly", 7.0, 3, {}})
		                 .withIntervalWidth(0.9)
		                 .withLaplace(true, 200)
		                 .withTrendSamples(300)
		                 .withSeed(7)
		                 .build();
		model->fit(history);

		const auto future = model->makeFutureTimestamps(14);
		const auto prediction = model->predict(future);
		printPrediction(prediction, 0);

		const auto &weekly = prediction.components.at("weekly");
		std::cout << "\n  weekly effect on the log scale, first forecast day: " << weekly.front() << "\n";
		std::cout << "  changepoints placed: " << model->changepointTimes().size() << "\n";
	} catch (const core::ConfigurationError &error) {
		GLAMCAST_ERROR("Configuration rejected: {}", error.what());
		return 1;
	} catch (const core::OptimizationError &error) {
		GLAMCAST_ERROR("Fit failed: {}", error.what());
		return 1;
	}
	return 0;
}
