#include "glamcast/uncertainty/trend_simulation.hpp"
#include "glamcast/trend/piecewise_linear.hpp"
#include "glamcast/utils/logging.hpp"
#include "glamcast/utils/statistics.hpp"

#include <cmath>
#include <stdexcept>

namespace glamcast::uncertainty {

namespace {

constexpr double kMinLaplaceScale = 1e-8;

double drawLaplace(double scale, std::mt19937_64 &rng) {
	std::uniform_real_distribution<double> uniform(-0.5, 0.5);
	const double u = uniform(rng);
	const double sign = u < 0.0 ? -1.0 : 1.0;
	return -scale * sign * std::log1p(-2.0 * std::abs(u));
}

} // namespace

Eigen::VectorXd simulateTrendPath(const Eigen::VectorXd &t, const fitting::FittedParameters &params,
                                  const Eigen::VectorXd &changepoints, std::mt19937_64 &rng) {
	if (params.delta.size() != changepoints.size()) {
		throw std::invalid_argument("Rate adjustments and changepoints must have the same length.");
	}
	const double t_max = t.size() > 0 ? t.maxCoeff() : 0.0;
	const double density = static_cast<double>(changepoints.size());
	const double expected = density * (t_max - 1.0);
	if (!(expected > 0.0)) {
		return trend::piecewiseLinear(t, params.k, params.m, params.delta, changepoints);
	}

	std::poisson_distribution<int> arrivals(expected);
	const int n_new = arrivals(rng);
	if (n_new == 0) {
		return trend::piecewiseLinear(t, params.k, params.m, params.delta, changepoints);
	}

	const double scale = utils::Statistics::meanAbsolute(params.delta) + kMinLaplaceScale;
	std::uniform_real_distribution<double> location(1.0, t_max);
	Eigen::VectorXd all_changepoints(changepoints.size() + n_new);
	Eigen::VectorXd all_delta(changepoints.size() + n_new);
	all_changepoints.head(changepoints.size()) = changepoints;
	all_delta.head(changepoints.size()) = params.delta;
	for (int j = 0; j < n_new; ++j) {
		all_changepoints[changepoints.size() + j] = location(rng);
		all_delta[changepoints.size() + j] = drawLaplace(scale, rng);
	}
	return trend::piecewiseLinear(t, params.k, params.m, all_delta, all_changepoints);
}

TrendBand simulateTrendUncertainty(const Eigen::VectorXd &t, const fitting::FitResult &fit,
                                   const Eigen::VectorXd &changepoints, const Eigen::VectorXd &center,
                                   const TrendSimulationOptions &options) {
	if (center.size() != t.size()) {
		throw std::invalid_argument("Trend center must have one value per time.");
	}
	if (options.samples < 0) {
		throw std::invalid_argument("Number of trend samples must be non-negative.");
	}
	TrendBand band;
	if (options.samples == 0) {
		band.lower = center;
		band.upper = center;
		return band;
	}

	Eigen::MatrixXd paths(t.size(), options.samples);
	for (int i = 0; i < options.samples; ++i) {
		const auto &params = fit.draws.empty() ? fit.map : fit.draws[static_cast<std::size_t>(i) % fit.draws.size()];
		std::mt19937_64 rng(options.seed + static_cast<std::uint64_t>(i));
		paths.col(i) = simulateTrendPath(t, params, changepoints, rng);
	}

	const double tail = (1.0 - options.interval_width) / 2.0;
	band.lower = utils::Statistics::rowPercentile(paths, tail);
	band.upper = utils::Statistics::rowPercentile(paths, 1.0 - tail);
	GLAMCAST_DEBUG("Simulated {} trend paths over {} rows", options.samples, t.size());
	return band;
}

} // namespace glamcast::uncertainty
