#pragma once

#include "glamcast/fitting/posterior_fitter.hpp"

#include <Eigen/Dense>
#include <cstdint>
#include <random>

namespace glamcast::uncertainty {

struct TrendSimulationOptions {
	int samples = 1000;
	double interval_width = 0.8;
	std::uint64_t seed = 0;
};

/// Percentile band of simulated trends, in normalized trend units.
struct TrendBand {
	Eigen::VectorXd lower;
	Eigen::VectorXd upper;
};

/**
 * @brief Simulates one trend trajectory.
 *
 * Times up to 1 (the end of training) follow the supplied parameters. Beyond
 * it, new changepoints arrive as a Poisson process whose density is the
 * number of training changepoints per unit of normalized time, and each new
 * rate change is Laplace distributed with the mean absolute fitted rate
 * change as scale.
 *
 * @param t Normalized evaluation times.
 * @param params Parameters of this run (MAP or one posterior draw).
 * @param changepoints Normalized training changepoints.
 */
Eigen::VectorXd simulateTrendPath(const Eigen::VectorXd &t, const fitting::FittedParameters &params,
                                  const Eigen::VectorXd &changepoints, std::mt19937_64 &rng);

/**
 * @brief Monte-Carlo trend uncertainty.
 *
 * Run i uses the MAP parameters, or posterior draw i modulo the number of
 * draws when the fit carries draws, and its own generator seeded with
 * `seed + i`. Runs are independent so the result does not depend on their
 * execution order. With zero samples both bounds equal @p center.
 *
 * @param center Normalized trend of the MAP fit at @p t.
 */
TrendBand simulateTrendUncertainty(const Eigen::VectorXd &t, const fitting::FitResult &fit,
                                   const Eigen::VectorXd &changepoints, const Eigen::VectorXd &center,
                                   const TrendSimulationOptions &options);

} // namespace glamcast::uncertainty
