#pragma once

#include "glamcast/design/scaling.hpp"

#include <Eigen/Dense>

namespace glamcast::trend {

/**
 * @struct TrendParameters
 * @brief Piecewise-linear trend: base rate, offset and per-changepoint rate adjustments.
 */
struct TrendParameters {
	double k = 0.0;
	double m = 0.0;
	Eigen::VectorXd delta;
	/// Changepoint locations in the same time unit as the evaluation times, increasing.
	Eigen::VectorXd changepoints;
};

/**
 * @brief Evaluates the trend at each time.
 *
 * The slope after changepoint j is k + sum of delta up to j. The offset is
 * shifted by -changepoint_j * delta_j at each active changepoint so the
 * trend stays continuous.
 */
Eigen::VectorXd piecewiseLinear(const Eigen::VectorXd &t, double k, double m, const Eigen::VectorXd &delta,
                                const Eigen::VectorXd &changepoints);

inline Eigen::VectorXd piecewiseLinear(const Eigen::VectorXd &t, const TrendParameters &params) {
	return piecewiseLinear(t, params.k, params.m, params.delta, params.changepoints);
}

/// Trend evaluated through the changepoint indicator matrix (rows of t, columns of changepoints).
Eigen::VectorXd piecewiseLinear(const Eigen::VectorXd &t, double k, double m, const Eigen::VectorXd &delta,
                                const Eigen::VectorXd &changepoints, const Eigen::MatrixXd &indicator);

/**
 * @brief Maps normalized trend parameters to original units.
 *
 * The result evaluated at seconds since the epoch reproduces the linked
 * trend `link.offset + link.scale * trend(normalized time)`.
 */
TrendParameters denormalizeTrend(const TrendParameters &normalized, const design::TimeScaling &time,
                                 const design::LinkScaling &link);

} // namespace glamcast::trend
