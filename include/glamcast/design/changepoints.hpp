#pragma once

#include "glamcast/design/scaling.hpp"

#include <Eigen/Dense>
#include <utility>
#include <vector>

namespace glamcast::design {

/**
 * @struct TrendBasis
 * @brief Normalized times, changepoint locations and their indicator matrix.
 */
struct TrendBasis {
	Eigen::VectorXd t;
	Eigen::VectorXd changepoints;
	Eigen::MatrixXd indicator;
};

/**
 * @brief Places changepoints at evenly spaced rows of the training span.
 *
 * Candidates are drawn from the first @p changepoint_range share of the rows.
 * The first row is never a changepoint; when fewer rows are available than
 * requested the count is reduced to what fits.
 *
 * @param t Normalized training times, sorted.
 * @return Normalized changepoint locations in increasing order.
 * @throws core::ConfigurationError for a negative count or a range outside (0, 1].
 */
Eigen::VectorXd placeChangepoints(const Eigen::VectorXd &t, int n_changepoints, double changepoint_range);

/**
 * @brief Normalizes user-supplied changepoint times.
 * @throws core::ConfigurationError when a changepoint is not strictly inside the training span.
 */
Eigen::VectorXd normalizeChangepoints(const std::vector<core::TimePoint> &changepoints, const TimeScaling &scaling);

/**
 * @brief Changepoint indicator matrix A.
 *
 * A(i, j) is 1 when t_i is at or past changepoint j and 0 otherwise. Valid
 * for any times, including ones beyond the training span.
 */
Eigen::MatrixXd changepointIndicatorMatrix(const Eigen::VectorXd &t, const Eigen::VectorXd &changepoints);

inline TrendBasis makeTrendBasis(Eigen::VectorXd t, Eigen::VectorXd changepoints) {
	TrendBasis basis;
	basis.indicator = changepointIndicatorMatrix(t, changepoints);
	basis.t = std::move(t);
	basis.changepoints = std::move(changepoints);
	return basis;
}

} // namespace glamcast::design
