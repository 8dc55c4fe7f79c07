#pragma once

#include "glamcast/design/scaling.hpp"
#include "glamcast/families/family.hpp"

#include <Eigen/Dense>

namespace glamcast::uncertainty {

/**
 * @struct VariabilityBand
 * @brief Interval expected to contain new observations.
 */
struct VariabilityBand {
	Eigen::VectorXd lower;
	Eigen::VectorXd upper;
	Eigen::VectorXd lower_linked;
	Eigen::VectorXd upper_linked;
};

/**
 * @brief Evaluates the family's quantile function at `(1 -+ interval_width) / 2`.
 *
 * Needs only a point estimate of the linked predictor and the raw
 * dispersion, so it is available with or without posterior draws.
 *
 * @throws std::invalid_argument when interval_width is outside (0, 1).
 */
VariabilityBand dataVariability(const families::Family &family, const Eigen::VectorXd &linked,
                                double dispersion_raw, const design::LinkScaling &scaling, double interval_width);

} // namespace glamcast::uncertainty
