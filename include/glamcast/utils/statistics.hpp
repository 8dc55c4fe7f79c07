#pragma once

#include <Eigen/Dense>
#include <vector>

namespace glamcast::utils {

/**
 * @brief Order statistics over sample sets.
 */
namespace Statistics {

/**
 * @brief Percentile with linear interpolation between order statistics.
 *
 * For sorted values x_0..x_{n-1} the position is q (n - 1); the result
 * interpolates between the two neighbouring order statistics.
 *
 * @param data Samples (reordered in place).
 * @param q Probability in [0, 1].
 * @throws std::invalid_argument for empty data or q outside [0, 1].
 */
double percentile(std::vector<double> &data, double q);

/**
 * @brief Percentile of every row of a sample matrix.
 *
 * @param samples Matrix with one row per time point and one column per sample.
 * @return One percentile per row.
 */
Eigen::VectorXd rowPercentile(const Eigen::MatrixXd &samples, double q);

/// Mean of absolute values; zero for an empty vector.
double meanAbsolute(const Eigen::VectorXd &values);

} // namespace Statistics
} // namespace glamcast::utils
