#include "glamcast/utils/statistics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace glamcast::utils {

namespace Statistics {

double percentile(std::vector<double> &data, double q) {
	if (data.empty()) {
		throw std::invalid_argument("Cannot compute percentile of empty vector");
	}
	if (!(q >= 0.0 && q <= 1.0)) {
		throw std::invalid_argument("Percentile level must lie in [0, 1]");
	}

	const double position = q * static_cast<double>(data.size() - 1);
	const auto lower_index = static_cast<std::size_t>(std::floor(position));
	const double fraction = position - static_cast<double>(lower_index);

	// nth_element leaves everything above the pivot in the upper part
	std::nth_element(data.begin(), data.begin() + lower_index, data.end());
	const double lower = data[lower_index];
	if (fraction == 0.0 || lower_index + 1 >= data.size()) {
		return lower;
	}
	const double upper = *std::min_element(data.begin() + lower_index + 1, data.end());
	return lower + fraction * (upper - lower);
}

Eigen::VectorXd rowPercentile(const Eigen::MatrixXd &samples, double q) {
	Eigen::VectorXd result(samples.rows());
	std::vector<double> row(static_cast<std::size_t>(samples.cols()));
	for (Eigen::Index i = 0; i < samples.rows(); ++i) {
		for (Eigen::Index j = 0; j < samples.cols(); ++j) {
			row[static_cast<std::size_t>(j)] = samples(i, j);
		}
		result[i] = percentile(row, q);
	}
	return result;
}

double meanAbsolute(const Eigen::VectorXd &values) {
	if (values.size() == 0) {
		return 0.0;
	}
	return values.cwiseAbs().mean();
}

} // namespace Statistics
} // namespace glamcast::utils
