#include "glamcast/design/changepoints.hpp"
#include "glamcast/core/errors.hpp"
#include "glamcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>

namespace glamcast::design {

using core::ConfigErrorKind;
using core::ConfigurationError;

Eigen::VectorXd placeChangepoints(const Eigen::VectorXd &t, int n_changepoints, double changepoint_range) {
	if (n_changepoints < 0) {
		throw ConfigurationError(ConfigErrorKind::NegativeChangepoints, "n_changepoints must be non-negative.");
	}
	if (!(changepoint_range > 0.0 && changepoint_range <= 1.0)) {
		throw ConfigurationError(ConfigErrorKind::InvalidParameter, "changepoint_range must lie in (0, 1].");
	}
	const auto hist_size = static_cast<int>(std::floor(static_cast<double>(t.size()) * changepoint_range));
	int count = n_changepoints;
	if (count + 1 > hist_size) {
		const int reduced = std::max(hist_size - 1, 0);
		if (count > 0) {
			GLAMCAST_WARN("n_changepoints greater than number of observations. Using {}.", reduced);
		}
		count = reduced;
	}
	Eigen::VectorXd changepoints(count);
	if (count == 0) {
		return changepoints;
	}
	// Evenly spaced indices over [0, hist_size - 1]; index 0 is dropped.
	const double step = static_cast<double>(hist_size - 1) / static_cast<double>(count);
	for (int j = 0; j < count; ++j) {
		const auto index = static_cast<Eigen::Index>(std::round(step * static_cast<double>(j + 1)));
		changepoints[j] = t[index];
	}
	return changepoints;
}

Eigen::VectorXd normalizeChangepoints(const std::vector<core::TimePoint> &changepoints, const TimeScaling &scaling) {
	Eigen::VectorXd normalized = scaling.normalize(changepoints);
	for (Eigen::Index j = 0; j < normalized.size(); ++j) {
		if (!(normalized[j] > 0.0 && normalized[j] < 1.0)) {
			throw ConfigurationError(ConfigErrorKind::InvalidParameter,
			                         "Changepoints must lie strictly inside the training span.");
		}
	}
	std::sort(normalized.data(), normalized.data() + normalized.size());
	return normalized;
}

Eigen::MatrixXd changepointIndicatorMatrix(const Eigen::VectorXd &t, const Eigen::VectorXd &changepoints) {
	Eigen::MatrixXd indicator(t.size(), changepoints.size());
	for (Eigen::Index i = 0; i < t.size(); ++i) {
		for (Eigen::Index j = 0; j < changepoints.size(); ++j) {
			indicator(i, j) = t[i] >= changepoints[j] ? 1.0 : 0.0;
		}
	}
	return indicator;
}

} // namespace glamcast::design
