#include "glamcast/trend/piecewise_linear.hpp"

#include <stdexcept>

namespace glamcast::trend {

Eigen::VectorXd piecewiseLinear(const Eigen::VectorXd &t, double k, double m, const Eigen::VectorXd &delta,
                                const Eigen::VectorXd &changepoints) {
	if (delta.size() != changepoints.size()) {
		throw std::invalid_argument("delta and changepoints must have the same length.");
	}
	Eigen::VectorXd trend(t.size());
	for (Eigen::Index i = 0; i < t.size(); ++i) {
		double rate = k;
		double offset = m;
		for (Eigen::Index j = 0; j < changepoints.size(); ++j) {
			if (t[i] >= changepoints[j]) {
				rate += delta[j];
				offset -= changepoints[j] * delta[j];
			}
		}
		trend[i] = rate * t[i] + offset;
	}
	return trend;
}

Eigen::VectorXd piecewiseLinear(const Eigen::VectorXd &t, double k, double m, const Eigen::VectorXd &delta,
                                const Eigen::VectorXd &changepoints, const Eigen::MatrixXd &indicator) {
	if (indicator.rows() != t.size() || indicator.cols() != delta.size() || delta.size() != changepoints.size()) {
		throw std::invalid_argument("Indicator matrix does not match times and changepoints.");
	}
	const Eigen::VectorXd rate = ((indicator * delta).array() + k).matrix();
	const Eigen::VectorXd offset = (m - (indicator * changepoints.cwiseProduct(delta)).array()).matrix();
	return rate.cwiseProduct(t) + offset;
}

TrendParameters denormalizeTrend(const TrendParameters &normalized, const design::TimeScaling &time,
                                 const design::LinkScaling &link) {
	TrendParameters result;
	result.k = link.scale * normalized.k / time.scale;
	result.m = link.offset + link.scale * normalized.m - result.k * time.start;
	result.delta = normalized.delta * (link.scale / time.scale);
	result.changepoints = ((normalized.changepoints * time.scale).array() + time.start).matrix();
	return result;
}

} // namespace glamcast::trend
