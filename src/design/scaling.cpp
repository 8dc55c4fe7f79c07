#include "glamcast/design/scaling.hpp"
#include "glamcast/core/errors.hpp"
#include "glamcast/design/features.hpp"
#include "glamcast/families/family.hpp"

#include <algorithm>
#include <cmath>

namespace glamcast::design {

using core::ConfigErrorKind;
using core::ConfigurationError;

Eigen::VectorXd TimeScaling::normalize(const std::vector<core::TimePoint> &timestamps) const {
	Eigen::VectorXd t(static_cast<Eigen::Index>(timestamps.size()));
	for (std::size_t i = 0; i < timestamps.size(); ++i) {
		t[static_cast<Eigen::Index>(i)] = normalize(timestamps[i]);
	}
	return t;
}

TimeScaling computeTimeScaling(const std::vector<core::TimePoint> &timestamps) {
	if (timestamps.size() < 2) {
		throw ConfigurationError(ConfigErrorKind::DegenerateSeries, "At least two observations are required.");
	}
	TimeScaling scaling;
	scaling.start = core::toSeconds(timestamps.front());
	scaling.scale = core::toSeconds(timestamps.back()) - scaling.start;
	if (!(scaling.scale > 0.0)) {
		throw ConfigurationError(ConfigErrorKind::DegenerateSeries, "Training series spans zero time.");
	}
	return scaling;
}

LinkScaling computeLinkScaling(const std::vector<double> &values, const families::Family &family) {
	if (values.empty()) {
		throw ConfigurationError(ConfigErrorKind::DegenerateSeries, "Cannot scale an empty series.");
	}
	double lo = family.linkData(values.front());
	double hi = lo;
	for (double y : values) {
		const double linked = family.linkData(y);
		lo = std::min(lo, linked);
		hi = std::max(hi, linked);
	}
	if (!(hi - lo > 0.0)) {
		throw ConfigurationError(ConfigErrorKind::DegenerateSeries, "Metric is constant on the linked scale.");
	}
	return LinkScaling{lo, hi - lo};
}

RegressorScale computeRegressorScale(const std::string &name, const std::vector<double> &values) {
	if (values.empty()) {
		throw ConfigurationError(ConfigErrorKind::DegenerateSeries, "Regressor '" + name + "' is empty.");
	}
	const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
	const double range = *hi - *lo;
	if (!(range > 0.0)) {
		throw ConfigurationError(ConfigErrorKind::DegenerateSeries, "Regressor '" + name + "' is constant.");
	}
	return RegressorScale{*lo, range};
}

ScalingContext buildScalingContext(const core::TimeSeries &series, const families::Family &family,
                                   const std::vector<RegressorSpec> &regressors) {
	ScalingContext context;
	context.time = computeTimeScaling(series.getTimestamps());
	context.link = computeLinkScaling(series.getValues(), family);
	for (const auto &spec : regressors) {
		if (!series.hasRegressor(spec.name)) {
			throw ConfigurationError(ConfigErrorKind::MissingRegressor,
			                         "Training series lacks regressor '" + spec.name + "'.");
		}
		context.regressors.emplace(spec.name, computeRegressorScale(spec.name, series.regressor(spec.name)));
	}
	return context;
}

} // namespace glamcast::design
