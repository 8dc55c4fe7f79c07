#pragma once

#include "glamcast/core/time_series.hpp"

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace glamcast::families {
class Family;
}

namespace glamcast::design {

struct RegressorSpec;

/**
 * @struct TimeScaling
 * @brief Maps the training span onto [0, 1].
 */
struct TimeScaling {
	double start = 0.0; ///< seconds since the epoch of the first observation
	double scale = 1.0; ///< training span in seconds

	double normalize(const core::TimePoint &tp) const {
		return (core::toSeconds(tp) - start) / scale;
	}

	Eigen::VectorXd normalize(const std::vector<core::TimePoint> &timestamps) const;

	/// Seconds since the epoch for a normalized time.
	double denormalize(double t) const {
		return start + t * scale;
	}
};

/**
 * @struct LinkScaling
 * @brief Global offset and scale applied to the linear predictor.
 *
 * The linked predictor is `offset + scale * (trend + X beta)`. Both values
 * come from the range of the linked training data so that normalized-space
 * priors behave the same for any metric unit.
 */
struct LinkScaling {
	double offset = 0.0;
	double scale = 1.0;

	double toLinked(double normalized) const {
		return offset + scale * normalized;
	}

	double toNormalized(double linked) const {
		return (linked - offset) / scale;
	}
};

/// Range-based scaling of one external regressor.
struct RegressorScale {
	double offset = 0.0;
	double scale = 1.0;

	double apply(double value) const {
		return (value - offset) / scale;
	}
};

/**
 * @struct ScalingContext
 * @brief Per-series scalars owned by a fitted model.
 *
 * Needed both to fit in normalized space and to map fitted parameters back
 * to the original units.
 */
struct ScalingContext {
	TimeScaling time;
	LinkScaling link;
	std::map<std::string, RegressorScale> regressors;
};

/// @throws core::ConfigurationError(DegenerateSeries) for fewer than two rows or a zero span.
TimeScaling computeTimeScaling(const std::vector<core::TimePoint> &timestamps);

/// @throws core::ConfigurationError(DegenerateSeries) when the linked metric is constant.
LinkScaling computeLinkScaling(const std::vector<double> &values, const families::Family &family);

/// @throws core::ConfigurationError(DegenerateSeries) for a constant regressor column.
RegressorScale computeRegressorScale(const std::string &name, const std::vector<double> &values);

/**
 * @brief Builds the full scaling context of a training series.
 * @throws core::ConfigurationError for degenerate inputs or missing regressor columns.
 */
ScalingContext buildScalingContext(const core::TimeSeries &series, const families::Family &family,
                                   const std::vector<RegressorSpec> &regressors);

} // namespace glamcast::design
