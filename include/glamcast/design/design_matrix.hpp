#pragma once

#include "glamcast/design/features.hpp"
#include "glamcast/design/scaling.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace glamcast::design {

enum class ComponentType { Seasonality, Event, Regressor };

/// A contiguous block of design-matrix columns belonging to one component.
struct ComponentBlock {
	std::string name;
	ComponentType type = ComponentType::Seasonality;
	Eigen::Index first_column = 0;
	Eigen::Index columns = 0;
};

/**
 * @struct DesignMatrix
 * @brief Regression columns for a set of timestamps.
 */
struct DesignMatrix {
	Eigen::MatrixXd X;
	/// Normal prior standard deviation of each column's coefficient.
	std::vector<double> prior_scales;
	std::vector<std::string> column_names;
	std::vector<ComponentBlock> components;

	Eigen::Index columns() const {
		return X.cols();
	}
};

/**
 * @class DesignMatrixBuilder
 * @brief Builds the seasonality, event and regressor columns of the model.
 *
 * The builder is created once per model and evaluated for the training
 * timestamps and again for every set of prediction timestamps, always with
 * the scaling context of the fit.
 */
class DesignMatrixBuilder {
public:
	DesignMatrixBuilder() = default;
	DesignMatrixBuilder(std::vector<SeasonalitySpec> seasonalities, std::vector<EventSpec> events,
	                    std::vector<RegressorSpec> regressors, double seasonality_prior_scale,
	                    double event_prior_scale);

	/// @throws core::ConfigurationError for duplicate names or invalid component settings.
	void validate() const;

	/**
	 * @brief Evaluates all columns.
	 * @param regressors Raw regressor values aligned with @p timestamps.
	 * @throws core::ConfigurationError(MissingRegressor) when a regressor column is absent or misaligned.
	 */
	DesignMatrix build(const std::vector<core::TimePoint> &timestamps, const core::RegressorValues &regressors,
	                   const ScalingContext &scaling) const;

	Eigen::Index columnCount() const;

	const std::vector<RegressorSpec> &regressors() const {
		return regressors_;
	}

private:
	std::vector<SeasonalitySpec> seasonalities_;
	std::vector<EventSpec> events_;
	std::vector<RegressorSpec> regressors_;
	double seasonality_prior_scale_ = 10.0;
	double event_prior_scale_ = 10.0;
};

} // namespace glamcast::design
