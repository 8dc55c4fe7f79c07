#pragma once

#include "glamcast/core/prediction.hpp"
#include "glamcast/core/time_series.hpp"

#include <string>

namespace glamcast::model {

/**
 * @class IForecaster
 * @brief An interface for forecasting models.
 *
 * Fitting replaces the model state; predicting reads it and may be called
 * any number of times, including concurrently.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided time series data.
	 * @param ts The time series data to train the model on.
	 */
	virtual void fit(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Generates forecasts for a specified number of steps after the training data.
	 * @param horizon The number of future time steps to predict.
	 */
	virtual core::Prediction predict(int horizon) const = 0;

	/**
	 * @brief Gets the name of the forecasting model.
	 */
	virtual std::string getName() const = 0;
};

} // namespace glamcast::model
