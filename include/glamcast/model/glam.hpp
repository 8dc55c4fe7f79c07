#pragma once

#include "glamcast/config/model_config.hpp"
#include "glamcast/design/design_matrix.hpp"
#include "glamcast/families/family.hpp"
#include "glamcast/fitting/posterior_fitter.hpp"
#include "glamcast/model/iforecaster.hpp"
#include "glamcast/trend/piecewise_linear.hpp"

#include <Eigen/Dense>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace glamcast::model {

class GlamBuilder; // Forward declaration

/**
 * @class Glam
 * @brief Generalized additive forecaster with a choice of observation family.
 *
 * The linear predictor is a piecewise-linear trend plus Fourier seasonalities,
 * events and external regressors, mapped to the family's mean through its
 * inverse link. Fits are MAP estimates with optional Laplace sampling.
 *
 * A failed fit throws and leaves the previously fitted state untouched.
 */
class Glam final : public IForecaster {
public:
	friend class GlamBuilder;

	/// @throws core::ConfigurationError for an invalid configuration or component set.
	explicit Glam(config::ModelConfig config = {}, std::vector<design::SeasonalitySpec> seasonalities = {},
	              std::vector<design::EventSpec> events = {}, std::vector<design::RegressorSpec> regressors = {},
	              std::shared_ptr<const fitting::IPosteriorBackend> backend = nullptr);

	void fit(const core::TimeSeries &ts) override;

	/// Predicts @p horizon steps after the training data at the inferred frequency.
	core::Prediction predict(int horizon) const override;

	/**
	 * @brief Predicts arbitrary timestamps.
	 * @param regressors Values of every configured regressor at @p timestamps.
	 */
	core::Prediction predict(const std::vector<core::TimePoint> &timestamps,
	                         const core::RegressorValues &regressors = {}) const;

	/// Same as above with a different interval width than the configured one.
	core::Prediction predict(const std::vector<core::TimePoint> &timestamps, const core::RegressorValues &regressors,
	                         double interval_width) const;

	/**
	 * @brief Timestamps following the training data.
	 * @param frequency Step between timestamps; the inferred training frequency when unset.
	 * @param include_history Prepend the training timestamps.
	 */
	std::vector<core::TimePoint> makeFutureTimestamps(int periods,
	                                                  std::optional<std::chrono::nanoseconds> frequency = std::nullopt,
	                                                  bool include_history = false) const;

	std::string getName() const override {
		return "Glam";
	}

	bool isFitted() const {
		return static_cast<bool>(state_);
	}

	const config::ModelConfig &config() const {
		return config_;
	}

	const families::Family &family() const {
		return *family_;
	}

	const fitting::FitResult &fitResult() const;
	const design::ScalingContext &scaling() const;

	/// Changepoint times of the fit.
	std::vector<core::TimePoint> changepointTimes() const;

	/// Trend parameters in normalized time and normalized linked units.
	trend::TrendParameters normalizedTrend() const;

	/// Trend parameters in seconds since the epoch and linked units.
	trend::TrendParameters denormalizedTrend() const;

	/// Natural dispersion of the family (sigma, kappa, ...); zero when the family has none.
	double dispersion() const;

private:
	struct FittedState {
		design::ScalingContext scaling;
		Eigen::VectorXd changepoints;
		fitting::FitResult fit;
		std::vector<core::TimePoint> history;
		std::optional<std::chrono::nanoseconds> frequency;
	};

	const FittedState &state() const;

	config::ModelConfig config_;
	design::DesignMatrixBuilder components_;
	std::unique_ptr<families::Family> family_;
	std::shared_ptr<const fitting::IPosteriorBackend> backend_;
	std::shared_ptr<const FittedState> state_;
};

class GlamBuilder {
public:
	GlamBuilder &withFamily(families::FamilyKind family);
	GlamBuilder &withFamily(const std::string &family);
	GlamBuilder &withCapacity(int capacity);
	GlamBuilder &withVarianceMax(double variance_max);
	GlamBuilder &withChangepoints(int n_changepoints, double changepoint_range = 0.8);
	GlamBuilder &withChangepointTimes(std::vector<core::TimePoint> changepoints);
	GlamBuilder &withChangepointPriorScale(double scale);
	GlamBuilder &withSeasonality(design::SeasonalitySpec seasonality);
	GlamBuilder &withEvent(design::EventSpec event);
	GlamBuilder &withRegressor(design::RegressorSpec regressor);
	GlamBuilder &withIntervalWidth(double interval_width);
	GlamBuilder &withLaplace(bool use_laplace, int samples = 500);
	GlamBuilder &withTrendSamples(int trend_samples);
	GlamBuilder &withSeed(std::uint64_t seed);
	GlamBuilder &withConfig(const config::PartialModelConfig &layer);
	GlamBuilder &withBackend(std::shared_ptr<const fitting::IPosteriorBackend> backend);
	std::unique_ptr<Glam> build();

private:
	config::ModelConfig config_;
	std::vector<design::SeasonalitySpec> seasonalities_;
	std::vector<design::EventSpec> events_;
	std::vector<design::RegressorSpec> regressors_;
	std::shared_ptr<const fitting::IPosteriorBackend> backend_;
};

} // namespace glamcast::model
