#include "glamcast/model/glam.hpp"
#include "glamcast/core/errors.hpp"
#include "glamcast/design/changepoints.hpp"
#include "glamcast/model/prediction_assembler.hpp"
#include "glamcast/utils/logging.hpp"

#include <stdexcept>
#include <utility>

namespace glamcast::model {

Glam::Glam(config::ModelConfig config, std::vector<design::SeasonalitySpec> seasonalities,
           std::vector<design::EventSpec> events, std::vector<design::RegressorSpec> regressors,
           std::shared_ptr<const fitting::IPosteriorBackend> backend)
    : config_(std::move(config)),
      components_(std::move(seasonalities), std::move(events), std::move(regressors), config_.seasonality_prior_scale,
                  config_.event_prior_scale),
      backend_(backend ? std::move(backend) : std::make_shared<fitting::LbfgsBackend>()) {
	config_.validate();
	components_.validate();
	families::FamilyOptions options;
	options.capacity = config_.capacity;
	options.variance_max = config_.variance_max;
	family_ = families::makeFamily(config_.family, options);
}

const Glam::FittedState &Glam::state() const {
	if (!state_) {
		throw core::NotFittedError("Glam model has not been fitted.");
	}
	return *state_;
}

void Glam::fit(const core::TimeSeries &ts) {
	state_.reset();
	if (ts.size() < 2) {
		throw core::ConfigurationError(core::ConfigErrorKind::DegenerateSeries,
		                               "At least two observations are required to fit.");
	}
	const auto &timestamps = ts.getTimestamps();
	const auto &values = ts.getValues();
	family_->validateObservations(values);

	auto state = std::make_shared<FittedState>();
	state->scaling = design::buildScalingContext(ts, *family_, components_.regressors());
	const Eigen::VectorXd t = state->scaling.time.normalize(timestamps);
	if (config_.changepoints) {
		state->changepoints = design::normalizeChangepoints(*config_.changepoints, state->scaling.time);
	} else {
		state->changepoints = design::placeChangepoints(t, config_.n_changepoints, config_.changepoint_range);
	}
	const design::TrendBasis basis = design::makeTrendBasis(t, state->changepoints);
	const design::DesignMatrix design = components_.build(timestamps, ts.regressors(), state->scaling);

	GLAMCAST_INFO("Fitting {} model on {} rows with {} changepoints and {} design columns", family_->name(),
	              ts.size(), state->changepoints.size(), design.columns());

	fitting::PriorSpec priors;
	priors.changepoint_prior_scale = config_.changepoint_prior_scale;
	priors.dispersion_prior_scale = config_.dispersion_prior_scale;
	priors.beta_scales = design.prior_scales;

	fitting::FitData data;
	data.y = values;
	data.link = state->scaling.link;

	fitting::FitOptions options;
	options.use_laplace = config_.use_laplace;
	options.laplace_samples = config_.laplace_samples;
	options.seed = config_.seed;
	options.max_iterations = config_.max_iterations;

	const fitting::PosteriorFitter fitter(backend_);
	state->fit = fitter.fit(design, basis, *family_, priors, data, options);
	state->history = timestamps;
	state->frequency = ts.inferFrequency();

	state_ = std::move(state);
	GLAMCAST_INFO("Glam model fitted: log posterior {:.6f} after {} iterations", state_->fit.log_posterior,
	              state_->fit.iterations);
}

core::Prediction Glam::predict(int horizon) const {
	if (horizon <= 0) {
		throw std::invalid_argument("Forecast horizon must be positive.");
	}
	return predict(makeFutureTimestamps(horizon));
}

core::Prediction Glam::predict(const std::vector<core::TimePoint> &timestamps,
                               const core::RegressorValues &regressors) const {
	return predict(timestamps, regressors, config_.interval_width);
}

core::Prediction Glam::predict(const std::vector<core::TimePoint> &timestamps, const core::RegressorValues &regressors,
                               double interval_width) const {
	const auto state_ptr = state_;
	if (!state_ptr) {
		throw core::NotFittedError("Glam model has not been fitted.");
	}
	if (timestamps.empty()) {
		throw std::invalid_argument("Cannot predict an empty set of timestamps.");
	}
	if (!(interval_width > 0.0 && interval_width < 1.0)) {
		throw core::ConfigurationError(core::ConfigErrorKind::InvalidParameter, "interval_width must lie in (0, 1).");
	}

	const design::DesignMatrix design = components_.build(timestamps, regressors, state_ptr->scaling);
	PredictionOptions options;
	options.interval_width = interval_width;
	options.trend_samples = config_.trend_samples;
	options.seed = config_.seed;

	const PredictionAssembler assembler(*family_, state_ptr->scaling, state_ptr->fit, state_ptr->changepoints);
	return assembler.assemble(timestamps, design, options);
}

std::vector<core::TimePoint> Glam::makeFutureTimestamps(int periods, std::optional<std::chrono::nanoseconds> frequency,
                                                        bool include_history) const {
	const auto &fitted = state();
	if (periods < 0) {
		throw std::invalid_argument("Number of periods must be non-negative.");
	}
	const auto step = frequency ? frequency : fitted.frequency;
	if (!step || step->count() <= 0) {
		throw std::invalid_argument("Cannot infer a positive frequency from the training timestamps.");
	}

	std::vector<core::TimePoint> result;
	if (include_history) {
		result = fitted.history;
	}
	result.reserve(result.size() + static_cast<std::size_t>(periods));
	const auto last = fitted.history.back();
	for (int i = 1; i <= periods; ++i) {
		result.push_back(last + std::chrono::duration_cast<core::TimePoint::duration>(*step * i));
	}
	return result;
}

const fitting::FitResult &Glam::fitResult() const {
	return state().fit;
}

const design::ScalingContext &Glam::scaling() const {
	return state().scaling;
}

std::vector<core::TimePoint> Glam::changepointTimes() const {
	const auto &fitted = state();
	std::vector<core::TimePoint> times;
	times.reserve(static_cast<std::size_t>(fitted.changepoints.size()));
	for (Eigen::Index j = 0; j < fitted.changepoints.size(); ++j) {
		const std::chrono::duration<double> seconds(fitted.scaling.time.denormalize(fitted.changepoints[j]));
		times.push_back(core::TimePoint(std::chrono::duration_cast<core::TimePoint::duration>(seconds)));
	}
	return times;
}

trend::TrendParameters Glam::normalizedTrend() const {
	const auto &fitted = state();
	trend::TrendParameters params;
	params.k = fitted.fit.map.k;
	params.m = fitted.fit.map.m;
	params.delta = fitted.fit.map.delta;
	params.changepoints = fitted.changepoints;
	return params;
}

trend::TrendParameters Glam::denormalizedTrend() const {
	const auto &fitted = state();
	return trend::denormalizeTrend(normalizedTrend(), fitted.scaling.time, fitted.scaling.link);
}

double Glam::dispersion() const {
	const auto &fitted = state();
	return family_->dispersion(fitted.fit.map.dispersion_raw, fitted.scaling.link);
}

GlamBuilder &GlamBuilder::withFamily(families::FamilyKind family) {
	config_.family = family;
	return *this;
}

GlamBuilder &GlamBuilder::withFamily(const std::string &family) {
	config_.family = families::familyFromString(family);
	return *this;
}

GlamBuilder &GlamBuilder::withCapacity(int capacity) {
	config_.capacity = capacity;
	return *this;
}

GlamBuilder &GlamBuilder::withVarianceMax(double variance_max) {
	config_.variance_max = variance_max;
	return *this;
}

GlamBuilder &GlamBuilder::withChangepoints(int n_changepoints, double changepoint_range) {
	config_.n_changepoints = n_changepoints;
	config_.changepoint_range = changepoint_range;
	return *this;
}

GlamBuilder &GlamBuilder::withChangepointTimes(std::vector<core::TimePoint> changepoints) {
	config_.changepoints = std::move(changepoints);
	return *this;
}

GlamBuilder &GlamBuilder::withChangepointPriorScale(double scale) {
	config_.changepoint_prior_scale = scale;
	return *this;
}

GlamBuilder &GlamBuilder::withSeasonality(design::SeasonalitySpec seasonality) {
	seasonalities_.push_back(std::move(seasonality));
	return *this;
}

GlamBuilder &GlamBuilder::withEvent(design::EventSpec event) {
	events_.push_back(std::move(event));
	return *this;
}

GlamBuilder &GlamBuilder::withRegressor(design::RegressorSpec regressor) {
	regressors_.push_back(std::move(regressor));
	return *this;
}

GlamBuilder &GlamBuilder::withIntervalWidth(double interval_width) {
	config_.interval_width = interval_width;
	return *this;
}

GlamBuilder &GlamBuilder::withLaplace(bool use_laplace, int samples) {
	config_.use_laplace = use_laplace;
	config_.laplace_samples = samples;
	return *this;
}

GlamBuilder &GlamBuilder::withTrendSamples(int trend_samples) {
	config_.trend_samples = trend_samples;
	return *this;
}

GlamBuilder &GlamBuilder::withSeed(std::uint64_t seed) {
	config_.seed = seed;
	return *this;
}

GlamBuilder &GlamBuilder::withConfig(const config::PartialModelConfig &layer) {
	config_ = config::applyLayer(config_, layer);
	return *this;
}

GlamBuilder &GlamBuilder::withBackend(std::shared_ptr<const fitting::IPosteriorBackend> backend) {
	backend_ = std::move(backend);
	return *this;
}

std::unique_ptr<Glam> GlamBuilder::build() {
	return std::make_unique<Glam>(config_, seasonalities_, events_, regressors_, backend_);
}

} // namespace glamcast::model
