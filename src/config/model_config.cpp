#include "glamcast/config/model_config.hpp"
#include "glamcast/core/errors.hpp"

#include <cmath>
#include <string>
#include <utility>

namespace glamcast::config {

namespace {

using core::ConfigErrorKind;
using core::ConfigurationError;

void requirePositive(double value, const char *name) {
	if (!(value > 0.0) || !std::isfinite(value)) {
		throw ConfigurationError(ConfigErrorKind::InvalidParameter, std::string(name) + " must be positive.");
	}
}

template <typename T>
void assignIfSet(T &target, const std::optional<T> &value) {
	if (value) {
		target = *value;
	}
}

} // namespace

void ModelConfig::validate() const {
	if (n_changepoints < 0) {
		throw ConfigurationError(ConfigErrorKind::NegativeChangepoints, "n_changepoints must be non-negative.");
	}
	if (!(changepoint_range > 0.0 && changepoint_range <= 1.0)) {
		throw ConfigurationError(ConfigErrorKind::InvalidParameter, "changepoint_range must lie in (0, 1].");
	}
	requirePositive(seasonality_prior_scale, "seasonality_prior_scale");
	requirePositive(event_prior_scale, "event_prior_scale");
	requirePositive(changepoint_prior_scale, "changepoint_prior_scale");
	requirePositive(dispersion_prior_scale, "dispersion_prior_scale");
	if (variance_max) {
		requirePositive(*variance_max, "variance_max");
	}
	if (!(interval_width > 0.0 && interval_width < 1.0)) {
		throw ConfigurationError(ConfigErrorKind::InvalidParameter, "interval_width must lie in (0, 1).");
	}
	if (trend_samples < 0) {
		throw ConfigurationError(ConfigErrorKind::InvalidParameter, "trend_samples must be non-negative.");
	}
	if (use_laplace && laplace_samples <= 0) {
		throw ConfigurationError(ConfigErrorKind::InvalidParameter,
		                         "laplace_samples must be positive when Laplace sampling is enabled.");
	}
	if (max_iterations <= 0) {
		throw ConfigurationError(ConfigErrorKind::InvalidParameter, "max_iterations must be positive.");
	}
	if (families::requiresCapacity(family)) {
		if (!capacity || *capacity < 1) {
			throw ConfigurationError(ConfigErrorKind::InvalidParameter,
			                         families::toString(family) + " family requires a capacity of at least 1.");
		}
	}
}

ModelConfig applyLayer(ModelConfig base, const PartialModelConfig &layer) {
	assignIfSet(base.family, layer.family);
	if (layer.capacity) {
		base.capacity = layer.capacity;
	}
	assignIfSet(base.n_changepoints, layer.n_changepoints);
	assignIfSet(base.changepoint_range, layer.changepoint_range);
	if (layer.changepoints) {
		base.changepoints = layer.changepoints;
	}
	assignIfSet(base.seasonality_prior_scale, layer.seasonality_prior_scale);
	assignIfSet(base.event_prior_scale, layer.event_prior_scale);
	assignIfSet(base.changepoint_prior_scale, layer.changepoint_prior_scale);
	assignIfSet(base.dispersion_prior_scale, layer.dispersion_prior_scale);
	if (layer.variance_max) {
		base.variance_max = layer.variance_max;
	}
	assignIfSet(base.interval_width, layer.interval_width);
	assignIfSet(base.use_laplace, layer.use_laplace);
	assignIfSet(base.trend_samples, layer.trend_samples);
	assignIfSet(base.laplace_samples, layer.laplace_samples);
	assignIfSet(base.seed, layer.seed);
	assignIfSet(base.max_iterations, layer.max_iterations);
	return base;
}

ModelConfig resolveConfig(const ModelConfig &defaults, const std::optional<PartialModelConfig> &global_settings,
                          const std::optional<PartialModelConfig> &local_settings,
                          const std::optional<PartialModelConfig> &call_arguments) {
	ModelConfig resolved = defaults;
	for (const auto *layer : {&global_settings, &local_settings, &call_arguments}) {
		if (layer->has_value()) {
			resolved = applyLayer(std::move(resolved), **layer);
		}
	}
	resolved.validate();
	return resolved;
}

} // namespace glamcast::config
