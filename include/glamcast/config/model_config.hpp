#pragma once

#include "glamcast/core/time_series.hpp"
#include "glamcast/families/family_kind.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace glamcast::config {

/**
 * @struct ModelConfig
 * @brief Fully resolved scalar settings consumed by the numeric core.
 */
struct ModelConfig {
	families::FamilyKind family = families::FamilyKind::Normal;
	/// Trials per observation for binomial and beta-binomial families.
	std::optional<int> capacity;

	int n_changepoints = 25;
	double changepoint_range = 0.8;
	/// Explicit changepoint times; overrides automatic placement when set.
	std::optional<std::vector<core::TimePoint>> changepoints;

	double seasonality_prior_scale = 10.0;
	double event_prior_scale = 10.0;
	double changepoint_prior_scale = 0.05;
	double dispersion_prior_scale = 3.0;
	/// Upper bound on implied variance for bounded families (beta); family default when unset.
	std::optional<double> variance_max;

	double interval_width = 0.8;
	bool use_laplace = false;
	int trend_samples = 1000;
	int laplace_samples = 500;
	std::uint64_t seed = 0;
	int max_iterations = 1000;

	/// @throws core::ConfigurationError when a value is outside its valid range.
	void validate() const;
};

/**
 * @struct PartialModelConfig
 * @brief One configuration layer; unset fields defer to lower layers.
 */
struct PartialModelConfig {
	std::optional<families::FamilyKind> family;
	std::optional<int> capacity;
	std::optional<int> n_changepoints;
	std::optional<double> changepoint_range;
	std::optional<std::vector<core::TimePoint>> changepoints;
	std::optional<double> seasonality_prior_scale;
	std::optional<double> event_prior_scale;
	std::optional<double> changepoint_prior_scale;
	std::optional<double> dispersion_prior_scale;
	std::optional<double> variance_max;
	std::optional<double> interval_width;
	std::optional<bool> use_laplace;
	std::optional<int> trend_samples;
	std::optional<int> laplace_samples;
	std::optional<std::uint64_t> seed;
	std::optional<int> max_iterations;
};

/// Copies every field set in @p layer over @p base.
ModelConfig applyLayer(ModelConfig base, const PartialModelConfig &layer);

/**
 * @brief Resolves layered settings: defaults < global < local < call.
 * @throws core::ConfigurationError when the resolved configuration is invalid.
 */
ModelConfig resolveConfig(const ModelConfig &defaults, const std::optional<PartialModelConfig> &global_settings,
                          const std::optional<PartialModelConfig> &local_settings,
                          const std::optional<PartialModelConfig> &call_arguments);

} // namespace glamcast::config
