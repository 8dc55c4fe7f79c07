#include "glamcast/design/design_matrix.hpp"
#include "glamcast/core/errors.hpp"

#include <set>
#include <string>
#include <utility>

namespace glamcast::design {

using core::ConfigErrorKind;
using core::ConfigurationError;

DesignMatrixBuilder::DesignMatrixBuilder(std::vector<SeasonalitySpec> seasonalities, std::vector<EventSpec> events,
                                         std::vector<RegressorSpec> regressors, double seasonality_prior_scale,
                                         double event_prior_scale)
    : seasonalities_(std::move(seasonalities)), events_(std::move(events)), regressors_(std::move(regressors)),
      seasonality_prior_scale_(seasonality_prior_scale), event_prior_scale_(event_prior_scale) {
}

void DesignMatrixBuilder::validate() const {
	std::set<std::string> names;
	auto claim = [&names](const std::string &name) {
		if (name.empty()) {
			throw ConfigurationError(ConfigErrorKind::InvalidParameter, "Component names must not be empty.");
		}
		if (!names.insert(name).second) {
			throw ConfigurationError(ConfigErrorKind::InvalidParameter, "Duplicate component name '" + name + "'.");
		}
	};
	auto check_scale = [](const std::optional<double> &scale, const std::string &name) {
		if (scale && !(*scale > 0.0)) {
			throw ConfigurationError(ConfigErrorKind::InvalidParameter,
			                         "Prior scale of '" + name + "' must be positive.");
		}
	};
	for (const auto &seasonality : seasonalities_) {
		claim(seasonality.name);
		check_scale(seasonality.prior_scale, seasonality.name);
		if (!(seasonality.period_days > 0.0) || seasonality.fourier_order <= 0) {
			throw ConfigurationError(ConfigErrorKind::InvalidParameter,
			                         "Seasonality '" + seasonality.name + "' needs a positive period and order.");
		}
	}
	for (const auto &event : events_) {
		claim(event.name);
		check_scale(event.prior_scale, event.name);
		if (event.width.count() <= 0) {
			throw ConfigurationError(ConfigErrorKind::InvalidParameter,
			                         "Event '" + event.name + "' needs a positive width.");
		}
	}
	for (const auto &regressor : regressors_) {
		claim(regressor.name);
		check_scale(regressor.prior_scale, regressor.name);
	}
}

Eigen::Index DesignMatrixBuilder::columnCount() const {
	Eigen::Index count = 0;
	for (const auto &seasonality : seasonalities_) {
		count += 2 * seasonality.fourier_order;
	}
	return count + static_cast<Eigen::Index>(events_.size() + regressors_.size());
}

DesignMatrix DesignMatrixBuilder::build(const std::vector<core::TimePoint> &timestamps,
                                        const core::RegressorValues &regressors,
                                        const ScalingContext &scaling) const {
	const auto rows = static_cast<Eigen::Index>(timestamps.size());
	DesignMatrix design;
	design.X.resize(rows, columnCount());
	design.prior_scales.reserve(static_cast<std::size_t>(columnCount()));
	design.column_names.reserve(static_cast<std::size_t>(columnCount()));

	Eigen::Index column = 0;
	for (const auto &seasonality : seasonalities_) {
		const auto block = fourierColumns(timestamps, seasonality.period_days, seasonality.fourier_order);
		design.X.middleCols(column, block.cols()) = block;
		design.components.push_back({seasonality.name, ComponentType::Seasonality, column, block.cols()});
		const double prior = seasonality.prior_scale.value_or(seasonality_prior_scale_);
		for (int k = 1; k <= seasonality.fourier_order; ++k) {
			design.column_names.push_back(seasonality.name + "_delim_" + std::to_string(2 * k - 1));
			design.column_names.push_back(seasonality.name + "_delim_" + std::to_string(2 * k));
			design.prior_scales.push_back(prior);
			design.prior_scales.push_back(prior);
		}
		column += block.cols();
	}

	for (const auto &event : events_) {
		design.X.col(column) = eventColumn(timestamps, event);
		design.components.push_back({event.name, ComponentType::Event, column, 1});
		design.column_names.push_back(event.name);
		design.prior_scales.push_back(event.prior_scale.value_or(event_prior_scale_));
		++column;
	}

	for (const auto &regressor : regressors_) {
		const auto values = regressors.find(regressor.name);
		if (values == regressors.end() || values->second.size() != timestamps.size()) {
			throw ConfigurationError(ConfigErrorKind::MissingRegressor,
			                         "Values for regressor '" + regressor.name + "' are missing or misaligned.");
		}
		const auto scale = scaling.regressors.find(regressor.name);
		if (scale == scaling.regressors.end()) {
			throw ConfigurationError(ConfigErrorKind::MissingRegressor,
			                         "No scaling recorded for regressor '" + regressor.name + "'.");
		}
		for (Eigen::Index i = 0; i < rows; ++i) {
			design.X(i, column) = scale->second.apply(values->second[static_cast<std::size_t>(i)]);
		}
		design.components.push_back({regressor.name, ComponentType::Regressor, column, 1});
		design.column_names.push_back(regressor.name);
		design.prior_scales.push_back(regressor.prior_scale.value_or(event_prior_scale_));
		++column;
	}
	return design;
}

} // namespace glamcast::design
