#pragma once

#include "glamcast/core/time_series.hpp"

#include <Eigen/Dense>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace glamcast::design {

/**
 * @struct SeasonalitySpec
 * @brief A periodic component expanded into Fourier terms.
 */
struct SeasonalitySpec {
	std::string name;
	double period_days = 7.0;
	int fourier_order = 3;
	std::optional<double> prior_scale;
};

enum class EventProfile {
	BoxCar,  ///< 1 inside [start, start + width), 0 elsewhere
	Gaussian ///< exp(-0.5 ((t - start) / width)^2)
};

/**
 * @struct EventSpec
 * @brief A recurring event whose effect follows a fixed profile.
 */
struct EventSpec {
	std::string name;
	std::vector<core::TimePoint> occurrences;
	EventProfile profile = EventProfile::BoxCar;
	std::chrono::seconds width = std::chrono::hours(24);
	std::optional<double> prior_scale;
};

/// An external regressor column supplied with the series.
struct RegressorSpec {
	std::string name;
	std::optional<double> prior_scale;
};

/**
 * @brief Fourier expansion of a seasonality.
 *
 * Time is measured in days since the epoch so the columns do not depend on
 * the training window. Column 2(k-1) holds sin(2 pi k t / P), column
 * 2(k-1)+1 holds cos(2 pi k t / P).
 */
Eigen::MatrixXd fourierColumns(const std::vector<core::TimePoint> &timestamps, double period_days,
                               int fourier_order);

/// Sum of the event profile over all occurrences, one value per timestamp.
Eigen::VectorXd eventColumn(const std::vector<core::TimePoint> &timestamps, const EventSpec &event);

/// Evaluates a single profile at an offset (in seconds) from an occurrence start.
double evaluateProfile(EventProfile profile, double offset_seconds, double width_seconds);

} // namespace glamcast::design
