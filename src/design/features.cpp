#include "glamcast/design/features.hpp"

#include <cmath>
#include <stdexcept>

namespace glamcast::design {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kSecondsPerDay = 86400.0;

} // namespace

Eigen::MatrixXd fourierColumns(const std::vector<core::TimePoint> &timestamps, double period_days,
                               int fourier_order) {
	if (!(period_days > 0.0)) {
		throw std::invalid_argument("Seasonality period must be positive.");
	}
	if (fourier_order <= 0) {
		throw std::invalid_argument("Fourier order must be positive.");
	}
	const auto rows = static_cast<Eigen::Index>(timestamps.size());
	Eigen::MatrixXd columns(rows, 2 * fourier_order);
	for (Eigen::Index i = 0; i < rows; ++i) {
		const double days = core::toSeconds(timestamps[static_cast<std::size_t>(i)]) / kSecondsPerDay;
		for (int k = 1; k <= fourier_order; ++k) {
			const double angle = 2.0 * kPi * k * days / period_days;
			columns(i, 2 * (k - 1)) = std::sin(angle);
			columns(i, 2 * (k - 1) + 1) = std::cos(angle);
		}
	}
	return columns;
}

double evaluateProfile(EventProfile profile, double offset_seconds, double width_seconds) {
	switch (profile) {
	case EventProfile::BoxCar:
		return (offset_seconds >= 0.0 && offset_seconds < width_seconds) ? 1.0 : 0.0;
	case EventProfile::Gaussian: {
		const double z = offset_seconds / width_seconds;
		return std::exp(-0.5 * z * z);
	}
	}
	throw std::logic_error("Unsupported event profile.");
}

Eigen::VectorXd eventColumn(const std::vector<core::TimePoint> &timestamps, const EventSpec &event) {
	const double width = std::chrono::duration<double>(event.width).count();
	if (!(width > 0.0)) {
		throw std::invalid_argument("Event '" + event.name + "' must have a positive width.");
	}
	Eigen::VectorXd column = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(timestamps.size()));
	for (std::size_t i = 0; i < timestamps.size(); ++i) {
		const double t = core::toSeconds(timestamps[i]);
		double value = 0.0;
		for (const auto &occurrence : event.occurrences) {
			value += evaluateProfile(event.profile, t - core::toSeconds(occurrence), width);
		}
		column[static_cast<Eigen::Index>(i)] = value;
	}
	return column;
}

} // namespace glamcast::design
