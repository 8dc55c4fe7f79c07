#pragma once

#include "glamcast/core/time_series.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace glamcast::core {

/**
 * @struct Prediction
 * @brief Decomposed forecast for a set of timestamps.
 *
 * Every column is present for every prediction. Columns without suffix are
 * on the metric scale, `_linked` columns on the scale of the linear
 * predictor. Without posterior draws the confidence bounds equal `yhat`.
 */
struct Prediction {
	using Series = std::vector<double>;

	std::vector<TimePoint> timestamps;

	Series yhat;
	Series yhat_upper;
	Series yhat_lower;
	Series observed_upper;
	Series observed_lower;
	Series trend;
	Series trend_upper;
	Series trend_lower;

	Series yhat_linked;
	Series yhat_upper_linked;
	Series yhat_lower_linked;
	Series observed_upper_linked;
	Series observed_lower_linked;
	Series trend_linked;
	Series trend_upper_linked;
	Series trend_lower_linked;

	/// Additive contribution of each seasonality, event and regressor on the linked scale.
	std::map<std::string, Series> components;

	std::size_t size() const {
		return timestamps.size();
	}

	bool empty() const {
		return timestamps.empty();
	}

	/// Output columns in their fixed order.
	static const std::vector<std::string> &columnNames() {
		static const std::vector<std::string> names = {
		    "yhat",           "yhat_upper",        "yhat_lower",        "observed_upper",
		    "observed_lower", "trend",             "trend_upper",       "trend_lower",
		    "yhat_linked",    "yhat_upper_linked", "yhat_lower_linked", "observed_upper_linked",
		    "observed_lower_linked", "trend_linked", "trend_upper_linked", "trend_lower_linked"};
		return names;
	}

	/// Column by name, components included.
	const Series &column(const std::string &name) const {
		if (name == "yhat") return yhat;
		if (name == "yhat_upper") return yhat_upper;
		if (name == "yhat_lower") return yhat_lower;
		if (name == "observed_upper") return observed_upper;
		if (name == "observed_lower") return observed_lower;
		if (name == "trend") return trend;
		if (name == "trend_upper") return trend_upper;
		if (name == "trend_lower") return trend_lower;
		if (name == "yhat_linked") return yhat_linked;
		if (name == "yhat_upper_linked") return yhat_upper_linked;
		if (name == "yhat_lower_linked") return yhat_lower_linked;
		if (name == "observed_upper_linked") return observed_upper_linked;
		if (name == "observed_lower_linked") return observed_lower_linked;
		if (name == "trend_linked") return trend_linked;
		if (name == "trend_upper_linked") return trend_upper_linked;
		if (name == "trend_lower_linked") return trend_lower_linked;
		const auto it = components.find(name);
		if (it == components.end()) {
			throw std::out_of_range("Unknown prediction column '" + name + "'.");
		}
		return it->second;
	}
};

} // namespace glamcast::core
