#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace glamcast::core {

using TimePoint = std::chrono::system_clock::time_point;

/// Named regressor columns, one value per timestamp.
using RegressorValues = std::map<std::string, std::vector<double>>;

/// Seconds since the epoch as a double, the time unit used by all numeric code.
inline double toSeconds(const TimePoint &tp) {
	return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

/**
 * @class TimeSeries
 * @brief An observed metric with optional external regressor columns.
 *
 * Timestamps and values are stored in separate vectors. The constructor
 * enforces equal lengths, strictly increasing timestamps and finite values so
 * that downstream scaling never sees duplicate or unordered rows.
 */
class TimeSeries {
public:
	using Value = double;

	/**
	 * @brief Constructs a TimeSeries object.
	 * @param timestamps Observation times, strictly increasing.
	 * @param values Metric value per timestamp.
	 * @param regressors Named regressor columns aligned with the timestamps.
	 * @throws std::invalid_argument On size mismatch, unordered timestamps or non-finite values.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values, RegressorValues regressors = {})
	    : timestamps_(std::move(timestamps)), values_(std::move(values)), regressors_(std::move(regressors)) {
		if (timestamps_.size() != values_.size()) {
			throw std::invalid_argument("Timestamps and values vectors must have the same size.");
		}
		for (const auto &entry : regressors_) {
			if (entry.second.size() != timestamps_.size()) {
				throw std::invalid_argument("Regressor '" + entry.first + "' length must match time series length.");
			}
			if (std::any_of(entry.second.begin(), entry.second.end(), [](double v) { return !std::isfinite(v); })) {
				throw std::invalid_argument("Regressor '" + entry.first + "' contains non-finite values.");
			}
		}
		if (std::any_of(values_.begin(), values_.end(), [](double v) { return !std::isfinite(v); })) {
			throw std::invalid_argument("TimeSeries contains non-finite values.");
		}
		validateTimestampOrder();
	}

	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	const RegressorValues &regressors() const {
		return regressors_;
	}

	bool hasRegressor(const std::string &name) const {
		return regressors_.find(name) != regressors_.end();
	}

	const std::vector<double> &regressor(const std::string &name) const {
		const auto it = regressors_.find(name);
		if (it == regressors_.end()) {
			throw std::out_of_range("Regressor '" + name + "' not found.");
		}
		return it->second;
	}

	std::size_t size() const {
		return timestamps_.size();
	}

	bool isEmpty() const {
		return timestamps_.empty();
	}

	TimeSeries slice(std::size_t start, std::size_t end) const {
		if (start > end) {
			throw std::invalid_argument("Slice start index must not exceed end index.");
		}
		if (end > size()) {
			throw std::out_of_range("Slice end index exceeds the length of the time series.");
		}
		const auto first = static_cast<std::ptrdiff_t>(start);
		const auto last = static_cast<std::ptrdiff_t>(end);
		RegressorValues sliced_regressors;
		for (const auto &entry : regressors_) {
			sliced_regressors.emplace(entry.first,
			                          std::vector<double>(entry.second.begin() + first, entry.second.begin() + last));
		}
		return TimeSeries(std::vector<TimePoint>(timestamps_.begin() + first, timestamps_.begin() + last),
		                  std::vector<Value>(values_.begin() + first, values_.begin() + last),
		                  std::move(sliced_regressors));
	}

	/**
	 * @brief Infers the sampling step of the series.
	 *
	 * Returns the common spacing when all spacings agree. Otherwise the most
	 * frequent spacing among the last five is used when it is unique.
	 */
	std::optional<std::chrono::nanoseconds> inferFrequency() const {
		if (timestamps_.size() < 2) {
			return std::nullopt;
		}
		std::vector<std::chrono::nanoseconds> differences;
		differences.reserve(timestamps_.size() - 1);
		for (std::size_t i = 0; i + 1 < timestamps_.size(); ++i) {
			differences.push_back(
			    std::chrono::duration_cast<std::chrono::nanoseconds>(timestamps_[i + 1] - timestamps_[i]));
		}
		const auto base = differences.front();
		if (std::all_of(differences.begin(), differences.end(), [&](const auto &d) { return d == base; })) {
			return base;
		}

		const std::size_t max_samples = 5;
		const std::size_t start = differences.size() > max_samples ? differences.size() - max_samples : 0;
		std::map<std::int64_t, std::size_t> counts;
		for (std::size_t i = start; i < differences.size(); ++i) {
			++counts[differences[i].count()];
		}
		std::int64_t best = 0;
		std::size_t best_count = 0;
		bool unique_best = false;
		for (const auto &entry : counts) {
			if (entry.second > best_count) {
				best = entry.first;
				best_count = entry.second;
				unique_best = true;
			} else if (entry.second == best_count) {
				unique_best = false;
			}
		}
		if (!unique_best || best <= 0) {
			return std::nullopt;
		}
		return std::chrono::nanoseconds(best);
	}

private:
	void validateTimestampOrder() const {
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			if (!(timestamps_[i] > timestamps_[i - 1])) {
				throw std::invalid_argument("TimeSeries timestamps must be strictly increasing and unique.");
			}
		}
	}

	std::vector<TimePoint> timestamps_;
	std::vector<Value> values_;
	RegressorValues regressors_;
};

} // namespace glamcast::core
