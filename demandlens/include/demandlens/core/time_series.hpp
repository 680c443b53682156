#pragma once

#include <chrono>
#include <cmath>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace demandlens::core {

/**
 * @class TimeSeries
 * @brief An immutable, strictly time-ordered sequence of observations.
 *
 * Timestamps and values are stored in separate vectors for cache-efficient
 * numerical processing. The decomposition algorithms only look at the value
 * vector and rely on a caller-declared sampling period; timestamps are kept
 * so that calendar adjustments can be resolved per observation.
 */
class TimeSeries {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Value = double;

	/**
	 * @brief Constructs a TimeSeries object.
	 * @param timestamps A vector of strictly increasing time points.
	 * @param values A vector of corresponding values.
	 * @throws std::invalid_argument If the sizes differ or the timestamps are not strictly increasing.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values)
	    : timestamps_(std::move(timestamps)), values_(std::move(values)) {
		if (timestamps_.size() != values_.size()) {
			throw std::invalid_argument("Timestamps and values vectors must have the same size.");
		}
		validateTimestampOrder();
	}

	/**
	 * @brief Builds a series with evenly spaced timestamps starting at @p start.
	 */
	static TimeSeries regular(std::vector<Value> values, TimePoint start, std::chrono::seconds step) {
		if (step <= std::chrono::seconds::zero()) {
			throw std::invalid_argument("Sampling step must be positive.");
		}
		std::vector<TimePoint> timestamps;
		timestamps.reserve(values.size());
		for (std::size_t i = 0; i < values.size(); ++i) {
			timestamps.push_back(start + step * static_cast<long long>(i));
		}
		TimeSeries series(std::move(timestamps), std::move(values));
		series.frequency_ = std::chrono::duration_cast<std::chrono::nanoseconds>(step);
		return series;
	}

	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	const std::vector<Value> &getValues() const {
		return values_;
	}

	/**
	 * @brief Returns the declared sampling frequency, if any.
	 */
	const std::optional<std::chrono::nanoseconds> &frequency() const {
		return frequency_;
	}

	std::size_t size() const {
		return timestamps_.size();
	}

	TimeSeries slice(std::size_t start, std::size_t end) const {
		if (start > end) {
			throw std::invalid_argument("Slice start index must not exceed end index.");
		}
		if (end > size()) {
			throw std::out_of_range("Slice end index exceeds the length of the time series.");
		}
		std::vector<TimePoint> sliced_timestamps(timestamps_.begin() + static_cast<std::ptrdiff_t>(start),
		                                         timestamps_.begin() + static_cast<std::ptrdiff_t>(end));
		std::vector<Value> sliced_values(values_.begin() + static_cast<std::ptrdiff_t>(start),
		                                 values_.begin() + static_cast<std::ptrdiff_t>(end));
		TimeSeries result(std::move(sliced_timestamps), std::move(sliced_values));
		result.frequency_ = frequency_;
		return result;
	}

	bool hasMissingValues() const {
		for (double v : values_) {
			if (!std::isfinite(v)) {
				return true;
			}
		}
		return false;
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
	std::optional<std::chrono::nanoseconds> frequency_;
};

} // namespace demandlens::core
