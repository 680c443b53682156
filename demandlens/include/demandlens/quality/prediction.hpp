#pragma once

#include "demandlens/core/calendar.hpp"
#include <optional>
#include <vector>

namespace demandlens::quality {

/**
 * @struct PredictionRecord
 * @brief One forecast together with its realized outcome, once known.
 */
struct PredictionRecord {
	core::TimePoint timestamp;
	double predicted_value = 0.0;
	std::optional<double> actual_value;
	/// Nominal coverage of [lower_bound, upper_bound], in [0, 1].
	double confidence = 0.0;
	std::optional<double> lower_bound;
	std::optional<double> upper_bound;

	bool isActualized() const {
		return actual_value.has_value();
	}

	/**
	 * @throws std::invalid_argument If confidence is outside [0, 1] or lower_bound > upper_bound.
	 */
	void validate() const;
};

/// Actualized records ordered by timestamp.
std::vector<PredictionRecord> actualized(const std::vector<PredictionRecord> &records);

/// Records whose timestamp lies in [start, end].
std::vector<PredictionRecord> inRange(const std::vector<PredictionRecord> &records, const core::TimePoint &start,
                                      const core::TimePoint &end);

} // namespace demandlens::quality
