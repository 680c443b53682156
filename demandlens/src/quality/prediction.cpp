#include "demandlens/quality/prediction.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>

namespace demandlens::quality {

void PredictionRecord::validate() const {
	if (std::isnan(confidence) || confidence < 0.0 || confidence > 1.0) {
		throw std::invalid_argument("Prediction confidence must be in [0, 1].");
	}
	if (lower_bound && upper_bound && *lower_bound > *upper_bound) {
		throw std::invalid_argument("Prediction lower bound exceeds the upper bound.");
	}
}

std::vector<PredictionRecord> actualized(const std::vector<PredictionRecord> &records) {
	std::vector<PredictionRecord> result;
	result.reserve(records.size());
	std::copy_if(records.begin(), records.end(), std::back_inserter(result),
	             [](const PredictionRecord &record) { return record.isActualized(); });
	std::stable_sort(result.begin(), result.end(), [](const PredictionRecord &lhs, const PredictionRecord &rhs) {
		return lhs.timestamp < rhs.timestamp;
	});
	return result;
}

std::vector<PredictionRecord> inRange(const std::vector<PredictionRecord> &records, const core::TimePoint &start,
                                      const core::TimePoint &end) {
	std::vector<PredictionRecord> result;
	std::copy_if(records.begin(), records.end(), std::back_inserter(result), [&](const PredictionRecord &record) {
		return record.timestamp >= start && record.timestamp <= end;
	});
	return result;
}

} // namespace demandlens::quality
