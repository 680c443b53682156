#include "demandlens/quality/accuracy.hpp"
#include "demandlens/core/errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace demandlens::quality {

AccuracyMetrics computeAccuracyMetrics(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size()) {
		throw std::invalid_argument("Actual and predicted series must have the same length.");
	}
	if (actual.empty()) {
		throw core::NoDataError("No actualized predictions available for accuracy metrics.");
	}

	AccuracyMetrics metrics;
	metrics.n = actual.size();
	metrics.mape = utils::Metrics::mape(actual, predicted).value_or(0.0);
	metrics.rmse = utils::Metrics::rmse(actual, predicted);
	metrics.mae = utils::Metrics::mae(actual, predicted);
	metrics.bias = utils::Metrics::bias(actual, predicted);
	metrics.accuracy = std::max(0.0, 100.0 - metrics.mape);
	metrics.r2 = utils::Metrics::r2(actual, predicted);
	metrics.theil_u = utils::Metrics::theilU(actual, predicted);
	return metrics;
}

AccuracyMetrics computeAccuracyMetrics(const std::vector<PredictionRecord> &records) {
	std::vector<double> actual;
	std::vector<double> predicted;
	for (const auto &record : actualized(records)) {
		actual.push_back(*record.actual_value);
		predicted.push_back(record.predicted_value);
	}
	return computeAccuracyMetrics(actual, predicted);
}

} // namespace demandlens::quality
