#include "demandlens/quality/calibration.hpp"
#include "demandlens/utils/numeric.hpp"

#include <cmath>

namespace demandlens::quality {

namespace {

constexpr double kCalibrationTolerance = 0.1;
constexpr double kStableSlope = 0.001;
constexpr double kExcellentCorrelation = 0.8;

TrendDirection directionOf(const std::vector<double> &values) {
	const double slope = utils::numeric::linearRegression(values).slope;
	const double threshold = kStableSlope * std::abs(utils::numeric::mean(values));
	if (std::abs(slope) <= threshold) {
		return TrendDirection::Stable;
	}
	return slope > 0.0 ? TrendDirection::Increasing : TrendDirection::Decreasing;
}

int sign(double value) {
	return (value > 0.0) - (value < 0.0);
}

} // namespace

std::string toString(Calibration calibration) {
	switch (calibration) {
	case Calibration::WellCalibrated:
		return "well_calibrated";
	case Calibration::Overconfident:
		return "overconfident";
	case Calibration::Underconfident:
		return "underconfident";
	case Calibration::Unknown:
		return "unknown";
	}
	return "unknown";
}

std::string toString(TrendDirection direction) {
	switch (direction) {
	case TrendDirection::Increasing:
		return "increasing";
	case TrendDirection::Decreasing:
		return "decreasing";
	case TrendDirection::Stable:
		return "stable";
	}
	return "unknown";
}

std::string toString(TrendAlignment alignment) {
	switch (alignment) {
	case TrendAlignment::Excellent:
		return "excellent";
	case TrendAlignment::Good:
		return "good";
	case TrendAlignment::Poor:
		return "poor";
	}
	return "unknown";
}

ConfidenceAnalysis analyzeConfidence(const std::vector<PredictionRecord> &predictions) {
	const auto records = actualized(predictions);
	ConfidenceAnalysis analysis;
	if (records.empty()) {
		return analysis;
	}

	std::size_t within = 0;
	double confidence_sum = 0.0;
	for (const auto &record : records) {
		if (record.lower_bound && record.upper_bound && *record.actual_value >= *record.lower_bound &&
		    *record.actual_value <= *record.upper_bound) {
			++within;
		}
		confidence_sum += record.confidence;
	}
	const auto count = static_cast<double>(records.size());
	analysis.within_confidence_interval = static_cast<double>(within) / count;
	analysis.average_confidence_level = confidence_sum / count;

	const double gap = analysis.within_confidence_interval - analysis.average_confidence_level;
	if (std::abs(gap) < kCalibrationTolerance) {
		analysis.calibration = Calibration::WellCalibrated;
	} else if (gap < 0.0) {
		analysis.calibration = Calibration::Overconfident;
	} else {
		analysis.calibration = Calibration::Underconfident;
	}
	analysis.confidence_accuracy = 1.0 - std::abs(gap);
	return analysis;
}

TrendAnalysis analyzeTrend(const std::vector<PredictionRecord> &predictions) {
	const auto records = actualized(predictions);
	TrendAnalysis analysis;
	if (records.size() < 2) {
		return analysis;
	}

	std::vector<double> forecast;
	std::vector<double> actual;
	for (const auto &record : records) {
		forecast.push_back(record.predicted_value);
		actual.push_back(*record.actual_value);
	}
	analysis.forecast_trend = directionOf(forecast);
	analysis.actual_trend = directionOf(actual);

	std::vector<double> forecast_steps;
	std::vector<double> actual_steps;
	std::size_t agreeing = 0;
	for (std::size_t i = 1; i < records.size(); ++i) {
		forecast_steps.push_back(forecast[i] - forecast[i - 1]);
		actual_steps.push_back(actual[i] - actual[i - 1]);
		if (sign(forecast_steps.back()) == sign(actual_steps.back())) {
			++agreeing;
		}
	}
	analysis.trend_accuracy = static_cast<double>(agreeing) / static_cast<double>(forecast_steps.size());

	if (analysis.forecast_trend == analysis.actual_trend) {
		analysis.alignment = utils::numeric::correlation(forecast_steps, actual_steps) > kExcellentCorrelation
		                         ? TrendAlignment::Excellent
		                         : TrendAlignment::Good;
	}
	return analysis;
}

} // namespace demandlens::quality
