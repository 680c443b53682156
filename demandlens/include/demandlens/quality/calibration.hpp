#pragma once

#include "demandlens/quality/prediction.hpp"
#include <string>
#include <vector>

namespace demandlens::quality {

enum class Calibration { WellCalibrated, Overconfident, Underconfident, Unknown };
enum class TrendDirection { Increasing, Decreasing, Stable };
enum class TrendAlignment { Excellent, Good, Poor };

std::string toString(Calibration calibration);
std::string toString(TrendDirection direction);
std::string toString(TrendAlignment alignment);

struct ConfidenceAnalysis {
	/// Share of actualized records whose actual lies inside [lower_bound, upper_bound].
	double within_confidence_interval = 0.0;
	double average_confidence_level = 0.0;
	Calibration calibration = Calibration::Unknown;
	/// 1 - |coverage - average confidence|
	double confidence_accuracy = 0.0;
};

struct TrendAnalysis {
	TrendDirection forecast_trend = TrendDirection::Stable;
	TrendDirection actual_trend = TrendDirection::Stable;
	TrendAlignment alignment = TrendAlignment::Poor;
	/// Share of consecutive steps where forecast and actual move the same way.
	double trend_accuracy = 0.0;
};

/**
 * @brief Compares interval coverage against the stated confidence.
 *
 * Records without both bounds count as outside their interval. Unknown
 * calibration when nothing is actualized.
 */
ConfidenceAnalysis analyzeConfidence(const std::vector<PredictionRecord> &predictions);

/**
 * @brief Compares the direction of the forecast path with the realized one.
 *
 * Directions come from the OLS slope; slopes within 0.1% of the mean level
 * per step are stable. Fewer than two actualized records give stable/stable
 * with poor alignment.
 */
TrendAnalysis analyzeTrend(const std::vector<PredictionRecord> &predictions);

} // namespace demandlens::quality
