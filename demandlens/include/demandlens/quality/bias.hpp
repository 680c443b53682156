#pragma once

#include "demandlens/quality/prediction.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace demandlens::quality {

enum class BiasDirection { Underforecast, Overforecast, Neutral };
enum class BiasPattern { Systematic, Random, Seasonal };
enum class BiasTrend { Increasing, Decreasing, Stable };

std::string toString(BiasDirection direction);
std::string toString(BiasPattern pattern);
std::string toString(BiasTrend trend);

/**
 * @struct BiasAnalysis
 * @brief Direction, size and structure of the forecast errors.
 *
 * overall_bias is in the units of the series; mean_bias, median_bias and
 * seasonal_bias are percentage errors (predicted - actual) / actual * 100.
 */
struct BiasAnalysis {
	double overall_bias = 0.0;
	BiasDirection direction = BiasDirection::Neutral;
	bool significant_bias = false;
	BiasPattern pattern = BiasPattern::Random;
	double mean_bias = 0.0;
	double median_bias = 0.0;
	BiasTrend trend = BiasTrend::Stable;
	std::map<std::string, double> seasonal_bias;
};

/// Maps a timestamp to the label used to group seasonal_bias.
using PeriodLabelFn = std::function<std::string(const core::TimePoint &)>;

/**
 * @brief Bias analysis over the actualized records, in timestamp order.
 *
 * Direction is neutral below 2% mean percentage error; the bias is
 * significant above 5%. The pattern is systematic when the errors correlate
 * with time (|r| > 0.3), seasonal when the day-of-week mean errors vary by
 * more than 1, random otherwise. Records with a zero actual are left out of
 * every percentage figure.
 *
 * @param label Groups seasonal_bias; defaults to the English month name.
 * @throws core::NoDataError If no record is actualized.
 */
BiasAnalysis analyzeBias(const std::vector<PredictionRecord> &predictions, const PeriodLabelFn &label = {});

} // namespace demandlens::quality
