#include "demandlens/quality/bias.hpp"
#include "demandlens/core/errors.hpp"
#include "demandlens/utils/logging.hpp"
#include "demandlens/utils/numeric.hpp"

#include <array>
#include <cmath>

namespace demandlens::quality {

namespace {

constexpr double kNeutralBias = 2.0;
constexpr double kSignificantBias = 5.0;
constexpr double kSystematicCorrelation = 0.3;
constexpr double kTrendCorrelation = 0.2;
constexpr double kWeekdayVariance = 1.0;
constexpr std::size_t kMinTrendPoints = 5;

BiasPattern classifyPattern(const std::vector<PredictionRecord> &records, const std::vector<double> &errors,
                            double time_correlation) {
	if (std::abs(time_correlation) > kSystematicCorrelation) {
		return BiasPattern::Systematic;
	}
	// Days without observations count as a zero mean error.
	std::array<double, 7> sums {};
	std::array<std::size_t, 7> counts {};
	for (std::size_t i = 0; i < records.size(); ++i) {
		const int day = core::calendar::dayOfWeek(records[i].timestamp);
		sums[static_cast<std::size_t>(day)] += errors[i];
		++counts[static_cast<std::size_t>(day)];
	}
	std::vector<double> weekday_means(7, 0.0);
	for (std::size_t day = 0; day < 7; ++day) {
		if (counts[day] > 0) {
			weekday_means[day] = sums[day] / static_cast<double>(counts[day]);
		}
	}
	return utils::numeric::variance(weekday_means) > kWeekdayVariance ? BiasPattern::Seasonal : BiasPattern::Random;
}

} // namespace

std::string toString(BiasDirection direction) {
	switch (direction) {
	case BiasDirection::Underforecast:
		return "underforecast";
	case BiasDirection::Overforecast:
		return "overforecast";
	case BiasDirection::Neutral:
		return "neutral";
	}
	return "unknown";
}

std::string toString(BiasPattern pattern) {
	switch (pattern) {
	case BiasPattern::Systematic:
		return "systematic";
	case BiasPattern::Random:
		return "random";
	case BiasPattern::Seasonal:
		return "seasonal";
	}
	return "unknown";
}

std::string toString(BiasTrend trend) {
	switch (trend) {
	case BiasTrend::Increasing:
		return "increasing";
	case BiasTrend::Decreasing:
		return "decreasing";
	case BiasTrend::Stable:
		return "stable";
	}
	return "unknown";
}

BiasAnalysis analyzeBias(const std::vector<PredictionRecord> &predictions, const PeriodLabelFn &label) {
	const auto records = actualized(predictions);
	if (records.empty()) {
		throw core::NoDataError("No actualized predictions found for bias analysis.");
	}
	const PeriodLabelFn period_label = label ? label : PeriodLabelFn(core::calendar::monthName);

	std::vector<double> errors;
	std::vector<double> time_index;
	std::vector<double> percentage_errors;
	std::map<std::string, std::vector<double>> grouped;
	errors.reserve(records.size());
	for (std::size_t i = 0; i < records.size(); ++i) {
		const double actual = *records[i].actual_value;
		const double error = records[i].predicted_value - actual;
		errors.push_back(error);
		time_index.push_back(static_cast<double>(i));
		if (actual != 0.0) {
			const double pct = error / actual * 100.0;
			percentage_errors.push_back(pct);
			grouped[period_label(records[i].timestamp)].push_back(pct);
		}
	}

	BiasAnalysis analysis;
	analysis.overall_bias = utils::numeric::mean(errors);
	if (!percentage_errors.empty()) {
		analysis.mean_bias = utils::numeric::mean(percentage_errors);
		analysis.median_bias = utils::numeric::median(percentage_errors);
	}

	if (std::abs(analysis.mean_bias) < kNeutralBias) {
		analysis.direction = BiasDirection::Neutral;
	} else {
		analysis.direction = analysis.mean_bias > 0.0 ? BiasDirection::Overforecast : BiasDirection::Underforecast;
	}
	analysis.significant_bias = std::abs(analysis.mean_bias) > kSignificantBias;

	const double time_correlation = utils::numeric::correlation(time_index, errors);
	analysis.pattern = classifyPattern(records, errors, time_correlation);

	if (records.size() >= kMinTrendPoints) {
		if (time_correlation > kTrendCorrelation) {
			analysis.trend = BiasTrend::Increasing;
		} else if (time_correlation < -kTrendCorrelation) {
			analysis.trend = BiasTrend::Decreasing;
		}
	}

	for (const auto &entry : grouped) {
		analysis.seasonal_bias[entry.first] = utils::numeric::mean(entry.second);
	}

	DEMANDLENS_DEBUG("Bias analysis over {} records: mean {:.2f}% ({}), pattern {}", records.size(),
	                 analysis.mean_bias, toString(analysis.direction), toString(analysis.pattern));
	return analysis;
}

} // namespace demandlens::quality
