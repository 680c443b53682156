#pragma once

#include "demandlens/core/calendar.hpp"
#include "demandlens/core/time_series.hpp"
#include "demandlens/detectors/ioutlier_detector.hpp"
#include "demandlens/utils/logging.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <vector>

namespace demandlens::seasonality {

enum class LogTransformMode { Auto, Always, Never };

/**
 * @struct SeasonalAdjustmentResult
 * @brief Output of the X13-style pipeline, on the scale of the input series.
 *
 * trend[i] + seasonal[i] + irregular[i] == value[i]. Calendar effects are
 * part of the seasonal component and are also reported on their own.
 */
struct SeasonalAdjustmentResult {
	std::vector<double> seasonal;
	std::vector<double> trend;
	std::vector<double> irregular;
	/// value - seasonal
	std::vector<double> seasonally_adjusted;
	/// value minus the calendar-adjusted value; zeros when no calendar adjustment ran.
	std::vector<double> calendar_effect;
	/// Position within the period -> seasonal factor (additive, or multiplicative under the log transform).
	std::map<std::size_t, double> seasonal_factors;
	std::vector<detectors::Outlier> outliers;
	bool log_transformed = false;
	/// Yule-Walker coefficients of the AR model fitted on the differenced series.
	std::vector<double> ar_coefficients;
};

/**
 * @class SeasonalAdjuster
 * @brief Pragmatic X13-style seasonal adjustment.
 *
 * Pipeline: calendar pre-adjustment, optional log transform, rolling MAD
 * outlier detection (additive outliers are replaced by their local median),
 * AR(p) fit on the differenced series, centered moving average trend,
 * per-position seasonal factors, inverse transform.
 *
 * This is a heuristic; it does not estimate a regARIMA model.
 */
class SeasonalAdjuster {
public:
	class Builder {
	public:
		Builder &withSeasonalPeriod(std::size_t period);
		Builder &withArOrder(std::size_t order);
		Builder &withLogTransform(LogTransformMode mode);
		Builder &withOutlierDetection(bool enabled);
		Builder &withTradingDayAdjustment(bool enabled);
		Builder &withHolidayAdjustment(bool enabled);
		Builder &withCalendar(std::shared_ptr<const core::CalendarProvider> calendar);
		SeasonalAdjuster build() const;

	private:
		std::size_t period_ = 12;
		std::size_t ar_order_ = 2;
		LogTransformMode log_mode_ = LogTransformMode::Auto;
		bool detect_outliers_ = true;
		bool trading_days_ = false;
		bool holidays_ = false;
		std::shared_ptr<const core::CalendarProvider> calendar_;
	};

	static Builder builder();

	/**
	 * @throws core::InsufficientDataError If the series is shorter than max(8, 2 * period).
	 * @throws std::invalid_argument If calendar adjustments are requested without timestamps
	 * or the log transform is forced on non-positive data.
	 */
	SeasonalAdjustmentResult adjust(const core::TimeSeries &series) const;

	/// Adjusts a bare value vector; calendar adjustments need timestamps and are rejected here.
	SeasonalAdjustmentResult adjust(const std::vector<double> &values) const;

	std::size_t seasonalPeriod() const {
		return period_;
	}

private:
	SeasonalAdjuster(std::size_t period, std::size_t ar_order, LogTransformMode log_mode, bool detect_outliers,
	                 bool trading_days, bool holidays, std::shared_ptr<const core::CalendarProvider> calendar);

	SeasonalAdjustmentResult run(const std::vector<double> &values,
	                             const std::vector<core::TimePoint> *timestamps) const;
	std::vector<double> fitAutoRegressive(const std::vector<double> &values) const;

	std::size_t period_;
	std::size_t ar_order_;
	LogTransformMode log_mode_;
	bool detect_outliers_;
	bool trading_days_;
	bool holidays_;
	std::shared_ptr<const core::CalendarProvider> calendar_;
};

} // namespace demandlens::seasonality
