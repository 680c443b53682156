#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace demandlens::core {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief UTC calendar helpers shared by the bias analysis and calendar adjustment.
 */
namespace calendar {

/// Days since the Unix epoch (floor division, valid before 1970).
std::int64_t dayKey(const TimePoint &tp);

/// 0 = Sunday ... 6 = Saturday.
int dayOfWeek(const TimePoint &tp);

/// 1 = January ... 12 = December.
int month(const TimePoint &tp);

int year(const TimePoint &tp);

/// English month name ("January").
std::string monthName(const TimePoint &tp);

/// Number of Monday-Friday days in the month containing @p tp.
int weekdaysInMonth(const TimePoint &tp);

TimePoint fromCivil(int year, int month, int day);

} // namespace calendar

/**
 * @class CalendarProvider
 * @brief Source of business-calendar effects used by the seasonal adjustment.
 *
 * The holiday tables themselves live outside this library; implementations
 * only have to resolve them per observation timestamp.
 */
class CalendarProvider {
public:
	virtual ~CalendarProvider() = default;

	/// Multiplicative holiday adjustment for the period starting at @p tp (1.0 = no effect).
	virtual double holidayFactor(const TimePoint &tp) const = 0;

	/// Business days in the period starting at @p tp.
	virtual double tradingDays(const TimePoint &tp) const = 0;

	/// Long-run average of tradingDays() used as the normalization constant.
	virtual double averageTradingDays() const = 0;
};

/**
 * @class MonthlyWeekdayCalendar
 * @brief CalendarProvider for monthly series: trading days are the weekdays of
 * each month, holiday factors come from an explicit per-day table.
 */
class MonthlyWeekdayCalendar final : public CalendarProvider {
public:
	MonthlyWeekdayCalendar() = default;

	MonthlyWeekdayCalendar &withHolidayFactor(const TimePoint &day, double factor);
	MonthlyWeekdayCalendar &withAverageTradingDays(double days);

	double holidayFactor(const TimePoint &tp) const override;
	double tradingDays(const TimePoint &tp) const override;
	double averageTradingDays() const override {
		return average_trading_days_;
	}

private:
	std::unordered_map<std::int64_t, double> holiday_factors_;
	double average_trading_days_ = 21.75;
};

} // namespace demandlens::core
