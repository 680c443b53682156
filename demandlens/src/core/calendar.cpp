#include "demandlens/core/calendar.hpp"

#include <array>
#include <ctime>
#include <stdexcept>

namespace demandlens::core {

namespace {

constexpr std::int64_t kSecondsPerDay = 86400LL;

bool safeGmTime(std::time_t time_value, std::tm &out) {
#if defined(_WIN32)
	return gmtime_s(&out, &time_value) == 0;
#else
	return gmtime_r(&time_value, &out) != nullptr;
#endif
}

std::tm toUtc(const TimePoint &tp) {
	std::tm tm{};
	const std::time_t seconds = static_cast<std::time_t>(calendar::dayKey(tp) * kSecondsPerDay);
	if (!safeGmTime(seconds, tm)) {
		throw std::out_of_range("Timestamp cannot be represented as a UTC calendar date.");
	}
	return tm;
}

// Proleptic Gregorian day count (H. Hinnant's days_from_civil).
std::int64_t daysFromCivil(int y, int m, int d) {
	y -= m <= 2 ? 1 : 0;
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const auto yoe = static_cast<unsigned>(y - era * 400);
	const auto mp = static_cast<unsigned>(m > 2 ? m - 3 : m + 9);
	const unsigned doy = (153 * mp + 2) / 5 + static_cast<unsigned>(d) - 1;
	const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

} // namespace

namespace calendar {

std::int64_t dayKey(const TimePoint &tp) {
	const auto secs = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
	std::int64_t quotient = secs / kSecondsPerDay;
	if (secs % kSecondsPerDay < 0) {
		--quotient;
	}
	return quotient;
}

int dayOfWeek(const TimePoint &tp) {
	return toUtc(tp).tm_wday;
}

int month(const TimePoint &tp) {
	return toUtc(tp).tm_mon + 1;
}

int year(const TimePoint &tp) {
	return toUtc(tp).tm_year + 1900;
}

std::string monthName(const TimePoint &tp) {
	static const std::array<const char *, 12> names{"January", "February", "March",     "April",   "May",      "June",
	                                                "July",    "August",   "September", "October", "November", "December"};
	return names[static_cast<std::size_t>(month(tp) - 1)];
}

TimePoint fromCivil(int y, int m, int d) {
	if (m < 1 || m > 12 || d < 1 || d > 31) {
		throw std::invalid_argument("Invalid civil date.");
	}
	return TimePoint{} + std::chrono::seconds(daysFromCivil(y, m, d) * kSecondsPerDay);
}

int weekdaysInMonth(const TimePoint &tp) {
	const auto tm = toUtc(tp);
	const int y = tm.tm_year + 1900;
	const int m = tm.tm_mon + 1;
	const std::int64_t first = daysFromCivil(y, m, 1);
	const std::int64_t next = m == 12 ? daysFromCivil(y + 1, 1, 1) : daysFromCivil(y, m + 1, 1);

	int count = 0;
	for (std::int64_t day = first; day < next; ++day) {
		// 1970-01-01 was a Thursday (wday 4).
		const auto wday = ((day % 7) + 7 + 4) % 7;
		if (wday != 0 && wday != 6) {
			++count;
		}
	}
	return count;
}

} // namespace calendar

MonthlyWeekdayCalendar &MonthlyWeekdayCalendar::withHolidayFactor(const TimePoint &day, double factor) {
	if (!(factor > 0.0)) {
		throw std::invalid_argument("Holiday factor must be positive.");
	}
	holiday_factors_[calendar::dayKey(day)] = factor;
	return *this;
}

MonthlyWeekdayCalendar &MonthlyWeekdayCalendar::withAverageTradingDays(double days) {
	if (!(days > 0.0)) {
		throw std::invalid_argument("Average trading days must be positive.");
	}
	average_trading_days_ = days;
	return *this;
}

double MonthlyWeekdayCalendar::holidayFactor(const TimePoint &tp) const {
	const auto it = holiday_factors_.find(calendar::dayKey(tp));
	return it == holiday_factors_.end() ? 1.0 : it->second;
}

double MonthlyWeekdayCalendar::tradingDays(const TimePoint &tp) const {
	return static_cast<double>(calendar::weekdaysInMonth(tp));
}

} // namespace demandlens::core
