#include "demandlens/seasonality/seasonal_adjustment.hpp"
#include "demandlens/core/errors.hpp"
#include "demandlens/detectors/rolling_mad.hpp"
#include "demandlens/models/autoregressive.hpp"
#include "demandlens/transform/transformer.hpp"
#include "demandlens/utils/numeric.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace demandlens::seasonality {

namespace {

constexpr std::size_t kMinimumLength = 8;

// Centered 2 x period moving average for even periods (half weight on the two
// end points), plain centered average for odd ones. Weights are renormalized
// where the window runs past the series boundary.
std::vector<double> centeredTrend(const std::vector<double> &values, std::size_t period) {
	if (period % 2 == 1) {
		return utils::numeric::movingAverage(values, period);
	}
	const auto n = static_cast<std::ptrdiff_t>(values.size());
	const auto half = static_cast<std::ptrdiff_t>(period / 2);
	std::vector<double> trend(values.size(), 0.0);
	for (std::ptrdiff_t i = 0; i < n; ++i) {
		double sum = 0.0;
		double weight_sum = 0.0;
		for (std::ptrdiff_t offset = -half; offset <= half; ++offset) {
			const std::ptrdiff_t j = i + offset;
			if (j < 0 || j >= n) {
				continue;
			}
			const double weight = (offset == -half || offset == half) ? 0.5 : 1.0;
			sum += weight * values[static_cast<std::size_t>(j)];
			weight_sum += weight;
		}
		trend[static_cast<std::size_t>(i)] = sum / weight_sum;
	}
	return trend;
}

} // namespace

SeasonalAdjuster::SeasonalAdjuster(std::size_t period, std::size_t ar_order, LogTransformMode log_mode,
                                   bool detect_outliers, bool trading_days, bool holidays,
                                   std::shared_ptr<const core::CalendarProvider> calendar)
    : period_(period), ar_order_(ar_order), log_mode_(log_mode), detect_outliers_(detect_outliers),
      trading_days_(trading_days), holidays_(holidays), calendar_(std::move(calendar)) {
	if (period_ == 0) {
		throw std::invalid_argument("Seasonal period must be positive.");
	}
	if ((trading_days_ || holidays_) && !calendar_) {
		throw std::invalid_argument("Calendar adjustments require a CalendarProvider.");
	}
}

SeasonalAdjustmentResult SeasonalAdjuster::adjust(const core::TimeSeries &series) const {
	return run(series.getValues(), &series.getTimestamps());
}

SeasonalAdjustmentResult SeasonalAdjuster::adjust(const std::vector<double> &values) const {
	return run(values, nullptr);
}

std::vector<double> SeasonalAdjuster::fitAutoRegressive(const std::vector<double> &values) const {
	// Fall back to lower orders when the Toeplitz system collapses or the
	// differenced series is too short for the requested order.
	for (std::size_t order = ar_order_;; --order) {
		auto model = models::AutoRegressiveBuilder()
		                 .withOrder(order)
		                 .withDifferencing(1)
		                 .withSeasonalDifferencing(period_ > 1 ? 1 : 0)
		                 .withSeasonalPeriod(static_cast<int>(period_))
		                 .build();
		try {
			model->fit(values);
			const auto &coefficients = model->coefficients();
			return std::vector<double>(coefficients.data(), coefficients.data() + coefficients.size());
		} catch (const core::SingularSystemError &e) {
			if (order == 0) {
				throw;
			}
			DEMANDLENS_WARN("AR({}) fit failed ({}); retrying with order {}.", order, e.what(), order - 1);
		} catch (const core::InsufficientDataError &e) {
			if (order == 0) {
				throw;
			}
			DEMANDLENS_DEBUG("AR({}) fit skipped ({}); retrying with order {}.", order, e.what(), order - 1);
		}
	}
}

SeasonalAdjustmentResult SeasonalAdjuster::run(const std::vector<double> &values,
                                               const std::vector<core::TimePoint> *timestamps) const {
	const std::size_t n = values.size();
	if (n < std::max(kMinimumLength, 2 * period_)) {
		throw core::InsufficientDataError("Seasonal adjustment requires at least " +
		                                  std::to_string(std::max(kMinimumLength, 2 * period_)) + " observations.");
	}
	if ((trading_days_ || holidays_) && timestamps == nullptr) {
		throw std::invalid_argument("Calendar adjustments need a timestamped series.");
	}

	// 1. Calendar pre-adjustment.
	std::vector<double> adjusted = values;
	if (trading_days_ || holidays_) {
		const double average_days = calendar_->averageTradingDays();
		for (std::size_t i = 0; i < n; ++i) {
			const auto &tp = (*timestamps)[i];
			if (holidays_) {
				const double factor = calendar_->holidayFactor(tp);
				if (!(factor > 0.0)) {
					throw std::invalid_argument("Holiday factors must be positive.");
				}
				adjusted[i] *= factor;
			}
			if (trading_days_) {
				const double days = calendar_->tradingDays(tp);
				if (!(days > 0.0)) {
					throw std::invalid_argument("Trading day counts must be positive.");
				}
				adjusted[i] /= days / average_days;
			}
		}
	}

	// 2. Log transform.
	SeasonalAdjustmentResult result;
	result.log_transformed = log_mode_ == LogTransformMode::Always ||
	                         (log_mode_ == LogTransformMode::Auto && transform::Log::isRecommended(adjusted));
	std::vector<double> working = adjusted;
	transform::Log log;
	if (result.log_transformed) {
		log.fitTransform(working);
	}

	// 3. Outliers: additive outliers are replaced by the local median, level shifts stay.
	if (detect_outliers_) {
		const auto detector = detectors::RollingMADDetectorBuilder().build();
		auto found = detector->detect(working);
		for (auto &outlier : found.outliers) {
			if (outlier.type == detectors::OutlierType::AdditiveOutlier) {
				working[outlier.index] = outlier.local_median;
			}
			if (result.log_transformed) {
				outlier.local_median = std::exp(outlier.local_median);
				outlier.impact = adjusted[outlier.index] - outlier.local_median;
			}
		}
		result.outliers = std::move(found.outliers);
	}

	// 4. AR model on the (seasonally) differenced series.
	result.ar_coefficients = fitAutoRegressive(working);

	// 5. Trend and per-position seasonal factors.
	const std::vector<double> trend = centeredTrend(working, period_);
	std::vector<double> position_sum(period_, 0.0);
	std::vector<std::size_t> position_count(period_, 0);
	for (std::size_t i = 0; i < n; ++i) {
		position_sum[i % period_] += working[i] - trend[i];
		++position_count[i % period_];
	}
	std::vector<double> factors(period_, 0.0);
	for (std::size_t k = 0; k < period_; ++k) {
		factors[k] = position_sum[k] / static_cast<double>(position_count[k]);
	}
	const double factor_mean = utils::numeric::mean(factors);
	for (std::size_t k = 0; k < period_; ++k) {
		factors[k] -= factor_mean;
		result.seasonal_factors[k] = result.log_transformed ? std::exp(factors[k]) : factors[k];
	}

	// 6. Back to the scale of the input.
	result.trend.resize(n);
	result.seasonal.resize(n);
	result.irregular.resize(n);
	result.seasonally_adjusted.resize(n);
	result.calendar_effect.resize(n);
	for (std::size_t i = 0; i < n; ++i) {
		const double factor = factors[i % period_];
		double seasonal = 0.0;
		if (result.log_transformed) {
			result.trend[i] = std::exp(trend[i]);
			const double deseasonalized = adjusted[i] / std::exp(factor);
			seasonal = adjusted[i] - deseasonalized;
			result.irregular[i] = deseasonalized - result.trend[i];
		} else {
			result.trend[i] = trend[i];
			seasonal = factor;
			result.irregular[i] = adjusted[i] - trend[i] - factor;
		}
		result.calendar_effect[i] = values[i] - adjusted[i];
		result.seasonal[i] = seasonal + result.calendar_effect[i];
		result.seasonally_adjusted[i] = values[i] - result.seasonal[i];
	}

	DEMANDLENS_INFO("Seasonal adjustment done: n={}, period={}, log={}, outliers={}", n, period_,
	                result.log_transformed, result.outliers.size());
	return result;
}

// --- Builder Implementation ---

SeasonalAdjuster::Builder SeasonalAdjuster::builder() {
	return Builder{};
}

SeasonalAdjuster::Builder &SeasonalAdjuster::Builder::withSeasonalPeriod(std::size_t period) {
	period_ = period;
	return *this;
}

SeasonalAdjuster::Builder &SeasonalAdjuster::Builder::withArOrder(std::size_t order) {
	ar_order_ = order;
	return *this;
}

SeasonalAdjuster::Builder &SeasonalAdjuster::Builder::withLogTransform(LogTransformMode mode) {
	log_mode_ = mode;
	return *this;
}

SeasonalAdjuster::Builder &SeasonalAdjuster::Builder::withOutlierDetection(bool enabled) {
	detect_outliers_ = enabled;
	return *this;
}

SeasonalAdjuster::Builder &SeasonalAdjuster::Builder::withTradingDayAdjustment(bool enabled) {
	trading_days_ = enabled;
	return *this;
}

SeasonalAdjuster::Builder &SeasonalAdjuster::Builder::withHolidayAdjustment(bool enabled) {
	holidays_ = enabled;
	return *this;
}

SeasonalAdjuster::Builder &
SeasonalAdjuster::Builder::withCalendar(std::shared_ptr<const core::CalendarProvider> calendar) {
	calendar_ = std::move(calendar);
	return *this;
}

SeasonalAdjuster SeasonalAdjuster::Builder::build() const {
	return SeasonalAdjuster(period_, ar_order_, log_mode_, detect_outliers_, trading_days_, holidays_, calendar_);
}

} // namespace demandlens::seasonality
