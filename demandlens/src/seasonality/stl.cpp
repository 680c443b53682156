#include "demandlens/seasonality/stl.hpp"
#include "demandlens/core/errors.hpp"
#include "demandlens/utils/numeric.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace {

std::size_t ensure_odd(std::size_t window) {
	if (window < 3) return 3;
	return (window % 2 == 0) ? window + 1 : window;
}

std::size_t default_trend_smoother(std::size_t period, std::size_t seasonal_smoother) {
	const double ns = static_cast<double>(seasonal_smoother);
	const double nt = std::ceil(1.5 * static_cast<double>(period) / (1.0 - 1.5 / ns));
	return ensure_odd(static_cast<std::size_t>(nt));
}

// Half-width for a Loess window covering `window` points centred on the target.
std::size_t half_width(std::size_t window) {
	return window / 2 + 1;
}

double strength(double var_remainder, double var_total) {
	if (var_total <= 0.0) {
		return 0.0;
	}
	return 1.0 - (var_remainder / var_total);
}

} // namespace

namespace demandlens::seasonality {

STLDecomposition::Builder &STLDecomposition::Builder::withPeriod(std::size_t period) {
	period_ = period;
	return *this;
}

STLDecomposition::Builder &STLDecomposition::Builder::withSeasonalSmoother(std::size_t window) {
	seasonal_smoother_ = window;
	return *this;
}

STLDecomposition::Builder &STLDecomposition::Builder::withTrendSmoother(std::size_t window) {
	trend_smoother_ = window;
	return *this;
}

STLDecomposition::Builder &STLDecomposition::Builder::withLowPassSmoother(std::size_t window) {
	low_pass_smoother_ = window;
	return *this;
}

STLDecomposition::Builder &STLDecomposition::Builder::withIterations(std::size_t iterations) {
	iterations_ = iterations;
	return *this;
}

STLDecomposition::Builder &STLDecomposition::Builder::withRobust(bool robust) {
	robust_ = robust;
	return *this;
}

STLDecomposition STLDecomposition::Builder::build() const {
	return STLDecomposition(period_, seasonal_smoother_, trend_smoother_, low_pass_smoother_, iterations_, robust_);
}

STLDecomposition::Builder STLDecomposition::builder() {
	return Builder();
}

STLDecomposition::STLDecomposition(std::size_t seasonal_period, std::size_t seasonal_smoother,
                                   std::optional<std::size_t> trend_smoother,
                                   std::optional<std::size_t> low_pass_smoother,
                                   std::optional<std::size_t> iterations, bool robust)
    : seasonal_period_(seasonal_period), seasonal_smoother_(ensure_odd(seasonal_smoother)), robust_(robust) {
	if (seasonal_period_ < 2) {
		throw std::invalid_argument("Seasonal period must be at least 2.");
	}
	trend_smoother_ = trend_smoother ? ensure_odd(*trend_smoother)
	                                 : default_trend_smoother(seasonal_period_, seasonal_smoother_);
	low_pass_smoother_ = std::max<std::size_t>(1, low_pass_smoother.value_or(seasonal_period_));
	const std::size_t default_iterations = robust_ ? kMaxIterations : 2;
	iterations_ = std::clamp<std::size_t>(iterations.value_or(default_iterations), 1, kMaxIterations);
}

void STLDecomposition::fit(const core::TimeSeries &ts) {
	fit(ts.getValues());
}

void STLDecomposition::fit(const std::vector<double> &data) {
	const std::size_t n = data.size();
	if (n < 2 * seasonal_period_) {
		throw core::InsufficientDataError("Insufficient data for STL decomposition: need at least two full periods.");
	}

	DecompositionResult result;
	result.seasonal.assign(n, 0.0);
	result.remainder.assign(n, 0.0);
	std::vector<double> weights(n, 1.0);
	std::vector<double> detrended(n, 0.0);
	std::vector<double> deseasonalized(n, 0.0);

	result.trend = utils::numeric::movingAverage(data, seasonal_period_);

	for (std::size_t iter = 0; iter < iterations_; ++iter) {
		for (std::size_t i = 0; i < n; ++i) {
			detrended[i] = data[i] - result.trend[i];
		}

		const auto cycle = smoothCycleSubseries(detrended, weights);
		const auto low = lowPass(cycle);
		for (std::size_t i = 0; i < n; ++i) {
			result.seasonal[i] = cycle[i] - low[i];
			deseasonalized[i] = data[i] - result.seasonal[i];
		}

		result.trend = utils::numeric::loessSmoothSpan(deseasonalized, half_width(trend_smoother_), weights);

		for (std::size_t i = 0; i < n; ++i) {
			result.remainder[i] = data[i] - result.trend[i] - result.seasonal[i];
		}

		if (robust_ && iter + 1 < iterations_) {
			weights = robustnessWeights(result.remainder);
		}
	}
	result.iterations = iterations_;

	std::vector<double> seasonal_plus_remainder(n);
	std::vector<double> trend_plus_remainder(n);
	for (std::size_t i = 0; i < n; ++i) {
		seasonal_plus_remainder[i] = result.seasonal[i] + result.remainder[i];
		trend_plus_remainder[i] = result.trend[i] + result.remainder[i];
	}
	const double var_remainder = utils::numeric::variance(result.remainder);
	result.raw_seasonal_strength = strength(var_remainder, utils::numeric::variance(seasonal_plus_remainder));
	result.raw_trend_strength = strength(var_remainder, utils::numeric::variance(trend_plus_remainder));
	result.seasonal_strength = std::clamp(result.raw_seasonal_strength, 0.0, 1.0);
	result.trend_strength = std::clamp(result.raw_trend_strength, 0.0, 1.0);
	if (result.raw_seasonal_strength < 0.0 || result.raw_trend_strength < 0.0) {
		DEMANDLENS_DEBUG("STL strengths clamped (raw seasonal {}, raw trend {}).", result.raw_seasonal_strength,
		                 result.raw_trend_strength);
	}

	result_ = std::move(result);
	DEMANDLENS_INFO("STL decomposition performed with seasonal period {} using {} iterations.", seasonal_period_,
	                iterations_);
}

std::vector<double> STLDecomposition::smoothCycleSubseries(const std::vector<double> &detrended,
                                                           const std::vector<double> &weights) const {
	const std::size_t n = detrended.size();
	std::vector<double> cycle(n, 0.0);
	std::vector<double> subseries;
	std::vector<double> subweights;
	subseries.reserve(n / seasonal_period_ + 1);
	subweights.reserve(n / seasonal_period_ + 1);

	for (std::size_t position = 0; position < seasonal_period_; ++position) {
		subseries.clear();
		subweights.clear();
		for (std::size_t i = position; i < n; i += seasonal_period_) {
			subseries.push_back(detrended[i]);
			subweights.push_back(weights[i]);
		}
		const auto smoothed = utils::numeric::loessSmoothSpan(subseries, half_width(seasonal_smoother_), subweights);
		for (std::size_t k = 0, i = position; i < n; ++k, i += seasonal_period_) {
			cycle[i] = smoothed[k];
		}
	}
	return cycle;
}

std::vector<double> STLDecomposition::lowPass(const std::vector<double> &values) const {
	// Single-pole IIR run forward then backward, which cancels the phase lag.
	const std::size_t n = values.size();
	const double alpha = 1.0 / static_cast<double>(low_pass_smoother_);
	const std::size_t warmup = std::min(n, low_pass_smoother_);

	std::vector<double> forward(n);
	double state = std::accumulate(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(warmup), 0.0) /
	               static_cast<double>(warmup);
	for (std::size_t i = 0; i < n; ++i) {
		state += alpha * (values[i] - state);
		forward[i] = state;
	}

	std::vector<double> backward(n);
	state = std::accumulate(forward.end() - static_cast<std::ptrdiff_t>(warmup), forward.end(), 0.0) /
	        static_cast<double>(warmup);
	for (std::size_t i = n; i-- > 0;) {
		state += alpha * (forward[i] - state);
		backward[i] = state;
	}
	return backward;
}

std::vector<double> STLDecomposition::robustnessWeights(const std::vector<double> &remainder) {
	std::vector<double> abs_residuals(remainder.size());
	for (std::size_t i = 0; i < remainder.size(); ++i) {
		abs_residuals[i] = std::abs(remainder[i]);
	}
	const double mad = utils::numeric::median(abs_residuals);
	std::vector<double> weights(remainder.size(), 1.0);
	if (mad <= 0.0) {
		return weights;
	}
	for (std::size_t i = 0; i < remainder.size(); ++i) {
		const double u = std::abs(remainder[i]) / (6.0 * mad);
		if (u < 1.0) {
			const double w = 1.0 - u * u;
			weights[i] = w * w;
		} else {
			weights[i] = 0.0;
		}
	}
	return weights;
}

const DecompositionResult &STLDecomposition::result() const {
	if (result_.trend.empty()) {
		throw std::runtime_error("STL decomposition not fitted.");
	}
	return result_;
}

double STLDecomposition::seasonalStrength() const {
	return result().seasonal_strength;
}

double STLDecomposition::trendStrength() const {
	return result().trend_strength;
}

} // namespace demandlens::seasonality
