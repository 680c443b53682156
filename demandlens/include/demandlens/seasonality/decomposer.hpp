#pragma once

#include "demandlens/core/calendar.hpp"
#include "demandlens/core/time_series.hpp"
#include "demandlens/seasonality/fourier.hpp"
#include "demandlens/seasonality/seasonal_adjustment.hpp"
#include "demandlens/seasonality/stl.hpp"
#include "demandlens/seasonality/wavelet.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace demandlens::seasonality {

enum class Algorithm { Fourier, STL, Wavelet, SeasonalAdjust };

std::string toString(Algorithm algorithm);

/**
 * @struct DecompositionParams
 * @brief Knobs for decompose(); only the fields of the selected algorithm are read.
 */
struct DecompositionParams {
	Algorithm algorithm = Algorithm::STL;
	/// Caller-declared sampling period (observations per seasonal cycle).
	std::size_t seasonal_period = 12;

	// STL
	std::size_t seasonal_smoother = 7;
	bool robust = true;

	// Fourier
	std::size_t max_frequencies = 50;
	double significance_threshold = 0.05;

	// Wavelet
	std::size_t wavelet_levels = 4;

	// Seasonal adjustment
	std::size_t ar_order = 2;
	LogTransformMode log_transform = LogTransformMode::Auto;
	bool detect_outliers = true;
	bool trading_day_adjustment = false;
	bool holiday_adjustment = false;
	std::shared_ptr<const core::CalendarProvider> calendar;
};

using Decomposition =
    std::variant<DecompositionResult, std::vector<FourierComponent>, WaveletTransform, SeasonalAdjustmentResult>;

/**
 * @brief Runs one of the four decomposers on @p series.
 *
 * Errors raised by the selected algorithm propagate unchanged.
 */
Decomposition decompose(const core::TimeSeries &series, const DecompositionParams &params);

} // namespace demandlens::seasonality
