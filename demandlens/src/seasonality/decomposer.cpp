#include "demandlens/seasonality/decomposer.hpp"
#include "demandlens/utils/logging.hpp"

#include <stdexcept>

namespace demandlens::seasonality {

std::string toString(Algorithm algorithm) {
	switch (algorithm) {
	case Algorithm::Fourier:
		return "fourier";
	case Algorithm::STL:
		return "stl";
	case Algorithm::Wavelet:
		return "wavelet";
	case Algorithm::SeasonalAdjust:
		return "seasonal_adjust";
	}
	return "unknown";
}

Decomposition decompose(const core::TimeSeries &series, const DecompositionParams &params) {
	if (series.hasMissingValues()) {
		throw std::invalid_argument("Cannot decompose a series with missing or non-finite values.");
	}
	DEMANDLENS_DEBUG("Decomposing {} observations with {}.", series.size(), toString(params.algorithm));

	switch (params.algorithm) {
	case Algorithm::Fourier: {
		const auto analyzer = FourierAnalyzer::builder()
		                          .withMaxFrequencies(params.max_frequencies)
		                          .withSignificanceThreshold(params.significance_threshold)
		                          .build();
		return analyzer.analyze(series).components;
	}
	case Algorithm::STL: {
		auto stl = STLDecomposition::builder()
		               .withPeriod(params.seasonal_period)
		               .withSeasonalSmoother(params.seasonal_smoother)
		               .withRobust(params.robust)
		               .build();
		stl.fit(series);
		return stl.result();
	}
	case Algorithm::Wavelet:
		return HaarWavelet(params.wavelet_levels).transform(series);
	case Algorithm::SeasonalAdjust: {
		const auto adjuster = SeasonalAdjuster::builder()
		                          .withSeasonalPeriod(params.seasonal_period)
		                          .withArOrder(params.ar_order)
		                          .withLogTransform(params.log_transform)
		                          .withOutlierDetection(params.detect_outliers)
		                          .withTradingDayAdjustment(params.trading_day_adjustment)
		                          .withHolidayAdjustment(params.holiday_adjustment)
		                          .withCalendar(params.calendar)
		                          .build();
		return adjuster.adjust(series);
	}
	}
	throw std::invalid_argument("Unknown decomposition algorithm.");
}

} // namespace demandlens::seasonality
