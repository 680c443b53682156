#pragma once

#include "demandlens/core/time_series.hpp"
#include "demandlens/utils/numeric.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace demandlens::seasonality {

struct FourierComponent {
	std::size_t harmonic = 0;
	double frequency = 0.0; ///< cycles per sample, k / n
	double amplitude = 0.0;
	double phase = 0.0;
	double period = 0.0; ///< samples per cycle, n / k
	double significance = 0.0;
};

struct FourierAnalysis {
	/// Retained components, sorted by descending amplitude.
	std::vector<FourierComponent> components;
	utils::numeric::LinearFit trend;
	std::size_t length = 0;
	double variance = 0.0;
	/// Sum of the amplitudes of the harmonics that failed the significance gate.
	double discarded_amplitude = 0.0;
	std::size_t discarded_count = 0;

	[[nodiscard]] std::optional<double> dominantPeriod() const;

	/**
	 * @brief Sums the retained harmonics and adds back the linear trend.
	 *
	 * The pointwise error against the analysed series is bounded by
	 * discarded_amplitude plus whatever lies above the analysed harmonic range.
	 */
	[[nodiscard]] std::vector<double> reconstruct() const;
};

/**
 * @class FourierAnalyzer
 * @brief Periodogram of an OLS-detrended series evaluated at the Fourier harmonics.
 *
 * The significance attached to each harmonic is a heuristic, not a spectral
 * test: 1 - exp(-amplitude^2 * n / (2 * variance)), which is close to 1 when a
 * harmonic explains a large share of the variance. Harmonics at or below the
 * gate (0.05 by default) are dropped. Do not read it as a p-value.
 */
class FourierAnalyzer {
public:
	class Builder {
	public:
		Builder &withMaxFrequencies(std::size_t count);
		Builder &withSignificanceThreshold(double threshold);
		FourierAnalyzer build() const;

	private:
		std::size_t max_frequencies_ = 50;
		double significance_threshold_ = 0.05;
	};

	static Builder builder();

	FourierAnalyzer(std::size_t max_frequencies, double significance_threshold);

	/**
	 * @throws core::InsufficientDataError If fewer than 4 points are supplied.
	 */
	FourierAnalysis analyze(const std::vector<double> &values) const;
	FourierAnalysis analyze(const core::TimeSeries &series) const {
		return analyze(series.getValues());
	}

	std::size_t maxFrequencies() const {
		return max_frequencies_;
	}

private:
	std::size_t max_frequencies_;
	double significance_threshold_;
};

} // namespace demandlens::seasonality
