#pragma once

#include "demandlens/core/time_series.hpp"
#include <cstddef>
#include <vector>

namespace demandlens::seasonality {

struct WaveletLevel {
	std::size_t level = 0;
	/// Detail coefficients produced at this level.
	std::vector<double> coefficients;
	/// Coarse frequency estimate per coefficient (cycles per sample).
	std::vector<double> frequencies;
	/// coefficient^2 / sum(coefficient^2); all zeros when the level has no energy.
	std::vector<double> time_localization;
};

struct WaveletTransform {
	/// Detail levels, coarsest first.
	std::vector<WaveletLevel> levels;
	/// Approximation left after the coarsest level.
	std::vector<double> approximation;
	std::size_t original_length = 0;

	/**
	 * @brief Inverts the transform, reproducing the analysed signal.
	 */
	[[nodiscard]] std::vector<double> inverse() const;
};

/**
 * @class HaarWavelet
 * @brief Multi-level Haar discrete wavelet transform.
 *
 * Each level pairs adjacent samples into (a + b) / sqrt(2) and (a - b) / sqrt(2).
 * An odd trailing sample is carried into the approximation unchanged.
 */
class HaarWavelet {
public:
	/**
	 * @param levels Requested depth; capped at floor(log2(n)).
	 */
	explicit HaarWavelet(std::size_t levels = 4);

	/**
	 * @throws core::InsufficientDataError If fewer than 2 samples are supplied.
	 */
	WaveletTransform transform(const std::vector<double> &values) const;
	WaveletTransform transform(const core::TimeSeries &series) const {
		return transform(series.getValues());
	}

	std::size_t levels() const {
		return levels_;
	}

private:
	std::size_t levels_;
};

} // namespace demandlens::seasonality
