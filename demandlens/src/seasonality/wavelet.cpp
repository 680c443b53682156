#include "demandlens/seasonality/wavelet.hpp"
#include "demandlens/core/errors.hpp"
#include "demandlens/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace demandlens::seasonality {

namespace {

const double kInvSqrt2 = 1.0 / std::sqrt(2.0);

} // namespace

HaarWavelet::HaarWavelet(std::size_t levels) : levels_(levels) {
	if (levels_ == 0) {
		throw std::invalid_argument("Wavelet transform needs at least one level.");
	}
}

WaveletTransform HaarWavelet::transform(const std::vector<double> &values) const {
	if (values.size() < 2) {
		throw core::InsufficientDataError("Wavelet transform requires at least 2 samples.");
	}
	const std::size_t depth = std::min(levels_, static_cast<std::size_t>(std::floor(std::log2(values.size()))));
	if (depth < levels_) {
		DEMANDLENS_DEBUG("Wavelet depth capped from {} to {} for {} samples.", levels_, depth, values.size());
	}

	WaveletTransform result;
	result.original_length = values.size();
	std::vector<double> approximation = values;

	for (std::size_t level = 1; level <= depth && approximation.size() >= 2; ++level) {
		const std::size_t pairs = approximation.size() / 2;
		std::vector<double> next;
		next.reserve(pairs + 1);

		WaveletLevel detail;
		detail.level = level;
		detail.coefficients.reserve(pairs);
		for (std::size_t i = 0; i < pairs; ++i) {
			const double a = approximation[2 * i];
			const double b = approximation[2 * i + 1];
			next.push_back((a + b) * kInvSqrt2);
			detail.coefficients.push_back((a - b) * kInvSqrt2);
		}
		if (approximation.size() % 2 == 1) {
			next.push_back(approximation.back());
		}

		const double base_freq = 0.5 / std::pow(2.0, static_cast<double>(level));
		const double count = static_cast<double>(pairs);
		double energy = 0.0;
		for (double c : detail.coefficients) {
			energy += c * c;
		}
		detail.frequencies.resize(pairs);
		detail.time_localization.resize(pairs, 0.0);
		for (std::size_t i = 0; i < pairs; ++i) {
			detail.frequencies[i] = base_freq * (1.0 + static_cast<double>(i) / count);
			if (energy > 0.0) {
				detail.time_localization[i] = detail.coefficients[i] * detail.coefficients[i] / energy;
			}
		}

		result.levels.push_back(std::move(detail));
		approximation = std::move(next);
	}

	std::reverse(result.levels.begin(), result.levels.end());
	result.approximation = std::move(approximation);
	return result;
}

std::vector<double> WaveletTransform::inverse() const {
	std::vector<double> signal = approximation;
	for (const auto &level : levels) {
		const auto &detail = level.coefficients;
		if (signal.size() != detail.size() && signal.size() != detail.size() + 1) {
			throw std::logic_error("Wavelet level sizes are inconsistent.");
		}
		const bool carried = signal.size() > detail.size();
		std::vector<double> expanded;
		expanded.reserve(detail.size() * 2 + 1);
		for (std::size_t i = 0; i < detail.size(); ++i) {
			expanded.push_back((signal[i] + detail[i]) * kInvSqrt2);
			expanded.push_back((signal[i] - detail[i]) * kInvSqrt2);
		}
		if (carried) {
			expanded.push_back(signal.back());
		}
		signal = std::move(expanded);
	}
	return signal;
}

} // namespace demandlens::seasonality
