#include "demandlens/seasonality/fourier.hpp"
#include "demandlens/core/errors.hpp"
#include "demandlens/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace demandlens::seasonality {

namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;

} // namespace

FourierAnalyzer::Builder &FourierAnalyzer::Builder::withMaxFrequencies(std::size_t count) {
	max_frequencies_ = count;
	return *this;
}

FourierAnalyzer::Builder &FourierAnalyzer::Builder::withSignificanceThreshold(double threshold) {
	significance_threshold_ = threshold;
	return *this;
}

FourierAnalyzer FourierAnalyzer::Builder::build() const {
	return FourierAnalyzer(max_frequencies_, significance_threshold_);
}

FourierAnalyzer::Builder FourierAnalyzer::builder() {
	return Builder();
}

FourierAnalyzer::FourierAnalyzer(std::size_t max_frequencies, double significance_threshold)
    : max_frequencies_(max_frequencies), significance_threshold_(significance_threshold) {
	if (max_frequencies_ == 0) {
		throw std::invalid_argument("At least one frequency must be analysed.");
	}
	if (significance_threshold_ < 0.0 || significance_threshold_ >= 1.0) {
		throw std::invalid_argument("Significance threshold must be in [0, 1).");
	}
}

FourierAnalysis FourierAnalyzer::analyze(const std::vector<double> &values) const {
	const std::size_t n = values.size();
	if (n < 4) {
		throw core::InsufficientDataError("Fourier analysis requires at least 4 observations.");
	}

	const auto detrended = utils::numeric::detrend(values);
	const auto &residuals = detrended.residuals;

	FourierAnalysis analysis;
	analysis.trend = detrended.fit;
	analysis.length = n;
	analysis.variance = utils::numeric::variance(residuals);
	double scale = 0.0;
	for (double v : values) {
		scale += v * v;
	}
	scale /= static_cast<double>(n);
	// Rounding noise left by the detrend on an exact line counts as no variance.
	if (analysis.variance <= std::numeric_limits<double>::epsilon() * scale) {
		DEMANDLENS_WARN("Fourier analysis skipped: detrended series has zero variance.");
		return analysis;
	}

	const std::size_t harmonics = std::min(max_frequencies_, n / 2);
	const double length = static_cast<double>(n);
	for (std::size_t k = 1; k <= harmonics; ++k) {
		double real = 0.0;
		double imag = 0.0;
		for (std::size_t t = 0; t < n; ++t) {
			const double angle = kTwoPi * static_cast<double>(k) * static_cast<double>(t) / length;
			real += residuals[t] * std::cos(angle);
			imag -= residuals[t] * std::sin(angle);
		}

		FourierComponent component;
		component.harmonic = k;
		component.frequency = static_cast<double>(k) / length;
		component.period = length / static_cast<double>(k);
		component.amplitude = 2.0 * std::sqrt(real * real + imag * imag) / length;
		component.phase = std::atan2(imag, real);
		component.significance =
		    1.0 - std::exp(-component.amplitude * component.amplitude * length / (2.0 * analysis.variance));

		if (component.significance > significance_threshold_) {
			analysis.components.push_back(component);
		} else {
			analysis.discarded_amplitude += component.amplitude;
			++analysis.discarded_count;
		}
	}

	std::sort(analysis.components.begin(), analysis.components.end(),
	          [](const FourierComponent &a, const FourierComponent &b) { return a.amplitude > b.amplitude; });

	DEMANDLENS_DEBUG("Fourier analysis kept {} of {} harmonics.", analysis.components.size(), harmonics);
	return analysis;
}

std::optional<double> FourierAnalysis::dominantPeriod() const {
	if (components.empty()) {
		return std::nullopt;
	}
	return components.front().period;
}

std::vector<double> FourierAnalysis::reconstruct() const {
	std::vector<double> signal(length, 0.0);
	const double n = static_cast<double>(length);
	for (std::size_t t = 0; t < length; ++t) {
		double value = trend.at(static_cast<double>(t));
		for (const auto &component : components) {
			// The Nyquist harmonic has no conjugate partner, so it carries half the amplitude.
			const bool nyquist = length % 2 == 0 && component.harmonic == length / 2;
			const double amplitude = nyquist ? component.amplitude / 2.0 : component.amplitude;
			value += amplitude * std::cos(kTwoPi * static_cast<double>(component.harmonic) * static_cast<double>(t) / n +
			                              component.phase);
		}
		signal[t] = value;
	}
	return signal;
}

} // namespace demandlens::seasonality
