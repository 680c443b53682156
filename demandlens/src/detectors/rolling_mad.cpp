#include "demandlens/detectors/rolling_mad.hpp"
#include "demandlens/utils/numeric.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace demandlens::detectors {

namespace {

// Consistency constants for normal data: sigma ~ 1.4826 * MAD ~ 1.2533 * mean |x - mean|.
constexpr double kMadToSigma = 1.4826;
constexpr double kMeanAbsToSigma = 1.2533;
constexpr std::size_t kMaxWindow = 30;
constexpr std::size_t kMinWindow = 3;

double meanAbsoluteDeviation(const std::vector<double> &values) {
	const double center = utils::numeric::mean(values);
	double total = 0.0;
	for (double v : values) {
		total += std::abs(v - center);
	}
	return total / static_cast<double>(values.size());
}

} // namespace

std::string toString(OutlierType type) {
	switch (type) {
	case OutlierType::AdditiveOutlier:
		return "AO";
	case OutlierType::LevelShift:
		return "LS";
	}
	return "unknown";
}

// --- Detector Implementation ---

RollingMADDetector::RollingMADDetector(double threshold, std::optional<std::size_t> window, std::size_t shift_window,
                                       double shift_multiplier)
    : threshold_(threshold), window_(window), shift_window_(shift_window), shift_multiplier_(shift_multiplier) {
	if (threshold_ <= 0) {
		throw std::invalid_argument("Threshold must be positive.");
	}
	if (window_ && *window_ < kMinWindow) {
		throw std::invalid_argument("Rolling window must cover at least 3 points.");
	}
	if (shift_window_ == 0) {
		throw std::invalid_argument("Level-shift window must be positive.");
	}
	if (shift_multiplier_ <= 0) {
		throw std::invalid_argument("Level-shift multiplier must be positive.");
	}
}

std::size_t RollingMADDetector::windowFor(std::size_t n) const {
	if (window_) {
		return std::min(*window_, n);
	}
	return std::min(n, std::max(kMinWindow, std::min(kMaxWindow, n / 3)));
}

OutlierResult RollingMADDetector::detect(const std::vector<double> &values) const {
	const std::size_t n = values.size();
	if (n < kMinWindow) {
		DEMANDLENS_WARN("RollingMADDetector requires at least {} data points. Returning no outliers.", kMinWindow);
		return {};
	}

	const std::size_t window = windowFor(n);
	const std::size_t half = window / 2;
	OutlierResult result;

	for (std::size_t i = 0; i < n; ++i) {
		// Centered window, shifted inwards at the boundaries so it keeps its size.
		std::size_t start = i >= half ? i - half : 0;
		if (start + window > n) {
			start = n - window;
		}
		const std::vector<double> local(values.begin() + static_cast<std::ptrdiff_t>(start),
		                                values.begin() + static_cast<std::ptrdiff_t>(start + window));

		const double local_median = utils::numeric::median(local);
		const double mad = utils::numeric::medianAbsoluteDeviation(local);
		double scale = kMadToSigma * mad;
		if (scale == 0.0) {
			scale = kMeanAbsToSigma * meanAbsoluteDeviation(local);
		}
		if (scale == 0.0) {
			continue;
		}

		const double deviation = values[i] - local_median;
		const double score = std::abs(deviation) / scale;
		if (score <= threshold_) {
			continue;
		}

		Outlier outlier;
		outlier.index = i;
		outlier.impact = deviation;
		outlier.local_median = local_median;
		outlier.score = score;

		const std::size_t before_start = i >= shift_window_ ? i - shift_window_ : 0;
		const std::size_t after_end = std::min(n, i + 1 + shift_window_);
		if (before_start < i && i + 1 < after_end) {
			const std::vector<double> before(values.begin() + static_cast<std::ptrdiff_t>(before_start),
			                                 values.begin() + static_cast<std::ptrdiff_t>(i));
			const std::vector<double> after(values.begin() + static_cast<std::ptrdiff_t>(i + 1),
			                                values.begin() + static_cast<std::ptrdiff_t>(after_end));
			const double shift = std::abs(utils::numeric::mean(after) - utils::numeric::mean(before));
			if (shift > shift_multiplier_ * (mad > 0.0 ? mad : scale / kMeanAbsToSigma)) {
				outlier.type = OutlierType::LevelShift;
			}
		}
		result.outliers.push_back(outlier);
	}

	DEMANDLENS_INFO("RollingMADDetector found {} outliers (window {}).", result.outliers.size(), window);
	return result;
}

// --- Builder Implementation ---

RollingMADDetectorBuilder &RollingMADDetectorBuilder::withThreshold(double threshold) {
	threshold_ = threshold;
	return *this;
}

RollingMADDetectorBuilder &RollingMADDetectorBuilder::withWindow(std::size_t window) {
	window_ = window;
	return *this;
}

RollingMADDetectorBuilder &RollingMADDetectorBuilder::withShiftWindow(std::size_t points) {
	shift_window_ = points;
	return *this;
}

RollingMADDetectorBuilder &RollingMADDetectorBuilder::withShiftMultiplier(double multiplier) {
	shift_multiplier_ = multiplier;
	return *this;
}

std::unique_ptr<RollingMADDetector> RollingMADDetectorBuilder::build() {
	DEMANDLENS_DEBUG("Building RollingMADDetector with threshold {}.", threshold_);
	return std::unique_ptr<RollingMADDetector>(
	    new RollingMADDetector(threshold_, window_, shift_window_, shift_multiplier_));
}

} // namespace demandlens::detectors
