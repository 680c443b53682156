#pragma once

#include "demandlens/detectors/ioutlier_detector.hpp"
#include "demandlens/utils/logging.hpp"
#include <cstddef>
#include <memory>
#include <optional>

namespace demandlens::detectors {

class RollingMADDetectorBuilder; // Forward declaration

/**
 * @class RollingMADDetector
 * @brief Outlier detector based on a rolling Median Absolute Deviation.
 *
 * Each point is scored against the median and MAD of a window around it:
 * |value - median| / (1.4826 * MAD). Points above the threshold are then
 * classified as a level shift when the means of the points right after and
 * right before differ by more than 2 * MAD, otherwise as an additive outlier.
 */
class RollingMADDetector final : public IOutlierDetector {
public:
	friend class RollingMADDetectorBuilder;

	using IOutlierDetector::detect;
	OutlierResult detect(const std::vector<double> &values) const override;
	std::string getName() const override {
		return "RollingMADDetector";
	}

	/// Window used for a series of length n: min(30, n / 3), at least 3.
	std::size_t windowFor(std::size_t n) const;

private:
	RollingMADDetector(double threshold, std::optional<std::size_t> window, std::size_t shift_window,
	                   double shift_multiplier);

	double threshold_;
	std::optional<std::size_t> window_;
	std::size_t shift_window_;
	double shift_multiplier_;
};

/**
 * @class RollingMADDetectorBuilder
 * @brief A builder for fluently configuring and creating RollingMADDetector instances.
 */
class RollingMADDetectorBuilder {
public:
	/**
	 * @brief Sets the robust z-score above which a point is flagged.
	 */
	RollingMADDetectorBuilder &withThreshold(double threshold);

	/**
	 * @brief Fixes the rolling window; by default it is derived from the series length.
	 */
	RollingMADDetectorBuilder &withWindow(std::size_t window);

	RollingMADDetectorBuilder &withShiftWindow(std::size_t points);
	RollingMADDetectorBuilder &withShiftMultiplier(double multiplier);

	std::unique_ptr<RollingMADDetector> build();

private:
	double threshold_ = 3.5;
	std::optional<std::size_t> window_;
	std::size_t shift_window_ = 5;
	double shift_multiplier_ = 2.0;
};

} // namespace demandlens::detectors
