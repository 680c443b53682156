#pragma once

#include "demandlens/core/time_series.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace demandlens::detectors {

enum class OutlierType {
	AdditiveOutlier, ///< AO: a single aberrant observation
	LevelShift       ///< LS: the series moves to a new level after the point
};

std::string toString(OutlierType type);

struct Outlier {
	std::size_t index = 0;
	OutlierType type = OutlierType::AdditiveOutlier;
	/// Observed value minus the local median.
	double impact = 0.0;
	double local_median = 0.0;
	double score = 0.0;
};

/**
 * @struct OutlierResult
 * @brief Holds the results of an outlier detection operation.
 */
struct OutlierResult {
	/// Detected outliers in ascending index order.
	std::vector<Outlier> outliers;

	std::vector<std::size_t> indices() const {
		std::vector<std::size_t> result;
		result.reserve(outliers.size());
		for (const auto &outlier : outliers) {
			result.push_back(outlier.index);
		}
		return result;
	}
};

/**
 * @class IOutlierDetector
 * @brief An interface for all outlier detection algorithms.
 */
class IOutlierDetector {
public:
	virtual ~IOutlierDetector() = default;

	virtual OutlierResult detect(const std::vector<double> &values) const = 0;

	OutlierResult detect(const core::TimeSeries &ts) const {
		return detect(ts.getValues());
	}

	virtual std::string getName() const = 0;
};

} // namespace demandlens::detectors
