#pragma once

#include "demandlens/quality/prediction.hpp"
#include "demandlens/utils/metrics.hpp"
#include <vector>

namespace demandlens::quality {

using utils::AccuracyMetrics;

/**
 * @brief Point-accuracy metrics of paired observations.
 *
 * MAPE only averages points with a non-zero actual and is 0 when there are
 * none; accuracy = max(0, 100 - MAPE).
 *
 * @throws core::NoDataError If no pair is supplied.
 * @throws std::invalid_argument If the inputs differ in length.
 */
AccuracyMetrics computeAccuracyMetrics(const std::vector<double> &actual, const std::vector<double> &predicted);

/// Metrics over the actualized records; throws core::NoDataError when there are none.
AccuracyMetrics computeAccuracyMetrics(const std::vector<PredictionRecord> &records);

} // namespace demandlens::quality
