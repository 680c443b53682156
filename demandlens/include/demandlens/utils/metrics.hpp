#pragma once

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

namespace demandlens::utils {

/**
 * @struct AccuracyMetrics
 * @brief Point-accuracy summary of a set of (actual, predicted) pairs.
 *
 * Percentages (mape, accuracy) are expressed on a 0-100 scale.
 */
struct AccuracyMetrics {
	double mape = 0.0;
	double rmse = 0.0;
	double mae = 0.0;
	double bias = 0.0;
	double accuracy = 0.0;
	double r2 = 0.0;
	double theil_u = 0.0;
	std::size_t n = 0;
};

class Metrics final {
public:
	static double mae(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double mse(const std::vector<double> &actual, const std::vector<double> &predicted);
	static double rmse(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// MAPE over the points with a non-zero actual; nullopt when every actual is zero.
	static std::optional<double> mape(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// Mean of (predicted - actual); positive values mean overforecasting.
	static double bias(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// 1 - SS_res / SS_tot, defined as 1 when the actuals have no variance.
	static double r2(const std::vector<double> &actual, const std::vector<double> &predicted);

	/// RMS(actual - predicted) / (RMS(actual) + RMS(predicted)); 0 when both series are all zero.
	static double theilU(const std::vector<double> &actual, const std::vector<double> &predicted);
};

} // namespace demandlens::utils
