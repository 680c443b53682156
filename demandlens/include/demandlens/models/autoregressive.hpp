#pragma once

#include "demandlens/utils/logging.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <memory>
#include <vector>

namespace demandlens::models {

class AutoRegressiveBuilder; // Forward declaration

/**
 * @class AutoRegressive
 * @brief Low-order AR(p) model estimated with the Yule-Walker equations on a
 * (seasonally) differenced series.
 *
 * This is the "ARIMA-lite" stage of the seasonal adjustment pipeline: no MA
 * terms and no likelihood optimisation.
 */
class AutoRegressive final {
public:
	friend class AutoRegressiveBuilder;

	/**
	 * @brief Differences the data and solves the Yule-Walker system.
	 * @throws core::InsufficientDataError If fewer than order + 2 points remain after differencing.
	 * @throws core::SingularSystemError If the Toeplitz system is singular; retry with a lower order.
	 */
	void fit(const std::vector<double> &data);

	const Eigen::VectorXd &coefficients() const {
		return coefficients_;
	}
	/// One-step-ahead residuals on the differenced scale.
	const std::vector<double> &residuals() const {
		return residuals_;
	}
	double residualVariance() const {
		return sigma2_;
	}
	const std::vector<double> &differenced() const {
		return differenced_;
	}
	std::size_t order() const {
		return order_;
	}
	bool isFitted() const {
		return is_fitted_;
	}

	static std::vector<double> difference(const std::vector<double> &data, int d);
	static std::vector<double> seasonalDifference(const std::vector<double> &data, int D, int s);

private:
	AutoRegressive(std::size_t order, int d, int D, int s);

	std::size_t order_;
	int d_;
	int D_;
	int seasonal_period_;
	Eigen::VectorXd coefficients_;
	std::vector<double> differenced_;
	std::vector<double> residuals_;
	double mean_ = 0.0;
	double sigma2_ = 0.0;
	bool is_fitted_ = false;
};

class AutoRegressiveBuilder {
public:
	AutoRegressiveBuilder &withOrder(std::size_t p);
	AutoRegressiveBuilder &withDifferencing(int d);
	AutoRegressiveBuilder &withSeasonalDifferencing(int D);
	AutoRegressiveBuilder &withSeasonalPeriod(int s);
	std::unique_ptr<AutoRegressive> build();

private:
	std::size_t p_ = 1;
	int d_ = 1;
	int D_ = 0;
	int s_ = 0;
};

} // namespace demandlens::models
