#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace demandlens::seasonality {

/**
 * @brief Sample autocorrelation for lags 0..max_lag.
 *
 * Uses the full-series mean and variance for every lag, so values shrink
 * towards zero at long lags. acf[0] is 1 (0 for a constant series).
 *
 * @throws std::invalid_argument If max_lag >= series length.
 */
Eigen::VectorXd acf(const std::vector<double> &series, std::size_t max_lag);

/**
 * @brief Partial autocorrelation for lags 0..max_lag.
 *
 * pacf[k] is the last coefficient of the order-k Yule-Walker solution.
 *
 * @throws core::SingularSystemError If a Yule-Walker system is singular.
 */
Eigen::VectorXd pacf(const std::vector<double> &series, std::size_t max_lag);

/**
 * @brief Solves the order-p Yule-Walker equations for the given autocorrelations.
 * @param autocorrelations acf values for lags 0..p (at least p+1 entries).
 */
Eigen::VectorXd yuleWalker(const Eigen::VectorXd &autocorrelations, std::size_t order);

} // namespace demandlens::seasonality
