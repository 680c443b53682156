#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace demandlens::utils {

/**
 * @brief Numeric building blocks shared by the decomposition and quality engines.
 *
 * All functions are pure; inputs are never modified unless documented.
 */
namespace numeric {

struct LinearFit {
	double slope = 0.0;
	double intercept = 0.0;

	double at(double x) const {
		return intercept + slope * x;
	}
};

/**
 * @brief Ordinary least squares fit of y on x.
 * @throws std::invalid_argument If the inputs are empty or differ in length.
 * @throws core::DegenerateInputError If x is constant.
 */
LinearFit linearRegression(const std::vector<double> &x, const std::vector<double> &y);

/// OLS fit of y on the index 0..n-1.
LinearFit linearRegression(const std::vector<double> &y);

struct Detrended {
	std::vector<double> residuals;
	LinearFit fit;
};

/// Removes the OLS linear trend; requires at least two points.
Detrended detrend(const std::vector<double> &y);

/**
 * @brief Centered moving average whose window shrinks at the series boundaries.
 *
 * For even windows the extra point is taken on the left side.
 */
std::vector<double> movingAverage(const std::vector<double> &series, std::size_t window);

/**
 * @brief Tricube-weighted local linear regression.
 * @param bandwidth Fraction of the series length in (0, 1]; h = ceil(bandwidth * n).
 * @param robustness_weights Optional per-point weights multiplied into the tricube weights.
 */
std::vector<double> loessSmooth(const std::vector<double> &series, double bandwidth,
                                const std::vector<double> &robustness_weights = {});

/// Loess with an absolute half-width h (in samples) instead of a fraction.
std::vector<double> loessSmoothSpan(const std::vector<double> &series, std::size_t span,
                                    const std::vector<double> &robustness_weights = {});

double mean(const std::vector<double> &values);
double median(std::vector<double> values);
double medianAbsoluteDeviation(const std::vector<double> &values);

/// Population variance (divides by n); 0 for empty input.
double variance(const std::vector<double> &values);
double covariance(const std::vector<double> &x, const std::vector<double> &y);

/// Pearson correlation; 0 when either input has no variance.
double correlation(const std::vector<double> &x, const std::vector<double> &y);

double skewness(const std::vector<double> &values);

/// Standard deviation over absolute mean; 0 when the mean is 0.
double coefficientOfVariation(const std::vector<double> &values);

/**
 * @brief Solves A x = b by Gaussian elimination with partial pivoting (Eigen::PartialPivLU).
 * @throws core::SingularSystemError If a pivot of the LU factorization is below 1e-12.
 */
Eigen::VectorXd solveLinearSystem(const Eigen::MatrixXd &A, const Eigen::VectorXd &b);

} // namespace numeric
} // namespace demandlens::utils
