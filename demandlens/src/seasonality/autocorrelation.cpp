#include "demandlens/seasonality/autocorrelation.hpp"
#include "demandlens/utils/numeric.hpp"

#include <cstdlib>
#include <numeric>
#include <stdexcept>

namespace demandlens::seasonality {

Eigen::VectorXd acf(const std::vector<double> &series, std::size_t max_lag) {
	const std::size_t n = series.size();
	if (max_lag >= n) {
		throw std::invalid_argument("ACF max lag must be smaller than the series length.");
	}
	Eigen::VectorXd result = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(max_lag + 1));

	const double mean = std::accumulate(series.begin(), series.end(), 0.0) / static_cast<double>(n);
	double variance = 0.0;
	for (double val : series) {
		const double diff = val - mean;
		variance += diff * diff;
	}
	if (variance == 0.0) {
		return result;
	}

	result[0] = 1.0;
	for (std::size_t lag = 1; lag <= max_lag; ++lag) {
		double covariance = 0.0;
		for (std::size_t i = lag; i < n; ++i) {
			covariance += (series[i] - mean) * (series[i - lag] - mean);
		}
		result[static_cast<Eigen::Index>(lag)] = covariance / variance;
	}
	return result;
}

Eigen::VectorXd yuleWalker(const Eigen::VectorXd &autocorrelations, std::size_t order) {
	const auto p = static_cast<Eigen::Index>(order);
	if (p == 0) {
		return {};
	}
	if (autocorrelations.size() < p + 1) {
		throw std::invalid_argument("Yule-Walker needs autocorrelations up to the model order.");
	}
	Eigen::MatrixXd R(p, p);
	for (Eigen::Index i = 0; i < p; ++i) {
		for (Eigen::Index j = 0; j < p; ++j) {
			R(i, j) = autocorrelations[std::abs(i - j)];
		}
	}
	return utils::numeric::solveLinearSystem(std::move(R), autocorrelations.segment(1, p));
}

Eigen::VectorXd pacf(const std::vector<double> &series, std::size_t max_lag) {
	const Eigen::VectorXd correlations = acf(series, max_lag);
	Eigen::VectorXd result = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(max_lag + 1));
	result[0] = correlations[0];
	for (std::size_t k = 1; k <= max_lag; ++k) {
		const Eigen::VectorXd phi = yuleWalker(correlations, k);
		result[static_cast<Eigen::Index>(k)] = phi[phi.size() - 1];
	}
	return result;
}

} // namespace demandlens::seasonality
