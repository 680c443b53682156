#include "demandlens/models/autoregressive.hpp"
#include "demandlens/core/errors.hpp"
#include "demandlens/seasonality/autocorrelation.hpp"

#include <numeric>
#include <stdexcept>
#include <utility>

namespace demandlens::models {

AutoRegressive::AutoRegressive(std::size_t order, int d, int D, int s)
    : order_(order), d_(d), D_(D), seasonal_period_(s) {
	if (d_ < 0 || D_ < 0) {
		throw std::invalid_argument("Differencing orders must be non-negative.");
	}
}

std::vector<double> AutoRegressive::difference(const std::vector<double> &data, int d) {
	if (d == 0)
		return data;
	if (data.size() <= static_cast<size_t>(d)) {
		throw core::InsufficientDataError("Insufficient data length for requested differencing order.");
	}

	std::vector<double> result = data;
	for (int diff_order = 0; diff_order < d; ++diff_order) {
		std::vector<double> temp;
		temp.reserve(result.size() - 1);
		for (size_t i = 1; i < result.size(); ++i) {
			temp.push_back(result[i] - result[i - 1]);
		}
		result = std::move(temp);
	}
	return result;
}

std::vector<double> AutoRegressive::seasonalDifference(const std::vector<double> &data, int D, int s) {
	if (D == 0 || s <= 1)
		return data;
	const size_t lag = static_cast<size_t>(s);
	if (data.size() <= static_cast<size_t>(D) * lag) {
		throw core::InsufficientDataError("Insufficient data length for requested seasonal differencing order.");
	}

	std::vector<double> result = data;
	for (int diff_order = 0; diff_order < D; ++diff_order) {
		std::vector<double> temp;
		temp.reserve(result.size() - lag);
		for (size_t i = lag; i < result.size(); ++i) {
			temp.push_back(result[i] - result[i - lag]);
		}
		result = std::move(temp);
	}
	return result;
}

void AutoRegressive::fit(const std::vector<double> &data) {
	is_fitted_ = false;
	differenced_ = difference(seasonalDifference(data, D_, seasonal_period_), d_);
	if (differenced_.size() < order_ + 2) {
		throw core::InsufficientDataError("Not enough data to estimate AR parameters.");
	}

	const std::size_t n = differenced_.size();
	mean_ = std::accumulate(differenced_.begin(), differenced_.end(), 0.0) / static_cast<double>(n);

	const Eigen::VectorXd correlations = order_ == 0 ? Eigen::VectorXd() : seasonality::acf(differenced_, order_);
	if (order_ == 0) {
		coefficients_.resize(0);
	} else if (correlations[0] == 0.0) {
		// Constant differenced series: nothing left to explain.
		coefficients_ = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(order_));
	} else {
		coefficients_ = seasonality::yuleWalker(correlations, order_);
	}

	residuals_.assign(n, 0.0);
	double sse = 0.0;
	for (std::size_t t = order_; t < n; ++t) {
		double prediction = mean_;
		for (std::size_t lag = 1; lag <= order_; ++lag) {
			prediction += coefficients_[static_cast<Eigen::Index>(lag - 1)] * (differenced_[t - lag] - mean_);
		}
		residuals_[t] = differenced_[t] - prediction;
		sse += residuals_[t] * residuals_[t];
	}
	sigma2_ = sse / static_cast<double>(n - order_);
	is_fitted_ = true;

	DEMANDLENS_DEBUG("AR({}) fitted on {} differenced points (d={}, D={}, s={}), sigma2={}", order_, n, d_, D_,
	                 seasonal_period_, sigma2_);
}

// --- Builder Implementation ---

AutoRegressiveBuilder &AutoRegressiveBuilder::withOrder(std::size_t p) {
	p_ = p;
	return *this;
}

AutoRegressiveBuilder &AutoRegressiveBuilder::withDifferencing(int d) {
	d_ = d;
	return *this;
}

AutoRegressiveBuilder &AutoRegressiveBuilder::withSeasonalDifferencing(int D) {
	D_ = D;
	return *this;
}

AutoRegressiveBuilder &AutoRegressiveBuilder::withSeasonalPeriod(int s) {
	s_ = s;
	return *this;
}

std::unique_ptr<AutoRegressive> AutoRegressiveBuilder::build() {
	return std::unique_ptr<AutoRegressive>(new AutoRegressive(p_, d_, D_, s_));
}

} // namespace demandlens::models
