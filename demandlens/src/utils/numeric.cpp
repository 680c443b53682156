#include "demandlens/utils/numeric.hpp"
#include "demandlens/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

namespace demandlens::utils::numeric {

namespace {

constexpr double kPivotTolerance = 1e-12;

void validate_pair(const std::vector<double> &x, const std::vector<double> &y) {
	if (x.size() != y.size() || x.empty()) {
		throw std::invalid_argument("Inputs must be non-empty and equal length.");
	}
}

double tricube(double u) {
	if (u >= 1.0) {
		return 0.0;
	}
	const double t = 1.0 - u * u * u;
	return t * t * t;
}

} // namespace

LinearFit linearRegression(const std::vector<double> &x, const std::vector<double> &y) {
	validate_pair(x, y);
	const double n = static_cast<double>(x.size());
	const double mean_x = std::accumulate(x.begin(), x.end(), 0.0) / n;
	const double mean_y = std::accumulate(y.begin(), y.end(), 0.0) / n;

	double sxx = 0.0;
	double sxy = 0.0;
	for (std::size_t i = 0; i < x.size(); ++i) {
		const double dx = x[i] - mean_x;
		sxx += dx * dx;
		sxy += dx * (y[i] - mean_y);
	}
	if (sxx <= std::numeric_limits<double>::epsilon() * std::max(1.0, std::abs(mean_x))) {
		throw core::DegenerateInputError("Linear regression requires a non-constant regressor.");
	}

	LinearFit fit;
	fit.slope = sxy / sxx;
	fit.intercept = mean_y - fit.slope * mean_x;
	return fit;
}

LinearFit linearRegression(const std::vector<double> &y) {
	std::vector<double> x(y.size());
	std::iota(x.begin(), x.end(), 0.0);
	return linearRegression(x, y);
}

Detrended detrend(const std::vector<double> &y) {
	Detrended result;
	result.fit = linearRegression(y);
	result.residuals.resize(y.size());
	for (std::size_t i = 0; i < y.size(); ++i) {
		result.residuals[i] = y[i] - result.fit.at(static_cast<double>(i));
	}
	return result;
}

std::vector<double> movingAverage(const std::vector<double> &series, std::size_t window) {
	if (window == 0) {
		throw std::invalid_argument("Moving average window must be positive.");
	}
	const std::size_t n = series.size();
	std::vector<double> result(n, 0.0);
	if (n == 0) {
		return result;
	}

	// Prefix sums keep the pass linear for wide windows.
	std::vector<double> prefix(n + 1, 0.0);
	for (std::size_t i = 0; i < n; ++i) {
		prefix[i + 1] = prefix[i] + series[i];
	}

	const std::size_t left = window / 2;
	const std::size_t right = window - 1 - left;
	for (std::size_t i = 0; i < n; ++i) {
		const std::size_t lo = i >= left ? i - left : 0;
		const std::size_t hi = std::min(n - 1, i + right);
		result[i] = (prefix[hi + 1] - prefix[lo]) / static_cast<double>(hi - lo + 1);
	}
	return result;
}

std::vector<double> loessSmoothSpan(const std::vector<double> &series, std::size_t span,
                                    const std::vector<double> &robustness_weights) {
	const std::size_t n = series.size();
	if (!robustness_weights.empty() && robustness_weights.size() != n) {
		throw std::invalid_argument("Robustness weights must match the series length.");
	}
	std::vector<double> smoothed(n, 0.0);
	if (n == 0) {
		return smoothed;
	}
	if (n == 1) {
		smoothed[0] = series[0];
		return smoothed;
	}

	const double h = static_cast<double>(std::max<std::size_t>(span, 1));
	const std::size_t reach = static_cast<std::size_t>(h);

	for (std::size_t i = 0; i < n; ++i) {
		const std::size_t lo = i >= reach ? i - reach : 0;
		const std::size_t hi = std::min(n - 1, i + reach);

		double sw = 0.0;
		double swx = 0.0;
		double swy = 0.0;
		double swxx = 0.0;
		double swxy = 0.0;
		for (std::size_t j = lo; j <= hi; ++j) {
			const double x = static_cast<double>(j) - static_cast<double>(i);
			double w = tricube(std::abs(x) / h);
			if (!robustness_weights.empty()) {
				w *= robustness_weights[j];
			}
			if (w <= 0.0) {
				continue;
			}
			sw += w;
			swx += w * x;
			swy += w * series[j];
			swxx += w * x * x;
			swxy += w * x * series[j];
		}

		if (sw <= 0.0) {
			smoothed[i] = series[i];
			continue;
		}
		// Local line evaluated at x = 0 (the center point); falls back to the
		// weighted mean when the neighbourhood is a single effective point.
		const double denom = sw * swxx - swx * swx;
		if (std::abs(denom) <= 1e-12 * std::max(1.0, sw * swxx)) {
			smoothed[i] = swy / sw;
		} else {
			smoothed[i] = (swxx * swy - swx * swxy) / denom;
		}
	}
	return smoothed;
}

std::vector<double> loessSmooth(const std::vector<double> &series, double bandwidth,
                                const std::vector<double> &robustness_weights) {
	if (!(bandwidth > 0.0) || bandwidth > 1.0) {
		throw std::invalid_argument("Loess bandwidth must be in (0, 1].");
	}
	const auto span = static_cast<std::size_t>(std::ceil(bandwidth * static_cast<double>(series.size())));
	return loessSmoothSpan(series, span, robustness_weights);
}

double mean(const std::vector<double> &values) {
	if (values.empty()) {
		return 0.0;
	}
	return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double median(std::vector<double> values) {
	if (values.empty()) {
		throw std::invalid_argument("Cannot compute median of empty vector");
	}
	const std::size_t mid = values.size() / 2;
	std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
	const double upper = values[mid];
	if (values.size() % 2 == 1) {
		return upper;
	}
	const double lower = *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid));
	return (lower + upper) / 2.0;
}

double medianAbsoluteDeviation(const std::vector<double> &values) {
	const double med = median(values);
	std::vector<double> deviations;
	deviations.reserve(values.size());
	for (double v : values) {
		deviations.push_back(std::abs(v - med));
	}
	return median(std::move(deviations));
}

double variance(const std::vector<double> &values) {
	if (values.empty()) {
		return 0.0;
	}
	const double m = mean(values);
	double accum = 0.0;
	for (double v : values) {
		const double diff = v - m;
		accum += diff * diff;
	}
	return accum / static_cast<double>(values.size());
}

double covariance(const std::vector<double> &x, const std::vector<double> &y) {
	validate_pair(x, y);
	const double mx = mean(x);
	const double my = mean(y);
	double accum = 0.0;
	for (std::size_t i = 0; i < x.size(); ++i) {
		accum += (x[i] - mx) * (y[i] - my);
	}
	return accum / static_cast<double>(x.size());
}

double correlation(const std::vector<double> &x, const std::vector<double> &y) {
	validate_pair(x, y);
	const double vx = variance(x);
	const double vy = variance(y);
	if (vx <= 0.0 || vy <= 0.0) {
		return 0.0;
	}
	const double r = covariance(x, y) / std::sqrt(vx * vy);
	return std::clamp(r, -1.0, 1.0);
}

double skewness(const std::vector<double> &values) {
	const double var = variance(values);
	if (var <= 0.0) {
		return 0.0;
	}
	const double m = mean(values);
	double accum = 0.0;
	for (double v : values) {
		const double d = v - m;
		accum += d * d * d;
	}
	return (accum / static_cast<double>(values.size())) / std::pow(var, 1.5);
}

double coefficientOfVariation(const std::vector<double> &values) {
	const double m = mean(values);
	if (m == 0.0) {
		return 0.0;
	}
	return std::sqrt(variance(values)) / std::abs(m);
}

Eigen::VectorXd solveLinearSystem(const Eigen::MatrixXd &A, const Eigen::VectorXd &b) {
	const Eigen::Index n = A.rows();
	if (A.cols() != n || b.size() != n) {
		throw std::invalid_argument("solveLinearSystem requires a square matrix and a matching right-hand side.");
	}
	if (n == 0) {
		return Eigen::VectorXd();
	}

	const Eigen::PartialPivLU<Eigen::MatrixXd> lu(A);
	Eigen::Index column = 0;
	const double smallest_pivot = lu.matrixLU().diagonal().cwiseAbs().minCoeff(&column);
	if (smallest_pivot < kPivotTolerance) {
		throw core::SingularSystemError("Linear system is singular (pivot collapsed at column " +
		                                std::to_string(column) + ").");
	}
	return lu.solve(b);
}

} // namespace demandlens::utils::numeric
