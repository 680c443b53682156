#pragma once

#include "demandlens/core/time_series.hpp"
#include "demandlens/utils/logging.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace demandlens::seasonality {

/**
 * @struct DecompositionResult
 * @brief Additive trend / seasonal / remainder split of a series.
 *
 * trend[i] + seasonal[i] + remainder[i] reproduces the input value. The
 * strengths are clamped to [0, 1]; the raw ratios (which go negative when the
 * remainder dominates) are kept for diagnostics.
 */
struct DecompositionResult {
	std::vector<double> trend;
	std::vector<double> seasonal;
	std::vector<double> remainder;
	double seasonal_strength = 0.0;
	double trend_strength = 0.0;
	double raw_seasonal_strength = 0.0;
	double raw_trend_strength = 0.0;
	std::size_t iterations = 0;
};

class STLDecomposition {
public:
	static constexpr std::size_t kMaxIterations = 15;

	class Builder {
	public:
		Builder &withPeriod(std::size_t period);
		Builder &withSeasonalSmoother(std::size_t window);
		Builder &withTrendSmoother(std::size_t window);
		Builder &withLowPassSmoother(std::size_t window);
		Builder &withIterations(std::size_t iterations);
		Builder &withRobust(bool robust);
		STLDecomposition build() const;

	private:
		std::size_t period_ = 12;
		std::size_t seasonal_smoother_ = 7;
		std::optional<std::size_t> trend_smoother_;
		std::optional<std::size_t> low_pass_smoother_;
		std::optional<std::size_t> iterations_;
		bool robust_ = true;
	};

	static Builder builder();

	/**
	 * @param trend_smoother Defaults to the smallest odd integer >= 1.5 * period / (1 - 1.5 / seasonal_smoother).
	 * @param low_pass_smoother Defaults to the period.
	 * @param iterations Defaults to 15 when robust, 2 otherwise; never more than 15.
	 */
	explicit STLDecomposition(std::size_t seasonal_period, std::size_t seasonal_smoother = 7,
	                          std::optional<std::size_t> trend_smoother = std::nullopt,
	                          std::optional<std::size_t> low_pass_smoother = std::nullopt,
	                          std::optional<std::size_t> iterations = std::nullopt, bool robust = true);

	/**
	 * @throws core::InsufficientDataError If the series has fewer than two full periods.
	 */
	void fit(const core::TimeSeries &ts);
	void fit(const std::vector<double> &data);

	const std::vector<double> &trend() const {
		return result_.trend;
	}
	const std::vector<double> &seasonal() const {
		return result_.seasonal;
	}
	const std::vector<double> &remainder() const {
		return result_.remainder;
	}
	const DecompositionResult &result() const;

	double seasonalStrength() const;
	double trendStrength() const;

	std::size_t seasonalPeriod() const {
		return seasonal_period_;
	}
	std::size_t trendSmoother() const {
		return trend_smoother_;
	}
	std::size_t iterations() const {
		return iterations_;
	}

private:
	std::vector<double> smoothCycleSubseries(const std::vector<double> &detrended,
	                                         const std::vector<double> &weights) const;
	std::vector<double> lowPass(const std::vector<double> &values) const;
	// Bisquare weights (1 - u^2)^2 with u = |r| / (6 * median(|r|)). The scale is the
	// median of the absolute remainders (Cleveland et al. 1990), not the MAD about the
	// remainder median; the two coincide when the remainder is centred on zero.
	static std::vector<double> robustnessWeights(const std::vector<double> &remainder);

	std::size_t seasonal_period_;
	std::size_t seasonal_smoother_;
	std::size_t trend_smoother_;
	std::size_t low_pass_smoother_;
	std::size_t iterations_;
	bool robust_;

	DecompositionResult result_;
};

} // namespace demandlens::seasonality
