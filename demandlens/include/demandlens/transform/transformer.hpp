#pragma once

#include <vector>

namespace demandlens::transform {

class Transformer {
public:
	virtual ~Transformer() = default;

	virtual void fit(const std::vector<double> &data) = 0;
	virtual void transform(std::vector<double> &data) const = 0;
	virtual void inverseTransform(std::vector<double> &data) const = 0;

	virtual void fitTransform(std::vector<double> &data) {
		fit(data);
		transform(data);
	}
};

/**
 * @class Log
 * @brief Natural log transform for strictly positive series.
 *
 * fit() rejects series with non-positive values, so transform() and
 * inverseTransform() are exact inverses on the fitted domain.
 */
class Log final : public Transformer {
public:
	Log() = default;

	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

	/**
	 * @brief Heuristic used by the seasonal adjustment: log when the series is
	 * strictly positive and either CV > 0.5 or |skewness| > 1.
	 */
	static bool isRecommended(const std::vector<double> &data);
};

} // namespace demandlens::transform
