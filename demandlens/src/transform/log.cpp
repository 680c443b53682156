#include "demandlens/transform/transformer.hpp"
#include "demandlens/utils/numeric.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace demandlens::transform {

void Log::fit(const std::vector<double> &data) {
	for (double value : data) {
		if (!(value > 0.0)) {
			throw std::invalid_argument("Log transform requires strictly positive values.");
		}
	}
}

void Log::transform(std::vector<double> &data) const {
	for (double &value : data) {
		if (std::isnan(value) || value <= 0.0) {
			continue;
		}
		value = std::log(value);
	}
}

void Log::inverseTransform(std::vector<double> &data) const {
	for (double &value : data) {
		if (std::isnan(value)) {
			continue;
		}
		value = std::exp(value);
	}
}

bool Log::isRecommended(const std::vector<double> &data) {
	if (data.empty() || std::any_of(data.begin(), data.end(), [](double v) { return !(v > 0.0); })) {
		return false;
	}
	return utils::numeric::coefficientOfVariation(data) > 0.5 || std::abs(utils::numeric::skewness(data)) > 1.0;
}

} // namespace demandlens::transform
