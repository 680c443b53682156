#pragma once

#include <stdexcept>
#include <string>

namespace demandlens::core {

/// The series is shorter than the minimum an algorithm needs (e.g. fewer than two seasonal cycles for STL).
class InsufficientDataError : public std::invalid_argument {
public:
	explicit InsufficientDataError(const std::string &message) : std::invalid_argument(message) {
	}
};

/// Regression input without variance in the regressor.
class DegenerateInputError : public std::invalid_argument {
public:
	explicit DegenerateInputError(const std::string &message) : std::invalid_argument(message) {
	}
};

/// No actualized (actual, predicted) pair was available for a metric.
class NoDataError : public std::invalid_argument {
public:
	explicit NoDataError(const std::string &message) : std::invalid_argument(message) {
	}
};

/**
 * @brief A pivot collapsed during Gaussian elimination.
 *
 * Raised by Yule-Walker fits on near-singular Toeplitz systems. Callers usually
 * retry with a lower autoregressive order.
 */
class SingularSystemError : public std::runtime_error {
public:
	explicit SingularSystemError(const std::string &message) : std::runtime_error(message) {
	}
};

class ModelNotFoundError : public std::out_of_range {
public:
	explicit ModelNotFoundError(const std::string &model_id) : std::out_of_range("Model " + model_id + " not found") {
	}
};

} // namespace demandlens::core
