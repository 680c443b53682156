#pragma once

#include "demandlens/quality/accuracy.hpp"
#include "demandlens/quality/bias.hpp"
#include "demandlens/quality/calibration.hpp"
#include "demandlens/quality/degradation.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace demandlens::quality {

struct EvaluationPeriod {
	core::TimePoint start;
	core::TimePoint end;
	std::size_t total_predictions = 0;
	std::size_t actualized_predictions = 0;
};

struct Alert {
	std::string type;
	Severity severity = Severity::Low;
	std::string message;
	std::string action_required;
};

/**
 * @struct ModelPerformanceReport
 * @brief Everything known about a model over one evaluation period.
 *
 * When the period has no actualized prediction, metrics_available is false,
 * accuracy and bias are zero-valued and an insufficient_data alert is raised.
 */
struct ModelPerformanceReport {
	std::string model_id;
	std::string model_type;
	EvaluationPeriod period;
	AccuracyMetrics accuracy;
	BiasAnalysis bias;
	TrendAnalysis trend;
	ConfidenceAnalysis confidence;
	DegradationAssessment degradation;
	std::vector<std::string> recommendations;
	std::vector<Alert> alerts;
	bool metrics_available = true;
};

/**
 * @class ReportAssembler
 * @brief Assembles a ModelPerformanceReport and derives recommendations and alerts.
 */
class ReportAssembler {
public:
	/**
	 * @param evaluation Prediction records of the evaluation period.
	 * @param degradation Assessment produced by a DegradationDetector.
	 */
	ModelPerformanceReport assemble(const std::string &model_id, const std::string &model_type,
	                                const core::TimePoint &start, const core::TimePoint &end,
	                                const std::vector<PredictionRecord> &evaluation,
	                                const DegradationAssessment &degradation) const;

	/// Recommendation and alert rules, applied to an otherwise complete report.
	static void annotate(ModelPerformanceReport &report);
};

} // namespace demandlens::quality
