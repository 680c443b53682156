#include "demandlens/quality/report.hpp"
#include "demandlens/core/errors.hpp"
#include "demandlens/utils/logging.hpp"

#include <iomanip>
#include <sstream>

namespace demandlens::quality {

namespace {

constexpr double kHighMape = 20.0;
constexpr double kElevatedMape = 10.0;

} // namespace

ModelPerformanceReport ReportAssembler::assemble(const std::string &model_id, const std::string &model_type,
                                                 const core::TimePoint &start, const core::TimePoint &end,
                                                 const std::vector<PredictionRecord> &evaluation,
                                                 const DegradationAssessment &degradation) const {
	ModelPerformanceReport report;
	report.model_id = model_id;
	report.model_type = model_type;
	report.period.start = start;
	report.period.end = end;
	report.period.total_predictions = evaluation.size();
	report.degradation = degradation;

	const auto records = actualized(evaluation);
	report.period.actualized_predictions = records.size();

	try {
		report.accuracy = computeAccuracyMetrics(records);
		report.bias = analyzeBias(records);
	} catch (const core::NoDataError &e) {
		DEMANDLENS_WARN("No metrics for model {}: {}", model_id, e.what());
		report.metrics_available = false;
		report.accuracy = AccuracyMetrics();
		report.bias = BiasAnalysis();
	}
	report.trend = analyzeTrend(records);
	report.confidence = analyzeConfidence(records);

	annotate(report);
	DEMANDLENS_INFO("Performance report for model {}: {} of {} predictions actualized, {} alerts", model_id,
	                report.period.actualized_predictions, report.period.total_predictions, report.alerts.size());
	return report;
}

void ReportAssembler::annotate(ModelPerformanceReport &report) {
	auto &recommendations = report.recommendations;
	auto &alerts = report.alerts;

	if (!report.metrics_available) {
		recommendations.push_back("Not enough actualized predictions to evaluate the model - record actual values");
		alerts.push_back({"insufficient_data", Severity::Low, "No actualized predictions in the evaluation period",
		                  "Record actual outcomes for recent predictions"});
	} else if (report.accuracy.mape > kHighMape) {
		recommendations.push_back("High MAPE (>20%) - consider retraining the model with more data");
		alerts.push_back({"high_mape", Severity::High, "Low model accuracy with MAPE > 20%",
		                  "Model retraining recommended"});
	} else if (report.accuracy.mape > kElevatedMape) {
		recommendations.push_back("Elevated MAPE (>10%) - monitor model performance regularly");
	}

	if (report.metrics_available && report.bias.significant_bias) {
		const std::string direction = toString(report.bias.direction);
		recommendations.push_back("Significant bias detected (" + direction +
		                          ") - review feature engineering or model configuration");
		alerts.push_back({"significant_bias", Severity::Medium, "Model shows significant " + direction + " bias",
		                  "Review and correct the model bias"});
	}

	if (report.confidence.calibration == Calibration::Overconfident) {
		recommendations.push_back("Model is overconfident - prediction intervals are too narrow for the observed accuracy");
	} else if (report.confidence.calibration == Calibration::Underconfident) {
		recommendations.push_back("Model is underconfident - prediction intervals are wider than needed");
	}

	if (report.degradation.is_detected) {
		std::ostringstream message;
		message << "Performance degradation detected: " << std::fixed << std::setprecision(1)
		        << report.degradation.degradation_rate << "%";
		alerts.push_back({"performance_degradation", report.degradation.severity, message.str(),
		                  report.degradation.triggers_retraining ? "Model retraining recommended"
		                                                         : "Monitor the model more closely"});
	}
}

} // namespace demandlens::quality
