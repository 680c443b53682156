#include "demandlens/quality/degradation.hpp"
#include "demandlens/core/errors.hpp"
#include "demandlens/quality/accuracy.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace demandlens::quality {

std::string toString(Severity severity) {
	switch (severity) {
	case Severity::Low:
		return "low";
	case Severity::Medium:
		return "medium";
	case Severity::High:
		return "high";
	}
	return "unknown";
}

std::string toString(TriggerType type) {
	switch (type) {
	case TriggerType::AccuracyDegradation:
		return "accuracy_degradation";
	case TriggerType::BiasDrift:
		return "bias_drift";
	case TriggerType::DataDrift:
		return "data_drift";
	case TriggerType::TimeBased:
		return "time_based";
	case TriggerType::Manual:
		return "manual";
	}
	return "unknown";
}

std::string toString(TriggerPriority priority) {
	switch (priority) {
	case TriggerPriority::Low:
		return "low";
	case TriggerPriority::Medium:
		return "medium";
	case TriggerPriority::High:
		return "high";
	case TriggerPriority::Critical:
		return "critical";
	}
	return "unknown";
}

DegradationDetector::DegradationDetector(Config config, std::shared_ptr<RetrainingSink> sink)
    : config_(std::move(config)), sink_(std::move(sink)) {
	if (config_.recent_window.count() <= 0 || config_.baseline_window.count() <= 0) {
		throw std::invalid_argument("Degradation windows must be positive.");
	}
	if (config_.baseline_gap.count() < 0) {
		throw std::invalid_argument("Baseline gap must not be negative.");
	}
	if (!(config_.low_threshold <= config_.medium_threshold && config_.medium_threshold <= config_.high_threshold)) {
		throw std::invalid_argument("Degradation thresholds must be ordered low <= medium <= high.");
	}
}

TimeWindow DegradationDetector::recentWindow(const core::TimePoint &now) const {
	return {now - config_.recent_window, now};
}

TimeWindow DegradationDetector::baselineWindow(const core::TimePoint &now) const {
	const core::TimePoint end = recentWindow(now).start - config_.baseline_gap;
	return {end - config_.baseline_window, end};
}

DegradationAssessment DegradationDetector::classify(double recent_mape, double baseline_mape) const {
	DegradationAssessment assessment;
	assessment.recent_mape = recent_mape;
	assessment.baseline_mape = baseline_mape;

	if (baseline_mape > 0.0) {
		assessment.degradation_rate = (recent_mape - baseline_mape) / baseline_mape * 100.0;
	} else if (recent_mape > 0.0) {
		// Any error after a perfect baseline is an unbounded relative increase.
		assessment.degradation_rate = std::numeric_limits<double>::infinity();
	}

	const double rate = assessment.degradation_rate;
	if (rate > config_.high_threshold) {
		assessment.is_detected = true;
		assessment.severity = Severity::High;
		assessment.triggers_retraining = true;
	} else if (rate > config_.medium_threshold) {
		assessment.is_detected = true;
		assessment.severity = Severity::Medium;
		assessment.triggers_retraining = rate > config_.medium_retrain_threshold;
	} else if (rate > config_.low_threshold) {
		assessment.is_detected = true;
		assessment.severity = Severity::Low;
	}
	return assessment;
}

DegradationAssessment DegradationDetector::assess(const std::string &model_id,
                                                  const std::vector<PredictionRecord> &history,
                                                  const core::TimePoint &now) const {
	const TimeWindow recent = recentWindow(now);
	const TimeWindow baseline = baselineWindow(now);

	AccuracyMetrics recent_metrics;
	AccuracyMetrics baseline_metrics;
	try {
		recent_metrics = computeAccuracyMetrics(inRange(history, recent.start, recent.end));
		baseline_metrics = computeAccuracyMetrics(inRange(history, baseline.start, baseline.end));
	} catch (const core::NoDataError &e) {
		DEMANDLENS_WARN("Performance degradation detection for model {} skipped: {}", model_id, e.what());
		DegradationAssessment assessment;
		assessment.insufficient_data = true;
		return assessment;
	}

	DegradationAssessment assessment = classify(recent_metrics.mape, baseline_metrics.mape);
	DEMANDLENS_DEBUG("Model {}: recent MAPE {:.2f}, baseline MAPE {:.2f}, rate {:.2f}%", model_id,
	                 recent_metrics.mape, baseline_metrics.mape, assessment.degradation_rate);

	if (assessment.triggers_retraining) {
		std::ostringstream description;
		description << "Model accuracy degraded by " << std::fixed << std::setprecision(1)
		            << assessment.degradation_rate << "%";

		RetrainingTrigger trigger;
		trigger.model_id = model_id;
		trigger.type = TriggerType::AccuracyDegradation;
		trigger.trigger_value = assessment.degradation_rate;
		trigger.threshold = config_.high_threshold;
		trigger.description = description.str();
		trigger.priority = assessment.severity == Severity::High ? TriggerPriority::Critical : TriggerPriority::High;
		trigger.recommended_action = "Immediate model retraining recommended";

		DEMANDLENS_WARN("Retraining trigger for model {}: {}", model_id, trigger.description);
		if (sink_) {
			sink_->publish(trigger);
		}
		assessment.trigger = std::move(trigger);
	}
	return assessment;
}

} // namespace demandlens::quality
