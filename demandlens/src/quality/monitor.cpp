#include "demandlens/quality/monitor.hpp"
#include "demandlens/core/errors.hpp"
#include "demandlens/utils/logging.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace demandlens::quality {

AccuracyMonitor::AccuracyMonitor(std::shared_ptr<const PredictionHistoryProvider> history, Options options,
                                 std::shared_ptr<RetrainingSink> sink, std::shared_ptr<ReportCache> cache)
    : history_(std::move(history)), options_(std::move(options)), detector_(options_.degradation, std::move(sink)),
      cache_(std::move(cache)) {
	if (!history_) {
		throw std::invalid_argument("AccuracyMonitor requires a prediction history provider.");
	}
}

AccuracyMetrics AccuracyMonitor::evaluateAccuracy(const std::vector<PredictionRecord> &history) const {
	return computeAccuracyMetrics(history);
}

BiasAnalysis AccuracyMonitor::analyzeBias(const std::vector<PredictionRecord> &history) const {
	return quality::analyzeBias(history);
}

std::string AccuracyMonitor::requireModelType(const std::string &model_id) const {
	auto type = history_->modelType(model_id);
	if (!type) {
		throw core::ModelNotFoundError(model_id);
	}
	return *type;
}

DegradationAssessment AccuracyMonitor::assessDegradation(const std::string &model_id,
                                                         const core::TimePoint &now) const {
	requireModelType(model_id);
	const TimeWindow baseline = detector_.baselineWindow(now);
	const auto history = history_->records(model_id, baseline.start, now);
	return detector_.assess(model_id, history, now);
}

ModelPerformanceReport AccuracyMonitor::buildPerformanceReport(const std::string &model_id,
                                                               std::chrono::hours evaluation_window,
                                                               const core::TimePoint &now) const {
	if (evaluation_window.count() <= 0) {
		throw std::invalid_argument("Evaluation window must be positive.");
	}
	const std::string model_type = requireModelType(model_id);

	const std::string cache_key = "report:" + model_id + ":" + std::to_string(evaluation_window.count()) + ":" +
	                              std::to_string(now.time_since_epoch().count());
	if (cache_) {
		if (auto cached = cache_->get(cache_key)) {
			DEMANDLENS_DEBUG("Serving cached performance report for model {}.", model_id);
			return *cached;
		}
	}

	const core::TimePoint start = now - evaluation_window;
	const auto evaluation = history_->records(model_id, start, now);
	const DegradationAssessment degradation = assessDegradation(model_id, now);
	ModelPerformanceReport report = assembler_.assemble(model_id, model_type, start, now, evaluation, degradation);

	if (cache_) {
		cache_->set(cache_key, report, options_.report_ttl);
	}
	return report;
}

} // namespace demandlens::quality
