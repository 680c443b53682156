#pragma once

#include "demandlens/quality/report.hpp"
#include "demandlens/utils/result_cache.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace demandlens::quality {

/**
 * @class PredictionHistoryProvider
 * @brief Read access to stored predictions; storage is outside this library.
 */
class PredictionHistoryProvider {
public:
	virtual ~PredictionHistoryProvider() = default;

	/// Every record of @p model_id with a timestamp in [start, end].
	virtual std::vector<PredictionRecord> records(const std::string &model_id, const core::TimePoint &start,
	                                              const core::TimePoint &end) const = 0;

	/// Model type label, or nullopt when the model is unknown.
	virtual std::optional<std::string> modelType(const std::string &model_id) const = 0;
};

struct MonitorOptions {
	DegradationConfig degradation;
	/// Lifetime of cached reports; zero disables caching.
	std::chrono::seconds report_ttl {300};
};

/**
 * @class AccuracyMonitor
 * @brief Entry point of the forecast-quality engine.
 *
 * Pulls prediction history through the provider and runs the metric, bias,
 * degradation and report stages. Retraining triggers go to the optional sink,
 * reports are memoized in the optional cache.
 */
class AccuracyMonitor {
public:
	using Options = MonitorOptions;
	using ReportCache = utils::ResultCache<ModelPerformanceReport>;

	AccuracyMonitor(std::shared_ptr<const PredictionHistoryProvider> history, Options options = Options(),
	                std::shared_ptr<RetrainingSink> sink = nullptr, std::shared_ptr<ReportCache> cache = nullptr);

	/**
	 * @throws core::NoDataError If no record is actualized.
	 */
	AccuracyMetrics evaluateAccuracy(const std::vector<PredictionRecord> &history) const;

	/**
	 * @throws core::NoDataError If no record is actualized.
	 */
	BiasAnalysis analyzeBias(const std::vector<PredictionRecord> &history) const;

	/**
	 * @brief Recent-versus-baseline comparison ending at @p now. Never throws for missing data.
	 * @throws core::ModelNotFoundError If the provider does not know the model.
	 */
	DegradationAssessment assessDegradation(const std::string &model_id, const core::TimePoint &now) const;

	/**
	 * @brief Report over [now - evaluation_window, now].
	 * @throws core::ModelNotFoundError If the provider does not know the model.
	 */
	ModelPerformanceReport buildPerformanceReport(const std::string &model_id, std::chrono::hours evaluation_window,
	                                              const core::TimePoint &now) const;

	const DegradationDetector &detector() const {
		return detector_;
	}

private:
	std::string requireModelType(const std::string &model_id) const;

	std::shared_ptr<const PredictionHistoryProvider> history_;
	Options options_;
	DegradationDetector detector_;
	std::shared_ptr<ReportCache> cache_;
	ReportAssembler assembler_;
};

} // namespace demandlens::quality
