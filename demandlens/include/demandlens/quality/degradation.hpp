#pragma once

#include "demandlens/quality/prediction.hpp"
#include "demandlens/utils/logging.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace demandlens::quality {

enum class Severity { Low, Medium, High };
enum class TriggerType { AccuracyDegradation, BiasDrift, DataDrift, TimeBased, Manual };
enum class TriggerPriority { Low, Medium, High, Critical };

std::string toString(Severity severity);
std::string toString(TriggerType type);
std::string toString(TriggerPriority priority);

/**
 * @struct RetrainingTrigger
 * @brief Request to retrain a model, handed to a RetrainingSink.
 */
struct RetrainingTrigger {
	std::string model_id;
	TriggerType type = TriggerType::AccuracyDegradation;
	double trigger_value = 0.0;
	double threshold = 0.0;
	std::string description;
	TriggerPriority priority = TriggerPriority::Medium;
	std::string recommended_action;
};

/**
 * @class RetrainingSink
 * @brief Receives retraining triggers; delivery is up to the implementation.
 */
class RetrainingSink {
public:
	virtual ~RetrainingSink() = default;
	virtual void publish(const RetrainingTrigger &trigger) = 0;
};

struct DegradationAssessment {
	bool is_detected = false;
	Severity severity = Severity::Low;
	/// MAPE increase of the recent window over the baseline, in percent.
	double degradation_rate = 0.0;
	bool triggers_retraining = false;
	std::optional<double> recent_mape;
	std::optional<double> baseline_mape;
	/// Set when either window had no actualized records.
	bool insufficient_data = false;
	std::optional<RetrainingTrigger> trigger;
};

struct TimeWindow {
	core::TimePoint start;
	core::TimePoint end;
};

struct DegradationConfig {
	std::chrono::hours recent_window {7 * 24};
	std::chrono::hours baseline_window {30 * 24};
	/// Gap between the end of the baseline and the start of the recent window.
	std::chrono::hours baseline_gap {24};
	double high_threshold = 20.0;
	double medium_threshold = 10.0;
	/// Medium degradations only trigger retraining above this rate.
	double medium_retrain_threshold = 15.0;
	double low_threshold = 5.0;
};

/**
 * @class DegradationDetector
 * @brief Compares the MAPE of a recent window with a preceding baseline window.
 *
 * Rates above 20% are high severity and trigger retraining, above 10% medium
 * (triggering only above 15%), above 5% low. A window without actualized
 * records yields "not detected" instead of an error.
 */
class DegradationDetector {
public:
	using Config = DegradationConfig;

	explicit DegradationDetector(Config config = Config(), std::shared_ptr<RetrainingSink> sink = nullptr);

	/**
	 * @param history Prediction records of the model; only those inside the two windows are used.
	 * @param now End of the recent window.
	 */
	DegradationAssessment assess(const std::string &model_id, const std::vector<PredictionRecord> &history,
	                             const core::TimePoint &now) const;

	/// Classification of a pair of MAPE values; emits no trigger.
	DegradationAssessment classify(double recent_mape, double baseline_mape) const;

	TimeWindow recentWindow(const core::TimePoint &now) const;
	TimeWindow baselineWindow(const core::TimePoint &now) const;

	const Config &config() const {
		return config_;
	}

private:
	Config config_;
	std::shared_ptr<RetrainingSink> sink_;
};

} // namespace demandlens::quality
