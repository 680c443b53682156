#include <catch2/catch.hpp>
#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include "common/prediction_helpers.hpp"
#include "demandlens/quality/report.hpp"

using namespace demandlens::quality;
using tests::helpers::dailyHistory;
using tests::helpers::makeRecord;
using tests::helpers::referenceNow;

namespace {

const Alert *findAlert(const ModelPerformanceReport &report, const std::string &type) {
	const auto it = std::find_if(report.alerts.begin(), report.alerts.end(),
	                             [&](const Alert &alert) { return alert.type == type; });
	return it == report.alerts.end() ? nullptr : &*it;
}

bool hasRecommendation(const ModelPerformanceReport &report, const std::string &prefix) {
	return std::any_of(report.recommendations.begin(), report.recommendations.end(),
	                   [&](const std::string &text) { return text.rfind(prefix, 0) == 0; });
}

std::vector<PredictionRecord> withBounds(std::vector<PredictionRecord> records, double confidence) {
	for (auto &record : records) {
		record.confidence = confidence;
		record.lower_bound = *record.actual_value * 0.5;
		record.upper_bound = *record.actual_value * 1.5;
	}
	return records;
}

} // namespace

TEST_CASE("Report of a healthy model", "[quality][report]") {
	const auto now = referenceNow();
	auto records = withBounds(dailyHistory(now, 6, 0, 0.01), 0.95);
	records.push_back(makeRecord(now, 100.0, std::nullopt));

	const auto report = ReportAssembler().assemble("m1", "prophet", now - std::chrono::hours{7 * 24}, now, records,
	                                               DegradationAssessment());

	REQUIRE(report.model_id == "m1");
	REQUIRE(report.model_type == "prophet");
	REQUIRE(report.metrics_available);
	REQUIRE(report.period.total_predictions == 8);
	REQUIRE(report.period.actualized_predictions == 7);
	REQUIRE(report.accuracy.mape == Catch::Detail::Approx(1.0));
	REQUIRE(report.bias.direction == BiasDirection::Neutral);
	REQUIRE(report.confidence.calibration == Calibration::WellCalibrated);
	REQUIRE(report.alerts.empty());
	REQUIRE(report.recommendations.empty());
}

TEST_CASE("Report alerts on high error and bias", "[quality][report]") {
	const auto now = referenceNow();
	const auto report = ReportAssembler().assemble("m2", "arima", now - std::chrono::hours{7 * 24}, now,
	                                               dailyHistory(now, 6, 0, 0.25), DegradationAssessment());

	const auto *high = findAlert(report, "high_mape");
	REQUIRE(high != nullptr);
	REQUIRE(high->severity == Severity::High);
	REQUIRE(hasRecommendation(report, "High MAPE (>20%)"));
	REQUIRE_FALSE(hasRecommendation(report, "Elevated MAPE"));

	const auto *bias = findAlert(report, "significant_bias");
	REQUIRE(bias != nullptr);
	REQUIRE(bias->severity == Severity::Medium);
	REQUIRE(bias->message == "Model shows significant overforecast bias");
	REQUIRE(hasRecommendation(report, "Significant bias detected (overforecast)"));

	// No bounds were recorded, so every interval misses.
	REQUIRE(report.confidence.calibration == Calibration::Overconfident);
	REQUIRE(hasRecommendation(report, "Model is overconfident"));
}

TEST_CASE("Report recommends monitoring for elevated error", "[quality][report]") {
	const auto now = referenceNow();
	std::vector<PredictionRecord> records;
	for (int days_ago = 6; days_ago >= 0; --days_ago) {
		const double predicted = days_ago % 2 == 0 ? 112.0 : 88.0;
		records.push_back(makeRecord(now - std::chrono::hours{24} * days_ago, predicted, 100.0));
	}
	const auto report = ReportAssembler().assemble("m3", "ets", now - std::chrono::hours{7 * 24}, now,
	                                               withBounds(records, 0.95), DegradationAssessment());

	REQUIRE(report.accuracy.mape == Catch::Detail::Approx(12.0));
	REQUIRE(hasRecommendation(report, "Elevated MAPE (>10%)"));
	REQUIRE(findAlert(report, "high_mape") == nullptr);
	REQUIRE(findAlert(report, "significant_bias") == nullptr);
	REQUIRE(report.alerts.empty());
}

TEST_CASE("Report without actualized predictions", "[quality][report]") {
	const auto now = referenceNow();
	const std::vector<PredictionRecord> pending{makeRecord(now, 10.0, std::nullopt),
	                                            makeRecord(now - std::chrono::hours{24}, 12.0, std::nullopt)};
	const auto report =
	    ReportAssembler().assemble("m4", "lstm", now - std::chrono::hours{48}, now, pending, DegradationAssessment());

	REQUIRE_FALSE(report.metrics_available);
	REQUIRE(report.period.total_predictions == 2);
	REQUIRE(report.period.actualized_predictions == 0);
	REQUIRE(report.accuracy.mape == 0.0);
	REQUIRE(report.confidence.calibration == Calibration::Unknown);

	const auto *alert = findAlert(report, "insufficient_data");
	REQUIRE(alert != nullptr);
	REQUIRE(alert->severity == Severity::Low);
	REQUIRE(report.alerts.size() == 1);
}

TEST_CASE("Report carries the degradation assessment", "[quality][report]") {
	const auto now = referenceNow();
	const DegradationDetector detector;

	SECTION("Retraining degradation") {
		const auto report = ReportAssembler().assemble("m5", "prophet", now - std::chrono::hours{7 * 24}, now,
		                                               withBounds(dailyHistory(now, 6, 0, 0.01), 0.95),
		                                               detector.classify(13.0, 10.0));
		const auto *alert = findAlert(report, "performance_degradation");
		REQUIRE(alert != nullptr);
		REQUIRE(alert->severity == Severity::High);
		REQUIRE(alert->message == "Performance degradation detected: 30.0%");
		REQUIRE(alert->action_required == "Model retraining recommended");
		REQUIRE(report.degradation.triggers_retraining);
	}

	SECTION("Low degradation only asks for monitoring") {
		const auto report = ReportAssembler().assemble("m5", "prophet", now - std::chrono::hours{7 * 24}, now,
		                                               withBounds(dailyHistory(now, 6, 0, 0.01), 0.95),
		                                               detector.classify(10.6, 10.0));
		const auto *alert = findAlert(report, "performance_degradation");
		REQUIRE(alert != nullptr);
		REQUIRE(alert->severity == Severity::Low);
		REQUIRE(alert->action_required == "Monitor the model more closely");
	}
}
