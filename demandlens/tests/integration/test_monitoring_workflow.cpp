#include <catch2/catch.hpp>
#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "common/prediction_helpers.hpp"
#include "common/time_series_helpers.hpp"
#include "demandlens/quality/monitor.hpp"
#include "demandlens/seasonality/decomposer.hpp"

using namespace demandlens;
using tests::helpers::referenceNow;

namespace {

constexpr std::size_t kDays = 60;
constexpr std::size_t kShockStart = 53; // 6 days before the reference date

struct DemandScenario {
	std::vector<core::TimePoint> timestamps;
	std::vector<double> actual;
	std::vector<quality::PredictionRecord> predictions;
};

// Weekly demand cycle, forecast with a seasonal naive model; demand jumps by 30% during the last week.
DemandScenario weeklyDemandWithShock() {
	DemandScenario scenario;
	const auto base = tests::helpers::add(tests::helpers::sineSeries(kDays, 7.0, 10.0, 100.0),
	                                      tests::helpers::wiggle(kDays, 0.5));
	for (std::size_t t = 0; t < kDays; ++t) {
		scenario.timestamps.push_back(referenceNow() - std::chrono::hours{24} * static_cast<int>(kDays - 1 - t));
		scenario.actual.push_back(t >= kShockStart ? base[t] * 1.3 : base[t]);
	}
	for (std::size_t t = 7; t < kDays; ++t) {
		auto record = tests::helpers::makeRecord(scenario.timestamps[t], scenario.actual[t - 7], scenario.actual[t]);
		record.lower_bound = record.predicted_value * 0.9;
		record.upper_bound = record.predicted_value * 1.1;
		scenario.predictions.push_back(record);
	}
	return scenario;
}

} // namespace

TEST_CASE("Weekly demand is decomposed before the shock", "[integration]") {
	const auto scenario = weeklyDemandWithShock();
	const std::vector<double> calm(scenario.actual.begin(), scenario.actual.begin() + 49);
	const core::TimeSeries series(std::vector<core::TimePoint>(scenario.timestamps.begin(),
	                                                           scenario.timestamps.begin() + 49),
	                              calm);

	seasonality::DecompositionParams params;
	params.seasonal_period = 7;
	const auto stl = std::get<seasonality::DecompositionResult>(seasonality::decompose(series, params));
	REQUIRE(stl.seasonal_strength > 0.8);

	params.algorithm = seasonality::Algorithm::Fourier;
	const auto components = std::get<std::vector<seasonality::FourierComponent>>(seasonality::decompose(series, params));
	REQUIRE_FALSE(components.empty());
	REQUIRE(components.front().period == Catch::Detail::Approx(7.0));
}

TEST_CASE("A demand shock degrades the model and triggers retraining", "[integration]") {
	const auto scenario = weeklyDemandWithShock();
	auto history = std::make_shared<tests::helpers::InMemoryHistory>();
	history->addModel("weekly-naive", "seasonal_naive", scenario.predictions);
	auto sink = std::make_shared<tests::helpers::CollectingSink>();
	auto cache = std::make_shared<utils::InMemoryResultCache<quality::ModelPerformanceReport>>();

	const quality::AccuracyMonitor monitor(history, quality::AccuracyMonitor::Options(), sink, cache);
	const auto report = monitor.buildPerformanceReport("weekly-naive", std::chrono::hours{6 * 24}, referenceNow());

	REQUIRE(report.metrics_available);
	REQUIRE(report.period.actualized_predictions == 7);
	REQUIRE(report.accuracy.mape == Catch::Detail::Approx(100.0 * 0.3 / 1.3).margin(1.5));
	REQUIRE(report.bias.direction == quality::BiasDirection::Underforecast);
	REQUIRE(report.bias.significant_bias);

	REQUIRE(report.degradation.is_detected);
	REQUIRE(report.degradation.severity == quality::Severity::High);
	REQUIRE(*report.degradation.baseline_mape < 1.5);

	REQUIRE(sink->triggers.size() == 1);
	REQUIRE(sink->triggers.front().priority == quality::TriggerPriority::Critical);

	const auto has_alert = [&](const std::string &type) {
		return std::any_of(report.alerts.begin(), report.alerts.end(),
		                   [&](const quality::Alert &alert) { return alert.type == type; });
	};
	REQUIRE(has_alert("high_mape"));
	REQUIRE(has_alert("significant_bias"));
	REQUIRE(has_alert("performance_degradation"));

	// Served from the cache: no new trigger is emitted.
	monitor.buildPerformanceReport("weekly-naive", std::chrono::hours{6 * 24}, referenceNow());
	REQUIRE(sink->triggers.size() == 1);
}
