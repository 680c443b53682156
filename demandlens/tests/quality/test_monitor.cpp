#include <catch2/catch.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>

#include "common/prediction_helpers.hpp"
#include "demandlens/core/errors.hpp"
#include "demandlens/quality/monitor.hpp"

using namespace demandlens::quality;
using demandlens::utils::InMemoryResultCache;
using tests::helpers::CollectingSink;
using tests::helpers::concat;
using tests::helpers::dailyHistory;
using tests::helpers::InMemoryHistory;
using tests::helpers::referenceNow;

namespace {

std::shared_ptr<InMemoryHistory> degradedHistory() {
	auto history = std::make_shared<InMemoryHistory>();
	const auto now = referenceNow();
	history->addModel("m1", "prophet", concat(dailyHistory(now, 38, 8, 0.10), dailyHistory(now, 7, 0, 0.13)));
	history->addModel("stable", "ets", concat(dailyHistory(now, 38, 8, 0.05), dailyHistory(now, 7, 0, 0.05)));
	return history;
}

} // namespace

TEST_CASE("AccuracyMonitor requires a history provider", "[quality][monitor]") {
	REQUIRE_THROWS_AS(AccuracyMonitor(nullptr), std::invalid_argument);
}

TEST_CASE("AccuracyMonitor metric wrappers", "[quality][monitor]") {
	const AccuracyMonitor monitor(degradedHistory());
	const auto records = dailyHistory(referenceNow(), 9, 0, 0.2);

	REQUIRE(monitor.evaluateAccuracy(records).mape == Catch::Detail::Approx(20.0));
	REQUIRE(monitor.analyzeBias(records).direction == BiasDirection::Overforecast);
	REQUIRE_THROWS_AS(monitor.evaluateAccuracy({}), demandlens::core::NoDataError);
}

TEST_CASE("AccuracyMonitor degradation assessment", "[quality][monitor]") {
	auto sink = std::make_shared<CollectingSink>();
	const AccuracyMonitor monitor(degradedHistory(), AccuracyMonitor::Options(), sink);

	const auto assessment = monitor.assessDegradation("m1", referenceNow());
	REQUIRE(assessment.severity == Severity::High);
	REQUIRE(assessment.degradation_rate == Catch::Detail::Approx(30.0));
	REQUIRE(sink->triggers.size() == 1);
	REQUIRE(sink->triggers.front().model_id == "m1");

	REQUIRE_FALSE(monitor.assessDegradation("stable", referenceNow()).is_detected);
	REQUIRE(sink->triggers.size() == 1);

	REQUIRE_THROWS_AS(monitor.assessDegradation("unknown", referenceNow()), demandlens::core::ModelNotFoundError);
}

TEST_CASE("AccuracyMonitor builds performance reports", "[quality][monitor]") {
	const AccuracyMonitor monitor(degradedHistory());
	const auto now = referenceNow();

	const auto report = monitor.buildPerformanceReport("m1", std::chrono::hours{7 * 24}, now);
	REQUIRE(report.model_type == "prophet");
	REQUIRE(report.period.start == now - std::chrono::hours{7 * 24});
	REQUIRE(report.period.end == now);
	REQUIRE(report.period.actualized_predictions == 8);
	REQUIRE(report.accuracy.mape == Catch::Detail::Approx(13.0));
	REQUIRE(report.degradation.is_detected);

	REQUIRE_THROWS_AS(monitor.buildPerformanceReport("m1", std::chrono::hours{0}, now), std::invalid_argument);
	REQUIRE_THROWS_AS(monitor.buildPerformanceReport("missing", std::chrono::hours{24}, now),
	                  demandlens::core::ModelNotFoundError);
}

TEST_CASE("AccuracyMonitor caches reports per model and window", "[quality][monitor]") {
	auto history = degradedHistory();
	auto cache = std::make_shared<InMemoryResultCache<ModelPerformanceReport>>();
	const AccuracyMonitor monitor(history, AccuracyMonitor::Options(), nullptr, cache);
	const auto now = referenceNow();

	const auto first = monitor.buildPerformanceReport("m1", std::chrono::hours{168}, now);
	const auto calls = history->calls;
	REQUIRE(calls > 0);
	REQUIRE(cache->size() == 1);

	const auto second = monitor.buildPerformanceReport("m1", std::chrono::hours{168}, now);
	REQUIRE(history->calls == calls);
	REQUIRE(second.accuracy.mape == first.accuracy.mape);

	monitor.buildPerformanceReport("m1", std::chrono::hours{24}, now);
	REQUIRE(history->calls > calls);
	REQUIRE(cache->size() == 2);
}

TEST_CASE("AccuracyMonitor keys cached reports by evaluation end", "[quality][monitor]") {
	auto history = degradedHistory();
	auto cache = std::make_shared<InMemoryResultCache<ModelPerformanceReport>>();
	const AccuracyMonitor monitor(history, AccuracyMonitor::Options(), nullptr, cache);
	const auto now = referenceNow();
	const auto earlier = now - std::chrono::hours{10 * 24};

	const auto late = monitor.buildPerformanceReport("m1", std::chrono::hours{168}, now);
	REQUIRE(late.accuracy.mape == Catch::Detail::Approx(13.0));

	const auto early = monitor.buildPerformanceReport("m1", std::chrono::hours{168}, earlier);
	REQUIRE(cache->size() == 2);
	REQUIRE(early.period.end == earlier);
	REQUIRE(early.accuracy.mape == Catch::Detail::Approx(10.0));
}

TEST_CASE("AccuracyMonitor skips caching with a zero TTL", "[quality][monitor]") {
	auto history = degradedHistory();
	auto cache = std::make_shared<InMemoryResultCache<ModelPerformanceReport>>();
	AccuracyMonitor::Options options;
	options.report_ttl = std::chrono::seconds{0};
	const AccuracyMonitor monitor(history, options, nullptr, cache);

	monitor.buildPerformanceReport("m1", std::chrono::hours{168}, referenceNow());
	REQUIRE(cache->size() == 0);
}
