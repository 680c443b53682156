#include <catch2/catch.hpp>
#include <chrono>
#include <vector>

#include "common/prediction_helpers.hpp"
#include "demandlens/quality/calibration.hpp"

using namespace demandlens::quality;
using tests::helpers::makeRecord;
using tests::helpers::referenceNow;

namespace {

/// Ten records at the given confidence; the first @p inside actuals fall within [90, 110].
std::vector<PredictionRecord> intervalRecords(int inside, double confidence) {
	std::vector<PredictionRecord> records;
	for (int i = 0; i < 10; ++i) {
		auto record = makeRecord(referenceNow() - std::chrono::hours{24} * (10 - i), 100.0,
		                         i < inside ? 105.0 : 130.0, confidence);
		record.lower_bound = 90.0;
		record.upper_bound = 110.0;
		records.push_back(record);
	}
	return records;
}

std::vector<PredictionRecord> paths(const std::vector<double> &forecast, const std::vector<double> &actual) {
	std::vector<PredictionRecord> records;
	for (std::size_t i = 0; i < forecast.size(); ++i) {
		records.push_back(makeRecord(referenceNow() - std::chrono::hours{24} * static_cast<int>(forecast.size() - i),
		                             forecast[i], actual[i]));
	}
	return records;
}

} // namespace

TEST_CASE("Confidence calibration", "[quality][calibration]") {
	SECTION("Coverage matching the stated level") {
		const auto analysis = analyzeConfidence(intervalRecords(9, 0.9));
		REQUIRE(analysis.within_confidence_interval == Catch::Detail::Approx(0.9));
		REQUIRE(analysis.average_confidence_level == Catch::Detail::Approx(0.9));
		REQUIRE(analysis.calibration == Calibration::WellCalibrated);
		REQUIRE(analysis.confidence_accuracy == Catch::Detail::Approx(1.0));
	}

	SECTION("Intervals too narrow") {
		const auto analysis = analyzeConfidence(intervalRecords(5, 0.9));
		REQUIRE(analysis.calibration == Calibration::Overconfident);
		REQUIRE(analysis.confidence_accuracy == Catch::Detail::Approx(0.6));
	}

	SECTION("Intervals too wide") {
		const auto analysis = analyzeConfidence(intervalRecords(10, 0.5));
		REQUIRE(analysis.calibration == Calibration::Underconfident);
		REQUIRE(analysis.confidence_accuracy == Catch::Detail::Approx(0.5));
	}

	SECTION("Records without bounds count as misses") {
		auto records = intervalRecords(10, 0.9);
		records[0].upper_bound.reset();
		const auto analysis = analyzeConfidence(records);
		REQUIRE(analysis.within_confidence_interval == Catch::Detail::Approx(0.9));
		REQUIRE(analysis.calibration == Calibration::WellCalibrated);
	}

	SECTION("Nothing actualized") {
		const auto analysis = analyzeConfidence({makeRecord(referenceNow(), 1.0, std::nullopt)});
		REQUIRE(analysis.calibration == Calibration::Unknown);
		REQUIRE(analysis.within_confidence_interval == 0.0);
	}
}

TEST_CASE("Trend alignment", "[quality][trend]") {
	SECTION("Identical movements are excellent") {
		const auto analysis = analyzeTrend(paths({100, 104, 103, 110, 115}, {98, 102, 101, 108, 113}));
		REQUIRE(analysis.forecast_trend == TrendDirection::Increasing);
		REQUIRE(analysis.actual_trend == TrendDirection::Increasing);
		REQUIRE(analysis.alignment == TrendAlignment::Excellent);
		REQUIRE(analysis.trend_accuracy == Catch::Detail::Approx(1.0));
	}

	SECTION("Same direction with unrelated steps is good") {
		const auto analysis = analyzeTrend(paths({100, 110, 120, 130, 140}, {100, 125, 122, 150, 149}));
		REQUIRE(analysis.forecast_trend == TrendDirection::Increasing);
		REQUIRE(analysis.actual_trend == TrendDirection::Increasing);
		REQUIRE(analysis.alignment == TrendAlignment::Good);
		REQUIRE(analysis.trend_accuracy == Catch::Detail::Approx(0.5));
	}

	SECTION("Opposite directions are poor") {
		const auto analysis = analyzeTrend(paths({100, 110, 120, 130}, {130, 120, 110, 100}));
		REQUIRE(analysis.actual_trend == TrendDirection::Decreasing);
		REQUIRE(analysis.alignment == TrendAlignment::Poor);
		REQUIRE(analysis.trend_accuracy == 0.0);
	}

	SECTION("Flat paths are stable") {
		const auto analysis = analyzeTrend(paths({50, 50, 50}, {50, 50, 50}));
		REQUIRE(analysis.forecast_trend == TrendDirection::Stable);
		REQUIRE(analysis.actual_trend == TrendDirection::Stable);
		REQUIRE(analysis.alignment == TrendAlignment::Good);
	}

	SECTION("A single record cannot show a trend") {
		const auto analysis = analyzeTrend(paths({50}, {60}));
		REQUIRE(analysis.forecast_trend == TrendDirection::Stable);
		REQUIRE(analysis.alignment == TrendAlignment::Poor);
		REQUIRE(analysis.trend_accuracy == 0.0);
	}
}

TEST_CASE("Calibration enum names", "[quality][calibration]") {
	REQUIRE(toString(Calibration::WellCalibrated) == "well_calibrated");
	REQUIRE(toString(TrendDirection::Stable) == "stable");
	REQUIRE(toString(TrendAlignment::Excellent) == "excellent");
}
