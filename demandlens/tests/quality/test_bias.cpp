#include <catch2/catch.hpp>
#include <chrono>
#include <string>
#include <vector>

#include "common/prediction_helpers.hpp"
#include "demandlens/core/errors.hpp"
#include "demandlens/quality/bias.hpp"

using namespace demandlens::quality;
using tests::helpers::dailyHistory;
using tests::helpers::makeRecord;
using tests::helpers::referenceNow;

TEST_CASE("Constant overforecast is significant and random", "[quality][bias]") {
	const auto analysis = analyzeBias(dailyHistory(referenceNow(), 20, 1, 0.10));

	REQUIRE(analysis.overall_bias == Catch::Detail::Approx(10.0));
	REQUIRE(analysis.mean_bias == Catch::Detail::Approx(10.0));
	REQUIRE(analysis.median_bias == Catch::Detail::Approx(10.0));
	REQUIRE(analysis.direction == BiasDirection::Overforecast);
	REQUIRE(analysis.significant_bias);
	REQUIRE(analysis.pattern == BiasPattern::Random);
	REQUIRE(analysis.trend == BiasTrend::Stable);
	REQUIRE(analysis.seasonal_bias.size() == 1);
	REQUIRE(analysis.seasonal_bias.at("June") == Catch::Detail::Approx(10.0));
}

TEST_CASE("Bias direction thresholds", "[quality][bias]") {
	SECTION("Moderate underforecast") {
		const auto analysis = analyzeBias(dailyHistory(referenceNow(), 10, 1, -0.03));
		REQUIRE(analysis.direction == BiasDirection::Underforecast);
		REQUIRE_FALSE(analysis.significant_bias);
		REQUIRE(analysis.mean_bias == Catch::Detail::Approx(-3.0));
	}

	SECTION("Small errors are neutral") {
		const auto analysis = analyzeBias(dailyHistory(referenceNow(), 10, 1, 0.01));
		REQUIRE(analysis.direction == BiasDirection::Neutral);
		REQUIRE_FALSE(analysis.significant_bias);
	}
}

TEST_CASE("Errors growing over time are systematic", "[quality][bias]") {
	const auto now = referenceNow();
	std::vector<PredictionRecord> records;
	for (int i = 0; i < 14; ++i) {
		records.push_back(makeRecord(now - std::chrono::hours{24} * (14 - i), 100.0 + i, 100.0));
	}
	const auto analysis = analyzeBias(records);
	REQUIRE(analysis.pattern == BiasPattern::Systematic);
	REQUIRE(analysis.trend == BiasTrend::Increasing);
	REQUIRE(analysis.direction == BiasDirection::Overforecast);
}

TEST_CASE("Weekday-specific errors are seasonal", "[quality][bias]") {
	const auto now = referenceNow();
	std::vector<PredictionRecord> records;
	for (int days_ago = 27; days_ago >= 0; --days_ago) {
		const auto tp = now - std::chrono::hours{24} * days_ago;
		const bool sunday = demandlens::core::calendar::dayOfWeek(tp) == 0;
		records.push_back(makeRecord(tp, sunday ? 120.0 : 100.0, 100.0));
	}
	const auto analysis = analyzeBias(records);
	REQUIRE(analysis.pattern == BiasPattern::Seasonal);
	REQUIRE(analysis.trend == BiasTrend::Stable);
	REQUIRE_FALSE(analysis.significant_bias);
}

TEST_CASE("Bias grouping and edge cases", "[quality][bias]") {
	const auto now = referenceNow();

	SECTION("Custom period labels") {
		std::vector<PredictionRecord> records{
		    makeRecord(now - std::chrono::hours{24}, 110.0, 100.0),
		    makeRecord(now, 95.0, 100.0),
		};
		const auto analysis = analyzeBias(records, [&](const demandlens::core::TimePoint &tp) {
			return tp < now ? std::string("before") : std::string("after");
		});
		REQUIRE(analysis.seasonal_bias.at("before") == Catch::Detail::Approx(10.0));
		REQUIRE(analysis.seasonal_bias.at("after") == Catch::Detail::Approx(-5.0));
	}

	SECTION("Zero actuals only count towards the absolute bias") {
		std::vector<PredictionRecord> records{
		    makeRecord(now - std::chrono::hours{24}, 4.0, 0.0),
		    makeRecord(now, 110.0, 100.0),
		};
		const auto analysis = analyzeBias(records);
		REQUIRE(analysis.overall_bias == Catch::Detail::Approx(7.0));
		REQUIRE(analysis.mean_bias == Catch::Detail::Approx(10.0));
	}

	SECTION("Too few points keep the trend stable") {
		const auto analysis = analyzeBias(dailyHistory(now, 3, 0, 0.2));
		REQUIRE(analysis.trend == BiasTrend::Stable);
	}

	SECTION("Nothing actualized") {
		REQUIRE_THROWS_AS(analyzeBias({}), demandlens::core::NoDataError);
		REQUIRE_THROWS_AS(analyzeBias({makeRecord(now, 1.0, std::nullopt)}), demandlens::core::NoDataError);
	}
}

TEST_CASE("Bias enum names", "[quality][bias]") {
	REQUIRE(toString(BiasDirection::Overforecast) == "overforecast");
	REQUIRE(toString(BiasPattern::Seasonal) == "seasonal");
	REQUIRE(toString(BiasTrend::Decreasing) == "decreasing");
}
