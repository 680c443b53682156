#include <catch2/catch.hpp>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "common/prediction_helpers.hpp"
#include "demandlens/core/errors.hpp"
#include "demandlens/quality/accuracy.hpp"

using namespace demandlens::quality;
using tests::helpers::makeRecord;
using tests::helpers::referenceNow;

TEST_CASE("Accuracy metrics from paired values", "[quality][accuracy]") {
	const auto metrics = computeAccuracyMetrics({100.0, 200.0, 50.0, 150.0}, {110.0, 190.0, 55.0, 150.0});

	REQUIRE(metrics.n == 4);
	REQUIRE(metrics.mape == Catch::Detail::Approx((10.0 + 5.0 + 10.0 + 0.0) / 4.0));
	REQUIRE(metrics.accuracy == Catch::Detail::Approx(100.0 - metrics.mape));
	REQUIRE(metrics.mae == Catch::Detail::Approx((10.0 + 10.0 + 5.0) / 4.0));
	REQUIRE(metrics.bias == Catch::Detail::Approx((10.0 - 10.0 + 5.0) / 4.0));
	REQUIRE(metrics.rmse == Catch::Detail::Approx(std::sqrt((100.0 + 100.0 + 25.0) / 4.0)));
	REQUIRE(metrics.r2 < 1.0);
	REQUIRE(metrics.theil_u > 0.0);
}

TEST_CASE("Accuracy is floored at zero", "[quality][accuracy]") {
	const auto metrics = computeAccuracyMetrics({10.0, 10.0}, {40.0, 5.0});
	REQUIRE(metrics.mape == Catch::Detail::Approx(175.0));
	REQUIRE(metrics.accuracy == 0.0);
}

TEST_CASE("Accuracy with only zero actuals reports a zero MAPE", "[quality][accuracy]") {
	const auto metrics = computeAccuracyMetrics({0.0, 0.0}, {1.0, 3.0});
	REQUIRE(metrics.mape == 0.0);
	REQUIRE(metrics.accuracy == 100.0);
	REQUIRE(metrics.mae == Catch::Detail::Approx(2.0));
}

TEST_CASE("Accuracy metrics from prediction records", "[quality][accuracy]") {
	const auto now = referenceNow();
	std::vector<PredictionRecord> records{
	    makeRecord(now - std::chrono::hours{48}, 120.0, 100.0),
	    makeRecord(now - std::chrono::hours{24}, 90.0, 100.0),
	    makeRecord(now, 500.0, std::nullopt),
	};
	const auto metrics = computeAccuracyMetrics(records);
	REQUIRE(metrics.n == 2);
	REQUIRE(metrics.mape == Catch::Detail::Approx(15.0));
	REQUIRE(metrics.bias == Catch::Detail::Approx(5.0));
}

TEST_CASE("Accuracy metrics reject unusable input", "[quality][accuracy]") {
	REQUIRE_THROWS_AS(computeAccuracyMetrics({1.0, 2.0}, {1.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(computeAccuracyMetrics(std::vector<double>{}, std::vector<double>{}),
	                  demandlens::core::NoDataError);

	const std::vector<PredictionRecord> pending{makeRecord(referenceNow(), 10.0, std::nullopt)};
	REQUIRE_THROWS_AS(computeAccuracyMetrics(pending), demandlens::core::NoDataError);
}

TEST_CASE("Prediction record helpers", "[quality][prediction]") {
	const auto now = referenceNow();
	const std::vector<PredictionRecord> records{
	    makeRecord(now, 1.0, 1.0),
	    makeRecord(now - std::chrono::hours{48}, 2.0, 2.0),
	    makeRecord(now - std::chrono::hours{24}, 3.0, std::nullopt),
	    makeRecord(now - std::chrono::hours{72}, 4.0, 4.0),
	};

	SECTION("actualized keeps resolved records in time order") {
		const auto resolved = actualized(records);
		REQUIRE(resolved.size() == 3);
		REQUIRE(resolved[0].predicted_value == 4.0);
		REQUIRE(resolved[1].predicted_value == 2.0);
		REQUIRE(resolved[2].predicted_value == 1.0);
	}

	SECTION("inRange is inclusive on both ends") {
		const auto window = inRange(records, now - std::chrono::hours{48}, now);
		REQUIRE(window.size() == 3);
	}

	SECTION("validate checks confidence and bounds") {
		auto record = makeRecord(now, 1.0, 1.0);
		REQUIRE_NOTHROW(record.validate());
		record.confidence = 1.5;
		REQUIRE_THROWS_AS(record.validate(), std::invalid_argument);
		record.confidence = 0.8;
		record.lower_bound = 5.0;
		record.upper_bound = 2.0;
		REQUIRE_THROWS_AS(record.validate(), std::invalid_argument);
	}
}
