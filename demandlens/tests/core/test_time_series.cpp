#include <catch2/catch.hpp>

#include "common/time_series_helpers.hpp"
#include "demandlens/core/time_series.hpp"

#include <chrono>
#include <cmath>
#include <stdexcept>
#include <vector>

using demandlens::core::TimeSeries;

TEST_CASE("TimeSeries rejects mismatched and unordered input", "[core][time_series][error]") {
	auto timestamps = tests::helpers::makeTimestamps(3);
	REQUIRE_THROWS_AS(TimeSeries(timestamps, {1.0, 2.0}), std::invalid_argument);

	std::vector<TimeSeries::TimePoint> repeated{timestamps[0], timestamps[0], timestamps[1]};
	REQUIRE_THROWS_AS(TimeSeries(repeated, {1.0, 2.0, 3.0}), std::invalid_argument);
}

TEST_CASE("TimeSeries regular construction and slicing", "[core][time_series]") {
	const auto start = demandlens::core::calendar::fromCivil(2024, 1, 1);
	const auto series = TimeSeries::regular({1.0, 2.0, 3.0, 4.0}, start, std::chrono::hours{24});

	REQUIRE(series.size() == 4);
	REQUIRE(series.frequency().has_value());
	REQUIRE(*series.frequency() == std::chrono::hours{24});
	REQUIRE(series.getTimestamps()[2] - series.getTimestamps()[0] == std::chrono::hours{48});

	const auto middle = series.slice(1, 3);
	REQUIRE(middle.size() == 2);
	REQUIRE(middle.getValues() == std::vector<double>{2.0, 3.0});
	REQUIRE(middle.frequency() == series.frequency());
	REQUIRE_THROWS_AS(series.slice(2, 5), std::out_of_range);
	REQUIRE_THROWS_AS(TimeSeries::regular({1.0}, start, std::chrono::seconds{0}), std::invalid_argument);
}

TEST_CASE("TimeSeries reports non-finite values", "[core][time_series]") {
	auto clean = tests::helpers::makeUnivariateSeries({1.0, 2.0});
	REQUIRE_FALSE(clean.hasMissingValues());

	auto gappy = tests::helpers::makeUnivariateSeries({1.0, std::nan("")});
	REQUIRE(gappy.hasMissingValues());
}
