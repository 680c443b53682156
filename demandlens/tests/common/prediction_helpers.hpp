#pragma once

#include "demandlens/quality/monitor.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tests::helpers {

using demandlens::core::TimePoint;
using demandlens::quality::PredictionRecord;

inline TimePoint referenceNow() {
	return demandlens::core::calendar::fromCivil(2024, 6, 30);
}

inline PredictionRecord makeRecord(TimePoint timestamp, double predicted, std::optional<double> actual,
                                   double confidence = 0.9) {
	PredictionRecord record;
	record.timestamp = timestamp;
	record.predicted_value = predicted;
	record.actual_value = actual;
	record.confidence = confidence;
	return record;
}

/// One actualized record per day over [first, last] days before @p now, with a relative error of @p error.
inline std::vector<PredictionRecord> dailyHistory(TimePoint now, int first_days_ago, int last_days_ago,
                                                  double error, double actual = 100.0) {
	std::vector<PredictionRecord> records;
	for (int days_ago = first_days_ago; days_ago >= last_days_ago; --days_ago) {
		const auto timestamp = now - std::chrono::hours{24} * days_ago;
		records.push_back(makeRecord(timestamp, actual * (1.0 + error), actual));
	}
	return records;
}

inline std::vector<PredictionRecord> concat(std::vector<PredictionRecord> lhs,
                                            const std::vector<PredictionRecord> &rhs) {
	lhs.insert(lhs.end(), rhs.begin(), rhs.end());
	return lhs;
}

class InMemoryHistory final : public demandlens::quality::PredictionHistoryProvider {
public:
	void addModel(const std::string &model_id, const std::string &model_type,
	              std::vector<PredictionRecord> records) {
		types_[model_id] = model_type;
		records_[model_id] = std::move(records);
	}

	std::vector<PredictionRecord> records(const std::string &model_id, const TimePoint &start,
	                                      const TimePoint &end) const override {
		++calls;
		const auto it = records_.find(model_id);
		if (it == records_.end()) {
			return {};
		}
		return demandlens::quality::inRange(it->second, start, end);
	}

	std::optional<std::string> modelType(const std::string &model_id) const override {
		const auto it = types_.find(model_id);
		if (it == types_.end()) {
			return std::nullopt;
		}
		return it->second;
	}

	mutable std::size_t calls = 0;

private:
	std::map<std::string, std::string> types_;
	std::map<std::string, std::vector<PredictionRecord>> records_;
};

class CollectingSink final : public demandlens::quality::RetrainingSink {
public:
	void publish(const demandlens::quality::RetrainingTrigger &trigger) override {
		triggers.push_back(trigger);
	}

	std::vector<demandlens::quality::RetrainingTrigger> triggers;
};

} // namespace tests::helpers
