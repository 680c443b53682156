#include "demandlens/quality/monitor.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

using namespace demandlens;

namespace {

class VectorHistory final : public quality::PredictionHistoryProvider {
public:
	void add(const std::string &model_id, const std::string &type, std::vector<quality::PredictionRecord> records) {
		types_[model_id] = type;
		records_[model_id] = std::move(records);
	}

	std::vector<quality::PredictionRecord> records(const std::string &model_id, const core::TimePoint &start,
	                                               const core::TimePoint &end) const override {
		const auto it = records_.find(model_id);
		return it == records_.end() ? std::vector<quality::PredictionRecord>{}
		                            : quality::inRange(it->second, start, end);
	}

	std::optional<std::string> modelType(const std::string &model_id) const override {
		const auto it = types_.find(model_id);
		if (it == types_.end()) {
			return std::nullopt;
		}
		return it->second;
	}

private:
	std::map<std::string, std::string> types_;
	std::map<std::string, std::vector<quality::PredictionRecord>> records_;
};

class ConsoleSink final : public quality::RetrainingSink {
public:
	void publish(const quality::RetrainingTrigger &trigger) override {
		std::cout << "[retrain] " << trigger.model_id << " (" << quality::toString(trigger.priority)
		          << "): " << trigger.description << "\n";
	}
};

// Daily demand with a forecast whose error grows over the last two weeks.
std::vector<quality::PredictionRecord> simulateHistory(const core::TimePoint &now, std::size_t days) {
	std::mt19937 rng(11);
	std::normal_distribution<double> noise(0.0, 2.0);
	std::vector<quality::PredictionRecord> records;
	for (std::size_t i = 0; i < days; ++i) {
		const double t = static_cast<double>(i);
		const double actual = 200.0 + 25.0 * std::sin(2.0 * M_PI * t / 7.0) + noise(rng);
		const double drift = i + 14 >= days ? 0.015 * static_cast<double>(i + 14 - days) : 0.0;
		quality::PredictionRecord record;
		record.timestamp = now - std::chrono::hours{24} * static_cast<int>(days - 1 - i);
		record.predicted_value = actual * (1.0 + 0.04 + drift) + noise(rng);
		record.actual_value = actual;
		record.confidence = 0.9;
		record.lower_bound = record.predicted_value * 0.9;
		record.upper_bound = record.predicted_value * 1.1;
		records.push_back(record);
	}
	return records;
}

void printReport(const quality::ModelPerformanceReport &report) {
	std::cout << std::fixed << std::setprecision(2);
	std::cout << "Model " << report.model_id << " (" << report.model_type << ")\n";
	std::cout << "  predictions: " << report.period.actualized_predictions << "/" << report.period.total_predictions
	          << " actualized\n";
	std::cout << "  MAPE " << report.accuracy.mape << "%, accuracy " << report.accuracy.accuracy << "%, RMSE "
	          << report.accuracy.rmse << "\n";
	std::cout << "  bias " << report.bias.mean_bias << "% (" << quality::toString(report.bias.direction) << ", "
	          << quality::toString(report.bias.pattern) << ")\n";
	std::cout << "  calibration " << quality::toString(report.confidence.calibration) << ", trend alignment "
	          << quality::toString(report.trend.alignment) << "\n";
	for (const auto &alert : report.alerts) {
		std::cout << "  ALERT [" << quality::toString(alert.severity) << "] " << alert.message << " -> "
		          << alert.action_required << "\n";
	}
	for (const auto &recommendation : report.recommendations) {
		std::cout << "  * " << recommendation << "\n";
	}
}

} // namespace

int main() {
	const auto now = core::calendar::fromCivil(2024, 6, 30);
	auto history = std::make_shared<VectorHistory>();
	history->add("store-42-demand", "seasonal_naive", simulateHistory(now, 60));

	auto cache = std::make_shared<utils::InMemoryResultCache<quality::ModelPerformanceReport>>();
	const quality::AccuracyMonitor monitor(history, quality::AccuracyMonitor::Options(),
	                                       std::make_shared<ConsoleSink>(), cache);

	const auto assessment = monitor.assessDegradation("store-42-demand", now);
	std::cout << "Degradation rate: " << assessment.degradation_rate << "% ("
	          << (assessment.is_detected ? quality::toString(assessment.severity) : std::string("none")) << ")\n\n";

	printReport(monitor.buildPerformanceReport("store-42-demand", std::chrono::hours{7 * 24}, now));
	return 0;
}
