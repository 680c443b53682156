#include "demandlens/core/calendar.hpp"
#include "demandlens/seasonality/decomposer.hpp"
#include "demandlens/seasonality/autocorrelation.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace demandlens;

namespace {

// AirPassengers dataset (full 144 months)
std::vector<double> airPassengersData() {
	return {
		112., 118., 132., 129., 121., 135., 148., 148., 136., 119., 104., 118.,
		115., 126., 141., 135., 125., 149., 170., 170., 158., 133., 114., 140.,
		145., 150., 178., 163., 172., 178., 199., 199., 184., 162., 146., 166.,
		171., 180., 193., 181., 183., 218., 230., 242., 209., 191., 172., 194.,
		196., 196., 236., 235., 229., 243., 264., 272., 237., 211., 180., 201.,
		204., 188., 235., 227., 234., 264., 302., 293., 259., 229., 203., 229.,
		242., 233., 267., 269., 270., 315., 364., 347., 312., 274., 237., 278.,
		284., 277., 317., 313., 318., 374., 413., 405., 355., 306., 271., 306.,
		315., 301., 356., 348., 355., 422., 465., 467., 404., 347., 305., 336.,
		340., 318., 362., 348., 363., 435., 491., 505., 404., 359., 310., 337.,
		360., 342., 406., 396., 420., 472., 548., 559., 463., 407., 362., 405.,
		417., 391., 419., 461., 472., 535., 622., 606., 508., 461., 390., 432.
	};
}

core::TimeSeries monthlySeries(const std::vector<double> &data) {
	std::vector<core::TimeSeries::TimePoint> timestamps;
	timestamps.reserve(data.size());
	for (std::size_t i = 0; i < data.size(); ++i) {
		timestamps.push_back(core::calendar::fromCivil(1949 + static_cast<int>(i / 12), static_cast<int>(i % 12) + 1, 1));
	}
	return core::TimeSeries(std::move(timestamps), data);
}

void printHeader(const std::string &title) {
	std::cout << "\n" << std::string(80, '=') << "\n";
	std::cout << title << "\n";
	std::cout << std::string(80, '=') << "\n";
}

} // namespace

int main() {
	const auto series = monthlySeries(airPassengersData());
	seasonality::DecompositionParams params;
	params.seasonal_period = 12;

	printHeader("STL decomposition");
	const auto stl = std::get<seasonality::DecompositionResult>(seasonality::decompose(series, params));
	std::cout << std::fixed << std::setprecision(3);
	std::cout << "Seasonal strength: " << stl.seasonal_strength << "\n";
	std::cout << "Trend strength:    " << stl.trend_strength << "\n";
	std::cout << "Iterations:        " << stl.iterations << "\n";

	printHeader("Fourier analysis");
	params.algorithm = seasonality::Algorithm::Fourier;
	params.max_frequencies = 5;
	const auto components = std::get<std::vector<seasonality::FourierComponent>>(seasonality::decompose(series, params));
	for (const auto &component : components) {
		std::cout << "  period " << std::setw(8) << component.period << "  amplitude " << std::setw(8)
		          << component.amplitude << "  significance " << component.significance << "\n";
	}

	printHeader("Haar wavelet");
	params.algorithm = seasonality::Algorithm::Wavelet;
	const auto wavelet = std::get<seasonality::WaveletTransform>(seasonality::decompose(series, params));
	for (const auto &level : wavelet.levels) {
		double energy = 0.0;
		for (double c : level.coefficients) {
			energy += c * c;
		}
		std::cout << "  level " << level.level << ": " << level.coefficients.size() << " coefficients, energy "
		          << energy << "\n";
	}

	printHeader("Seasonal adjustment with trading days");
	params.algorithm = seasonality::Algorithm::SeasonalAdjust;
	params.trading_day_adjustment = true;
	params.calendar = std::make_shared<core::MonthlyWeekdayCalendar>();
	const auto adjusted = std::get<seasonality::SeasonalAdjustmentResult>(seasonality::decompose(series, params));
	std::cout << "Log transformed: " << (adjusted.log_transformed ? "yes" : "no") << "\n";
	std::cout << "Seasonal factors:\n";
	for (const auto &entry : adjusted.seasonal_factors) {
		std::cout << "  month " << std::setw(2) << entry.first + 1 << ": " << entry.second << "\n";
	}
	std::cout << "Outliers: " << adjusted.outliers.size() << "\n";
	for (const auto &outlier : adjusted.outliers) {
		std::cout << "  " << detectors::toString(outlier.type) << " at " << outlier.index << " (impact "
		          << outlier.impact << ")\n";
	}

	printHeader("Autocorrelation of the seasonally adjusted series");
	const auto correlations = seasonality::acf(adjusted.seasonally_adjusted, 24);
	const auto partial = seasonality::pacf(adjusted.seasonally_adjusted, 12);
	for (Eigen::Index lag = 1; lag <= 12; ++lag) {
		std::cout << "  lag " << std::setw(2) << lag << "  acf " << std::setw(7) << correlations[lag] << "  pacf "
		          << std::setw(7) << partial[lag] << "\n";
	}
	return 0;
}
