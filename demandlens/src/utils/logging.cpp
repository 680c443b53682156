#include "demandlens/utils/logging.hpp"

#ifndef DEMANDLENS_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace demandlens::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("demandlens");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("demandlens");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		init();
	}
	return logger_;
}

} // namespace demandlens::utils

#endif // DEMANDLENS_NO_LOGGING
