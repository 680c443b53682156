#pragma once

#ifndef DEMANDLENS_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace demandlens::utils {

/**
 * @class Logging
 * @brief Process-wide access point to the spdlog logger used by demandlens.
 *
 * Every decomposition and monitoring component logs through the same
 * "demandlens" logger, so the level only has to be configured once at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the shared logger, creating it on first use.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace demandlens::utils

#define DEMANDLENS_TRACE(...)    demandlens::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define DEMANDLENS_DEBUG(...)    demandlens::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define DEMANDLENS_INFO(...)     demandlens::utils::Logging::getLogger()->info(__VA_ARGS__)
#define DEMANDLENS_WARN(...)     demandlens::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define DEMANDLENS_ERROR(...)    demandlens::utils::Logging::getLogger()->error(__VA_ARGS__)
#define DEMANDLENS_CRITICAL(...) demandlens::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else

namespace demandlens::utils {

class Logging {
public:
	static void init() {}
};

} // namespace demandlens::utils

#define DEMANDLENS_TRACE(...)    do {} while(0)
#define DEMANDLENS_DEBUG(...)    do {} while(0)
#define DEMANDLENS_INFO(...)     do {} while(0)
#define DEMANDLENS_WARN(...)     do {} while(0)
#define DEMANDLENS_ERROR(...)    do {} while(0)
#define DEMANDLENS_CRITICAL(...) do {} while(0)

#endif // DEMANDLENS_NO_LOGGING
