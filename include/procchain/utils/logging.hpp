#pragma once

#ifndef PROCCHAIN_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace procchain::utils {

/**
 * @class Logging
 * @brief Process-wide access point to the spdlog logger used by the library.
 *
 * The logger is created lazily on first use. Applications may call init()
 * at startup to pick the minimum level.
 */
class Logging {
public:
	/**
	 * @brief Gets the shared logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Creates the logger if needed and sets its level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

	/**
	 * @brief Parses a level name ("trace", "debug", "info", "warn", "error", "critical", "off").
	 * @throws std::invalid_argument for an unknown name.
	 */
	static spdlog::level::level_enum parseLevel(const std::string &name);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace procchain::utils

#define PROCCHAIN_TRACE(...)    procchain::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define PROCCHAIN_DEBUG(...)    procchain::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define PROCCHAIN_INFO(...)     procchain::utils::Logging::getLogger()->info(__VA_ARGS__)
#define PROCCHAIN_WARN(...)     procchain::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define PROCCHAIN_ERROR(...)    procchain::utils::Logging::getLogger()->error(__VA_ARGS__)
#define PROCCHAIN_CRITICAL(...) procchain::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// No-op logging when built without spdlog

#include <stdexcept>
#include <string>

namespace procchain::utils {

class Logging {
public:
	static void init() {}

	template <typename Level>
	static void init(Level) {}

	/// Validates a level name like the spdlog build does; the result only feeds init().
	static int parseLevel(const std::string &name) {
		static const char *const kNames[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
		for (int i = 0; i < 7; ++i) {
			if (name == kNames[i]) {
				return i;
			}
		}
		if (name == "warning") {
			return 3;
		}
		if (name == "err") {
			return 4;
		}
		throw std::invalid_argument("Unknown log level '" + name + "'.");
	}
};

} // namespace procchain::utils

#define PROCCHAIN_TRACE(...)    do {} while(0)
#define PROCCHAIN_DEBUG(...)    do {} while(0)
#define PROCCHAIN_INFO(...)     do {} while(0)
#define PROCCHAIN_WARN(...)     do {} while(0)
#define PROCCHAIN_ERROR(...)    do {} while(0)
#define PROCCHAIN_CRITICAL(...) do {} while(0)

#endif // PROCCHAIN_NO_LOGGING
