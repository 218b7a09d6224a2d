#include "procchain/utils/logging.hpp"

#ifndef PROCCHAIN_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>

namespace procchain::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::stderr_color_mt("procchain");
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

spdlog::level::level_enum Logging::parseLevel(const std::string &name) {
	auto level = spdlog::level::from_str(name);
	// from_str maps unknown names to off, so only accept "off" when it was asked for.
	if (level == spdlog::level::off && name != "off") {
		throw std::invalid_argument("Unknown log level '" + name + "'.");
	}
	return level;
}

} // namespace procchain::utils

#endif // PROCCHAIN_NO_LOGGING
