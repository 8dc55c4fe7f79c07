#include "glamcast/utils/logging.hpp"

#ifndef GLAMCAST_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace glamcast::utils {

namespace {

std::once_flag logger_created;

} // namespace

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::create() {
	logger_ = spdlog::get("glamcast");
	if (!logger_) {
		logger_ = spdlog::stdout_color_mt("glamcast");
	}
	logger_->set_level(spdlog::level::info);
	logger_->flush_on(spdlog::level::info);
}

void Logging::init(spdlog::level::level_enum level) {
	std::call_once(logger_created, &Logging::create);
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	std::call_once(logger_created, &Logging::create);
	return logger_;
}

} // namespace glamcast::utils

#endif // GLAMCAST_NO_LOGGING
