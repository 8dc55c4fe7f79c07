#pragma once

#ifndef GLAMCAST_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace glamcast::utils {

/**
 * @class Logging
 * @brief Owner of the `glamcast` spdlog logger.
 *
 * The logger is created exactly once, on the first call to either member, and
 * is shared by fitting, simulation and prediction. Creation is safe when the
 * first calls race, e.g. concurrent predictions on a fitted model.
 */
class Logging {
public:
	/// The shared logger, created at `info` level when first requested.
	static std::shared_ptr<spdlog::logger> &getLogger();

	/// Sets the minimum level of emitted messages; messages at or above it are flushed immediately.
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static void create();

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace glamcast::utils

#define GLAMCAST_TRACE(...)    glamcast::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define GLAMCAST_DEBUG(...)    glamcast::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define GLAMCAST_INFO(...)     glamcast::utils::Logging::getLogger()->info(__VA_ARGS__)
#define GLAMCAST_WARN(...)     glamcast::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define GLAMCAST_ERROR(...)    glamcast::utils::Logging::getLogger()->error(__VA_ARGS__)
#define GLAMCAST_CRITICAL(...) glamcast::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else

namespace glamcast::utils {

class Logging {
public:
	static void init() {}
};

} // namespace glamcast::utils

#define GLAMCAST_TRACE(...)    do {} while(0)
#define GLAMCAST_DEBUG(...)    do {} while(0)
#define GLAMCAST_INFO(...)     do {} while(0)
#define GLAMCAST_WARN(...)     do {} while(0)
#define GLAMCAST_ERROR(...)    do {} while(0)
#define GLAMCAST_CRITICAL(...) do {} while(0)

#endif // GLAMCAST_NO_LOGGING
