#pragma once

#if !defined(FCSTACC_NO_LOGGING) && !defined(DUCKDB_EXTENSION_BUILD)
#include <spdlog/spdlog.h>
#include <memory>
#include <mutex>

namespace fcstaccuracy::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * All metric computations log through the same logger instance, which can be
 * configured once at startup. The logger is created exactly once, so
 * concurrent first use from several threads is safe.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
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

	static void createLogger();

	static std::shared_ptr<spdlog::logger> logger_;
	static std::once_flag created_;
};

} // namespace fcstaccuracy::utils

// --- Logger Macros for convenient access ---
#define FCSTACC_TRACE(...)    fcstaccuracy::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define FCSTACC_DEBUG(...)    fcstaccuracy::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define FCSTACC_INFO(...)     fcstaccuracy::utils::Logging::getLogger()->info(__VA_ARGS__)
#define FCSTACC_WARN(...)     fcstaccuracy::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define FCSTACC_ERROR(...)    fcstaccuracy::utils::Logging::getLogger()->error(__VA_ARGS__)
#define FCSTACC_CRITICAL(...) fcstaccuracy::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// Logging compiled out, also inside the DuckDB extension so the host's stdout stays clean

namespace fcstaccuracy::utils {

class Logging {
public:
	static void init() {}
};

} // namespace fcstaccuracy::utils

#define FCSTACC_TRACE(...)    do {} while(0)
#define FCSTACC_DEBUG(...)    do {} while(0)
#define FCSTACC_INFO(...)     do {} while(0)
#define FCSTACC_WARN(...)     do {} while(0)
#define FCSTACC_ERROR(...)    do {} while(0)
#define FCSTACC_CRITICAL(...) do {} while(0)

#endif // FCSTACC_NO_LOGGING || DUCKDB_EXTENSION_BUILD
