#include "fcst-accuracy/utils/logging.hpp"

#if !defined(FCSTACC_NO_LOGGING) && !defined(DUCKDB_EXTENSION_BUILD)
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fcstaccuracy::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;
std::once_flag Logging::created_;

void Logging::createLogger() {
	logger_ = spdlog::get("fcst-accuracy");
	if (!logger_) {
		logger_ = spdlog::stdout_color_mt("fcst-accuracy");
	}
	logger_->flush_on(spdlog::level::info);
}

void Logging::init(spdlog::level::level_enum level) {
	auto &logger = getLogger();
	logger->set_level(level);
	logger->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	std::call_once(created_, createLogger);
	return logger_;
}

} // namespace fcstaccuracy::utils

#endif // FCSTACC_NO_LOGGING || DUCKDB_EXTENSION_BUILD
