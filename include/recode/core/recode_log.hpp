#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <utility>

/**
 * @brief Library logging.
 *
 * Recode logs through spdlog. By default it uses spdlog's default logger, so
 * an application that configures spdlog globally sees Recode's output with
 * no further setup. Nothing is logged on the successful encode/decode path.
 */
namespace Recode::log {

namespace detail {
inline std::shared_ptr<spdlog::logger>& LoggerSlot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}
}  // namespace detail

/**
 * @brief Replaces the logger used by Recode.
 *
 * Like registration, this must happen before transcoders are used from more
 * than one thread. Passing nullptr restores spdlog's default logger.
 */
inline void SetLogger(std::shared_ptr<spdlog::logger> logger) {
    detail::LoggerSlot() = std::move(logger);
}

/**
 * @brief The logger Recode writes to.
 */
[[nodiscard]] inline spdlog::logger& Logger() {
    if (auto& logger = detail::LoggerSlot(); logger) {
        return *logger;
    }
    return *spdlog::default_logger_raw();
}

}  // namespace Recode::log
