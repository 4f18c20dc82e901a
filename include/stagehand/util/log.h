#ifndef STAGEHAND_UTIL_LOG_H
#define STAGEHAND_UTIL_LOG_H

#include <stagehand/stagehand_export.h>

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace stagehand::log {
    using logger_ptr = std::shared_ptr<spdlog::logger>;

    /**
     * The root library logger, named "stagehand". Created on first use with a coloured stderr sink.
     */
    STAGEHAND_EXPORT logger_ptr core();

    /**
     * A child logger scoped to one component instance, e.g. named("Project", "my-project") yields a logger
     * called "stagehand.Project:my-project". Loggers are cached in the spdlog registry and share the sink and
     * level of the root logger.
     */
    STAGEHAND_EXPORT logger_ptr named(std::string_view scope, std::string_view name);

    /**
     * Applies the level to the root logger and every named logger created so far or later.
     */
    STAGEHAND_EXPORT void set_level(spdlog::level::level_enum level);

    [[nodiscard]] STAGEHAND_EXPORT spdlog::level::level_enum level();
} // namespace stagehand::log

#endif  // STAGEHAND_UTIL_LOG_H
