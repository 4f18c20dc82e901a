#include <stagehand/util/log.h>

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace stagehand::log {
    namespace {
        constexpr std::string_view ROOT_LOGGER_NAME{"stagehand"};

        spdlog::level::level_enum &current_level() {
            static spdlog::level::level_enum level{spdlog::level::warn};
            return level;
        }

        logger_ptr make_logger(const std::string &name, const logger_ptr &root) {
            auto logger = std::make_shared<spdlog::logger>(name, root->sinks().begin(), root->sinks().end());
            logger->set_level(current_level());
            spdlog::register_logger(logger);
            return logger;
        }
    } // namespace

    logger_ptr core() {
        if (auto existing = spdlog::get(std::string{ROOT_LOGGER_NAME})) { return existing; }
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        auto logger = std::make_shared<spdlog::logger>(std::string{ROOT_LOGGER_NAME}, std::move(sink));
        logger->set_level(current_level());
        logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        spdlog::register_logger(logger);
        return logger;
    }

    logger_ptr named(std::string_view scope, std::string_view name) {
        auto full_name = fmt::format("{}.{}:{}", ROOT_LOGGER_NAME, scope, name);
        if (auto existing = spdlog::get(full_name)) { return existing; }
        return make_logger(full_name, core());
    }

    void set_level(spdlog::level::level_enum level) {
        current_level() = level;
        core();
        spdlog::apply_all([level](const logger_ptr &logger) {
            if (logger->name().starts_with(ROOT_LOGGER_NAME)) { logger->set_level(level); }
        });
    }

    spdlog::level::level_enum level() { return current_level(); }
} // namespace stagehand::log
