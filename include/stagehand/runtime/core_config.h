#ifndef STAGEHAND_RUNTIME_CORE_CONFIG_H
#define STAGEHAND_RUNTIME_CORE_CONFIG_H

#include <spdlog/common.h>

#include <chrono>
#include <optional>
#include <string>

namespace stagehand {

    /**
     * Settings for one CoreContext, fixed at construction.
     */
    struct CoreConfig {
        /// Applied to every stagehand.* logger
        spdlog::level::level_enum log_level{spdlog::level::warn};
        /// Name of the context's default raf driver; "CustomRafDriver-<id>" when unset
        std::optional<std::string> default_raf_driver_name;
        /// Interval of FrameLoops created by the context
        std::chrono::milliseconds frame_interval{16};
    };

} // namespace stagehand

#endif  // STAGEHAND_RUNTIME_CORE_CONFIG_H
