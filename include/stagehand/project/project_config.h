#pragma once

#include <stagehand/project/snapshot.h>

#include <optional>
#include <string>

namespace stagehand {

struct AssetsConfig {
    /// Prefix of asset urls; a trailing '/' is ignored
    std::string base_url;

    bool operator==(const AssetsConfig&) const = default;
};

struct ProjectConfig {
    /// The saved state to start from; an empty state at the current definition version when absent
    std::optional<ProjectSnapshot> state;
    AssetsConfig assets;

    bool operator==(const ProjectConfig&) const = default;
};

}  // namespace stagehand
