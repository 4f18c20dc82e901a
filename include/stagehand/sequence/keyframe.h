#pragma once

/**
 * @file keyframe.h
 * @brief Keyframes and keyframed tracks.
 *
 * Handles follow the [leftX, leftY, rightX, rightY] layout: the right handle of a keyframe and the left handle
 * of the next one are the two inner control points of the unit cubic bezier easing the segment between them.
 */

#include <stagehand/core/ids.h>
#include <stagehand/stagehand_export.h>
#include <stagehand/value/value.h>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace stagehand {

enum class KeyframeType { bezier, hold };

[[nodiscard]] STAGEHAND_EXPORT std::string_view to_string(KeyframeType type);

using KeyframeHandles = std::array<double, 4>;

inline constexpr KeyframeHandles DEFAULT_KEYFRAME_HANDLES{0.5, 1.0, 0.5, 0.0};

struct Keyframe {
    KeyframeId id;
    Value value;
    double position{0.0};
    KeyframeHandles handles{DEFAULT_KEYFRAME_HANDLES};
    bool connected_right{true};
    KeyframeType type{KeyframeType::bezier};

    bool operator==(const Keyframe&) const = default;
};

struct BasicKeyframedTrack {
    std::vector<Keyframe> keyframes;
    std::string debug_name;

    bool operator==(const BasicKeyframedTrack&) const = default;
};

/**
 * @brief A copy of `keyframes` stable-sorted by position. The input is not modified.
 */
[[nodiscard]] STAGEHAND_EXPORT std::vector<Keyframe> sorted_by_position(const std::vector<Keyframe>& keyframes);

}  // namespace stagehand
