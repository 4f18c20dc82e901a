#include <stagehand/sequence/bezier.h>
#include <stagehand/sequence/track_sampler.h>
#include <stagehand/util/errors.h>

#include <algorithm>
#include <cmath>
#include <iterator>

namespace stagehand {

std::string_view to_string(KeyframeType type) {
    switch (type) {
        case KeyframeType::bezier: return "bezier";
        case KeyframeType::hold: return "hold";
    }
    return "unknown";
}

std::vector<Keyframe> sorted_by_position(const std::vector<Keyframe>& keyframes) {
    std::vector<Keyframe> sorted = keyframes;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Keyframe& a, const Keyframe& b) { return a.position < b.position; });
    return sorted;
}

Value keyframe_value(const Keyframe& keyframe, const PropTypeConfig& config) {
    return sanitize_or_default(config, keyframe.value);
}

Value sample_segment(const Keyframe& k0, const Keyframe& k1, double position, const PropTypeConfig& config) {
    const double duration = k1.position - k0.position;
    if (duration <= 0.0) {
        return keyframe_value(k1, config);
    }
    if (k0.type == KeyframeType::hold) {
        return keyframe_value(k0, config);
    }
    const double progression = std::clamp((position - k0.position) / duration, 0.0, 1.0);
    const UnitBezier easing{k0.handles[2], k0.handles[3], k1.handles[0], k1.handles[1]};
    return interpolate(config, keyframe_value(k0, config), keyframe_value(k1, config), easing.solve(progression));
}

std::optional<Value> sample_track(const BasicKeyframedTrack& track, double position, const PropTypeConfig& config) {
    if (!std::isfinite(position)) {
        throw_error<InvalidArgument>("Cannot sample track '{}' at position {}", track.debug_name, position);
    }
    const auto& keyframes = track.keyframes;
    if (keyframes.empty()) {
        return std::nullopt;
    }
    if (position <= keyframes.front().position) {
        return keyframe_value(keyframes.front(), config);
    }
    if (position >= keyframes.back().position) {
        return keyframe_value(keyframes.back(), config);
    }

    // First keyframe strictly after the position; the one before it is at or before the position
    auto next = std::upper_bound(keyframes.begin(), keyframes.end(), position,
                                 [](double p, const Keyframe& k) { return p < k.position; });
    const auto& k1 = *next;
    const auto& k0 = *std::prev(next);
    if (k0.position == position) {
        return keyframe_value(k0, config);
    }
    return sample_segment(k0, k1, position, config);
}

}  // namespace stagehand
