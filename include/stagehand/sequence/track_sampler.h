#pragma once

/**
 * @file track_sampler.h
 * @brief The value of a keyframed track at a position.
 *
 * Keyframe values are untrusted: each is sanitized with the prop's config before use and replaced by the
 * config's default when it fails.
 */

#include <stagehand/prop_types/prop_type.h>
#include <stagehand/sequence/keyframe.h>
#include <stagehand/stagehand_export.h>

#include <optional>

namespace stagehand {

/**
 * @brief Sample a track whose keyframes are sorted by position.
 *
 * Before the first keyframe the first value holds, at or after the last the last value holds, exactly at a
 * keyframe its value is returned, and anywhere else the bounding segment is sampled.
 *
 * @return nullopt for a track without keyframes
 * @throws InvalidArgument for a non-finite position
 */
[[nodiscard]] STAGEHAND_EXPORT std::optional<Value> sample_track(const BasicKeyframedTrack& track, double position,
                                                                 const PropTypeConfig& config);

/**
 * @brief Sample the segment k0 → k1.
 *
 * A hold keyframe keeps its value for the whole segment. A segment of zero (or negative) duration yields
 * k1's value. Otherwise the linear progression through the segment is eased by the bezier formed from k0's
 * right handle and k1's left handle, then handed to the config's interpolator.
 */
[[nodiscard]] STAGEHAND_EXPORT Value sample_segment(const Keyframe& k0, const Keyframe& k1, double position,
                                                    const PropTypeConfig& config);

/**
 * @brief The sanitized value of a keyframe, or the config default.
 */
[[nodiscard]] STAGEHAND_EXPORT Value keyframe_value(const Keyframe& keyframe, const PropTypeConfig& config);

}  // namespace stagehand
