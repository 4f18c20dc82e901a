#pragma once

/**
 * @file snapshot.h
 * @brief The passive, serializable project state.
 *
 * A snapshot is owned by whoever persists or edits the project. The library only reads it, to seed (or re-seed)
 * the live value trees, and hands back a copy from Project::state(). Values driven by the timeline are never
 * written into it.
 *
 * Layout:
 * @code
 * ProjectSnapshot
 *   sheets_by_id: SheetId -> SheetSnapshot
 *     static_overrides.by_object: ObjectAddressKey -> Value (partial prop tree)
 *     sequence?: PositionalSequence
 *       length, sub_units_per_unit
 *       tracks_by_object: ObjectAddressKey -> ObjectTracks
 *         track_id_by_prop_path: encoded path -> SequenceTrackId
 *         track_data: SequenceTrackId -> BasicKeyframedTrack
 *   revision_history: most recent first, at most 50 ids
 *   definition_version: "0.4.0"
 * @endcode
 */

#include <stagehand/core/ids.h>
#include <stagehand/sequence/keyframe.h>
#include <stagehand/stagehand_export.h>
#include <stagehand/util/log.h>
#include <stagehand/value/value.h>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stagehand {

inline constexpr std::string_view CURRENT_DEFINITION_VERSION{"0.4.0"};
inline constexpr std::size_t MAX_REVISION_HISTORY = 50;
inline constexpr double DEFAULT_SEQUENCE_LENGTH = 10.0;
inline constexpr double DEFAULT_SUB_UNITS_PER_UNIT = 30.0;

struct ObjectTracks {
    std::map<PathToPropEncoded, SequenceTrackId> track_id_by_prop_path;
    std::map<SequenceTrackId, BasicKeyframedTrack> track_data;

    bool operator==(const ObjectTracks&) const = default;
};

struct PositionalSequence {
    double length{DEFAULT_SEQUENCE_LENGTH};
    double sub_units_per_unit{DEFAULT_SUB_UNITS_PER_UNIT};
    std::map<ObjectAddressKey, ObjectTracks> tracks_by_object;

    bool operator==(const PositionalSequence&) const = default;
};

struct StaticOverrides {
    std::map<ObjectAddressKey, Value> by_object;

    bool operator==(const StaticOverrides&) const = default;
};

struct SheetSnapshot {
    StaticOverrides static_overrides;
    std::optional<PositionalSequence> sequence;

    bool operator==(const SheetSnapshot&) const = default;
};

struct ProjectSnapshot {
    std::map<SheetId, SheetSnapshot> sheets_by_id;
    std::vector<std::string> revision_history;
    std::string definition_version{CURRENT_DEFINITION_VERSION};

    bool operator==(const ProjectSnapshot&) const = default;
};

/**
 * @brief Check a snapshot before anything from it is ingested.
 *
 * @throws SchemaVersionMismatch when definition_version is not the current one
 * @throws InvalidArgument for a revision history longer than 50 entries, a negative or non-finite sequence length,
 *         non-finite keyframe positions or handles, and unparseable encoded prop paths
 *
 * Track ids referenced from track_id_by_prop_path with no track data are reported on `logger` and ignored.
 */
STAGEHAND_EXPORT void validate_snapshot(const ProjectSnapshot& snapshot, const log::logger_ptr& logger);

/**
 * @brief The track for a prop path of an object, or nullptr.
 */
[[nodiscard]] STAGEHAND_EXPORT const BasicKeyframedTrack* find_track(const PositionalSequence& sequence,
                                                                     const ObjectAddressKey& object,
                                                                     const PathToPropEncoded& path);

}  // namespace stagehand
