#include <stagehand/project/snapshot.h>
#include <stagehand/util/errors.h>
#include <stagehand/value/path.h>

#include <cmath>

namespace stagehand {

namespace {

void validate_track(const SheetId& sheet, const ObjectAddressKey& object, const SequenceTrackId& id,
                    const BasicKeyframedTrack& track) {
    for (const auto& keyframe : track.keyframes) {
        if (!std::isfinite(keyframe.position)) {
            throw_error<InvalidArgument>("Keyframe '{}' of track '{}' (sheet '{}', object '{}') has a non-finite position",
                                         keyframe.id, id, sheet, object);
        }
        for (double handle : keyframe.handles) {
            if (!std::isfinite(handle)) {
                throw_error<InvalidArgument>(
                    "Keyframe '{}' of track '{}' (sheet '{}', object '{}') has a non-finite handle", keyframe.id, id,
                    sheet, object);
            }
        }
    }
}

void validate_sequence(const SheetId& sheet, const PositionalSequence& sequence, const log::logger_ptr& logger) {
    if (!std::isfinite(sequence.length) || sequence.length < 0.0) {
        throw_error<InvalidArgument>("Sequence of sheet '{}' has an invalid length {}", sheet, sequence.length);
    }
    if (!std::isfinite(sequence.sub_units_per_unit) || sequence.sub_units_per_unit <= 0.0) {
        throw_error<InvalidArgument>("Sequence of sheet '{}' has an invalid subUnitsPerUnit {}", sheet,
                                     sequence.sub_units_per_unit);
    }
    for (const auto& [object, tracks] : sequence.tracks_by_object) {
        for (const auto& [encoded, track_id] : tracks.track_id_by_prop_path) {
            // Throws InvalidArgument on malformed text
            static_cast<void>(decode_path_to_prop(encoded));
            if (!tracks.track_data.contains(track_id)) {
                logger->warn("Sheet '{}', object '{}': prop {} refers to missing track '{}'; ignoring it", sheet,
                             object, encoded, track_id);
            }
        }
        for (const auto& [track_id, track] : tracks.track_data) {
            validate_track(sheet, object, track_id, track);
        }
    }
}

}  // namespace

void validate_snapshot(const ProjectSnapshot& snapshot, const log::logger_ptr& logger) {
    if (snapshot.definition_version != CURRENT_DEFINITION_VERSION) {
        throw_error<SchemaVersionMismatch>(std::string{CURRENT_DEFINITION_VERSION}, snapshot.definition_version);
    }
    if (snapshot.revision_history.size() > MAX_REVISION_HISTORY) {
        throw_error<InvalidArgument>("revisionHistory holds {} entries; at most {} are allowed",
                                     snapshot.revision_history.size(), MAX_REVISION_HISTORY);
    }
    for (const auto& [sheet_id, sheet] : snapshot.sheets_by_id) {
        if (sheet.sequence) {
            validate_sequence(sheet_id, *sheet.sequence, logger);
        }
    }
}

const BasicKeyframedTrack* find_track(const PositionalSequence& sequence, const ObjectAddressKey& object,
                                      const PathToPropEncoded& path) {
    auto tracks = sequence.tracks_by_object.find(object);
    if (tracks == sequence.tracks_by_object.end()) {
        return nullptr;
    }
    auto id = tracks->second.track_id_by_prop_path.find(path);
    if (id == tracks->second.track_id_by_prop_path.end()) {
        return nullptr;
    }
    auto track = tracks->second.track_data.find(id->second);
    return track == tracks->second.track_data.end() ? nullptr : &track->second;
}

}  // namespace stagehand
