#include <stagehand/project/state_editors.h>
#include <stagehand/util/errors.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <random>
#include <string_view>

namespace stagehand {

namespace {

constexpr std::string_view ID_ALPHABET{"0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"};
constexpr std::size_t ID_LENGTH = 10;

std::string generate_id() {
    static std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> pick(0, ID_ALPHABET.size() - 1);
    std::string id(ID_LENGTH, '0');
    for (auto& c : id) { c = ID_ALPHABET[pick(engine)]; }
    return id;
}

Value without_path(const Value& value, const PropPath& path, std::size_t depth) {
    if (depth >= path.size() || !value.is_map() || !path[depth].is_field()) { return value; }
    const auto& key = path[depth].name();
    const auto* child = value.find(key);
    if (child == nullptr) { return value; }

    ValueMap result = value.as_map();
    if (depth + 1 == path.size()) {
        result.erase(key);
    } else {
        result.set(key, without_path(*child, path, depth + 1));
    }
    return Value{std::move(result)};
}

ObjectTracks* find_object_tracks(ProjectSnapshot& snapshot, const PropLocation& prop) {
    auto sheet = snapshot.sheets_by_id.find(prop.sheet_id);
    if (sheet == snapshot.sheets_by_id.end() || !sheet->second.sequence) { return nullptr; }
    auto& by_object = sheet->second.sequence->tracks_by_object;
    auto tracks = by_object.find(prop.object_key);
    return tracks == by_object.end() ? nullptr : &tracks->second;
}

BasicKeyframedTrack& sequenced_track(ProjectSnapshot& snapshot, const PropLocation& prop) {
    auto* tracks = find_object_tracks(snapshot, prop);
    auto encoded = encode_path_to_prop(prop.path);
    if (tracks != nullptr) {
        if (auto id = tracks->track_id_by_prop_path.find(encoded); id != tracks->track_id_by_prop_path.end()) {
            if (auto track = tracks->track_data.find(id->second); track != tracks->track_data.end()) {
                return track->second;
            }
        }
    }
    throw_error<InvalidArgument>("Prop {} of object '{}' on sheet '{}' is not sequenced", encoded, prop.object_key,
                                 prop.sheet_id);
}

void remove_static_override(ProjectSnapshot& snapshot, const PropLocation& prop) {
    auto sheet = snapshot.sheets_by_id.find(prop.sheet_id);
    if (sheet == snapshot.sheets_by_id.end()) { return; }
    auto& by_object = sheet->second.static_overrides.by_object;
    auto it = by_object.find(prop.object_key);
    if (it == by_object.end()) { return; }
    it->second = without_path(it->second, prop.path, 0);
}

}  // namespace

SequenceTrackId set_primitive_prop_as_sequenced(ProjectSnapshot& snapshot, const PropLocation& prop) {
    if (prop.path.empty()) { throw_error<InvalidArgument>("Only props can be sequenced, not a whole object"); }

    auto& sheet = snapshot.sheets_by_id[prop.sheet_id];
    if (!sheet.sequence) { sheet.sequence = PositionalSequence{}; }
    auto& tracks = sheet.sequence->tracks_by_object[prop.object_key];
    auto encoded = encode_path_to_prop(prop.path);

    if (auto existing = tracks.track_id_by_prop_path.find(encoded); existing != tracks.track_id_by_prop_path.end()) {
        tracks.track_data.try_emplace(existing->second);
        return existing->second;
    }

    SequenceTrackId id{generate_id()};
    while (tracks.track_data.contains(id)) { id = SequenceTrackId{generate_id()}; }
    tracks.track_id_by_prop_path.emplace(encoded, id);
    tracks.track_data.emplace(id, BasicKeyframedTrack{{}, to_string(prop.path)});

    remove_static_override(snapshot, prop);
    return id;
}

void set_primitive_prop_as_static(ProjectSnapshot& snapshot, const PropLocation& prop, const Value& value) {
    if (auto* tracks = find_object_tracks(snapshot, prop)) {
        auto encoded = encode_path_to_prop(prop.path);
        if (auto id = tracks->track_id_by_prop_path.find(encoded); id != tracks->track_id_by_prop_path.end()) {
            tracks->track_data.erase(id->second);
            tracks->track_id_by_prop_path.erase(id);
        }
    }
    set_static_override(snapshot, prop, value);
}

KeyframeId set_keyframe_at_position(ProjectSnapshot& snapshot, const PropLocation& prop, double position,
                                    const Value& value) {
    if (!std::isfinite(position) || position < 0.0) {
        throw_error<InvalidArgument>("Keyframe position must be finite and not negative, got {}", position);
    }
    auto& keyframes = sequenced_track(snapshot, prop).keyframes;

    auto same = std::find_if(keyframes.begin(), keyframes.end(),
                             [position](const Keyframe& keyframe) { return keyframe.position == position; });
    if (same != keyframes.end()) {
        same->value = value;
        return same->id;
    }

    auto after = std::find_if(keyframes.begin(), keyframes.end(),
                              [position](const Keyframe& keyframe) { return keyframe.position > position; });

    Keyframe keyframe;
    keyframe.id = KeyframeId{generate_id()};
    keyframe.value = value;
    keyframe.position = position;
    keyframe.connected_right = after == keyframes.begin() ? true : std::prev(after)->connected_right;

    auto id = keyframe.id;
    keyframes.insert(after, std::move(keyframe));
    return id;
}

std::size_t delete_keyframes(ProjectSnapshot& snapshot, const PropLocation& prop, const std::vector<KeyframeId>& ids) {
    auto& keyframes = sequenced_track(snapshot, prop).keyframes;
    return std::erase_if(keyframes, [&ids](const Keyframe& keyframe) {
        return std::find(ids.begin(), ids.end(), keyframe.id) != ids.end();
    });
}

void set_static_override(ProjectSnapshot& snapshot, const PropLocation& prop, const Value& value) {
    auto& current = snapshot.sheets_by_id[prop.sheet_id].static_overrides.by_object[prop.object_key];
    if (!current.is_map()) { current = Value{ValueMap{}}; }
    current = prop.path.empty() ? deep_merge(current, value) : current.with_path(prop.path, value);
}

}  // namespace stagehand
