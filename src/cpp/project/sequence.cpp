#include <stagehand/project/handles.h>
#include <stagehand/util/errors.h>
#include <stagehand/value/path.h>

namespace stagehand {

Sheet Sequence::sheet() const { return Sheet{*_registry, _registry->sequence_record(_index).sheet}; }

PlaybackCompletion Sequence::play(const PlayOptions& options) const { return controller().play(options); }

void Sequence::pause() const { controller().pause(); }

double Sequence::position() const { return controller().position(); }

void Sequence::set_position(double value) const { controller().set_position(value); }

double Sequence::length() const { return controller().length(); }

PlaybackState Sequence::state() const { return controller().state(); }

bool Sequence::is_playing() const { return controller().is_playing(); }

Pointer Sequence::pointer() const { return controller().state_atom()->pointer(); }

std::vector<Keyframe> Sequence::keyframes(const Pointer& prop) const {
    const auto& sheet = _registry->sheet_record(_registry->sequence_record(_index).sheet);
    for (const auto& [key, object] : sheet.objects) {
        if (_registry->object_record(object).atom->id() != prop.atom_id()) { continue; }

        auto tracks = sheet.sorted_tracks.find(key);
        if (tracks == sheet.sorted_tracks.end()) { return {}; }
        auto track = tracks->second.find(encode_path_to_prop(prop.path()));
        if (track == tracks->second.end()) { return {}; }
        return track->second.keyframes;
    }
    throw_error<InvalidArgument>("Pointer {} does not belong to an object of sheet {}", to_string(prop.path()),
                                 to_string(sheet.address));
}

void Sequence::attach_audio(std::shared_ptr<AudioSync> audio) const {
    _registry->sequence_record(_index).audio = std::move(audio);
}

PlaybackController& Sequence::controller() const { return *_registry->sequence_record(_index).controller; }

}  // namespace stagehand
