#include <stagehand/project/registry.h>
#include <stagehand/sequence/track_sampler.h>
#include <stagehand/util/errors.h>
#include <stagehand/value/path.h>

#include <fmt/format.h>

namespace stagehand {

namespace {

Value initial_sequence_state(const PositionalSequence* sequence) {
    ValueMap state;
    state.set(std::string{sequence_state::PLAYING}, false);
    state.set(std::string{sequence_state::LENGTH}, sequence ? sequence->length : DEFAULT_SEQUENCE_LENGTH);
    state.set(std::string{sequence_state::POSITION}, 0.0);
    state.set(std::string{sequence_state::SUB_UNITS_PER_UNIT},
              sequence ? sequence->sub_units_per_unit : DEFAULT_SUB_UNITS_PER_UNIT);
    return Value{std::move(state)};
}

}  // namespace

Registry::Registry(RafDriver::ptr default_driver) : _default_driver(std::move(default_driver)) {
    if (!_default_driver) { throw_error<InvalidArgument>("Registry requires a raf driver"); }
}

Registry::~Registry() {
    // Controllers may outlive the registry through a ticker callback; their listeners capture this
    for (auto& sequence : _sequences) {
        sequence->controller->set_frame_listener({});
        sequence->controller->pause();
    }
}

std::size_t Registry::project(const ProjectId& id, ProjectConfig config) {
    validate_project_id(id.str());

    if (auto existing = find_project(id)) {
        if (_projects[*existing]->config == config) { return *existing; }
        throw_error<InvalidArgument>(
            "Project '{}' already exists with a different config; use Project::reload_state to replace its state", id);
    }

    auto logger = log::named("Project", id.str());
    ProjectSnapshot state = config.state.value_or(ProjectSnapshot{});
    if (config.state) { validate_snapshot(state, logger); }

    auto record = std::make_unique<ProjectRecord>();
    record->address = ProjectAddress{id};
    record->config = std::move(config);
    record->state = std::move(state);
    record->logger = std::move(logger);

    auto index = _projects.size();
    _projects.push_back(std::move(record));
    _project_by_id.emplace(id, index);
    _projects[index]->logger->debug("Project created");
    return index;
}

std::optional<std::size_t> Registry::find_project(const ProjectId& id) const {
    auto it = _project_by_id.find(id);
    if (it == _project_by_id.end()) { return std::nullopt; }
    return it->second;
}

std::size_t Registry::sheet(std::size_t project, const SheetId& sheet_id, const SheetInstanceId& instance_id) {
    validate_name(sheet_id.str(), "sheet id");
    validate_name(instance_id.str(), "sheet instance id");

    auto& project_rec = project_record(project);
    auto key = std::make_pair(sheet_id, instance_id);
    if (auto it = project_rec.sheets.find(key); it != project_rec.sheets.end()) { return it->second; }

    auto record = std::make_unique<SheetRecord>();
    record->address.project_id = project_rec.address.project_id;
    record->address.sheet_id = sheet_id;
    record->address.sheet_instance_id = instance_id;
    record->project = project;
    rebuild_tracks(*record);

    auto index = _sheets.size();
    _sheets.push_back(std::move(record));
    project_rec.sheets.emplace(std::move(key), index);
    project_rec.logger->debug("Sheet {} created", to_string(_sheets[index]->address));
    return index;
}

std::size_t Registry::object(std::size_t sheet, const ObjectAddressKey& key,
                             std::shared_ptr<const PropTypeConfig> config, bool reconfigure) {
    validate_name(key.str(), "object key");
    if (!config || config->kind() != PropTypeKind::compound) {
        throw_error<InvalidArgument>("The props of object '{}' must be a compound", key);
    }

    auto& sheet_rec = sheet_record(sheet);
    if (auto it = sheet_rec.objects.find(key); it != sheet_rec.objects.end()) {
        auto& existing = *_objects[it->second];
        if (*existing.config == *config) { return it->second; }
        if (!reconfigure) {
            throw_error<InvalidArgument>(
                "Object {} already exists with different props; pass reconfigure to replace them",
                to_string(existing.address));
        }
        existing.config = std::move(config);
        existing.initial_value = sanitize(*existing.config, existing.initial_value).value_or(Value{ValueMap{}});
        project_record(sheet_rec.project).logger->debug("Object {} reconfigured", to_string(existing.address));
        recompute_object(it->second);
        return it->second;
    }

    auto record = std::make_unique<ObjectRecord>();
    record->address.project_id = sheet_rec.address.project_id;
    record->address.sheet_id = sheet_rec.address.sheet_id;
    record->address.sheet_instance_id = sheet_rec.address.sheet_instance_id;
    record->address.object_key = key;
    record->sheet = sheet;
    record->initial_value = Value{ValueMap{}};
    record->atom = Atom::create(materialize_default(*config));
    record->config = std::move(config);

    auto index = _objects.size();
    _objects.push_back(std::move(record));
    sheet_rec.objects.emplace(key, index);
    recompute_object(index);
    return index;
}

std::optional<std::size_t> Registry::existing_object(std::size_t sheet, const ObjectAddressKey& key) const {
    const auto& objects = sheet_record(sheet).objects;
    auto it = objects.find(key);
    if (it == objects.end()) { return std::nullopt; }
    return it->second;
}

void Registry::detach_object(std::size_t sheet, const ObjectAddressKey& key) {
    auto& sheet_rec = sheet_record(sheet);
    auto it = sheet_rec.objects.find(key);
    if (it == sheet_rec.objects.end()) {
        project_record(sheet_rec.project)
            .logger->warn("Cannot detach object '{}' of sheet {}: no such object", key, to_string(sheet_rec.address));
        return;
    }
    _objects[it->second]->detached = true;
    sheet_rec.objects.erase(it);
}

std::size_t Registry::sequence(std::size_t sheet) {
    auto& sheet_rec = sheet_record(sheet);
    if (sheet_rec.sequence) { return *sheet_rec.sequence; }

    const auto* snapshot = sheet_snapshot(sheet_rec);
    const PositionalSequence* positional = snapshot && snapshot->sequence ? &*snapshot->sequence : nullptr;

    auto atom = Atom::create(initial_sequence_state(positional));
    auto logger = log::named("Sequence", to_string(sheet_rec.address));
    auto index = _sequences.size();

    auto record = std::make_unique<SequenceRecord>();
    record->sheet = sheet;
    record->controller = PlaybackController::create(std::move(atom), _default_driver, std::move(logger));
    record->controller->set_frame_listener([this, sheet, index](const PlaybackFrame& frame) {
        recompute_sheet(sheet);
        if (const auto& audio = _sequences[index]->audio) { audio->on_frame(frame); }
    });

    _sequences.push_back(std::move(record));
    sheet_rec.sequence = index;
    return index;
}

void Registry::reload_state(std::size_t project, ProjectSnapshot snapshot) {
    auto& project_rec = project_record(project);
    validate_snapshot(snapshot, project_rec.logger);
    project_rec.state = std::move(snapshot);
    project_rec.logger->debug("State reloaded");

    for (const auto& [key, sheet] : project_rec.sheets) {
        rebuild_tracks(*_sheets[sheet]);
        sync_sequence_with_state(sheet);
        recompute_sheet(sheet);
    }
}

void Registry::set_initial_value(std::size_t object, const Value& partial) {
    auto& record = object_record(object);
    if (!partial.is_map()) {
        throw_error<InvalidArgument>("Initial value of {} must be a map, got {}", to_string(record.address),
                                     to_string(partial.kind()));
    }
    auto sanitized = sanitize(*record.config, partial);
    if (!sanitized) {
        throw_error<InvalidArgument>("Initial value {} does not match the props of {}", partial.to_string(),
                                     to_string(record.address));
    }
    record.initial_value = deep_merge(record.initial_value, *sanitized);
    recompute_object(object);
}

void Registry::recompute_object(std::size_t object) {
    auto& record = *_objects.at(object);
    if (record.detached) { return; }

    const auto& sheet_rec = sheet_record(record.sheet);
    const auto& config = *record.config;
    const auto& key = record.address.object_key;

    Value value = deep_merge(materialize_default(config), record.initial_value);

    if (const auto* snapshot = sheet_snapshot(sheet_rec)) {
        if (auto it = snapshot->static_overrides.by_object.find(key); it != snapshot->static_overrides.by_object.end()) {
            if (auto overrides = sanitize(config, it->second)) {
                value = deep_merge(value, *overrides);
            } else {
                project_record(sheet_rec.project)
                    .logger->debug("Ignoring static overrides of {} that do not match its props",
                                   to_string(record.address));
            }
        }
    }

    if (auto tracks = sheet_rec.sorted_tracks.find(key); tracks != sheet_rec.sorted_tracks.end()) {
        double position = sequence_position(record.sheet);
        for (const auto& [encoded, track] : tracks->second) {
            auto path = decode_path_to_prop(encoded);
            const auto* prop = config_at_path(config, path);
            if (prop == nullptr || !prop->is_simple()) { continue; }
            if (auto sampled = sample_track(track, position, *prop)) { value = value.with_path(path, *sampled); }
        }
    }

    record.atom->set_changed(std::move(value));
}

void Registry::recompute_sheet(std::size_t sheet) {
    for (const auto& [key, object] : sheet_record(sheet).objects) { recompute_object(object); }
}

double Registry::sequence_position(std::size_t sheet) const {
    const auto& sheet_rec = sheet_record(sheet);
    if (!sheet_rec.sequence) { return 0.0; }
    return _sequences[*sheet_rec.sequence]->controller->position();
}

ObjectRecord& Registry::object_record(std::size_t index) {
    auto& record = *_objects.at(index);
    if (record.detached) {
        throw_error<InvalidArgument>("Object {} has been detached", to_string(record.address));
    }
    return record;
}

const ObjectRecord& Registry::object_record(std::size_t index) const {
    const auto& record = *_objects.at(index);
    if (record.detached) {
        throw_error<InvalidArgument>("Object {} has been detached", to_string(record.address));
    }
    return record;
}

const SheetSnapshot* Registry::sheet_snapshot(const SheetRecord& sheet) const {
    const auto& sheets = project_record(sheet.project).state.sheets_by_id;
    auto it = sheets.find(sheet.address.sheet_id);
    return it == sheets.end() ? nullptr : &it->second;
}

void Registry::rebuild_tracks(SheetRecord& sheet) {
    sheet.sorted_tracks.clear();
    const auto* snapshot = sheet_snapshot(sheet);
    if (snapshot == nullptr || !snapshot->sequence) { return; }

    for (const auto& [object, tracks] : snapshot->sequence->tracks_by_object) {
        auto& sorted = sheet.sorted_tracks[object];
        for (const auto& [encoded, track_id] : tracks.track_id_by_prop_path) {
            auto track = tracks.track_data.find(track_id);
            if (track == tracks.track_data.end()) { continue; }
            sorted.emplace(encoded, BasicKeyframedTrack{sorted_by_position(track->second.keyframes),
                                                        track->second.debug_name});
        }
    }
}

void Registry::sync_sequence_with_state(std::size_t sheet) {
    const auto& sheet_rec = sheet_record(sheet);
    if (!sheet_rec.sequence) { return; }

    const auto* snapshot = sheet_snapshot(sheet_rec);
    const PositionalSequence* positional = snapshot && snapshot->sequence ? &*snapshot->sequence : nullptr;
    auto& controller = *_sequences[*sheet_rec.sequence]->controller;
    controller.set_length(positional ? positional->length : DEFAULT_SEQUENCE_LENGTH);
    controller.state_atom()->set_by_path(PropPath{PathKey{std::string{sequence_state::SUB_UNITS_PER_UNIT}}},
                                         positional ? positional->sub_units_per_unit : DEFAULT_SUB_UNITS_PER_UNIT);
}

}  // namespace stagehand
