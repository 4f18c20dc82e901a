#pragma once

/**
 * @file registry.h
 * @brief The arena behind the public Project, Sheet, SheetObject and Sequence handles.
 *
 * Records are created on first request and live as long as the owning CoreContext. Handles are an index into
 * one of the record arrays, so copying a handle never copies state and a handle stays valid for the lifetime of
 * its context. Detached objects keep their record (and their atom, so outstanding pointers still resolve) but
 * reject further use.
 *
 * Every object value is recomputed from scratch when one of its inputs changes:
 *
 *   defaults <- initial value <- static overrides <- sequenced values
 *
 * and written into the object's atom with Atom::set_changed, so observers only hear about leaves that moved.
 */

#include <stagehand/core/address.h>
#include <stagehand/project/project_config.h>
#include <stagehand/project/snapshot.h>
#include <stagehand/prop_types/prop_type.h>
#include <stagehand/reactive/atom.h>
#include <stagehand/runtime/raf_driver.h>
#include <stagehand/sequence/audio_sync.h>
#include <stagehand/sequence/playback_controller.h>
#include <stagehand/stagehand_export.h>
#include <stagehand/util/log.h>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stagehand {

struct ProjectRecord {
    ProjectAddress address;
    ProjectConfig config;
    ProjectSnapshot state;
    log::logger_ptr logger;
    std::map<std::pair<SheetId, SheetInstanceId>, std::size_t> sheets;
};

struct SheetRecord {
    SheetAddress address;
    std::size_t project;
    std::map<ObjectAddressKey, std::size_t> objects;
    std::optional<std::size_t> sequence;
    // Snapshot tracks, copied and sorted by position: object -> encoded prop path -> track
    std::map<ObjectAddressKey, std::map<PathToPropEncoded, BasicKeyframedTrack>> sorted_tracks;
};

struct ObjectRecord {
    SheetObjectAddress address;
    std::size_t sheet;
    std::shared_ptr<const PropTypeConfig> config;
    Value initial_value;
    Atom::ptr atom;
    bool detached{false};
};

struct SequenceRecord {
    std::size_t sheet;
    PlaybackController::ptr controller;
    std::shared_ptr<AudioSync> audio;
};

class STAGEHAND_EXPORT Registry {
public:
    explicit Registry(RafDriver::ptr default_driver);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    ~Registry();

    /**
     * @brief Find or create a project. The snapshot is validated before anything is registered.
     * @throws InvalidArgument for a malformed id, or an existing id with a different config
     * @throws SchemaVersionMismatch for a snapshot at another definition version
     */
    std::size_t project(const ProjectId& id, ProjectConfig config);

    [[nodiscard]] std::optional<std::size_t> find_project(const ProjectId& id) const;

    std::size_t sheet(std::size_t project, const SheetId& sheet_id, const SheetInstanceId& instance_id);

    /**
     * @brief Find or create an object. A differing config replaces the old one only when `reconfigure` is set.
     * @throws InvalidArgument for a malformed key, a non-compound config or an unrequested reconfiguration
     */
    std::size_t object(std::size_t sheet, const ObjectAddressKey& key, std::shared_ptr<const PropTypeConfig> config,
                       bool reconfigure);

    [[nodiscard]] std::optional<std::size_t> existing_object(std::size_t sheet, const ObjectAddressKey& key) const;

    void detach_object(std::size_t sheet, const ObjectAddressKey& key);

    /**
     * @brief The sheet's sequence, created on first use.
     */
    std::size_t sequence(std::size_t sheet);

    /**
     * @brief Validate, then replace the project state and re-seed every sheet of the project.
     */
    void reload_state(std::size_t project, ProjectSnapshot snapshot);

    /**
     * @throws InvalidArgument when `partial` is not a map
     */
    void set_initial_value(std::size_t object, const Value& partial);

    void recompute_object(std::size_t object);

    void recompute_sheet(std::size_t sheet);

    [[nodiscard]] double sequence_position(std::size_t sheet) const;

    [[nodiscard]] ProjectRecord& project_record(std::size_t index) { return *_projects.at(index); }
    [[nodiscard]] const ProjectRecord& project_record(std::size_t index) const { return *_projects.at(index); }

    [[nodiscard]] SheetRecord& sheet_record(std::size_t index) { return *_sheets.at(index); }
    [[nodiscard]] const SheetRecord& sheet_record(std::size_t index) const { return *_sheets.at(index); }

    /**
     * @throws InvalidArgument when the object has been detached
     */
    [[nodiscard]] ObjectRecord& object_record(std::size_t index);
    [[nodiscard]] const ObjectRecord& object_record(std::size_t index) const;

    [[nodiscard]] bool is_detached(std::size_t object) const { return _objects.at(object)->detached; }

    [[nodiscard]] SequenceRecord& sequence_record(std::size_t index) { return *_sequences.at(index); }
    [[nodiscard]] const SequenceRecord& sequence_record(std::size_t index) const { return *_sequences.at(index); }

    [[nodiscard]] const RafDriver::ptr& default_driver() const noexcept { return _default_driver; }

private:
    [[nodiscard]] const SheetSnapshot* sheet_snapshot(const SheetRecord& sheet) const;
    void rebuild_tracks(SheetRecord& sheet);
    void sync_sequence_with_state(std::size_t sheet);

    RafDriver::ptr _default_driver;
    std::vector<std::unique_ptr<ProjectRecord>> _projects;
    std::vector<std::unique_ptr<SheetRecord>> _sheets;
    std::vector<std::unique_ptr<ObjectRecord>> _objects;
    std::vector<std::unique_ptr<SequenceRecord>> _sequences;
    std::unordered_map<ProjectId, std::size_t> _project_by_id;
};

}  // namespace stagehand
