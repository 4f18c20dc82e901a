#pragma once

/**
 * @file handles.h
 * @brief The public Project, Sheet, SheetObject and Sequence handles.
 *
 * Handles are small copyable values (a registry and an index). Two handles compare equal when they refer to the
 * same record. They must not outlive the CoreContext that handed them out.
 */

#include <stagehand/project/registry.h>
#include <stagehand/prop_types/types.h>
#include <stagehand/reactive/prism.h>
#include <stagehand/reactive/ticker.h>
#include <stagehand/sequence/keyframe.h>
#include <stagehand/stagehand_export.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stagehand {

class Sheet;
class SheetObject;
class Sequence;

inline const SheetInstanceId DEFAULT_SHEET_INSTANCE_ID{"default"};

class STAGEHAND_EXPORT Project {
public:
    Project(Registry& registry, std::size_t index) : _registry(&registry), _index(index) {}

    [[nodiscard]] const ProjectAddress& address() const;

    [[nodiscard]] const ProjectId& id() const { return address().project_id; }

    /**
     * @brief Projects are ready as soon as they are created; there is no asynchronous loading.
     */
    [[nodiscard]] bool is_ready() const noexcept { return true; }

    /**
     * @brief The url of an asset under the configured base url, or nullopt for an asset with no id.
     */
    [[nodiscard]] std::optional<std::string> asset_url(const Asset& asset) const;

    /**
     * @throws InvalidArgument for a malformed sheet or instance id
     */
    [[nodiscard]] Sheet sheet(const SheetId& sheet_id,
                              const SheetInstanceId& instance_id = DEFAULT_SHEET_INSTANCE_ID) const;

    /**
     * @brief A copy of the current snapshot.
     */
    [[nodiscard]] ProjectSnapshot state() const;

    void reload_state(ProjectSnapshot snapshot) const;

    [[nodiscard]] const ProjectConfig& config() const;

    bool operator==(const Project&) const = default;

private:
    Registry* _registry;
    std::size_t _index;
};

struct ObjectOptions {
    /// Replace the props of an existing object with the same key instead of throwing
    bool reconfigure{false};
};

class STAGEHAND_EXPORT Sheet {
public:
    Sheet(Registry& registry, std::size_t index) : _registry(&registry), _index(index) {}

    [[nodiscard]] const SheetAddress& address() const;

    [[nodiscard]] Project project() const;

    /**
     * @brief Find or create the object `key` with `props` (which must describe a compound).
     *
     * Asking again with equal props returns the same object. Different props throw InvalidArgument unless
     * `options.reconfigure` is set.
     */
    SheetObject object(const ObjectAddressKey& key, const ShorthandProp& props, ObjectOptions options = {}) const;

    [[nodiscard]] std::optional<SheetObject> existing_object(const ObjectAddressKey& key) const;

    /**
     * @brief Forget the object. Its handles throw from then on; a later object() with the key starts afresh.
     */
    void detach_object(const ObjectAddressKey& key) const;

    /**
     * @brief The sheet's timeline, created on first use.
     */
    [[nodiscard]] Sequence sequence() const;

    bool operator==(const Sheet&) const = default;

private:
    Registry* _registry;
    std::size_t _index;
};

class STAGEHAND_EXPORT SheetObject {
public:
    SheetObject(Registry& registry, std::size_t index) : _registry(&registry), _index(index) {}

    [[nodiscard]] const SheetObjectAddress& address() const;

    [[nodiscard]] Sheet sheet() const;

    [[nodiscard]] const PropTypeConfig& config() const;

    /**
     * @brief The current value tree: defaults, initial value, static overrides and sequenced values merged.
     */
    [[nodiscard]] Value value() const;

    /**
     * @brief A pointer to the root of the value tree; index it to reach single props.
     */
    [[nodiscard]] Pointer props() const;

    /**
     * @brief Observe the value tree. Fires immediately, then at most once per tick of `driver` (the context's
     * default driver when null).
     */
    [[nodiscard]] Unsubscribe on_values_change(ChangeCallback callback, RafDriver::ptr driver = nullptr) const;

    /**
     * @brief Merge `partial` into the initial value. Static overrides and sequenced values still take precedence.
     * @throws InvalidArgument when `partial` does not match the props
     */
    void set_initial_value(const Value& partial) const;

    [[nodiscard]] bool is_detached() const;

    bool operator==(const SheetObject&) const = default;

private:
    Registry* _registry;
    std::size_t _index;
};

class STAGEHAND_EXPORT Sequence {
public:
    Sequence(Registry& registry, std::size_t index) : _registry(&registry), _index(index) {}

    [[nodiscard]] Sheet sheet() const;

    PlaybackCompletion play(const PlayOptions& options = {}) const;

    void pause() const;

    [[nodiscard]] double position() const;

    /**
     * @brief Pause and jump to `value`, clamped to [0, length].
     */
    void set_position(double value) const;

    [[nodiscard]] double length() const;

    [[nodiscard]] PlaybackState state() const;

    [[nodiscard]] bool is_playing() const;

    /**
     * @brief Pointer to the sequence state {playing, length, position, subUnitsPerUnit}.
     */
    [[nodiscard]] Pointer pointer() const;

    /**
     * @brief The keyframes of the prop `prop`, sorted by position; empty when the prop is not sequenced.
     * @throws InvalidArgument when `prop` does not point into an object of this sheet
     */
    [[nodiscard]] std::vector<Keyframe> keyframes(const Pointer& prop) const;

    /**
     * @brief Receive every frame of this sequence. Replaces any previously attached sync; null detaches.
     */
    void attach_audio(std::shared_ptr<AudioSync> audio) const;

    bool operator==(const Sequence&) const = default;

private:
    [[nodiscard]] PlaybackController& controller() const;

    Registry* _registry;
    std::size_t _index;
};

}  // namespace stagehand
