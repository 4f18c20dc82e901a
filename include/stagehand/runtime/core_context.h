#pragma once

/**
 * @file core_context.h
 * @brief CoreContext - the entry point owning every project, sheet, object and sequence.
 *
 * @code
 * stagehand::CoreContext core;
 * auto project = core.project(stagehand::ProjectId{"my-project"});
 * auto box = project.sheet(stagehand::SheetId{"Scene"}).object(stagehand::ObjectAddressKey{"Box"},
 *     {{"x", 0.0}, {"y", 0.0}});
 * auto unsubscribe = box.on_values_change([](const stagehand::Value& v) { ... });
 * core.default_raf_driver()->tick(16.0);
 * @endcode
 *
 * The context is not thread safe. All calls, including ticks of its raf drivers, must come from one thread.
 */

#include <stagehand/project/handles.h>
#include <stagehand/runtime/core_config.h>
#include <stagehand/runtime/frame_loop.h>
#include <stagehand/runtime/raf_driver.h>
#include <stagehand/stagehand_export.h>

#include <memory>

namespace stagehand {

class STAGEHAND_EXPORT CoreContext {
public:
    explicit CoreContext(CoreConfig config = {});

    CoreContext(const CoreContext&) = delete;
    CoreContext& operator=(const CoreContext&) = delete;

    ~CoreContext();

    /**
     * @brief Find or create a project.
     * @throws InvalidArgument for an id shorter than three characters (or otherwise malformed), or when the id is
     *         already taken with a different config
     * @throws SchemaVersionMismatch when config.state was saved by another definition version
     */
    Project project(const ProjectId& id, ProjectConfig config = {});

    [[nodiscard]] const RafDriver::ptr& default_raf_driver() const noexcept { return _default_driver; }

    /**
     * @brief Observe a pointer or a prism on `driver`, the default driver when null.
     */
    [[nodiscard]] Unsubscribe on_change(const Observable& observable, ChangeCallback callback,
                                        RafDriver::ptr driver = nullptr) const;

    /**
     * @brief A wall-clock loop ticking `driver` (the default driver when null) at the configured frame interval.
     */
    [[nodiscard]] std::unique_ptr<FrameLoop> frame_loop(RafDriver::ptr driver = nullptr) const;

    [[nodiscard]] const CoreConfig& config() const noexcept { return _config; }

    [[nodiscard]] Registry& registry() noexcept { return *_registry; }

private:
    CoreConfig _config;
    RafDriver::ptr _default_driver;
    std::unique_ptr<Registry> _registry;
};

}  // namespace stagehand
