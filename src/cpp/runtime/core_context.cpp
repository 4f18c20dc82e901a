#include <stagehand/runtime/core_context.h>
#include <stagehand/util/log.h>

namespace stagehand {

CoreContext::CoreContext(CoreConfig config) : _config(std::move(config)) {
    log::set_level(_config.log_level);
    _default_driver = RafDriver::create(RafDriverConfig{_config.default_raf_driver_name, {}, {}});
    _registry = std::make_unique<Registry>(_default_driver);
    log::core()->debug("Core context created with raf driver '{}'", _default_driver->name());
}

CoreContext::~CoreContext() = default;

Project CoreContext::project(const ProjectId& id, ProjectConfig config) {
    return Project{*_registry, _registry->project(id, std::move(config))};
}

Unsubscribe CoreContext::on_change(const Observable& observable, ChangeCallback callback, RafDriver::ptr driver) const {
    const auto& target = driver ? driver : _default_driver;
    return stagehand::on_change(observable, std::move(callback), *target);
}

std::unique_ptr<FrameLoop> CoreContext::frame_loop(RafDriver::ptr driver) const {
    return std::make_unique<FrameLoop>(driver ? std::move(driver) : _default_driver, _config.frame_interval);
}

}  // namespace stagehand
