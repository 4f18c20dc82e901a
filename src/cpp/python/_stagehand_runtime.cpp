#include <stagehand/python/nb_base.h>
#include <stagehand/runtime/core_context.h>

#include <chrono>

namespace {
    stagehand::ChangeCallback wrap_callback(nb::callable callback) {
        return [callback](const stagehand::Value &value) { callback(stagehand::python::to_python(value)); };
    }

    std::function<void()> wrap_hook(std::optional<nb::callable> hook) {
        if (!hook) { return {}; }
        return [fn = std::move(*hook)] { fn(); };
    }
} // namespace

void export_runtime(nb::module_ &m) {
    using namespace stagehand;

    nb::class_<RafDriver>(m, "RafDriver")
        .def_static("create", [](std::optional<std::string> name, std::optional<nb::callable> start,
                                 std::optional<nb::callable> stop) {
            return RafDriver::create(RafDriverConfig{std::move(name), wrap_hook(std::move(start)),
                                                     wrap_hook(std::move(stop))});
        }, "name"_a = nb::none(), "start"_a = nb::none(), "stop"_a = nb::none())
        .def_prop_ro("id", &RafDriver::id)
        .def_prop_ro("name", &RafDriver::name)
        .def_prop_ro("is_active", &RafDriver::is_active)
        .def("tick", &RafDriver::tick, "time_ms"_a);

    nb::class_<FrameLoop>(m, "FrameLoop")
        .def("run_for", [](FrameLoop &self, double duration_ms) {
            return self.run_for(std::chrono::milliseconds{static_cast<std::int64_t>(duration_ms)});
        }, "duration_ms"_a)
        .def("request_stop", &FrameLoop::request_stop);

    nb::class_<CoreContext>(m, "CoreContext")
        .def("__init__", [](CoreContext *self, const std::string &log_level,
                            std::optional<std::string> default_raf_driver_name, double frame_interval_ms) {
            new (self) CoreContext(CoreConfig{
                spdlog::level::from_str(log_level), std::move(default_raf_driver_name),
                std::chrono::milliseconds{static_cast<std::int64_t>(frame_interval_ms)}});
        }, "log_level"_a = "warn", "default_raf_driver_name"_a = nb::none(), "frame_interval_ms"_a = 16.0)
        .def("project", [](CoreContext &self, const std::string &id, const std::string &assets_base_url) {
            return self.project(ProjectId{id}, ProjectConfig{std::nullopt, AssetsConfig{assets_base_url}});
        }, "id"_a, "assets_base_url"_a = "", nb::keep_alive<0, 1>())
        .def_prop_ro("default_raf_driver", &CoreContext::default_raf_driver)
        .def("on_change", [](const CoreContext &self, const Observable &observable, nb::callable callback,
                             RafDriver::ptr driver) {
            return self.on_change(observable, wrap_callback(std::move(callback)), std::move(driver));
        }, "observable"_a, "callback"_a, "driver"_a = nb::none())
        .def("frame_loop", &CoreContext::frame_loop, "driver"_a = nb::none(), nb::keep_alive<0, 1>());

    m.def("on_change", [](const Observable &observable, nb::callable callback, RafDriver &driver,
                          bool fire_immediately) {
        return on_change(observable, wrap_callback(std::move(callback)), driver, fire_immediately);
    }, "observable"_a, "callback"_a, "driver"_a, "fire_immediately"_a = true);
}
