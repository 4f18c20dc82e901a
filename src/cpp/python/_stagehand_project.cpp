#include <stagehand/python/nb_base.h>
#include <stagehand/runtime/core_context.h>
#include <stagehand/value/path.h>

#include <nanobind/operators.h>
#include <nanobind/stl/pair.h>

namespace {
    using namespace stagehand;

    /**
     * Forwards frames to a Python callable taking (position, playing, rate).
     */
    class CallbackAudioSync final : public AudioSync {
    public:
        explicit CallbackAudioSync(nb::callable callback) : _callback(std::move(callback)) {}

        void on_frame(const PlaybackFrame &frame) override { _callback(frame.position, frame.playing, frame.rate); }

    private:
        nb::callable _callback;
    };
} // namespace

void export_project(nb::module_ &m) {
    using namespace stagehand;

    nb::enum_<PlaybackState>(m, "PlaybackState")
        .value("idle", PlaybackState::idle)
        .value("playing", PlaybackState::playing)
        .value("paused", PlaybackState::paused);

    nb::enum_<PlaybackDirection>(m, "PlaybackDirection")
        .value("normal", PlaybackDirection::normal)
        .value("reverse", PlaybackDirection::reverse)
        .value("alternate", PlaybackDirection::alternate)
        .value("alternate_reverse", PlaybackDirection::alternate_reverse);

    nb::class_<PlaybackCompletion>(m, "PlaybackCompletion")
        .def_prop_ro("is_resolved", &PlaybackCompletion::is_resolved)
        .def_prop_ro("result", &PlaybackCompletion::result)
        .def("then", [](const PlaybackCompletion &self, nb::callable fn) {
            self.then([fn](bool finished) { fn(finished); });
        }, "fn"_a)
        .def("cancel", &PlaybackCompletion::cancel);

    nb::class_<Project>(m, "Project")
        .def_prop_ro("id", [](const Project &self) { return self.id().str(); })
        .def_prop_ro("is_ready", &Project::is_ready)
        .def("sheet", [](const Project &self, const std::string &sheet_id, const std::string &instance_id) {
            return self.sheet(SheetId{sheet_id}, SheetInstanceId{instance_id});
        }, "sheet_id"_a, "instance_id"_a = "default", nb::keep_alive<0, 1>())
        .def("asset_url", &Project::asset_url, "asset"_a)
        .def(nb::self == nb::self);

    nb::class_<Sheet>(m, "Sheet")
        .def_prop_ro("address", [](const Sheet &self) { return to_string(self.address()); })
        .def("object", [](const Sheet &self, const std::string &key, nb::handle props, bool reconfigure) {
            return self.object(ObjectAddressKey{key}, python::shorthand_from_python(props), ObjectOptions{reconfigure});
        }, "key"_a, "props"_a, "reconfigure"_a = false, nb::keep_alive<0, 1>())
        .def("existing_object", [](const Sheet &self, const std::string &key) {
            return self.existing_object(ObjectAddressKey{key});
        }, "key"_a, nb::keep_alive<0, 1>())
        .def("detach_object", [](const Sheet &self, const std::string &key) {
            self.detach_object(ObjectAddressKey{key});
        }, "key"_a)
        .def("sequence", &Sheet::sequence, nb::keep_alive<0, 1>())
        .def(nb::self == nb::self);

    nb::class_<SheetObject>(m, "SheetObject")
        .def_prop_ro("address", [](const SheetObject &self) { return to_string(self.address()); })
        .def_prop_ro("value", [](const SheetObject &self) { return python::to_python(self.value()); })
        .def_prop_ro("props", &SheetObject::props)
        .def_prop_ro("is_detached", &SheetObject::is_detached)
        .def("on_values_change", [](const SheetObject &self, nb::callable callback, RafDriver::ptr driver) {
            return self.on_values_change(
                [callback](const Value &value) { callback(python::to_python(value)); }, std::move(driver));
        }, "callback"_a, "driver"_a = nb::none())
        .def("set_initial_value", [](const SheetObject &self, nb::handle partial) {
            self.set_initial_value(python::from_python(partial));
        }, "partial"_a)
        .def(nb::self == nb::self);

    nb::class_<Sequence>(m, "Sequence")
        .def("play", [](const Sequence &self, double iteration_count, std::optional<std::pair<double, double>> range,
                        double rate, PlaybackDirection direction, RafDriver::ptr raf_driver) {
            PlayOptions options;
            options.iteration_count = iteration_count;
            if (range) { options.range = PlaybackRange{range->first, range->second}; }
            options.rate = rate;
            options.direction = direction;
            options.raf_driver = std::move(raf_driver);
            return self.play(options);
        }, "iteration_count"_a = 1.0, "range"_a = nb::none(), "rate"_a = 1.0,
           "direction"_a = PlaybackDirection::normal, "raf_driver"_a = nb::none())
        .def("pause", &Sequence::pause)
        .def_prop_rw("position", &Sequence::position, &Sequence::set_position)
        .def_prop_ro("length", &Sequence::length)
        .def_prop_ro("state", &Sequence::state)
        .def_prop_ro("is_playing", &Sequence::is_playing)
        .def_prop_ro("pointer", &Sequence::pointer)
        .def("attach_audio", [](const Sequence &self, std::optional<nb::callable> callback) {
            self.attach_audio(callback ? std::make_shared<CallbackAudioSync>(std::move(*callback)) : nullptr);
        }, "callback"_a = nb::none())
        .def(nb::self == nb::self);
}
