#include <stagehand/project/handles.h>

namespace stagehand {

const SheetObjectAddress& SheetObject::address() const { return _registry->object_record(_index).address; }

Sheet SheetObject::sheet() const { return Sheet{*_registry, _registry->object_record(_index).sheet}; }

const PropTypeConfig& SheetObject::config() const { return *_registry->object_record(_index).config; }

Value SheetObject::value() const { return _registry->object_record(_index).atom->get(); }

Pointer SheetObject::props() const { return _registry->object_record(_index).atom->pointer(); }

Unsubscribe SheetObject::on_values_change(ChangeCallback callback, RafDriver::ptr driver) const {
    auto pointer = props();
    const auto& target = driver ? driver : _registry->default_driver();
    return on_change(Observable{std::move(pointer)}, std::move(callback), *target);
}

void SheetObject::set_initial_value(const Value& partial) const { _registry->set_initial_value(_index, partial); }

bool SheetObject::is_detached() const { return _registry->is_detached(_index); }

}  // namespace stagehand
