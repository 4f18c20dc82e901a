#include <stagehand/project/handles.h>

namespace stagehand {

const SheetAddress& Sheet::address() const { return _registry->sheet_record(_index).address; }

Project Sheet::project() const { return Project{*_registry, _registry->sheet_record(_index).project}; }

SheetObject Sheet::object(const ObjectAddressKey& key, const ShorthandProp& props, ObjectOptions options) const {
    return SheetObject{*_registry, _registry->object(_index, key, props.config(), options.reconfigure)};
}

std::optional<SheetObject> Sheet::existing_object(const ObjectAddressKey& key) const {
    if (auto index = _registry->existing_object(_index, key)) { return SheetObject{*_registry, *index}; }
    return std::nullopt;
}

void Sheet::detach_object(const ObjectAddressKey& key) const { _registry->detach_object(_index, key); }

Sequence Sheet::sequence() const { return Sequence{*_registry, _registry->sequence(_index)}; }

}  // namespace stagehand
