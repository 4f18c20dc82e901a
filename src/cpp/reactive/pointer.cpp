#include <stagehand/reactive/atom.h>
#include <stagehand/reactive/pointer.h>

namespace stagehand {

Pointer::Pointer(std::weak_ptr<Atom> atom, std::uint64_t atom_id, PropPath path)
    : _atom(std::move(atom)), _atom_id(atom_id), _path(std::move(path)) {}

Pointer Pointer::child(const PathKey& key) const {
    PropPath path = _path;
    path.push_back(key);
    return Pointer{_atom, _atom_id, std::move(path)};
}

Pointer Pointer::operator[](std::string_view field) const { return child(PathKey::field(std::string{field})); }

Pointer Pointer::operator[](std::size_t index) const { return child(PathKey::index(index)); }

Value Pointer::resolve() const {
    auto atom = _atom.lock();
    if (!atom) {
        return Value{};
    }
    return atom->get_by_path(_path);
}

Value val(const Pointer& pointer) { return pointer.resolve(); }

}  // namespace stagehand
