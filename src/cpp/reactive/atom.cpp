#include <stagehand/reactive/atom.h>

#include <atomic>

namespace stagehand {

namespace {

std::uint64_t next_atom_id() {
    static std::atomic<std::uint64_t> counter{0};
    return ++counter;
}

void collect_changes(const Value& before, const Value& after, PropPath& path, std::vector<PropPath>& out) {
    if (before.same(after)) {
        return;
    }
    if (!before.is_map() || !after.is_map()) {
        if (!(before == after)) {
            out.push_back(path);
        }
        return;
    }
    for (const auto& [key, child] : after.as_map()) {
        const Value* previous = before.find(key);
        path.emplace_back(key);
        collect_changes(previous != nullptr ? *previous : Value{}, child, path, out);
        path.pop_back();
    }
    for (const auto& [key, child] : before.as_map()) {
        if (!after.as_map().contains(key)) {
            path.emplace_back(key);
            out.push_back(path);
            path.pop_back();
        }
    }
}

}  // namespace

std::vector<PropPath> changed_paths(const Value& before, const Value& after) {
    std::vector<PropPath> out;
    PropPath path;
    collect_changes(before, after, path, out);
    return out;
}

Atom::ptr Atom::create(Value initial) { return ptr{new Atom(std::move(initial))}; }

Atom::Atom(Value initial) : _id(next_atom_id()), _value(std::move(initial)) {}

void Atom::set(Value value) {
    _value = std::move(value);
    _listeners.notify_dirty(*this, PropPath{});
}

void Atom::set_by_path(const PropPath& path, Value value) {
    _value = _value.with_path(path, std::move(value));
    _listeners.notify_dirty(*this, path);
}

void Atom::set_changed(Value value) {
    auto changes = changed_paths(_value, value);
    if (changes.empty()) {
        return;
    }
    _value = std::move(value);
    for (const auto& path : changes) {
        _listeners.notify_dirty(*this, path);
    }
}

Pointer Atom::pointer() { return Pointer{weak_from_this(), _id, PropPath{}}; }

}  // namespace stagehand
