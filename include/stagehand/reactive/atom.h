#pragma once

/**
 * @file atom.h
 * @brief Atom - the owner of one live value tree.
 *
 * Atoms are the roots of the reactive graph. Reading is direct; every write records the written path as dirty
 * with each ticker observing the atom, and observers learn about the change on that ticker's next tick.
 *
 * Atoms are always owned by a shared_ptr (see create) because pointers refer to them weakly.
 */

#include <stagehand/reactive/listener_list.h>
#include <stagehand/reactive/pointer.h>
#include <stagehand/stagehand_export.h>
#include <stagehand/value/value.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace stagehand {

class STAGEHAND_EXPORT Atom : public std::enable_shared_from_this<Atom> {
public:
    using ptr = std::shared_ptr<Atom>;

    static ptr create(Value initial = Value{});

    Atom(const Atom&) = delete;
    Atom& operator=(const Atom&) = delete;

    /**
     * @brief Process-unique, never zero.
     */
    [[nodiscard]] std::uint64_t id() const noexcept { return _id; }

    [[nodiscard]] const Value& get() const noexcept { return _value; }

    [[nodiscard]] Value get_by_path(const PropPath& path) const { return _value.at_path(path); }

    /**
     * @brief Replace the whole tree. The root path is marked dirty.
     */
    void set(Value value);

    /**
     * @brief Replace the subtree at `path`, creating intermediate maps as required.
     * @throws InvalidArgument when an index step cannot be written (see Value::with_path)
     */
    void set_by_path(const PropPath& path, Value value);

    /**
     * @brief Replace the tree, marking dirty only the leaves that differ. A tree equal to the current one is a
     * no-op and notifies no one.
     */
    void set_changed(Value value);

    [[nodiscard]] Pointer pointer();

    void add_listener(DirtyListener* listener) { _listeners.add_listener(listener); }

    void remove_listener(DirtyListener* listener) { _listeners.remove_listener(listener); }

    [[nodiscard]] std::size_t listener_count() const { return _listeners.size(); }

private:
    explicit Atom(Value initial);

    std::uint64_t _id;
    Value _value;
    ListenerList _listeners;
};

/**
 * @brief Every path at which `before` and `after` differ, stopping at the first non-map on either side.
 */
[[nodiscard]] STAGEHAND_EXPORT std::vector<PropPath> changed_paths(const Value& before, const Value& after);

}  // namespace stagehand
