#pragma once

/**
 * @file pointer.h
 * @brief Pointer - a lazy (atom, path) pair.
 *
 * Building a pointer performs no lookup; it only remembers which atom and which path it designates. The
 * value is read when the pointer is resolved, observed through on_change or turned into a prism.
 *
 * Usage:
 * @code
 * auto atom = Atom::create(ValueMap{{"position", ValueMap{{"x", 1.0}}}});
 * Pointer x = atom->pointer()["position"]["x"];
 * double now = val(x).as_number();
 * @endcode
 */

#include <stagehand/stagehand_export.h>
#include <stagehand/value/path.h>
#include <stagehand/value/value.h>

#include <cstdint>
#include <memory>
#include <string_view>

namespace stagehand {

class Atom;

class STAGEHAND_EXPORT Pointer {
public:
    /**
     * @brief The null pointer. It designates nothing and cannot be observed.
     */
    Pointer() = default;

    Pointer(std::weak_ptr<Atom> atom, std::uint64_t atom_id, PropPath path);

    [[nodiscard]] Pointer operator[](std::string_view field) const;

    [[nodiscard]] Pointer operator[](std::size_t index) const;

    [[nodiscard]] Pointer child(const PathKey& key) const;

    [[nodiscard]] const PropPath& path() const noexcept { return _path; }

    [[nodiscard]] std::uint64_t atom_id() const noexcept { return _atom_id; }

    /**
     * @return the atom, or nullptr when it is gone (or this is the null pointer)
     */
    [[nodiscard]] std::shared_ptr<Atom> atom() const { return _atom.lock(); }

    [[nodiscard]] const std::weak_ptr<Atom>& weak_atom() const noexcept { return _atom; }

    [[nodiscard]] bool is_null() const noexcept { return _atom_id == 0; }

    /**
     * @brief Read the value at the path now. A gone atom or a missing path yields undefined.
     */
    [[nodiscard]] Value resolve() const;

    bool operator==(const Pointer& other) const { return _atom_id == other._atom_id && _path == other._path; }

private:
    std::weak_ptr<Atom> _atom;
    std::uint64_t _atom_id{0};
    PropPath _path;
};

/**
 * @brief Read the value a pointer designates, once.
 */
[[nodiscard]] STAGEHAND_EXPORT Value val(const Pointer& pointer);

}  // namespace stagehand
