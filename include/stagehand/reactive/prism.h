#pragma once

/**
 * @file prism.h
 * @brief Prism - a live computed value with explicit dependencies.
 *
 * A prism pairs a compute function with the (atom, path) dependencies it reads. A ticker re-evaluates a
 * subscribed prism when a write intersects one of those dependencies. Prisms hold their atoms weakly and are
 * cheap to copy; copies share the same compute function.
 *
 * Usage:
 * @code
 * Prism x = pointer_to_prism(atom->pointer()["x"]);
 * Prism doubled = x.map([](const Value& v) { return Value{v.as_number() * 2.0}; });
 * Prism sum = Prism::combine({x, doubled}, [](const std::vector<Value>& vs) {
 *     return Value{vs[0].as_number() + vs[1].as_number()};
 * });
 * @endcode
 */

#include <stagehand/reactive/pointer.h>
#include <stagehand/stagehand_export.h>
#include <stagehand/value/value.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <variant>
#include <vector>

namespace stagehand {

struct Dependency {
    std::weak_ptr<Atom> atom;
    std::uint64_t atom_id{0};
    PropPath path;
};

class STAGEHAND_EXPORT Prism {
public:
    using compute_fn = std::function<Value()>;

    /**
     * @brief The empty prism. It computes nothing and cannot be observed.
     */
    Prism() = default;

    Prism(std::vector<Dependency> dependencies, compute_fn compute);

    [[nodiscard]] bool empty() const noexcept { return !_state; }

    /**
     * @brief Evaluate now.
     * @throws InvalidArgument on the empty prism
     */
    [[nodiscard]] Value get() const;

    [[nodiscard]] const std::vector<Dependency>& dependencies() const;

    /**
     * @brief A prism over the same dependencies whose value is fn(this->get()).
     */
    [[nodiscard]] Prism map(std::function<Value(const Value&)> fn) const;

    /**
     * @brief A prism over the union of the inputs' dependencies whose value is fn of their values, in order.
     */
    [[nodiscard]] static Prism combine(std::vector<Prism> prisms, std::function<Value(const std::vector<Value>&)> fn);

private:
    struct State {
        std::vector<Dependency> dependencies;
        compute_fn compute;
    };

    std::shared_ptr<const State> _state;
};

/**
 * @brief A prism that re-resolves the pointer on every read.
 * @throws InvalidArgument on the null pointer
 */
[[nodiscard]] STAGEHAND_EXPORT Prism pointer_to_prism(const Pointer& pointer);

[[nodiscard]] STAGEHAND_EXPORT Value val(const Prism& prism);

/**
 * @brief Anything that can be passed to on_change.
 */
using Observable = std::variant<Pointer, Prism>;

/**
 * @throws InvalidArgument on the null pointer or the empty prism
 */
[[nodiscard]] STAGEHAND_EXPORT Prism to_prism(const Observable& observable);

}  // namespace stagehand
