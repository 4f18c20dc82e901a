#include <stagehand/reactive/prism.h>
#include <stagehand/util/errors.h>
#include <stagehand/util/overloaded.h>

namespace stagehand {

Prism::Prism(std::vector<Dependency> dependencies, compute_fn compute) {
    if (!compute) {
        throw_error<InvalidArgument>("A prism needs a compute function");
    }
    _state = std::make_shared<const State>(State{std::move(dependencies), std::move(compute)});
}

Value Prism::get() const {
    if (empty()) {
        throw_error<InvalidArgument>("Cannot evaluate an empty prism");
    }
    return _state->compute();
}

const std::vector<Dependency>& Prism::dependencies() const {
    static const std::vector<Dependency> none;
    return _state ? _state->dependencies : none;
}

Prism Prism::map(std::function<Value(const Value&)> fn) const {
    if (empty()) {
        throw_error<InvalidArgument>("Cannot map an empty prism");
    }
    auto state = _state;
    return Prism{state->dependencies, [state, fn = std::move(fn)]() { return fn(state->compute()); }};
}

Prism Prism::combine(std::vector<Prism> prisms, std::function<Value(const std::vector<Value>&)> fn) {
    std::vector<Dependency> dependencies;
    for (const auto& prism : prisms) {
        if (prism.empty()) {
            throw_error<InvalidArgument>("Cannot combine an empty prism");
        }
        const auto& deps = prism.dependencies();
        dependencies.insert(dependencies.end(), deps.begin(), deps.end());
    }
    return Prism{std::move(dependencies), [prisms = std::move(prisms), fn = std::move(fn)]() {
                     std::vector<Value> values;
                     values.reserve(prisms.size());
                     for (const auto& prism : prisms) {
                         values.push_back(prism.get());
                     }
                     return fn(values);
                 }};
}

Prism pointer_to_prism(const Pointer& pointer) {
    if (pointer.is_null()) {
        throw_error<InvalidArgument>("Cannot make a prism from a null pointer");
    }
    return Prism{{Dependency{pointer.weak_atom(), pointer.atom_id(), pointer.path()}},
                 [pointer]() { return pointer.resolve(); }};
}

Value val(const Prism& prism) { return prism.get(); }

Prism to_prism(const Observable& observable) {
    return std::visit(overloaded{
                          [](const Pointer& pointer) { return pointer_to_prism(pointer); },
                          [](const Prism& prism) {
                              if (prism.empty()) {
                                  throw_error<InvalidArgument>("Cannot observe an empty prism");
                              }
                              return prism;
                          },
                      },
                      observable);
}

}  // namespace stagehand
