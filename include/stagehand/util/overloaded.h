#pragma once

namespace stagehand {

/**
 * @brief Combines multiple callables into a single overloaded callable, for use with std::visit.
 */
template<typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};

template<typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

}  // namespace stagehand
