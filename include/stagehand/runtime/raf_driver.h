#pragma once

/**
 * @file raf_driver.h
 * @brief RafDriver - a named, numbered owner of a ticker.
 *
 * The driver is the bridge between an external frame source (a display refresh callback, a FrameLoop, a test
 * calling tick directly) and the reactive graph. The optional start and stop hooks are called when the ticker
 * goes from idle to active and back, so a frame source only needs to run while something is observed or
 * playing.
 */

#include <stagehand/reactive/ticker.h>
#include <stagehand/stagehand_export.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace stagehand {

struct RafDriverConfig {
    std::optional<std::string> name;
    std::function<void()> start;
    std::function<void()> stop;
};

class STAGEHAND_EXPORT RafDriver {
public:
    using ptr = std::shared_ptr<RafDriver>;

    explicit RafDriver(RafDriverConfig config = {});

    static ptr create(RafDriverConfig config = {}) { return std::make_shared<RafDriver>(std::move(config)); }

    RafDriver(const RafDriver&) = delete;
    RafDriver& operator=(const RafDriver&) = delete;

    /**
     * @brief Process-unique, starting at 1.
     */
    [[nodiscard]] std::uint64_t id() const noexcept { return _id; }

    /**
     * @brief The configured name, or "CustomRafDriver-<id>".
     */
    [[nodiscard]] const std::string& name() const noexcept { return _name; }

    /**
     * @brief Advance to `time_ms`; see Ticker::tick.
     */
    void tick(double time_ms) { _ticker->tick(time_ms); }

    [[nodiscard]] Ticker& ticker() noexcept { return *_ticker; }

    [[nodiscard]] const Ticker::ptr& ticker_ptr() const noexcept { return _ticker; }

    /**
     * @brief True between the start and stop hooks, i.e. while the ticker has work.
     */
    [[nodiscard]] bool is_active() const noexcept { return !_ticker->is_idle(); }

private:
    std::uint64_t _id;
    std::string _name;
    Ticker::ptr _ticker;
};

/**
 * @brief Observe a pointer or prism, delivering on the driver's ticker.
 * @throws InvalidArgument on the null pointer or the empty prism
 */
[[nodiscard]] STAGEHAND_EXPORT Unsubscribe on_change(const Observable& observable, ChangeCallback callback,
                                                     RafDriver& driver, bool fire_immediately = true);

}  // namespace stagehand
