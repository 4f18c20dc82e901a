#pragma once

/**
 * @file ticker.h
 * @brief Ticker - batches dirty paths and delivers change notifications once per tick.
 *
 * A ticker watches the atoms its subscriptions depend on. Writes to those atoms only record the written path in
 * the ticker's dirty set; nothing is evaluated until tick(time) runs, which:
 *
 * 1. drains the dirty set into the set of pending subscriptions (those with an intersecting dependency),
 * 2. runs the registered tick callbacks (timeline players) with the tick time,
 * 3. drains the dirty set again, collecting what the tick callbacks wrote,
 * 4. delivers each pending subscription at most once, and only if its value differs from the one it was last
 *    given.
 *
 * Writes made by subscription callbacks during step 4 are delivered on the following tick.
 *
 * A ticker is idle while it has neither subscriptions nor tick callbacks. The idle to active and active to
 * idle transitions call the optional hooks, which a raf driver uses to start and stop its frame source.
 */

#include <stagehand/reactive/listener_list.h>
#include <stagehand/reactive/prism.h>
#include <stagehand/stagehand_export.h>
#include <stagehand/util/reference_count_subscriber.h>
#include <stagehand/value/value.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <unordered_map>
#include <vector>

namespace stagehand {

using ChangeCallback = std::function<void(const Value&)>;

/**
 * @brief Removes a subscription or a tick callback. Calling it more than once, or after the ticker is gone,
 * does nothing. Copies share the same state.
 */
using Unsubscribe = std::function<void()>;

using TickCallback = std::function<void(double time_ms)>;

struct TickerHooks {
    std::function<void()> on_active;
    std::function<void()> on_idle;
};

class STAGEHAND_EXPORT Ticker final : public DirtyListener, public std::enable_shared_from_this<Ticker> {
public:
    using ptr = std::shared_ptr<Ticker>;

    static ptr create(TickerHooks hooks = {});

    ~Ticker() override;

    Ticker(const Ticker&) = delete;
    Ticker& operator=(const Ticker&) = delete;

    /**
     * @brief Run one propagation round at `time_ms`. A time earlier than the current one is clamped to it.
     * @throws InvalidArgument when called from inside a tick, or with a non-finite time
     */
    void tick(double time_ms);

    /**
     * @brief The time of the last tick, or nullopt before the first.
     */
    [[nodiscard]] std::optional<double> time() const noexcept { return _time; }

    [[nodiscard]] bool is_ticking() const noexcept { return _ticking; }

    [[nodiscard]] bool is_idle() const noexcept { return _subscriptions.empty() && _tick_callbacks.empty(); }

    [[nodiscard]] std::size_t subscription_count() const noexcept { return _subscriptions.size(); }

    [[nodiscard]] std::size_t tick_callback_count() const noexcept { return _tick_callbacks.size(); }

    /**
     * @brief Subscribe to a prism. The callback is called at most once per tick when the value differs from the
     * one it last saw.
     *
     * With `fire_immediately` the callback is also called right away with the current value. Without it the
     * registration-time value counts as seen, so the first call comes from the first tick that changes it.
     * @throws InvalidArgument on the empty prism
     */
    [[nodiscard]] Unsubscribe subscribe(const Prism& prism, ChangeCallback callback, bool fire_immediately = true);

    /**
     * @brief Register a callback run during every tick (step 2) until removed.
     */
    [[nodiscard]] Unsubscribe on_tick(TickCallback callback);

    void mark_dirty(const Atom& atom, const PropPath& path) override;

private:
    explicit Ticker(TickerHooks hooks);

    struct Subscription {
        Prism prism;
        ChangeCallback callback;
        Value last_value;
    };

    Unsubscribe make_unsubscribe(std::uint64_t id, bool tick_callback);
    void remove_subscription(std::uint64_t id);
    void remove_tick_callback(std::uint64_t id);
    void watch(const Dependency& dependency);
    void unwatch(const Dependency& dependency);
    void drain_dirty();
    void notify_transition(bool was_idle);

    TickerHooks _hooks;
    std::optional<double> _time;
    bool _ticking{false};
    std::uint64_t _next_id{1};

    std::map<std::uint64_t, Subscription> _subscriptions;
    std::map<std::uint64_t, TickCallback> _tick_callbacks;

    ReferenceCountSubscriber<std::uint64_t> _watch_counts;
    std::unordered_map<std::uint64_t, std::weak_ptr<Atom>> _watched_atoms;

    std::unordered_map<std::uint64_t, std::vector<PropPath>> _dirty;
    std::set<std::uint64_t> _pending;
};

/**
 * @brief Observe a pointer or prism on a ticker. See Ticker::subscribe.
 * @throws InvalidArgument on the null pointer or the empty prism
 */
[[nodiscard]] STAGEHAND_EXPORT Unsubscribe on_change(const Observable& observable, ChangeCallback callback,
                                                     Ticker& ticker, bool fire_immediately = true);

}  // namespace stagehand
