#include <stagehand/reactive/atom.h>
#include <stagehand/reactive/ticker.h>
#include <stagehand/util/errors.h>

#include <algorithm>
#include <cmath>

namespace stagehand {

namespace {

struct TickingGuard {
    explicit TickingGuard(bool& flag) : _flag(flag) { _flag = true; }
    ~TickingGuard() { _flag = false; }

    TickingGuard(const TickingGuard&) = delete;
    TickingGuard& operator=(const TickingGuard&) = delete;

private:
    bool& _flag;
};

}  // namespace

Ticker::ptr Ticker::create(TickerHooks hooks) { return ptr{new Ticker(std::move(hooks))}; }

Ticker::Ticker(TickerHooks hooks) : _hooks(std::move(hooks)) {}

Ticker::~Ticker() {
    for (const auto& [id, weak] : _watched_atoms) {
        if (auto atom = weak.lock()) {
            atom->remove_listener(this);
        }
    }
}

void Ticker::tick(double time_ms) {
    if (!std::isfinite(time_ms)) {
        throw_error<InvalidArgument>("Ticker time must be finite, got {}", time_ms);
    }
    if (_ticking) {
        throw_error<InvalidArgument>("Ticker::tick() was called from inside a tick");
    }
    TickingGuard guard{_ticking};

    _time = _time ? std::max(*_time, time_ms) : time_ms;

    drain_dirty();

    if (!_tick_callbacks.empty()) {
        std::vector<std::uint64_t> ids;
        ids.reserve(_tick_callbacks.size());
        for (const auto& [id, _] : _tick_callbacks) {
            ids.push_back(id);
        }
        for (auto id : ids) {
            auto it = _tick_callbacks.find(id);
            if (it == _tick_callbacks.end()) {
                continue;
            }
            auto callback = it->second;
            callback(*_time);
        }
    }

    drain_dirty();

    auto pending = std::move(_pending);
    _pending.clear();
    for (auto id : pending) {
        auto it = _subscriptions.find(id);
        if (it == _subscriptions.end()) {
            continue;
        }
        Value current = it->second.prism.get();
        if (current == it->second.last_value) {
            continue;
        }
        it->second.last_value = current;
        auto callback = it->second.callback;
        callback(current);
    }
}

Unsubscribe Ticker::subscribe(const Prism& prism, ChangeCallback callback, bool fire_immediately) {
    if (prism.empty()) {
        throw_error<InvalidArgument>("Cannot subscribe to an empty prism");
    }
    if (!callback) {
        throw_error<InvalidArgument>("A change subscription needs a callback");
    }
    const bool was_idle = is_idle();
    const auto id = _next_id++;
    for (const auto& dependency : prism.dependencies()) {
        watch(dependency);
    }
    Value current = prism.get();
    _subscriptions.emplace(id, Subscription{prism, callback, current});
    auto unsubscribe = make_unsubscribe(id, false);
    notify_transition(was_idle);

    if (fire_immediately) {
        callback(current);
    }
    return unsubscribe;
}

Unsubscribe Ticker::on_tick(TickCallback callback) {
    if (!callback) {
        throw_error<InvalidArgument>("A tick callback must not be empty");
    }
    const bool was_idle = is_idle();
    const auto id = _next_id++;
    _tick_callbacks.emplace(id, std::move(callback));
    notify_transition(was_idle);
    return make_unsubscribe(id, true);
}

void Ticker::mark_dirty(const Atom& atom, const PropPath& path) {
    auto& paths = _dirty[atom.id()];
    if (std::any_of(paths.begin(), paths.end(), [&path](const PropPath& p) { return is_prefix(p, path); })) {
        return;
    }
    paths.push_back(path);
}

Unsubscribe Ticker::make_unsubscribe(std::uint64_t id, bool tick_callback) {
    auto done = std::make_shared<bool>(false);
    std::weak_ptr<Ticker> weak = weak_from_this();
    return [weak, id, tick_callback, done]() {
        if (*done) {
            return;
        }
        *done = true;
        if (auto ticker = weak.lock()) {
            if (tick_callback) {
                ticker->remove_tick_callback(id);
            } else {
                ticker->remove_subscription(id);
            }
        }
    };
}

void Ticker::remove_subscription(std::uint64_t id) {
    auto it = _subscriptions.find(id);
    if (it == _subscriptions.end()) {
        return;
    }
    const bool was_idle = is_idle();
    for (const auto& dependency : it->second.prism.dependencies()) {
        unwatch(dependency);
    }
    _subscriptions.erase(it);
    _pending.erase(id);
    notify_transition(was_idle);
}

void Ticker::remove_tick_callback(std::uint64_t id) {
    const bool was_idle = is_idle();
    if (_tick_callbacks.erase(id) > 0) {
        notify_transition(was_idle);
    }
}

void Ticker::watch(const Dependency& dependency) {
    if (!_watch_counts.subscribe(dependency.atom_id)) {
        return;
    }
    _watched_atoms.emplace(dependency.atom_id, dependency.atom);
    if (auto atom = dependency.atom.lock()) {
        atom->add_listener(this);
    }
}

void Ticker::unwatch(const Dependency& dependency) {
    if (!_watch_counts.un_subscribe(dependency.atom_id)) {
        return;
    }
    auto it = _watched_atoms.find(dependency.atom_id);
    if (it == _watched_atoms.end()) {
        return;
    }
    if (auto atom = it->second.lock()) {
        atom->remove_listener(this);
    }
    _watched_atoms.erase(it);
    _dirty.erase(dependency.atom_id);
}

void Ticker::drain_dirty() {
    if (_dirty.empty()) {
        return;
    }
    for (const auto& [id, subscription] : _subscriptions) {
        if (_pending.contains(id)) {
            continue;
        }
        for (const auto& dependency : subscription.prism.dependencies()) {
            auto dirty = _dirty.find(dependency.atom_id);
            if (dirty == _dirty.end()) {
                continue;
            }
            const auto& paths = dirty->second;
            if (std::any_of(paths.begin(), paths.end(),
                            [&dependency](const PropPath& p) { return paths_intersect(p, dependency.path); })) {
                _pending.insert(id);
                break;
            }
        }
    }
    _dirty.clear();
}

void Ticker::notify_transition(bool was_idle) {
    const bool idle = is_idle();
    if (was_idle && !idle && _hooks.on_active) {
        _hooks.on_active();
    } else if (!was_idle && idle && _hooks.on_idle) {
        _hooks.on_idle();
    }
}

Unsubscribe on_change(const Observable& observable, ChangeCallback callback, Ticker& ticker,
                      bool fire_immediately) {
    return ticker.subscribe(to_prism(observable), std::move(callback), fire_immediately);
}

}  // namespace stagehand
