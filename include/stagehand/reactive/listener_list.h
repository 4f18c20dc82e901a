#pragma once

/**
 * @file listener_list.h
 * @brief DirtyListener and ListenerList - how an atom tells the tickers watching it which paths were written.
 *
 * An atom keeps one ListenerList. Every write notifies each listener with the written path; the listener (a
 * Ticker) records the path in its dirty set and does nothing else until its next tick.
 */

#include <stagehand/value/path.h>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace stagehand {

class Atom;

struct DirtyListener {
    virtual ~DirtyListener() = default;

    virtual void mark_dirty(const Atom& atom, const PropPath& path) = 0;
};

/**
 * @brief Non-owning list of listeners. Listeners must remove themselves before they are destroyed.
 */
class ListenerList {
public:
    /**
     * @note Adding the same listener twice results in two notifications per write
     */
    void add_listener(DirtyListener* listener) {
        if (listener) {
            listeners_.push_back(listener);
        }
    }

    /**
     * @note Only the first instance of a listener added several times is removed
     */
    void remove_listener(DirtyListener* listener) {
        auto it = std::find(listeners_.begin(), listeners_.end(), listener);
        if (it != listeners_.end()) {
            listeners_.erase(it);
        }
    }

    void notify_dirty(const Atom& atom, const PropPath& path) const {
        for (auto* listener : listeners_) {
            listener->mark_dirty(atom, path);
        }
    }

    [[nodiscard]] bool empty() const { return listeners_.empty(); }

    [[nodiscard]] size_t size() const { return listeners_.size(); }

private:
    std::vector<DirtyListener*> listeners_;
};

}  // namespace stagehand
