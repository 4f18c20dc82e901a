#pragma once

/**
 * @file playback_completion.h
 * @brief PlaybackCompletion - the eventual outcome of one play() call.
 *
 * A completion resolves exactly once: true when every iteration finished, false when the playback was paused,
 * replaced by another play() or cancelled. It never fails. Resolution happens inside a tick (or inside pause,
 * play or cancel), so continuations run on the thread driving the ticker.
 */

#include <stagehand/stagehand_export.h>

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace stagehand {

class STAGEHAND_EXPORT PlaybackCompletion {
public:
    using continuation_fn = std::function<void(bool finished)>;

    /**
     * @brief A completion that is already resolved with `finished`.
     */
    static PlaybackCompletion resolved(bool finished);

    /**
     * @brief An unresolved completion. `on_cancel` runs when cancel() is called before resolution.
     */
    static PlaybackCompletion pending(std::function<void()> on_cancel);

    [[nodiscard]] bool is_resolved() const noexcept { return _state->result.has_value(); }

    /**
     * @return true if the playback finished, false if it was interrupted, nullopt while it is running
     */
    [[nodiscard]] std::optional<bool> result() const noexcept { return _state->result; }

    /**
     * @brief Run `fn` on resolution, or immediately when already resolved.
     */
    void then(continuation_fn fn) const;

    /**
     * @brief Stop the playback this completion belongs to if it is still the active one. No-op once resolved.
     */
    void cancel() const;

    /**
     * @brief Resolve and run the continuations. Only the first call has an effect.
     */
    void resolve(bool finished) const;

private:
    struct State {
        std::optional<bool> result;
        std::vector<continuation_fn> continuations;
        std::function<void()> on_cancel;
    };

    explicit PlaybackCompletion(std::shared_ptr<State> state) : _state(std::move(state)) {}

    std::shared_ptr<State> _state;
};

}  // namespace stagehand
