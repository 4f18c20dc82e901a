#include <stagehand/sequence/playback_completion.h>

namespace stagehand {

PlaybackCompletion PlaybackCompletion::resolved(bool finished) {
    auto state = std::make_shared<State>();
    state->result = finished;
    return PlaybackCompletion{std::move(state)};
}

PlaybackCompletion PlaybackCompletion::pending(std::function<void()> on_cancel) {
    auto state = std::make_shared<State>();
    state->on_cancel = std::move(on_cancel);
    return PlaybackCompletion{std::move(state)};
}

void PlaybackCompletion::then(continuation_fn fn) const {
    if (!fn) {
        return;
    }
    if (_state->result) {
        fn(*_state->result);
        return;
    }
    _state->continuations.push_back(std::move(fn));
}

void PlaybackCompletion::cancel() const {
    if (_state->result) {
        return;
    }
    // on_cancel normally resolves this completion through pause()
    auto on_cancel = _state->on_cancel;
    if (on_cancel) {
        on_cancel();
    }
    resolve(false);
}

void PlaybackCompletion::resolve(bool finished) const {
    if (_state->result) {
        return;
    }
    _state->result = finished;
    _state->on_cancel = nullptr;
    auto continuations = std::move(_state->continuations);
    _state->continuations.clear();
    for (auto& fn : continuations) {
        fn(finished);
    }
}

}  // namespace stagehand
