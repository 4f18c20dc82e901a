#pragma once

namespace stagehand {

/**
 * @brief What an audio sink needs to follow the timeline: where it is, whether it moves and how fast.
 */
struct PlaybackFrame {
    double position{0.0};
    bool playing{false};
    double rate{1.0};

    bool operator==(const PlaybackFrame&) const = default;
};

/**
 * @brief Implemented by whoever plays audio alongside a sequence. Decoding and output are the implementer's
 * business; the sequence only reports frames.
 */
class AudioSync {
public:
    virtual ~AudioSync() = default;

    /**
     * @brief Called within the tick (or the pause / set_position call) that changed the position or the play
     * state.
     */
    virtual void on_frame(const PlaybackFrame& frame) = 0;
};

}  // namespace stagehand
