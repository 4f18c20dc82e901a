#pragma once

/**
 * @file playback_controller.h
 * @brief PlaybackController - the timeline player of one sequence.
 *
 * The controller owns no clock. While playing it registers a tick callback with a raf driver's ticker and, on
 * every tick, advances the position by the elapsed time multiplied by the rate. The position, the play state and
 * the length live in the sequence-state atom:
 *
 *   {"playing": bool, "length": number, "position": number, "subUnitsPerUnit": number}
 *
 * so observers of the sequence pointer receive the same batched notifications as for any other value.
 *
 * Iterations complete when the position reaches the range boundary in the current direction (inclusive). A
 * finished iteration either ends the playback at that boundary, flips direction (alternate) or restarts from the
 * other end (normal, reverse); in the last two cases the distance left over in the tick is carried into the next
 * iteration.
 */

#include <stagehand/reactive/atom.h>
#include <stagehand/runtime/raf_driver.h>
#include <stagehand/sequence/audio_sync.h>
#include <stagehand/sequence/playback_completion.h>
#include <stagehand/stagehand_export.h>
#include <stagehand/util/log.h>

#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string_view>

namespace stagehand {

namespace sequence_state {
    inline constexpr std::string_view PLAYING{"playing"};
    inline constexpr std::string_view LENGTH{"length"};
    inline constexpr std::string_view POSITION{"position"};
    inline constexpr std::string_view SUB_UNITS_PER_UNIT{"subUnitsPerUnit"};
}  // namespace sequence_state

enum class PlaybackState { idle, playing, paused };

enum class PlaybackDirection { normal, reverse, alternate, alternate_reverse };

[[nodiscard]] STAGEHAND_EXPORT std::string_view to_string(PlaybackState state);

[[nodiscard]] STAGEHAND_EXPORT std::string_view to_string(PlaybackDirection direction);

struct PlaybackRange {
    double start;
    double end;

    bool operator==(const PlaybackRange&) const = default;
};

inline constexpr double INFINITE_ITERATIONS = std::numeric_limits<double>::infinity();

struct PlayOptions {
    /// A whole number >= 1, or INFINITE_ITERATIONS
    double iteration_count{1.0};
    /// Defaults to [0, length]
    std::optional<PlaybackRange> range;
    /// Finite; negative rates run against the direction
    double rate{1.0};
    PlaybackDirection direction{PlaybackDirection::normal};
    /// Defaults to the driver the controller was created with
    RafDriver::ptr raf_driver;
};

/**
 * @brief Throws InvalidArgument describing the first problem with `options` for a sequence of `length`.
 */
STAGEHAND_EXPORT void validate_play_options(const PlayOptions& options, double length);

class STAGEHAND_EXPORT PlaybackController : public std::enable_shared_from_this<PlaybackController> {
public:
    using ptr = std::shared_ptr<PlaybackController>;
    using frame_listener = std::function<void(const PlaybackFrame&)>;

    /**
     * @param state_atom the sequence-state atom; missing fields are filled with defaults
     * @param default_driver used when PlayOptions::raf_driver is not set
     */
    static ptr create(Atom::ptr state_atom, RafDriver::ptr default_driver, log::logger_ptr logger);

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    ~PlaybackController();

    /**
     * @brief Start playing. A playback already running is interrupted and its completion resolves false.
     * @throws InvalidArgument for invalid options; the current playback is then left untouched
     */
    PlaybackCompletion play(const PlayOptions& options = {});

    /**
     * @brief Freeze at the current position and resolve the completion false. No-op unless playing.
     */
    void pause();

    [[nodiscard]] PlaybackState state() const noexcept { return _state; }

    [[nodiscard]] bool is_playing() const noexcept { return _state == PlaybackState::playing; }

    [[nodiscard]] double position() const;

    [[nodiscard]] double length() const;

    /**
     * @brief Pause, then move to `position` clamped to [0, length].
     * @throws InvalidArgument for a non-finite position
     */
    void set_position(double value);

    /**
     * @brief Change the length, clamping the position into the new length.
     * @throws InvalidArgument for a negative or non-finite length
     */
    void set_length(double length);

    [[nodiscard]] const Atom::ptr& state_atom() const noexcept { return _state_atom; }

    [[nodiscard]] double rate() const noexcept { return _rate; }

    /**
     * @brief Called synchronously whenever the position or the play state changes.
     */
    void set_frame_listener(frame_listener listener) { _frame_listener = std::move(listener); }

private:
    PlaybackController(Atom::ptr state_atom, RafDriver::ptr default_driver, log::logger_ptr logger);

    void on_tick(double time_ms);
    void advance(double distance);
    void finish();
    void stop_ticking();
    void write_position(double value);
    void write_playing(bool playing);
    void emit_frame();

    Atom::ptr _state_atom;
    RafDriver::ptr _default_driver;
    log::logger_ptr _logger;
    frame_listener _frame_listener;

    PlaybackState _state{PlaybackState::idle};
    std::optional<PlaybackCompletion> _completion;
    Unsubscribe _unsubscribe_tick;
    Ticker::ptr _ticker;
    std::uint64_t _playback_id{0};

    // The running playback
    PlaybackRange _range{0.0, 0.0};
    double _iteration_count{1.0};
    double _iterations_done{0.0};
    double _rate{1.0};
    bool _alternate{false};
    int _direction_sign{1};
    std::optional<double> _last_time;
};

}  // namespace stagehand
