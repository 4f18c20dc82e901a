#include <stagehand/sequence/playback_controller.h>
#include <stagehand/util/errors.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace stagehand {

std::string_view to_string(PlaybackState state) {
    switch (state) {
        case PlaybackState::idle: return "idle";
        case PlaybackState::playing: return "playing";
        case PlaybackState::paused: return "paused";
    }
    return "unknown";
}

std::string_view to_string(PlaybackDirection direction) {
    switch (direction) {
        case PlaybackDirection::normal: return "normal";
        case PlaybackDirection::reverse: return "reverse";
        case PlaybackDirection::alternate: return "alternate";
        case PlaybackDirection::alternate_reverse: return "alternateReverse";
    }
    return "unknown";
}

namespace {

PropPath field_path(std::string_view field) { return PropPath{PathKey::field(std::string{field})}; }

double number_field(const Value& state, std::string_view field, double fallback) {
    const Value* value = state.find(field);
    return value != nullptr && value->is_number() ? value->as_number() : fallback;
}

}  // namespace

void validate_play_options(const PlayOptions& options, double length) {
    const double count = options.iteration_count;
    const bool infinite = std::isinf(count) && count > 0;
    if (!infinite && (!std::isfinite(count) || count < 1.0 || std::floor(count) != count)) {
        throw_error<InvalidArgument>("iteration_count must be a whole number >= 1 or infinity, got {}", count);
    }
    if (!std::isfinite(options.rate)) {
        throw_error<InvalidArgument>("rate must be a finite number, got {}", options.rate);
    }
    if (options.range) {
        const auto& [start, end] = *options.range;
        if (!std::isfinite(start) || !std::isfinite(end)) {
            throw_error<InvalidArgument>("range [{}, {}] must have finite bounds", start, end);
        }
        if (start < 0.0) {
            throw_error<InvalidArgument>("range [{}, {}] must not start before 0", start, end);
        }
        if (start >= end) {
            throw_error<InvalidArgument>("range [{}, {}] must end after it starts", start, end);
        }
        if (start >= length) {
            throw_error<InvalidArgument>("range [{}, {}] starts at or after the end of the sequence ({})", start, end,
                                         length);
        }
    } else if (length <= 0.0) {
        throw_error<InvalidArgument>("Cannot play a sequence of length {}", length);
    }
}

PlaybackController::ptr PlaybackController::create(Atom::ptr state_atom, RafDriver::ptr default_driver,
                                                   log::logger_ptr logger) {
    return ptr{new PlaybackController(std::move(state_atom), std::move(default_driver), std::move(logger))};
}

PlaybackController::PlaybackController(Atom::ptr state_atom, RafDriver::ptr default_driver, log::logger_ptr logger)
    : _state_atom(std::move(state_atom)), _default_driver(std::move(default_driver)), _logger(std::move(logger)) {
    if (!_state_atom || !_default_driver) {
        throw_error<InvalidArgument>("A playback controller needs a state atom and a raf driver");
    }
    const Value defaults = ValueMap{
        {std::string{sequence_state::PLAYING}, false},
        {std::string{sequence_state::LENGTH}, 10.0},
        {std::string{sequence_state::POSITION}, 0.0},
        {std::string{sequence_state::SUB_UNITS_PER_UNIT}, 30.0},
    };
    _state_atom->set_changed(deep_merge(defaults, _state_atom->get().is_map() ? _state_atom->get() : Value{}));
}

PlaybackController::~PlaybackController() {
    stop_ticking();
    if (_completion) {
        auto completion = *_completion;
        _completion.reset();
        completion.resolve(false);
    }
}

double PlaybackController::position() const {
    return number_field(_state_atom->get(), sequence_state::POSITION, 0.0);
}

double PlaybackController::length() const { return number_field(_state_atom->get(), sequence_state::LENGTH, 10.0); }

PlaybackCompletion PlaybackController::play(const PlayOptions& options) {
    const double sequence_length = length();
    validate_play_options(options, sequence_length);

    PlaybackRange range = options.range.value_or(PlaybackRange{0.0, sequence_length});
    if (range.end > sequence_length) {
        _logger->warn("Playback range [{}, {}] ends after the sequence ({}); clamping it", range.start, range.end,
                      sequence_length);
        range.end = sequence_length;
    }

    // The interrupted completion resolves only after the new playback is fully set up
    std::optional<PlaybackCompletion> interrupted;
    if (is_playing()) {
        _logger->debug("play() interrupts the running playback");
        stop_ticking();
        interrupted = std::exchange(_completion, std::nullopt);
    }

    auto driver = options.raf_driver ? options.raf_driver : _default_driver;
    const auto id = ++_playback_id;

    _range = range;
    _iteration_count = options.iteration_count;
    _iterations_done = 0.0;
    _rate = options.rate;
    _alternate = options.direction == PlaybackDirection::alternate ||
                 options.direction == PlaybackDirection::alternate_reverse;
    _direction_sign = options.direction == PlaybackDirection::reverse ||
                              options.direction == PlaybackDirection::alternate_reverse
                          ? -1
                          : 1;

    const bool forward = _direction_sign * (_rate < 0.0 ? -1 : 1) > 0;
    double start = position();
    if (forward && (start < range.start || start >= range.end)) {
        start = range.start;
    } else if (!forward && (start <= range.start || start > range.end)) {
        start = range.end;
    }
    write_position(start);

    _logger->debug("play range=[{}, {}] iterations={} rate={} direction={} driver={}", range.start, range.end,
                   _iteration_count, _rate, to_string(options.direction), driver->name());

    std::weak_ptr<PlaybackController> weak = weak_from_this();
    auto completion = PlaybackCompletion::pending([weak, id]() {
        if (auto self = weak.lock(); self && self->_playback_id == id) {
            self->pause();
        }
    });
    _completion = completion;
    _state = PlaybackState::playing;
    _ticker = driver->ticker_ptr();
    _last_time = _ticker->time();
    write_playing(true);
    _unsubscribe_tick = _ticker->on_tick([weak, id](double time_ms) {
        if (auto self = weak.lock(); self && self->_playback_id == id) {
            self->on_tick(time_ms);
        }
    });
    emit_frame();
    if (interrupted) {
        interrupted->resolve(false);
    }
    return completion;
}

void PlaybackController::pause() {
    if (!is_playing()) {
        return;
    }
    stop_ticking();
    _state = PlaybackState::paused;
    write_playing(false);
    emit_frame();
    _logger->debug("paused at {}", position());
    if (_completion) {
        auto completion = *_completion;
        _completion.reset();
        completion.resolve(false);
    }
}

void PlaybackController::set_position(double value) {
    if (!std::isfinite(value)) {
        throw_error<InvalidArgument>("Sequence position must be a finite number, got {}", value);
    }
    pause();
    write_position(std::clamp(value, 0.0, length()));
    emit_frame();
}

void PlaybackController::set_length(double new_length) {
    if (!std::isfinite(new_length) || new_length < 0.0) {
        throw_error<InvalidArgument>("Sequence length must be a non-negative finite number, got {}", new_length);
    }
    _state_atom->set_by_path(field_path(sequence_state::LENGTH), new_length);
    if (position() > new_length) {
        write_position(new_length);
        emit_frame();
    }
}

void PlaybackController::on_tick(double time_ms) {
    if (!_last_time) {
        _last_time = time_ms;
        return;
    }
    const double delta_ms = time_ms - *_last_time;
    _last_time = time_ms;
    if (delta_ms > 0.0) {
        advance(delta_ms / 1000.0 * std::abs(_rate));
    }
}

void PlaybackController::advance(double distance) {
    if (distance <= 0.0) {
        return;
    }
    double pos = position();
    int sign = _direction_sign * (_rate < 0.0 ? -1 : 1);
    while (true) {
        const double boundary = sign > 0 ? _range.end : _range.start;
        const double to_boundary = std::abs(boundary - pos);
        if (distance < to_boundary) {
            pos += sign * distance;
            break;
        }
        distance -= to_boundary;
        pos = boundary;
        _iterations_done += 1.0;
        if (_iterations_done >= _iteration_count) {
            write_position(pos);
            finish();
            return;
        }
        if (_alternate) {
            _direction_sign = -_direction_sign;
            sign = -sign;
        } else {
            pos = sign > 0 ? _range.start : _range.end;
        }

        // pos sits on a boundary now; skip whole iterations, keeping at least one for a finite count to finish on
        const double span = _range.end - _range.start;
        double cycles = std::floor(distance / span);
        if (std::isfinite(_iteration_count)) {
            cycles = std::min(cycles, _iteration_count - _iterations_done - 1.0);
        }
        if (cycles > 0.0) {
            distance = std::max(0.0, distance - cycles * span);
            _iterations_done += cycles;
            if (_alternate && std::fmod(cycles, 2.0) == 1.0) {
                pos = sign > 0 ? _range.end : _range.start;
                _direction_sign = -_direction_sign;
                sign = -sign;
            }
        }
        if (distance <= 0.0) {
            break;
        }
    }
    write_position(pos);
    emit_frame();
}

void PlaybackController::finish() {
    stop_ticking();
    _state = PlaybackState::idle;
    write_playing(false);
    emit_frame();
    _logger->debug("playback finished at {}", position());
    if (_completion) {
        auto completion = *_completion;
        _completion.reset();
        completion.resolve(true);
    }
}

void PlaybackController::stop_ticking() {
    if (_unsubscribe_tick) {
        auto unsubscribe = std::move(_unsubscribe_tick);
        _unsubscribe_tick = nullptr;
        unsubscribe();
    }
    _ticker.reset();
    _last_time.reset();
}

void PlaybackController::write_position(double value) {
    if (position() == value) {
        return;
    }
    _state_atom->set_by_path(field_path(sequence_state::POSITION), value);
}

void PlaybackController::write_playing(bool playing) {
    _state_atom->set_by_path(field_path(sequence_state::PLAYING), playing);
}

void PlaybackController::emit_frame() {
    if (_frame_listener) {
        _frame_listener(PlaybackFrame{position(), is_playing(), _rate});
    }
}

}  // namespace stagehand
