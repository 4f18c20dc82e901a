#include <stagehand/runtime/frame_loop.h>
#include <stagehand/util/errors.h>
#include <stagehand/util/log.h>

#include <algorithm>

namespace stagehand {

FrameLoop::FrameLoop(RafDriver::ptr driver, std::chrono::milliseconds frame_interval)
    : _driver(std::move(driver)), _frame_interval(frame_interval), _epoch(clock::now()) {
    if (!_driver) {
        throw_error<InvalidArgument>("A frame loop needs a raf driver");
    }
    if (_frame_interval.count() <= 0) {
        throw_error<InvalidArgument>("Frame interval must be positive, got {}ms", _frame_interval.count());
    }
}

std::size_t FrameLoop::run_for(std::chrono::milliseconds duration) {
    return run_until([] { return false; }, duration);
}

std::size_t FrameLoop::run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(_mutex);
        _stop_requested = false;
    }
    const auto deadline = clock::now() + timeout;
    auto next_frame = clock::now();
    std::size_t frames = 0;

    log::core()->debug("FrameLoop on '{}' running for at most {}ms", _driver->name(), timeout.count());
    while (true) {
        _driver->tick(elapsed_ms());
        ++frames;
        if (done()) {
            break;
        }

        next_frame += _frame_interval;
        const auto now = clock::now();
        if (now >= deadline) {
            break;
        }
        if (next_frame < now) {
            // Fell behind; skip the missed frames instead of bursting to catch up
            next_frame = now;
        }

        std::unique_lock<std::mutex> lock(_mutex);
        if (_stop_condition.wait_until(lock, std::min(next_frame, deadline), [this] { return _stop_requested; })) {
            break;
        }
    }
    return frames;
}

void FrameLoop::request_stop() {
    {
        std::unique_lock<std::mutex> lock(_mutex);
        _stop_requested = true;
    }
    _stop_condition.notify_all();
}

double FrameLoop::elapsed_ms() const {
    return std::chrono::duration<double, std::milli>(clock::now() - _epoch).count();
}

}  // namespace stagehand
