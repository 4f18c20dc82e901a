#pragma once

/**
 * @file frame_loop.h
 * @brief FrameLoop - a real-time frame source for a raf driver.
 *
 * Ticks the driver on the calling thread at a fixed interval measured with std::chrono::steady_clock. Tick
 * times are milliseconds since the loop was constructed, so two runs of the same loop continue one timeline.
 * Offline and test code does not need a FrameLoop; it calls RafDriver::tick with synthetic times.
 */

#include <stagehand/runtime/raf_driver.h>
#include <stagehand/stagehand_export.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace stagehand {

class STAGEHAND_EXPORT FrameLoop {
public:
    using clock = std::chrono::steady_clock;

    explicit FrameLoop(RafDriver::ptr driver, std::chrono::milliseconds frame_interval = std::chrono::milliseconds{16});

    /**
     * @brief Tick for `duration` of wall-clock time.
     * @return the number of frames ticked
     */
    std::size_t run_for(std::chrono::milliseconds duration);

    /**
     * @brief Tick until `done` returns true (checked after each frame), `timeout` elapses or request_stop is
     * called.
     * @return the number of frames ticked
     */
    std::size_t run_until(const std::function<bool()>& done, std::chrono::milliseconds timeout);

    /**
     * @brief Ask a running loop to return after its current frame. Safe to call from another thread.
     */
    void request_stop();

    [[nodiscard]] std::chrono::milliseconds frame_interval() const noexcept { return _frame_interval; }

    [[nodiscard]] const RafDriver::ptr& driver() const noexcept { return _driver; }

private:
    [[nodiscard]] double elapsed_ms() const;

    RafDriver::ptr _driver;
    std::chrono::milliseconds _frame_interval;
    clock::time_point _epoch;

    std::mutex _mutex;
    std::condition_variable _stop_condition;
    bool _stop_requested{false};
};

}  // namespace stagehand
