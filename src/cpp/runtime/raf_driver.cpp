#include <stagehand/runtime/raf_driver.h>
#include <stagehand/util/log.h>

#include <atomic>

namespace stagehand {

namespace {

std::uint64_t next_driver_id() {
    static std::atomic<std::uint64_t> counter{0};
    return ++counter;
}

}  // namespace

RafDriver::RafDriver(RafDriverConfig config)
    : _id(next_driver_id()), _name(config.name ? std::move(*config.name) : fmt::format("CustomRafDriver-{}", _id)) {
    TickerHooks hooks;
    hooks.on_active = [name = _name, start = std::move(config.start)]() {
        log::core()->debug("RafDriver '{}' started", name);
        if (start) start();
    };
    hooks.on_idle = [name = _name, stop = std::move(config.stop)]() {
        log::core()->debug("RafDriver '{}' stopped", name);
        if (stop) stop();
    };
    _ticker = Ticker::create(std::move(hooks));
}

Unsubscribe on_change(const Observable& observable, ChangeCallback callback, RafDriver& driver,
                      bool fire_immediately) {
    return on_change(observable, std::move(callback), driver.ticker(), fire_immediately);
}

}  // namespace stagehand
