#include "control_loop.h"
#include "bipedmotion_constants.h"
#include <fmt/format.h>
#include <thread>

ControlLoop::ControlLoop(GaitController &controller, double period)
    : controller_(controller), period_(period), stop_tick_limit_(0),
      stop_requested_(false), tick_count_(0), settle_tick_count_(0), overrun_count_(0) {}

ControlLoop::ControlLoop(GaitController &controller)
    : ControlLoop(controller, controller.getConfiguration().control_period) {}

bool ControlLoop::run(unsigned long max_ticks) {
    if (!controller_.isInitialized()) {
        fmt::print(stderr, "ERROR: [ControlLoop] controller not initialised, refusing to start\n");
        return false;
    }
    if (!(period_ > 0.0)) {
        fmt::print(stderr, "ERROR: [ControlLoop] invalid period {} s\n", period_);
        return false;
    }

    tick_count_ = 0;
    settle_tick_count_ = 0;
    overrun_count_ = 0;

    Clock::time_point next_tick = Clock::now();
    while (!stop_requested_.load() && (max_ticks == 0 || tick_count_ < max_ticks)) {
        controller_.update(period_);
        tick_count_++;
        waitForNextTick(next_tick);
    }

    if (!settle(next_tick)) {
        fmt::print(stderr, "ERROR: [ControlLoop] gait did not settle within {} ticks\n", settle_tick_count_);
    }
    return true;
}

bool ControlLoop::settle(Clock::time_point &next_tick) {
    controller_.stopWalking();
    // Bound taken once the stop is requested, from the parameters in effect
    int limit = stop_tick_limit_ > 0 ? stop_tick_limit_ : controller_.getStopTickBound();
    while (!controller_.isSettled()) {
        if (settle_tick_count_ >= static_cast<unsigned long>(limit)) {
            return false;
        }
        controller_.update(period_);
        settle_tick_count_++;
        waitForNextTick(next_tick);
    }
    return true;
}

void ControlLoop::waitForNextTick(Clock::time_point &next_tick) {
    next_tick += std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(period_));
    Clock::time_point now = Clock::now();
    if (now > next_tick) {
        // Overran the period: resynchronise instead of bursting to catch up
        overrun_count_++;
        next_tick = now;
        return;
    }
    std::this_thread::sleep_until(next_tick);
}
