#ifndef CONTROL_LOOP_H
#define CONTROL_LOOP_H

#include "gait_controller.h"
#include <atomic>
#include <chrono>

/**
 * @brief Fixed-period driver for a GaitController.
 *
 * Executes one GaitController::update() per period and sleeps until the
 * next period boundary. Ticks are never pipelined. A stop request lets the
 * current tick finish, then the loop keeps ticking while the gait settles
 * back to READY, bounded by the ticks the gait needs to finish its step
 * and settle, before returning.
 */
class ControlLoop {
  public:
    /**
     * @param controller Initialised controller to drive
     * @param period Tick period in seconds
     */
    ControlLoop(GaitController &controller, double period);

    /** Use the controller's configured control period. */
    explicit ControlLoop(GaitController &controller);

    /**
     * @brief Run until a stop is requested or max_ticks ticks ran.
     * @param max_ticks Walking tick budget, 0 for unbounded
     * @return false if the controller is not initialised
     */
    bool run(unsigned long max_ticks = 0);

    /** Safe to call from another thread or a signal handler. */
    void requestStop() { stop_requested_.store(true); }
    bool isStopRequested() const { return stop_requested_.load(); }

    /**
     * @brief Override the ticks spent settling after a stop.
     *
     * 0 (the default) uses GaitController::getStopTickBound() at the time
     * the stop is requested, so a step in progress always completes.
     */
    void setStopTickLimit(int ticks) { stop_tick_limit_ = ticks; }
    int getStopTickLimit() const { return stop_tick_limit_; }

    double getPeriod() const { return period_; }
    unsigned long getTickCount() const { return tick_count_; }
    unsigned long getSettleTickCount() const { return settle_tick_count_; }
    unsigned long getOverrunCount() const { return overrun_count_; }

  private:
    using Clock = std::chrono::steady_clock;

    GaitController &controller_;
    double period_;
    int stop_tick_limit_;
    std::atomic<bool> stop_requested_;

    unsigned long tick_count_;
    unsigned long settle_tick_count_;
    unsigned long overrun_count_;

    void waitForNextTick(Clock::time_point &next_tick);
    bool settle(Clock::time_point &next_tick);
};

#endif // CONTROL_LOOP_H
