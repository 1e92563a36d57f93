#include "balance_corrector.h"
#include "math_utils.h"
#include <cmath>

BalanceCorrector::BalanceCorrector(const BalanceParameters &params)
    : params_(params), elapsed_time_(0.0) {}

void BalanceCorrector::reset() {
    state_ = BalanceState();
    last_correction_ = BalanceCorrection();
    elapsed_time_ = 0.0;
}

BalanceCorrector::BalanceCorrection BalanceCorrector::update(const OrientationSample &sample, double dt) {
    if (dt > 0.0) {
        elapsed_time_ += dt;
    }

    if (!params_.enable_balance) {
        last_correction_ = BalanceCorrection();
        return last_correction_;
    }

    if (!sample.is_valid) {
        // Freeze: keep the filter and the last correction untouched
        state_.frozen_updates++;
        return last_correction_;
    }

    double raw_roll = sample.roll;
    double raw_pitch = sample.pitch;
    if (sample.has_quaternion) {
        Eigen::Vector3d euler = math_utils::quaternionToEuler(sample.quaternion);
        raw_roll = euler[0];
        raw_pitch = euler[1];
    }
    if (!std::isfinite(raw_roll) || !std::isfinite(raw_pitch)) {
        state_.frozen_updates++;
        return last_correction_;
    }
    state_.frozen_updates = 0;

    double previous_pitch = state_.filtered_pitch;
    double previous_roll = state_.filtered_roll;

    double alpha = params_.filter_alpha;
    state_.filtered_roll = alpha * raw_roll + (1.0 - alpha) * state_.filtered_roll;
    state_.filtered_pitch = alpha * raw_pitch + (1.0 - alpha) * state_.filtered_pitch;

    // Velocities held when the time step is unusable
    if (dt > 0.0) {
        state_.pitch_velocity = (state_.filtered_pitch - previous_pitch) / dt;
        state_.roll_velocity = (state_.filtered_roll - previous_roll) / dt;
    }
    state_.last_update_time = elapsed_time_;

    pushVelocityHistory();

    last_correction_ = computeCorrection();
    return last_correction_;
}

void BalanceCorrector::pushVelocityHistory() {
    state_.pitch_velocity_history[state_.history_head] = state_.pitch_velocity;
    state_.roll_velocity_history[state_.history_head] = state_.roll_velocity;
    state_.history_head = (state_.history_head + 1) % BALANCE_HISTORY_SIZE;
}

double BalanceCorrector::historyTrend(const double *history) const {
    // Walk the ring from oldest to newest summing successive differences
    double trend = 0.0;
    for (int i = 1; i < BALANCE_HISTORY_SIZE; ++i) {
        int previous = (state_.history_head + i - 1) % BALANCE_HISTORY_SIZE;
        int current = (state_.history_head + i) % BALANCE_HISTORY_SIZE;
        trend += history[current] - history[previous];
    }
    return trend;
}

double BalanceCorrector::getPitchAcceleration() const {
    return historyTrend(state_.pitch_velocity_history);
}

double BalanceCorrector::getRollAcceleration() const {
    return historyTrend(state_.roll_velocity_history);
}

BalanceCorrector::BalanceCorrection BalanceCorrector::computeCorrection() const {
    const double pitch = state_.filtered_pitch;
    const double roll = state_.filtered_roll;

    double predictive_pitch = state_.pitch_velocity * params_.pitch_velocity_gain +
                              getPitchAcceleration() * PITCH_ACCELERATION_WEIGHT;
    double predictive_roll = state_.roll_velocity * params_.roll_velocity_gain +
                             getRollAcceleration() * ROLL_ACCELERATION_WEIGHT;

    double pitch_correction = params_.pitch_gain * pitch + predictive_pitch;
    double roll_correction = params_.roll_gain * roll + predictive_roll;

    // Early correction once visibly tipping
    if (std::abs(pitch) > params_.pitch_early_threshold) {
        pitch_correction *= BALANCE_EARLY_SCALE;
    }
    if (std::abs(roll) > params_.roll_early_threshold) {
        roll_correction *= BALANCE_EARLY_SCALE;
    }

    // Forward falls are corrected harder
    if (pitch > 0.0 || (pitch > -BALANCE_FORWARD_PITCH_WINDOW && state_.pitch_velocity > 0.0)) {
        pitch_correction *= BALANCE_FORWARD_PITCH_SCALE;
    }

    BalanceCorrection correction;
    correction.pitch = math_utils::clamped(pitch_correction, -params_.max_pitch_correction,
                                           params_.max_pitch_correction);
    correction.roll = math_utils::clamped(roll_correction, -params_.max_roll_correction,
                                          params_.max_roll_correction);
    return correction;
}
