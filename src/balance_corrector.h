#ifndef BALANCE_CORRECTOR_H
#define BALANCE_CORRECTOR_H

#include "biped_model.h"
#include "bipedmotion_constants.h"
#include "gait_config.h"

/**
 * @brief Closed-loop pitch/roll balance corrector driven by orientation feedback
 *
 * Low-pass filters pitch and roll, estimates their rates and a coarse
 * acceleration trend from a short velocity history, and produces clamped
 * corrections for the gait state machine:
 * - pitch correction is subtracted from the hip pitch bias
 * - roll correction is distributed over ankles and hip rolls
 *
 * When no orientation sample is available the filter state is frozen and
 * the last correction is returned unchanged.
 */
class BalanceCorrector {
  public:
    /**
     * @brief Clamped corrective offsets in radians.
     */
    struct BalanceCorrection {
        double pitch = 0.0;
        double roll = 0.0;
    };

    /**
     * @brief Filter and derivative state.
     */
    struct BalanceState {
        double filtered_pitch = 0.0;
        double filtered_roll = 0.0;
        double pitch_velocity = 0.0;  //< rad/s
        double roll_velocity = 0.0;   //< rad/s
        double pitch_velocity_history[BALANCE_HISTORY_SIZE] = {};
        double roll_velocity_history[BALANCE_HISTORY_SIZE] = {};
        int history_head = 0;         //< Index of the oldest history sample
        double last_update_time = 0.0; //< Accumulated time of the last accepted sample in s
        int frozen_updates = 0;       //< Consecutive updates without a valid sample
    };

    explicit BalanceCorrector(const BalanceParameters &params);

    /**
     * @brief Process one orientation sample.
     * @param sample Orientation reading, is_valid false when absent
     * @param dt Time since the previous update in seconds
     * @return Corrections clamped to the configured maxima
     */
    BalanceCorrection update(const OrientationSample &sample, double dt);

    /** Clear filter state, history and the last correction. */
    void reset();

    void setBalanceParameters(const BalanceParameters &params) { params_ = params; }
    const BalanceParameters &getBalanceParameters() const { return params_; }

    const BalanceState &getBalanceState() const { return state_; }
    const BalanceCorrection &getLastCorrection() const { return last_correction_; }

    /** Sum of consecutive differences of the pitch velocity history. */
    double getPitchAcceleration() const;
    /** Sum of consecutive differences of the roll velocity history. */
    double getRollAcceleration() const;

  private:
    BalanceParameters params_;
    BalanceState state_;
    BalanceCorrection last_correction_;
    double elapsed_time_;

    void pushVelocityHistory();
    double historyTrend(const double *history) const;
    BalanceCorrection computeCorrection() const;
};

#endif // BALANCE_CORRECTOR_H
