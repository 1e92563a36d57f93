#ifndef GAIT_STATE_MACHINE_H
#define GAIT_STATE_MACHINE_H

#include "biped_model.h"
#include "gait_config.h"
#include "leg_kinematics.h"
#include <fmt/format.h>
#include <utility>

/**
 * @brief Biped gait state machine.
 *
 * Owns the gait phase, per-foot forward offsets, lateral weight shift,
 * swing foot lift and step-cycle counters. Every call to update() advances
 * one control tick and solves both legs with LegKinematics.
 *
 * Phase sequence:
 *   RAMP_DOWN -> READY -> DOUBLE_SUPPORT <-> SINGLE_SUPPORT
 *   DOUBLE_SUPPORT -> STOPPING -> READY (when walking is disabled)
 */
class GaitStateMachine {
  public:
    enum GaitPhase {
        GAIT_RAMP_DOWN,      ///< Lowering from the initial to the nominal leg height
        GAIT_READY,          ///< Standing at nominal height, waiting for walk enable
        GAIT_DOUBLE_SUPPORT, ///< Both feet loaded, weight shifting to the stance foot
        GAIT_SINGLE_SUPPORT, ///< Swing foot airborne
        GAIT_STOPPING        ///< Feet returning to the ready stance after a stop
    };

    /**
     * @brief Mutable gait state. Owned exclusively by the state machine.
     */
    struct GaitState {
        GaitPhase phase = GAIT_RAMP_DOWN;
        int step_cycle_counter = 0;             //< Tick within the current step, in [0, step_cycle_length]
        LegSide stance_foot = LEFT_LEG;         //< Loaded foot
        double forward_offset[NUM_BIPED_LEGS] = {0.0, 0.0}; //< Forward foot offsets in mm
        double accumulated_forward_offset = 0.0;
        double previous_stance_offset = 0.0;    //< Stance foot offset at the start of the step
        double previous_swing_offset = 0.0;     //< Swing foot offset at the start of the swing
        double foot_lift = 0.0;                 //< Swing foot lift in mm, zero in double support
        double lateral_offset = 0.0;            //< Lateral weight shift in mm
        double leg_height = 0.0;                //< Current hip height while ramping down
        int completed_steps = 0;
        int settle_counter = 0;
    };

    /**
     * @brief Construct the state machine in RAMP_DOWN.
     * @param geometry Leg geometry, fixed for the controller lifetime
     * @param params Initial gait parameters
     */
    GaitStateMachine(const LegGeometry &geometry, const GaitParameters &params);

    /**
     * @brief Advance one control tick and recompute the joint angles.
     */
    void update();

    /**
     * @brief Enable or disable walking.
     *
     * Disabling never aborts a swing. The current step finishes, the feet
     * settle back to the ready stance over settle_ticks ticks and the
     * machine enters READY.
     */
    void setWalkingEnabled(bool enabled);
    bool isWalkingEnabled() const { return walking_enabled_; }

    /** Equivalent to setWalkingEnabled(false). */
    void requestStop() { setWalkingEnabled(false); }

    /**
     * @brief Return to RAMP_DOWN at the initial leg height.
     *
     * The only transition back to RAMP_DOWN. Walking is disabled and
     * pending parameters are applied.
     */
    void reset();

    /**
     * @brief Replace the gait parameters.
     *
     * Applied immediately when not walking. While walking the parameters are
     * staged and applied at the next step boundary.
     */
    void setGaitParameters(const GaitParameters &params);
    bool hasPendingParameters() const { return has_pending_params_; }

    /**
     * @brief Set the clamped balance corrections applied on the next update.
     * @param pitch_correction Subtracted from the hip pitch bias (rad)
     * @param roll_correction Distributed over ankles and hip rolls (rad)
     */
    void setBalanceCorrection(double pitch_correction, double roll_correction);

    GaitPhase getPhase() const { return state_.phase; }
    const GaitState &getState() const { return state_; }
    const JointAngles &getJointAngles() const { return joint_angles_; }
    const JointAngles &getRawJointAngles() const { return raw_joint_angles_; }
    const Point3D &getFootTarget(LegSide side) const { return foot_targets_[side]; }
    const GaitParameters &getGaitParameters() const { return params_; }
    const LegGeometry &getLegGeometry() const { return geometry_; }
    const LegKinematics &getKinematics() const { return kinematics_; }
    double getEffectiveHipPitchBias() const { return params_.hip_pitch_bias - pitch_correction_; }

    /** True in DOUBLE_SUPPORT or SINGLE_SUPPORT. */
    bool isWalking() const;

    /**
     * @brief Upper bound on the ticks needed to reach READY once walking is disabled.
     *
     * Covers the rest of the ramp, the rest of the current step and the
     * settle ticks, including parameters staged for the next step.
     */
    int getStopTickBound() const;

    static const char *getPhaseName(GaitPhase phase);

  private:
    LegGeometry geometry_;
    GaitParameters params_;
    GaitParameters pending_params_;
    bool has_pending_params_;
    LegKinematics kinematics_;

    GaitState state_;
    bool walking_enabled_;

    double pitch_correction_;
    double roll_correction_;

    // Feet offsets captured when settling starts
    double settle_start_forward_[NUM_BIPED_LEGS];
    double settle_start_lateral_;

    Point3D foot_targets_[NUM_BIPED_LEGS];
    JointAngles raw_joint_angles_;
    JointAngles joint_angles_;

    void updateRampDown();
    void updateReady();
    void updateWalking();
    void updateStopping();

    void startWalking();
    void beginStopping();
    void completeStepCycle();
    void applyPendingParameters();
    void setPhase(GaitPhase phase);

    void setFootTargets(double left_forward, double right_forward, double lateral, double stance_width,
                        double left_height, double right_height);
    void solveLegs();

    template <typename... Args>
    void logDebug(fmt::format_string<Args...> format, Args &&...args) const {
#ifdef DEBUG_LOGGING
        fmt::print(stderr, "DEBUG: [GaitStateMachine] {}\n", fmt::format(format, std::forward<Args>(args)...));
#else
        (void)format;
        ((void)args, ...);
#endif
    }
};

#endif // GAIT_STATE_MACHINE_H
