#include "gait_state_machine.h"
#include "bipedmotion_constants.h"
#include "math_utils.h"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>

GaitStateMachine::GaitStateMachine(const LegGeometry &geometry, const GaitParameters &params)
    : geometry_(geometry), params_(params), pending_params_(params), has_pending_params_(false),
      kinematics_(geometry, params.roll_bias), walking_enabled_(false),
      pitch_correction_(0.0), roll_correction_(0.0), settle_start_lateral_(0.0) {
    settle_start_forward_[LEFT_LEG] = 0.0;
    settle_start_forward_[RIGHT_LEG] = 0.0;
    reset();
}

void GaitStateMachine::reset() {
    state_ = GaitState();
    state_.phase = GAIT_RAMP_DOWN;
    state_.leg_height = geometry_.initial_leg_height;
    walking_enabled_ = false;
    applyPendingParameters();
    state_.stance_foot = params_.initial_stance_foot;

    setFootTargets(0.0, 0.0, 0.0, 0.0, state_.leg_height, state_.leg_height);
    solveLegs();
}

void GaitStateMachine::update() {
    switch (state_.phase) {
    case GAIT_RAMP_DOWN:
        updateRampDown();
        break;
    case GAIT_READY:
        updateReady();
        break;
    case GAIT_DOUBLE_SUPPORT:
        if (!walking_enabled_) {
            // Both feet are loaded, safe to settle
            beginStopping();
            updateStopping();
        } else {
            updateWalking();
        }
        break;
    case GAIT_SINGLE_SUPPORT:
        updateWalking();
        break;
    case GAIT_STOPPING:
        updateStopping();
        break;
    }
    solveLegs();
}

bool GaitStateMachine::isWalking() const {
    return state_.phase == GAIT_DOUBLE_SUPPORT || state_.phase == GAIT_SINGLE_SUPPORT;
}

int GaitStateMachine::getStopTickBound() const {
    int settle_ticks = params_.settle_ticks;
    if (has_pending_params_) {
        settle_ticks = std::max(settle_ticks, pending_params_.settle_ticks);
    }

    switch (state_.phase) {
    case GAIT_RAMP_DOWN: {
        double remaining = std::max(state_.leg_height - geometry_.nominal_leg_height, 0.0);
        return static_cast<int>(std::ceil(remaining / params_.ramp_step)) + 1;
    }
    case GAIT_READY:
        return 0;
    case GAIT_DOUBLE_SUPPORT:
    case GAIT_SINGLE_SUPPORT: {
        // A step in progress always finishes before settling starts
        int remaining_step = std::max(params_.step_cycle_length - state_.step_cycle_counter + 1, 0);
        return remaining_step + settle_ticks + 1;
    }
    case GAIT_STOPPING:
        return std::max(params_.settle_ticks - state_.settle_counter, 0) + 1;
    }
    return 0;
}

void GaitStateMachine::setWalkingEnabled(bool enabled) {
    if (enabled != walking_enabled_) {
        logDebug("walking {}", enabled ? "enabled" : "disabled");
    }
    walking_enabled_ = enabled;
}

void GaitStateMachine::setGaitParameters(const GaitParameters &params) {
    pending_params_ = params;
    has_pending_params_ = true;
    if (state_.phase == GAIT_RAMP_DOWN || state_.phase == GAIT_READY) {
        applyPendingParameters();
    }
}

void GaitStateMachine::setBalanceCorrection(double pitch_correction, double roll_correction) {
    pitch_correction_ = pitch_correction;
    roll_correction_ = roll_correction;
}

// ============================================================================
// Phase bodies
// ============================================================================

void GaitStateMachine::updateRampDown() {
    double next_height = state_.leg_height - params_.ramp_step;
    state_.leg_height = std::max(next_height, geometry_.nominal_leg_height);

    // Feet held together under the hip while lowering
    setFootTargets(0.0, 0.0, 0.0, 0.0, state_.leg_height, state_.leg_height);

    if (state_.leg_height - geometry_.nominal_leg_height <= RAMP_HEIGHT_TOLERANCE) {
        state_.leg_height = geometry_.nominal_leg_height;
        setPhase(GAIT_READY);
    }
}

void GaitStateMachine::updateReady() {
    state_.foot_lift = 0.0;
    state_.lateral_offset = 0.0;
    setFootTargets(0.0, 0.0, 0.0, params_.base_stance_width,
                   geometry_.nominal_leg_height, geometry_.nominal_leg_height);

    if (walking_enabled_) {
        startWalking();
    }
}

void GaitStateMachine::updateWalking() {
    const double cycle_length = static_cast<double>(params_.step_cycle_length);
    const double counter = static_cast<double>(state_.step_cycle_counter);
    const LegSide stance = state_.stance_foot;
    const LegSide swing = (stance == LEFT_LEG) ? RIGHT_LEG : LEFT_LEG;

    // Lateral weight shift, recomputed every tick from the cycle fraction
    if (params_.enable_lateral_motion) {
        double lateral_shift = params_.lateral_foot_shift * std::sin(M_PI * counter / cycle_length);
        state_.lateral_offset = (stance == LEFT_LEG) ? lateral_shift : -lateral_shift;
    } else {
        state_.lateral_offset = 0.0;
    }

    // Stance foot: decay over the first half, then retreat toward the next step
    if (counter < cycle_length / 2.0) {
        double fraction = counter / cycle_length;
        state_.forward_offset[stance] = state_.previous_stance_offset * (1.0 - 2.0 * fraction);
    } else {
        double fraction = 2.0 * counter / cycle_length - 1.0;
        state_.forward_offset[stance] = -(params_.step_length - state_.accumulated_forward_offset) * fraction;
    }

    if (state_.phase == GAIT_DOUBLE_SUPPORT) {
        if (counter < params_.double_support_fraction * cycle_length) {
            // Swing foot trails the stance foot
            state_.forward_offset[swing] =
                state_.previous_swing_offset - (state_.previous_stance_offset - state_.forward_offset[stance]);
        } else {
            state_.previous_swing_offset = state_.forward_offset[swing];
            setPhase(GAIT_SINGLE_SUPPORT);
        }
    }

    if (state_.phase == GAIT_SINGLE_SUPPORT) {
        int swing_start = static_cast<int>(params_.double_support_fraction * cycle_length);
        double denominator = (1.0 - params_.double_support_fraction) * cycle_length;
        if (denominator < TRAJECTORY_DENOMINATOR_MIN) {
            denominator = 1.0;
        }
        double eased = math_utils::cosineEase((counter - swing_start) / denominator);
        state_.forward_offset[swing] =
            state_.previous_swing_offset +
            eased * (params_.step_length - state_.accumulated_forward_offset - state_.previous_swing_offset);
    }

    // Swing foot lift over the single support share of the cycle
    int lift_start = static_cast<int>(params_.double_support_fraction * cycle_length);
    if (state_.step_cycle_counter > lift_start) {
        state_.foot_lift = params_.max_foot_lift *
                           std::sin(M_PI * (counter - lift_start) / (cycle_length - lift_start));
        state_.foot_lift = std::max(state_.foot_lift, 0.0);
    } else {
        state_.foot_lift = 0.0;
    }

    double left_height = geometry_.nominal_leg_height;
    double right_height = geometry_.nominal_leg_height;
    if (swing == LEFT_LEG) {
        left_height -= state_.foot_lift;
    } else {
        right_height -= state_.foot_lift;
    }
    setFootTargets(state_.forward_offset[LEFT_LEG], state_.forward_offset[RIGHT_LEG], state_.lateral_offset,
                   params_.base_stance_width, left_height, right_height);

    if (state_.step_cycle_counter >= params_.step_cycle_length) {
        completeStepCycle();
    } else {
        state_.step_cycle_counter++;
    }
}

void GaitStateMachine::updateStopping() {
    state_.settle_counter++;
    double progress = math_utils::clamped(
        static_cast<double>(state_.settle_counter) / static_cast<double>(params_.settle_ticks), 0.0, 1.0);
    double eased = math_utils::cosineEase(progress);

    state_.forward_offset[LEFT_LEG] = math_utils::interpolate(settle_start_forward_[LEFT_LEG], 0.0, eased);
    state_.forward_offset[RIGHT_LEG] = math_utils::interpolate(settle_start_forward_[RIGHT_LEG], 0.0, eased);
    state_.lateral_offset = math_utils::interpolate(settle_start_lateral_, 0.0, eased);
    state_.foot_lift = 0.0;

    setFootTargets(state_.forward_offset[LEFT_LEG], state_.forward_offset[RIGHT_LEG], state_.lateral_offset,
                   params_.base_stance_width, geometry_.nominal_leg_height, geometry_.nominal_leg_height);

    if (state_.settle_counter >= params_.settle_ticks) {
        state_.step_cycle_counter = 0;
        state_.forward_offset[LEFT_LEG] = 0.0;
        state_.forward_offset[RIGHT_LEG] = 0.0;
        state_.previous_stance_offset = 0.0;
        state_.previous_swing_offset = 0.0;
        state_.accumulated_forward_offset = 0.0;
        state_.lateral_offset = 0.0;
        state_.settle_counter = 0;
        applyPendingParameters();
        setPhase(GAIT_READY);
    }
}

// ============================================================================
// Transitions
// ============================================================================

void GaitStateMachine::startWalking() {
    applyPendingParameters();
    state_.stance_foot = params_.initial_stance_foot;
    state_.step_cycle_counter = 1;
    state_.forward_offset[LEFT_LEG] = 0.0;
    state_.forward_offset[RIGHT_LEG] = 0.0;
    state_.accumulated_forward_offset = 0.0;
    state_.previous_stance_offset = 0.0;
    state_.previous_swing_offset = 0.0;
    state_.foot_lift = 0.0;
    state_.lateral_offset = 0.0;
    setPhase(GAIT_DOUBLE_SUPPORT);
}

void GaitStateMachine::beginStopping() {
    settle_start_forward_[LEFT_LEG] = state_.forward_offset[LEFT_LEG];
    settle_start_forward_[RIGHT_LEG] = state_.forward_offset[RIGHT_LEG];
    settle_start_lateral_ = state_.lateral_offset;
    state_.settle_counter = 0;
    state_.foot_lift = 0.0;
    setPhase(GAIT_STOPPING);
}

void GaitStateMachine::completeStepCycle() {
    state_.stance_foot = (state_.stance_foot == LEFT_LEG) ? RIGHT_LEG : LEFT_LEG;
    const LegSide swing = (state_.stance_foot == LEFT_LEG) ? RIGHT_LEG : LEFT_LEG;

    state_.step_cycle_counter = 1;
    state_.accumulated_forward_offset = 0.0;
    state_.previous_stance_offset = state_.forward_offset[state_.stance_foot];
    state_.previous_swing_offset = state_.forward_offset[swing];
    state_.foot_lift = 0.0;
    state_.completed_steps++;

    // Step boundary: staged parameters become visible here
    applyPendingParameters();
    setPhase(GAIT_DOUBLE_SUPPORT);
}

void GaitStateMachine::applyPendingParameters() {
    if (!has_pending_params_) {
        return;
    }
    params_ = pending_params_;
    has_pending_params_ = false;
    kinematics_.setRollBias(params_.roll_bias);
    logDebug("gait parameters applied: step_length={} cycle={} dsf={}",
             params_.step_length, params_.step_cycle_length, params_.double_support_fraction);
}

void GaitStateMachine::setPhase(GaitPhase phase) {
    if (phase != state_.phase) {
        logDebug("{} -> {}", getPhaseName(state_.phase), getPhaseName(phase));
    }
    state_.phase = phase;
}

// ============================================================================
// Kinematics
// ============================================================================

void GaitStateMachine::setFootTargets(double left_forward, double right_forward, double lateral, double stance_width,
                                      double left_height, double right_height) {
    foot_targets_[LEFT_LEG] = Point3D(left_forward - geometry_.hip_forward_offset,
                                      -lateral - stance_width, left_height);
    foot_targets_[RIGHT_LEG] = Point3D(right_forward - geometry_.hip_forward_offset,
                                       lateral + stance_width, right_height);
}

void GaitStateMachine::solveLegs() {
    const LegSide stance = state_.stance_foot;
    const LegSide swing = (stance == LEFT_LEG) ? RIGHT_LEG : LEFT_LEG;

    raw_joint_angles_[LEFT_LEG] = kinematics_.solveLeg(foot_targets_[LEFT_LEG], LEFT_LEG);
    raw_joint_angles_[RIGHT_LEG] = kinematics_.solveLeg(foot_targets_[RIGHT_LEG], RIGHT_LEG);

    double hip_pitch_bias = getEffectiveHipPitchBias();
    double ankle_pitch_comp = ANKLE_PITCH_COMPENSATION_RATIO * pitch_correction_;
    double roll_comp = ROLL_COMPENSATION_FRACTION * roll_correction_;

    joint_angles_ = raw_joint_angles_;
    joint_angles_[LEFT_LEG].hip_pitch += hip_pitch_bias;
    joint_angles_[RIGHT_LEG].hip_pitch += hip_pitch_bias;

    joint_angles_[stance].ankle_pitch += roll_comp + ankle_pitch_comp;
    joint_angles_[swing].ankle_pitch -= roll_comp - ankle_pitch_comp;

    joint_angles_[LEFT_LEG].hip_roll += roll_comp;
    joint_angles_[RIGHT_LEG].hip_roll -= roll_comp;
}

const char *GaitStateMachine::getPhaseName(GaitPhase phase) {
    switch (phase) {
    case GAIT_RAMP_DOWN:
        return "RAMP_DOWN";
    case GAIT_READY:
        return "READY";
    case GAIT_DOUBLE_SUPPORT:
        return "DOUBLE_SUPPORT";
    case GAIT_SINGLE_SUPPORT:
        return "SINGLE_SUPPORT";
    case GAIT_STOPPING:
        return "STOPPING";
    default:
        return "UNKNOWN";
    }
}
