#include "gait_config_factory.h"
#include "bipedmotion_constants.h"
#include "math_utils.h"
#include <cmath>
#include <fmt/format.h>

// ============================================================================
// Presets
// ============================================================================

GaitConfiguration createZmpWalkConfig() {
    GaitConfiguration config;
    config.name = "zmp_walk";

    config.geometry.leg_length = DEFAULT_LEG_LENGTH;
    config.geometry.hip_forward_offset = 2.04;
    config.geometry.nominal_leg_height = 170.0;
    config.geometry.initial_leg_height = 180.0;

    config.gait.step_length = 20.0;
    config.gait.step_cycle_length = 4;
    config.gait.double_support_fraction = 0.2;
    config.gait.max_foot_lift = 10.0;
    config.gait.lateral_foot_shift = 12.0;
    config.gait.base_stance_width = 2.0;
    config.gait.hip_pitch_bias = math_utils::degreesToRadians(20.0);
    config.gait.enable_lateral_motion = true;

    // ZMP walk runs open loop
    config.balance.enable_balance = false;
    config.enable_arm_swing = true;
    config.control_period = 0.05;
    return config;
}

GaitConfiguration createGentleWalkConfig(bool enable_lateral_motion) {
    GaitConfiguration config;
    config.name = "gentle_walk";

    config.geometry.leg_length = DEFAULT_LEG_LENGTH;
    config.geometry.hip_forward_offset = 1.0;
    config.geometry.nominal_leg_height = 170.0;
    config.geometry.initial_leg_height = 175.0;

    config.gait.step_length = 10.0;
    config.gait.step_cycle_length = 20;
    config.gait.double_support_fraction = 0.4;
    config.gait.max_foot_lift = 2.0;
    config.gait.lateral_foot_shift = enable_lateral_motion ? 6.0 : 0.0;
    config.gait.base_stance_width = 2.0;
    config.gait.hip_pitch_bias = math_utils::degreesToRadians(25.0);
    config.gait.enable_lateral_motion = enable_lateral_motion;

    config.balance.enable_balance = false;
    config.control_period = 0.05;
    return config;
}

GaitConfiguration createTallWalkConfig() {
    GaitConfiguration config;
    config.name = "tall_walk";

    config.geometry.leg_length = DEFAULT_LEG_LENGTH;
    config.geometry.hip_forward_offset = 2.04;
    config.geometry.nominal_leg_height = 175.0;
    config.geometry.initial_leg_height = 175.0;

    config.gait.step_length = 10.0;
    config.gait.step_cycle_length = 8;
    config.gait.double_support_fraction = 0.3;
    config.gait.max_foot_lift = 8.0;
    config.gait.lateral_foot_shift = 12.0;
    config.gait.base_stance_width = 2.0;
    config.gait.hip_pitch_bias = math_utils::degreesToRadians(15.0);
    config.gait.enable_lateral_motion = true;

    config.balance.enable_balance = false;
    config.control_period = 0.05;
    return config;
}

GaitConfiguration createImuBalancedWalkConfig() {
    GaitConfiguration config;
    config.name = "imu_balanced_walk";

    config.geometry.leg_length = DEFAULT_LEG_LENGTH;
    config.geometry.hip_forward_offset = 2.0;
    config.geometry.nominal_leg_height = 165.0;
    config.geometry.initial_leg_height = 165.0;

    config.gait.step_length = 5.0;
    config.gait.step_cycle_length = 200;
    config.gait.double_support_fraction = 0.4;
    config.gait.max_foot_lift = 2.0;
    config.gait.lateral_foot_shift = 0.0;
    config.gait.base_stance_width = 2.0;
    config.gait.hip_pitch_bias = math_utils::degreesToRadians(15.0);
    config.gait.enable_lateral_motion = false;

    config.balance = BalanceParameters();
    config.balance.enable_balance = true;
    config.control_period = 0.02;
    return config;
}

GaitConfiguration createGaitConfiguration(GaitPreset preset) {
    switch (preset) {
    case GAIT_PRESET_GENTLE:
        return createGentleWalkConfig(true);
    case GAIT_PRESET_TALL:
        return createTallWalkConfig();
    case GAIT_PRESET_IMU_BALANCED:
        return createImuBalancedWalkConfig();
    case GAIT_PRESET_ZMP:
    default:
        return createZmpWalkConfig();
    }
}

JointNameMap createDefaultJointNameMap() {
    JointNameMap map;
    map[LEFT_HIP_YAW] = "left_hip_yaw";
    map[LEFT_HIP_ROLL] = "left_hip_roll";
    map[LEFT_HIP_PITCH] = "left_hip_pitch";
    map[LEFT_KNEE] = "left_knee";
    map[LEFT_ANKLE] = "left_ankle";
    map[RIGHT_HIP_YAW] = "right_hip_yaw";
    map[RIGHT_HIP_ROLL] = "right_hip_roll";
    map[RIGHT_HIP_PITCH] = "right_hip_pitch";
    map[RIGHT_KNEE] = "right_knee";
    map[RIGHT_ANKLE] = "right_ankle";
    map[LEFT_SHOULDER_PITCH] = "left_shoulder_pitch";
    map[RIGHT_SHOULDER_PITCH] = "right_shoulder_pitch";
    return map;
}

// ============================================================================
// Validation
// ============================================================================

bool validateGaitParameters(const GaitParameters &params, const LegGeometry &geometry, std::string &error_message) {
    if (params.step_cycle_length <= 0) {
        error_message = fmt::format("step_cycle_length must be positive (got {})", params.step_cycle_length);
        return false;
    }
    if (!(params.double_support_fraction >= 0.0 && params.double_support_fraction < 1.0)) {
        error_message = fmt::format("double_support_fraction must be in [0,1) (got {})", params.double_support_fraction);
        return false;
    }
    if (!std::isfinite(params.step_length) || params.step_length < 0.0) {
        error_message = fmt::format("step_length must be non-negative (got {})", params.step_length);
        return false;
    }
    if (params.step_length >= geometry.leg_length) {
        error_message = fmt::format("step_length {} exceeds leg_length {}", params.step_length, geometry.leg_length);
        return false;
    }
    if (!std::isfinite(params.max_foot_lift) || params.max_foot_lift < 0.0) {
        error_message = fmt::format("max_foot_lift must be non-negative (got {})", params.max_foot_lift);
        return false;
    }
    if (params.max_foot_lift >= geometry.nominal_leg_height) {
        error_message = fmt::format("max_foot_lift {} must be below nominal_leg_height {}",
                                    params.max_foot_lift, geometry.nominal_leg_height);
        return false;
    }
    if (!std::isfinite(params.lateral_foot_shift) || params.lateral_foot_shift < 0.0) {
        error_message = fmt::format("lateral_foot_shift must be non-negative (got {})", params.lateral_foot_shift);
        return false;
    }
    if (!std::isfinite(params.base_stance_width)) {
        error_message = "base_stance_width must be finite";
        return false;
    }
    if (!std::isfinite(params.hip_pitch_bias) || !std::isfinite(params.roll_bias)) {
        error_message = "hip_pitch_bias and roll_bias must be finite";
        return false;
    }
    if (!(params.ramp_step > 0.0)) {
        error_message = fmt::format("ramp_step must be positive (got {})", params.ramp_step);
        return false;
    }
    if (params.settle_ticks <= 0) {
        error_message = fmt::format("settle_ticks must be positive (got {})", params.settle_ticks);
        return false;
    }
    if (params.initial_stance_foot != LEFT_LEG && params.initial_stance_foot != RIGHT_LEG) {
        error_message = "initial_stance_foot must be LEFT_LEG or RIGHT_LEG";
        return false;
    }
    return true;
}

bool validateGaitConfiguration(const GaitConfiguration &config, std::string &error_message) {
    const LegGeometry &geometry = config.geometry;
    if (!(geometry.leg_length > 0.0) || !std::isfinite(geometry.leg_length)) {
        error_message = fmt::format("leg_length must be positive (got {})", geometry.leg_length);
        return false;
    }
    if (!(geometry.nominal_leg_height > 0.0) || geometry.nominal_leg_height > geometry.leg_length) {
        error_message = fmt::format("nominal_leg_height must be in (0, {}] (got {})",
                                    geometry.leg_length, geometry.nominal_leg_height);
        return false;
    }
    if (!std::isfinite(geometry.initial_leg_height) || geometry.initial_leg_height < geometry.nominal_leg_height) {
        error_message = fmt::format("initial_leg_height {} must not be below nominal_leg_height {}",
                                    geometry.initial_leg_height, geometry.nominal_leg_height);
        return false;
    }
    if (!std::isfinite(geometry.hip_forward_offset)) {
        error_message = "hip_forward_offset must be finite";
        return false;
    }

    if (!validateGaitParameters(config.gait, geometry, error_message)) {
        return false;
    }

    const BalanceParameters &balance = config.balance;
    if (!(balance.filter_alpha > 0.0 && balance.filter_alpha <= 1.0)) {
        error_message = fmt::format("filter_alpha must be in (0,1] (got {})", balance.filter_alpha);
        return false;
    }
    if (!(balance.max_pitch_correction >= 0.0) || !(balance.max_roll_correction >= 0.0)) {
        error_message = "maximum balance corrections must be non-negative";
        return false;
    }
    if (!(balance.pitch_early_threshold >= 0.0) || !(balance.roll_early_threshold >= 0.0)) {
        error_message = "early correction thresholds must be non-negative";
        return false;
    }

    if (!(config.control_period >= MIN_CONTROL_PERIOD && config.control_period <= MAX_CONTROL_PERIOD)) {
        error_message = fmt::format("control_period must be in [{}, {}] s (got {})",
                                    MIN_CONTROL_PERIOD, MAX_CONTROL_PERIOD, config.control_period);
        return false;
    }
    return true;
}
