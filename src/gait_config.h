#ifndef GAIT_CONFIG_H
#define GAIT_CONFIG_H

#include "biped_model.h"
#include <string>

/**
 * @file gait_config.h
 * @brief Gait, geometry and balance configuration data structures
 *
 * The controller variants that differ only in hip offsets, gains and
 * lateral-motion toggles are expressed as presets of these structures
 * (see gait_config_factory.h).
 */

/**
 * @brief Leg geometry. Immutable for the lifetime of a controller.
 */
struct LegGeometry {
    double leg_length = DEFAULT_LEG_LENGTH; //< Effective single-link leg length in mm
    double hip_forward_offset = 2.04;       //< Forward offset of the hip above the foot in mm
    double nominal_leg_height = 170.0;      //< Standing hip-to-foot height in mm
    double initial_leg_height = 180.0;      //< Hip-to-foot height at start-up in mm
};

/**
 * @brief Tunable gait parameters.
 *
 * May be changed by the caller between steps. Changes made while walking
 * take effect at the next step boundary.
 */
struct GaitParameters {
    double step_length = 20.0;             //< Forward step length in mm
    int step_cycle_length = 4;             //< Ticks per step
    double double_support_fraction = 0.2;  //< Share of the cycle with both feet loaded, in [0,1)
    double max_foot_lift = 10.0;           //< Swing foot lift apex in mm
    double lateral_foot_shift = 12.0;      //< Amplitude of the side-to-side weight shift in mm
    double base_stance_width = 2.0;        //< Lateral foot offset from the hip in mm
    double hip_pitch_bias = 20.0 * DEGREES_TO_RADIANS_FACTOR; //< Forward lean added to both hips in rad
    double roll_bias = 0.0;                //< Added to both hip roll targets in rad
    double ramp_step = DEFAULT_RAMP_STEP;  //< Height decrement per tick during RampDown in mm
    int settle_ticks = DEFAULT_SETTLE_TICKS; //< Ticks used to return to stance after a stop
    bool enable_lateral_motion = true;     //< Enable the side-to-side weight shift
    LegSide initial_stance_foot = LEFT_LEG; //< Stance foot of the first step
};

/**
 * @brief Balance corrector tuning.
 *
 * Angles are in radians and rates in radians per second.
 */
struct BalanceParameters {
    bool enable_balance = true;
    double filter_alpha = 0.5;          //< Exponential low-pass factor in (0,1]
    double pitch_gain = 2.0;            //< Proportional pitch gain
    double roll_gain = 1.0;             //< Proportional roll gain
    double pitch_velocity_gain = 0.8;
    double roll_velocity_gain = 0.3;
    double pitch_early_threshold = 5.0 * DEGREES_TO_RADIANS_FACTOR;
    double roll_early_threshold = 3.0 * DEGREES_TO_RADIANS_FACTOR;
    double max_pitch_correction = 25.0 * DEGREES_TO_RADIANS_FACTOR;
    double max_roll_correction = 20.0 * DEGREES_TO_RADIANS_FACTOR;
};

/**
 * @brief Named configuration presets.
 */
enum GaitPreset {
    GAIT_PRESET_ZMP,          //< Fast ZMP walk with lateral weight shift
    GAIT_PRESET_GENTLE,       //< Slow, low-lift walk
    GAIT_PRESET_TALL,         //< Tall stance walk with a shorter hip lean
    GAIT_PRESET_IMU_BALANCED  //< Slow walk without lateral sway, relying on inertial balance
};

/**
 * @brief Complete controller configuration.
 */
struct GaitConfiguration {
    std::string name = "zmp_walk";
    LegGeometry geometry;
    GaitParameters gait;
    BalanceParameters balance;
    bool enable_arm_swing = false;       //< Drive shoulder pitch from hip roll
    double control_period = DEFAULT_CONTROL_PERIOD; //< Tick period in seconds
};

#endif // GAIT_CONFIG_H
