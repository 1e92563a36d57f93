#ifndef BIPEDMOTION_CONSTANTS_H
#define BIPEDMOTION_CONSTANTS_H

/**
 * @file bipedmotion_constants.h
 * @brief Global constants for the BipedMotion gait controller
 *
 * Kinematic biases, numeric guards, balance scaling factors and default
 * configuration values shared by the gait, balance and command modules.
 */

#include <cmath>

#define NUM_BIPED_LEGS 2
#define JOINTS_PER_LEG 4

// ========================================================================
// ANGLE CONVERSION
// ========================================================================

#define DEGREES_TO_RADIANS_FACTOR (M_PI / 180.0)
#define RADIANS_TO_DEGREES_FACTOR (180.0 / M_PI)

// ========================================================================
// NUMERIC GUARDS
// ========================================================================

#define KINEMATICS_EPSILON 1e-8       // Below this the virtual leg is treated as degenerate
#define TRAJECTORY_DENOMINATOR_MIN 1e-8 // Guard for the single-support duration denominator
#define RAMP_HEIGHT_TOLERANCE 0.1     // mm, RampDown finishes within this distance of nominal

// ========================================================================
// LEG KINEMATICS
// ========================================================================

#define KNEE_BEND_GAIN 2.0       // knee = gain * gamma + bias
#define KNEE_BEND_BIAS 0.3       // rad, keeps the knee off the straight-leg singularity
#define ANKLE_PITCH_OFFSET 0.3   // rad, keeps the sole parallel under nominal lean

// ========================================================================
// BALANCE CORRECTION
// ========================================================================

#define BALANCE_HISTORY_SIZE 5
#define BALANCE_EARLY_SCALE 1.5          // Applied once the tilt passes the early threshold
#define BALANCE_FORWARD_PITCH_SCALE 2.0  // Forward falls are corrected harder
#define BALANCE_FORWARD_PITCH_WINDOW 0.1 // rad, near-zero band where forward velocity counts
#define PITCH_ACCELERATION_WEIGHT 0.3
#define ROLL_ACCELERATION_WEIGHT 0.2
#define ANKLE_PITCH_COMPENSATION_RATIO 0.7
#define ROLL_COMPENSATION_FRACTION 0.5

// ========================================================================
// COMMAND MAPPING
// ========================================================================

#define ARM_SWING_GAIN 3.0 // shoulder pitch = gain * hip roll (degrees)

// ========================================================================
// DEFAULT CONFIGURATION
// ========================================================================

#define DEFAULT_LEG_LENGTH 180.0
#define DEFAULT_RAMP_STEP 1.0       // mm per tick
#define DEFAULT_SETTLE_TICKS 10
#define DEFAULT_CONTROL_PERIOD 0.05 // s
#define MIN_CONTROL_PERIOD 0.01     // s, 100 Hz
#define MAX_CONTROL_PERIOD 0.05     // s, 20 Hz

#endif // BIPEDMOTION_CONSTANTS_H
