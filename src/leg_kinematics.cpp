#include "leg_kinematics.h"
#include "bipedmotion_constants.h"
#include "math_utils.h"
#include <algorithm>
#include <cmath>

LegKinematics::LegKinematics(const LegGeometry &geometry, double roll_bias)
    : leg_length_(geometry.leg_length), roll_bias_(roll_bias) {}

LegJointAngles LegKinematics::solveLeg(double x, double y, double h, LegSide side) const {
    (void)side; // both legs share the same geometry
    LegJointAngles angles;

    // Virtual leg length, clamped to full extension
    double k = std::min(std::sqrt(x * x + y * y + h * h), leg_length_);

    double alpha = 0.0;
    if (std::abs(k) >= KINEMATICS_EPSILON) {
        alpha = std::asin(math_utils::clamped(x / k, -1.0, 1.0));
    }

    double gamma = std::acos(math_utils::clamped(k / leg_length_, -1.0, 1.0));

    angles.hip_pitch = gamma + alpha;
    angles.knee = KNEE_BEND_GAIN * gamma + KNEE_BEND_BIAS;
    angles.ankle_pitch = gamma - alpha + ANKLE_PITCH_OFFSET;

    if (std::abs(h) < KINEMATICS_EPSILON) {
        angles.hip_roll = roll_bias_;
    } else {
        angles.hip_roll = std::atan2(y, h) + roll_bias_;
    }
    return angles;
}

LegJointAngles LegKinematics::solveLeg(const Point3D &foot, LegSide side) const {
    return solveLeg(foot.x, foot.y, foot.z, side);
}

Point3D LegKinematics::forwardKinematics(const LegJointAngles &angles, LegSide side) const {
    (void)side;
    // hip = gamma + alpha, ankle = gamma - alpha + offset
    double gamma = (angles.hip_pitch + angles.ankle_pitch - ANKLE_PITCH_OFFSET) / 2.0;
    double alpha = (angles.hip_pitch - angles.ankle_pitch + ANKLE_PITCH_OFFSET) / 2.0;
    double roll = angles.hip_roll - roll_bias_;

    double k = leg_length_ * std::cos(gamma);
    double x = k * std::sin(alpha);
    double r = k * std::cos(alpha); // projection onto the lateral/vertical plane

    return Point3D(x, r * std::sin(roll), r * std::cos(roll));
}

bool LegKinematics::isReachable(const Point3D &foot) const {
    return std::sqrt(foot.x * foot.x + foot.y * foot.y + foot.z * foot.z) <= leg_length_;
}
