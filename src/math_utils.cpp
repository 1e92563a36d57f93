#include "math_utils.h"
#include "bipedmotion_constants.h"
#include <cmath>

// Utility function implementations
namespace math_utils {
double degreesToRadians(double degrees) {
    return degrees * DEGREES_TO_RADIANS_FACTOR;
}

double radiansToDegrees(double radians) {
    return radians * RADIANS_TO_DEGREES_FACTOR;
}

Eigen::Vector3d quaternionToEuler(const Eigen::Quaterniond &quaternion) {
    const Eigen::Quaterniond q = quaternion.normalized();
    Eigen::Vector3d euler;

    // Roll about X
    euler[0] = std::atan2(2.0 * (q.w() * q.x() + q.y() * q.z()), 1.0 - 2.0 * (q.x() * q.x() + q.y() * q.y()));

    // Pitch about Y, saturated at the gimbal lock
    double sin_pitch = clamped(2.0 * (q.w() * q.y() - q.z() * q.x()), -1.0, 1.0);
    euler[1] = std::asin(sin_pitch);

    // Yaw about Z
    euler[2] = std::atan2(2.0 * (q.w() * q.z() + q.x() * q.y()), 1.0 - 2.0 * (q.y() * q.y() + q.z() * q.z()));
    return euler;
}

double cosineEase(double control_input) {
    return (1.0 - std::cos(M_PI * control_input)) / 2.0;
}

} // namespace math_utils
