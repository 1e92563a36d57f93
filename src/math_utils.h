#ifndef MATH_UTILS_H
#define MATH_UTILS_H

#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <algorithm>

namespace math_utils {
/** Convert degrees to radians. */
double degreesToRadians(double degrees);
/** Convert radians to degrees. */
double radiansToDegrees(double radians);

/**
 * @brief Convert an orientation quaternion to Euler angles.
 * @param quaternion Orientation, normalised before conversion
 * @return (roll, pitch, yaw) in radians, Z-Y-X convention
 */
Eigen::Vector3d quaternionToEuler(const Eigen::Quaterniond &quaternion);

/**
 * @brief Linear interpolation between two values
 * @param origin The origin value
 * @param target The target value
 * @param control_input The interpolation factor (0.0 to 1.0)
 * @return The interpolated value
 */
template <class T>
inline T interpolate(const T &origin, const T &target, double control_input) {
    return (1.0 - control_input) * origin + control_input * target;
}

/**
 * @brief Clamp a value between min and max
 * @param value The value to clamp
 * @param min_value Minimum value
 * @param max_value Maximum value
 * @return Clamped value
 */
template <class T>
inline T clamped(T value, T min_value, T max_value) {
    return std::max(min_value, std::min(max_value, value));
}

/**
 * @brief Half-cosine ease from 0 to 1.
 * @param control_input Progress between 0.0 and 1.0
 */
double cosineEase(double control_input);

} // namespace math_utils

#endif // MATH_UTILS_H
