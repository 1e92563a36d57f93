#ifndef BIPED_MODEL_H
#define BIPED_MODEL_H

#include "bipedmotion_constants.h"
#include <Eigen/Geometry>
#include <array>
#include <memory>
#include <string>

/**
 * @file biped_model.h
 * @brief Core data types and collaborator interfaces of the biped controller
 *
 * Joint identifiers, per-leg joint angle containers, orientation samples,
 * joint command sets and the narrow interfaces through which the controller
 * talks to the actuator service that owns the physical robot.
 */

/**
 * @brief 3D point in millimetres.
 */
struct Point3D {
    double x, y, z;
    explicit Point3D(double x = 0, double y = 0, double z = 0) : x(x), y(y), z(z) {}
};

/**
 * @brief Leg index. Also used as the stance foot index.
 */
enum LegSide {
    LEFT_LEG = 0,
    RIGHT_LEG = 1
};

/**
 * @brief Closed set of joints driven by the controller.
 */
enum JointId {
    LEFT_HIP_YAW = 0,
    LEFT_HIP_ROLL,
    LEFT_HIP_PITCH,
    LEFT_KNEE,
    LEFT_ANKLE,
    RIGHT_HIP_YAW,
    RIGHT_HIP_ROLL,
    RIGHT_HIP_PITCH,
    RIGHT_KNEE,
    RIGHT_ANKLE,
    LEFT_SHOULDER_PITCH,
    RIGHT_SHOULDER_PITCH,
    JOINT_COUNT
};

/**
 * @brief Joint angles of one leg in radians.
 */
struct LegJointAngles {
    double hip_pitch = 0.0;
    double hip_roll = 0.0;
    double knee = 0.0;
    double ankle_pitch = 0.0;
};

/**
 * @brief Joint angles of both legs, indexed by LegSide.
 */
struct JointAngles {
    LegJointAngles legs[NUM_BIPED_LEGS];

    LegJointAngles &operator[](LegSide side) { return legs[side]; }
    const LegJointAngles &operator[](LegSide side) const { return legs[side]; }
};

/**
 * @brief Body orientation reading.
 *
 * Either a quaternion or an Euler triple may be supplied. When
 * has_quaternion is set the quaternion takes precedence.
 */
struct OrientationSample {
    double roll = 0.0;  //< Roll in radians
    double pitch = 0.0; //< Pitch in radians
    double yaw = 0.0;   //< Yaw in radians
    Eigen::Quaterniond quaternion = Eigen::Quaterniond::Identity();
    bool has_quaternion = false;
    bool is_valid = false; //< False when no reading was available this tick
};

/**
 * @brief Joint name table injected into the command mapper.
 *
 * Name to actuator id resolution stays with the actuator collaborator.
 */
struct JointNameMap {
    std::array<std::string, JOINT_COUNT> names;

    const std::string &operator[](JointId joint) const { return names[joint]; }
    std::string &operator[](JointId joint) { return names[joint]; }
};

/**
 * @brief Target angle for one joint.
 */
struct JointCommand {
    JointId joint = LEFT_HIP_YAW;
    double degrees = 0.0;
    bool active = false;    //< Inactive commands must not be forwarded to actuators
};

/**
 * @brief Command set for all joints, produced fresh every tick.
 *
 * Shares ownership of the name table, so a set kept by a collaborator
 * stays labelled after the mapper that produced it is gone.
 */
struct JointCommandSet {
    std::array<JointCommand, JOINT_COUNT> commands;
    std::shared_ptr<const JointNameMap> names;

    const JointCommand &operator[](JointId joint) const { return commands[joint]; }
    JointCommand &operator[](JointId joint) { return commands[joint]; }

    /** Actuator name of a joint, empty when the set carries no name table. */
    const std::string &getName(JointId joint) const {
        static const std::string empty;
        if (!names || joint < 0 || joint >= JOINT_COUNT) {
            return empty;
        }
        return (*names)[joint];
    }
};

class IOrientationInterface {
  public:
    virtual ~IOrientationInterface() = default;

    /** Initialize the orientation source. */
    virtual bool initialize() = 0;

    /** Retrieve the latest orientation. is_valid is false when absent. */
    virtual OrientationSample readOrientation() = 0;
};

class IJointFeedbackInterface {
  public:
    virtual ~IJointFeedbackInterface() = default;

    /** Initialize the feedback source. */
    virtual bool initialize() = 0;

    /** Refresh the feedback snapshot. Called once per tick before queries. */
    virtual bool update() = 0;

    /**
     * Read the current angle of one joint in degrees.
     * @return false when the joint is missing from the latest snapshot.
     */
    virtual bool getJointAngle(JointId joint, double &degrees) = 0;
};

class IJointCommandInterface {
  public:
    virtual ~IJointCommandInterface() = default;

    /** Initialize the command sink. */
    virtual bool initialize() = 0;

    /** Forward the active commands to the actuators. */
    virtual bool sendJointCommands(const JointCommandSet &commands) = 0;
};

#endif // BIPED_MODEL_H
