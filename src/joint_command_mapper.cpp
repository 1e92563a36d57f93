#include "joint_command_mapper.h"
#include "bipedmotion_constants.h"
#include "math_utils.h"

namespace {

// Mounting direction of each actuator, indexed by JointId
const double JOINT_SIGNS[JOINT_COUNT] = {
    1.0,  // LEFT_HIP_YAW
    -1.0, // LEFT_HIP_ROLL
    -1.0, // LEFT_HIP_PITCH
    1.0,  // LEFT_KNEE
    1.0,  // LEFT_ANKLE
    1.0,  // RIGHT_HIP_YAW
    1.0,  // RIGHT_HIP_ROLL
    1.0,  // RIGHT_HIP_PITCH
    -1.0, // RIGHT_KNEE
    -1.0, // RIGHT_ANKLE
    1.0,  // LEFT_SHOULDER_PITCH
    1.0,  // RIGHT_SHOULDER_PITCH
};

} // namespace

JointCommandMapper::JointCommandMapper(const JointNameMap &names, bool enable_arm_swing)
    : names_(std::make_shared<const JointNameMap>(names)), arm_swing_enabled_(enable_arm_swing) {}

double JointCommandMapper::getJointSign(JointId joint) {
    if (joint < 0 || joint >= JOINT_COUNT) {
        return 1.0;
    }
    return JOINT_SIGNS[joint];
}

void JointCommandMapper::setCommand(JointCommandSet &set, JointId joint, double radians, bool active) const {
    JointCommand &command = set[joint];
    command.joint = joint;
    command.degrees = getJointSign(joint) * math_utils::radiansToDegrees(radians);
    command.active = active;
}

JointCommandSet JointCommandMapper::map(const JointAngles &angles) const {
    JointCommandSet set;
    set.names = names_;
    const LegJointAngles &left = angles[LEFT_LEG];
    const LegJointAngles &right = angles[RIGHT_LEG];

    // Hip yaw is not used by the gait and is held at zero
    setCommand(set, LEFT_HIP_YAW, 0.0, true);
    setCommand(set, LEFT_HIP_ROLL, left.hip_roll, true);
    setCommand(set, LEFT_HIP_PITCH, left.hip_pitch, true);
    setCommand(set, LEFT_KNEE, left.knee, true);
    setCommand(set, LEFT_ANKLE, left.ankle_pitch, true);

    setCommand(set, RIGHT_HIP_YAW, 0.0, true);
    setCommand(set, RIGHT_HIP_ROLL, right.hip_roll, true);
    setCommand(set, RIGHT_HIP_PITCH, right.hip_pitch, true);
    setCommand(set, RIGHT_KNEE, right.knee, true);
    setCommand(set, RIGHT_ANKLE, right.ankle_pitch, true);

    // Arms counter-swing with the hips
    if (arm_swing_enabled_) {
        setCommand(set, LEFT_SHOULDER_PITCH, ARM_SWING_GAIN * left.hip_roll, true);
        setCommand(set, RIGHT_SHOULDER_PITCH, ARM_SWING_GAIN * right.hip_roll, true);
    } else {
        setCommand(set, LEFT_SHOULDER_PITCH, 0.0, false);
        setCommand(set, RIGHT_SHOULDER_PITCH, 0.0, false);
    }
    return set;
}
