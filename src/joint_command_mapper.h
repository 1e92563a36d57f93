#ifndef JOINT_COMMAND_MAPPER_H
#define JOINT_COMMAND_MAPPER_H

#include "biped_model.h"
#include <memory>

/**
 * @brief Converts gait joint angles into actuator commands.
 *
 * Radians become degrees, a static per-joint sign table accounts for the
 * mounting direction of each actuator and the injected name table labels
 * every command. Name to actuator id resolution is left to the command
 * interface.
 */
class JointCommandMapper {
  public:
    explicit JointCommandMapper(const JointNameMap &names, bool enable_arm_swing = false);

    /**
     * @brief Map joint angles to a complete command set.
     * @param angles Leg joint angles in radians
     * @return Commands in degrees for every JointId
     */
    JointCommandSet map(const JointAngles &angles) const;

    /** Mounting sign of a joint (+1 or -1). */
    static double getJointSign(JointId joint);

    void setArmSwingEnabled(bool enabled) { arm_swing_enabled_ = enabled; }
    bool isArmSwingEnabled() const { return arm_swing_enabled_; }
    const JointNameMap &getJointNames() const { return *names_; }

  private:
    std::shared_ptr<const JointNameMap> names_;
    bool arm_swing_enabled_;

    void setCommand(JointCommandSet &set, JointId joint, double radians, bool active) const;
};

#endif // JOINT_COMMAND_MAPPER_H
