#ifndef LEG_KINEMATICS_H
#define LEG_KINEMATICS_H

#include "biped_model.h"
#include "gait_config.h"

/**
 * @class LegKinematics
 * @brief Closed-form inverse kinematics for a biped leg.
 *
 * The leg is treated as a single virtual link between hip and ankle whose
 * length shrinks as the knee bends. Requests beyond the leg length are
 * clamped to full extension and never fail.
 */
class LegKinematics {
  public:
    /**
     * @brief Construct a solver for the given leg geometry.
     * @param geometry Leg geometry (only leg_length is used)
     * @param roll_bias Constant added to every hip roll solution in radians
     */
    explicit LegKinematics(const LegGeometry &geometry, double roll_bias = 0.0);

    /**
     * @brief Solve joint angles for a foot position relative to the hip.
     * @param x Forward offset in mm
     * @param y Lateral offset in mm
     * @param h Vertical hip-to-foot distance in mm (positive down)
     * @param side Leg being solved
     * @return Joint angles in radians
     */
    LegJointAngles solveLeg(double x, double y, double h, LegSide side) const;

    /** Convenience overload taking the foot position as a point. */
    LegJointAngles solveLeg(const Point3D &foot, LegSide side) const;

    /**
     * @brief Reconstruct the foot position from a solution of solveLeg.
     *
     * Exact inverse of solveLeg for reachable targets with positive height.
     */
    Point3D forwardKinematics(const LegJointAngles &angles, LegSide side) const;

    /** True when the target lies within the leg length and is not clamped. */
    bool isReachable(const Point3D &foot) const;

    double getLegLength() const { return leg_length_; }
    double getRollBias() const { return roll_bias_; }
    void setRollBias(double roll_bias) { roll_bias_ = roll_bias; }

  private:
    double leg_length_;
    double roll_bias_;
};

#endif // LEG_KINEMATICS_H
