#ifndef JOINT_FEEDBACK_CACHE_H
#define JOINT_FEEDBACK_CACHE_H

#include "biped_model.h"

/**
 * @brief Last-known joint feedback.
 *
 * Joints missing from a partial or stale feedback snapshot keep their last
 * known angle, or zero if they were never reported.
 */
class JointFeedbackCache {
  public:
    JointFeedbackCache();

    /**
     * @brief Refresh the cache from a feedback source.
     * @param feedback Feedback interface, may be null
     * @return Number of joints that were missing this refresh
     */
    int refresh(IJointFeedbackInterface *feedback);

    /** Cached angle in degrees. */
    double getJointAngle(JointId joint) const;

    /** True if the joint was reported at least once. */
    bool hasJoint(JointId joint) const;

    /** True if the joint was reported by the last refresh. */
    bool isFresh(JointId joint) const;

    /** Forget all cached angles. */
    void clear();

  private:
    double angles_[JOINT_COUNT];
    bool known_[JOINT_COUNT];
    bool fresh_[JOINT_COUNT];
};

#endif // JOINT_FEEDBACK_CACHE_H
