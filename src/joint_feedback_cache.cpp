#include "joint_feedback_cache.h"
#include <cmath>

JointFeedbackCache::JointFeedbackCache() {
    clear();
}

void JointFeedbackCache::clear() {
    for (int i = 0; i < JOINT_COUNT; ++i) {
        angles_[i] = 0.0;
        known_[i] = false;
        fresh_[i] = false;
    }
}

int JointFeedbackCache::refresh(IJointFeedbackInterface *feedback) {
    for (int i = 0; i < JOINT_COUNT; ++i) {
        fresh_[i] = false;
    }
    if (!feedback || !feedback->update()) {
        return JOINT_COUNT;
    }

    int missing = 0;
    for (int i = 0; i < JOINT_COUNT; ++i) {
        double degrees = 0.0;
        if (feedback->getJointAngle(static_cast<JointId>(i), degrees) && std::isfinite(degrees)) {
            angles_[i] = degrees;
            known_[i] = true;
            fresh_[i] = true;
        } else {
            missing++;
        }
    }
    return missing;
}

double JointFeedbackCache::getJointAngle(JointId joint) const {
    if (joint < 0 || joint >= JOINT_COUNT) {
        return 0.0;
    }
    return angles_[joint];
}

bool JointFeedbackCache::hasJoint(JointId joint) const {
    return joint >= 0 && joint < JOINT_COUNT && known_[joint];
}

bool JointFeedbackCache::isFresh(JointId joint) const {
    return joint >= 0 && joint < JOINT_COUNT && fresh_[joint];
}
