#ifndef BIPEDMOTION_MOCK_INTERFACES_H
#define BIPEDMOTION_MOCK_INTERFACES_H

#include "BipedMotion.h"
#include <cmath>

/**
 * @brief Example orientation source producing a slow forward sway.
 */
class ExampleOrientation : public IOrientationInterface {
  public:
    bool initialize() override { return true; }
    OrientationSample readOrientation() override {
        OrientationSample sample;
        sample.roll = 0.01 * std::sin(phase_);
        sample.pitch = 0.02 * std::sin(0.5 * phase_);
        sample.yaw = 0.0;
        sample.is_valid = true;
        phase_ += 0.1;
        return sample;
    }

  private:
    double phase_ = 0.0;
};

/**
 * @brief Example feedback source echoing the last commanded angles.
 */
class ExampleFeedback : public IJointFeedbackInterface {
  public:
    bool initialize() override { return true; }
    bool update() override { return true; }
    bool getJointAngle(JointId joint, double &degrees) override {
        if (joint < 0 || joint >= JOINT_COUNT) {
            return false;
        }
        degrees = angles[joint];
        return true;
    }

    double angles[JOINT_COUNT] = {};
};

/**
 * @brief Example command sink storing commanded angles in RAM.
 */
class ExampleCommands : public IJointCommandInterface {
  public:
    explicit ExampleCommands(ExampleFeedback *echo = nullptr) : echo_(echo) {}

    bool initialize() override { return true; }
    bool sendJointCommands(const JointCommandSet &commands) override {
        for (int i = 0; i < JOINT_COUNT; ++i) {
            const JointCommand &command = commands[static_cast<JointId>(i)];
            if (!command.active) {
                continue;
            }
            last_degrees[i] = command.degrees;
            if (echo_) {
                echo_->angles[i] = command.degrees;
            }
        }
        sent_count++;
        return true;
    }

    double last_degrees[JOINT_COUNT] = {};
    unsigned long sent_count = 0;

  private:
    ExampleFeedback *echo_;
};

#endif // BIPEDMOTION_MOCK_INTERFACES_H
