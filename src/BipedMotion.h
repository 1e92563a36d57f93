#ifndef BIPEDMOTION_H
#define BIPEDMOTION_H

#include "balance_corrector.h"
#include "biped_model.h"
#include "bipedmotion_constants.h"
#include "control_loop.h"
#include "gait_config.h"
#include "gait_config_factory.h"
#include "gait_controller.h"
#include "gait_state_machine.h"
#include "joint_command_mapper.h"
#include "joint_feedback_cache.h"
#include "leg_kinematics.h"
#include "math_utils.h"

#endif // BIPEDMOTION_H
