#ifndef GAIT_CONFIG_FACTORY_H
#define GAIT_CONFIG_FACTORY_H

#include "gait_config.h"
#include <string>

/**
 * @file gait_config_factory.h
 * @brief Gait configuration presets and validation
 */

// Preset creation functions
GaitConfiguration createZmpWalkConfig();
GaitConfiguration createGentleWalkConfig(bool enable_lateral_motion);
GaitConfiguration createTallWalkConfig();
GaitConfiguration createImuBalancedWalkConfig();
GaitConfiguration createGaitConfiguration(GaitPreset preset);

/**
 * @brief Joint names used by the reference actuator service.
 */
JointNameMap createDefaultJointNameMap();

/**
 * @brief Validate a configuration once, before a controller is started.
 * @param config Configuration to check
 * @param error_message Receives a description of the first invalid field
 * @return true when the configuration can drive a controller
 */
bool validateGaitConfiguration(const GaitConfiguration &config, std::string &error_message);

/**
 * @brief Validate tunable gait parameters against a fixed leg geometry.
 */
bool validateGaitParameters(const GaitParameters &params, const LegGeometry &geometry, std::string &error_message);

#endif // GAIT_CONFIG_FACTORY_H
