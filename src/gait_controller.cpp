#include "gait_controller.h"
#include "gait_config_factory.h"

GaitController::GaitController(const GaitConfiguration &config)
    : GaitController(config, createDefaultJointNameMap()) {}

GaitController::GaitController(const GaitConfiguration &config, const JointNameMap &joint_names)
    : config_(config), joint_names_(joint_names), orientation_(nullptr), feedback_(nullptr), commands_(nullptr),
      initialized_(false), feedback_degraded_(false), orientation_degraded_(false),
      consecutive_command_failures_(0), last_error_(NO_ERROR) {}

GaitController::~GaitController() {
    initialized_ = false;
}

// System initialization
bool GaitController::initialize(IOrientationInterface *orientation, IJointFeedbackInterface *feedback,
                                IJointCommandInterface *commands) {
    initialized_ = false;

    std::string message;
    if (!validateGaitConfiguration(config_, message)) {
        setError(PARAMETER_ERROR, fmt::format("invalid configuration '{}': {}", config_.name, message));
        return false;
    }

    if (!feedback || !commands) {
        setError(INTERFACE_ERROR, "joint feedback and command interfaces are required");
        return false;
    }

    orientation_ = orientation;
    feedback_ = feedback;
    commands_ = commands;

    if (orientation_ && !orientation_->initialize()) {
        setError(ORIENTATION_ERROR, "orientation source failed to initialise");
        return false;
    }
    if (!feedback_->initialize()) {
        setError(FEEDBACK_ERROR, "joint feedback source failed to initialise");
        return false;
    }
    if (!commands_->initialize()) {
        setError(COMMAND_ERROR, "joint command sink failed to initialise");
        return false;
    }
    if (!orientation_ && config_.balance.enable_balance) {
        logDebug("no orientation source, balance correction stays at zero");
    }

    gait_ = std::make_unique<GaitStateMachine>(config_.geometry, config_.gait);
    balance_ = std::make_unique<BalanceCorrector>(config_.balance);
    mapper_ = std::make_unique<JointCommandMapper>(joint_names_, config_.enable_arm_swing);
    feedback_cache_.clear();

    last_commands_ = mapper_->map(gait_->getJointAngles());
    statistics_ = ControllerStatistics();
    feedback_degraded_ = false;
    orientation_degraded_ = false;
    consecutive_command_failures_ = 0;
    last_error_ = NO_ERROR;
    last_error_message_.clear();
    initialized_ = true;

    logDebug("initialised '{}' ({} ticks per step, period {} s)", config_.name,
             config_.gait.step_cycle_length, config_.control_period);
    return true;
}

bool GaitController::update(double dt) {
    if (!initialized_) {
        setError(STATE_ERROR, "update called before initialize");
        return false;
    }

    // Feedback: gaps are filled with last-known values
    int missing = feedback_cache_.refresh(feedback_);
    if (missing > 0) {
        statistics_.feedback_misses++;
        if (!feedback_degraded_) {
            logDebug("joint feedback incomplete ({} joints missing), using last-known values", missing);
        }
        feedback_degraded_ = true;
    } else {
        feedback_degraded_ = false;
    }

    // Orientation: an absent sample freezes the balance corrector
    OrientationSample sample;
    if (orientation_) {
        sample = orientation_->readOrientation();
    }
    if (!sample.is_valid) {
        statistics_.orientation_dropouts++;
        if (!orientation_degraded_ && orientation_) {
            logDebug("orientation sample missing, balance correction frozen");
        }
        orientation_degraded_ = true;
    } else {
        orientation_degraded_ = false;
    }

    BalanceCorrector::BalanceCorrection correction = balance_->update(sample, dt);
    gait_->setBalanceCorrection(correction.pitch, correction.roll);

    gait_->update();
    syncAppliedParameters();

    last_commands_ = mapper_->map(gait_->getJointAngles());
    if (!commands_->sendJointCommands(last_commands_)) {
        statistics_.command_failures++;
        consecutive_command_failures_++;
        if (consecutive_command_failures_ == 1) {
            setError(COMMAND_ERROR, fmt::format("joint command send failed at tick {}", statistics_.tick_count));
        } else {
            last_error_ = COMMAND_ERROR;
        }
    } else {
        if (consecutive_command_failures_ > 0) {
            logDebug("joint command sink recovered after {} failed ticks", consecutive_command_failures_);
        }
        consecutive_command_failures_ = 0;
    }

    statistics_.tick_count++;
    return true;
}

bool GaitController::startWalking() {
    if (!initialized_) {
        setError(STATE_ERROR, "startWalking called before initialize");
        return false;
    }
    gait_->setWalkingEnabled(true);
    return true;
}

bool GaitController::stopWalking() {
    if (!initialized_) {
        setError(STATE_ERROR, "stopWalking called before initialize");
        return false;
    }
    gait_->requestStop();
    return true;
}

bool GaitController::reset() {
    if (!initialized_) {
        setError(STATE_ERROR, "reset called before initialize");
        return false;
    }
    gait_->reset();
    syncAppliedParameters();
    balance_->reset();
    feedback_cache_.clear();
    return true;
}

bool GaitController::setGaitParameters(const GaitParameters &params) {
    std::string message;
    if (!validateGaitParameters(params, config_.geometry, message)) {
        setError(PARAMETER_ERROR, fmt::format("invalid gait parameters: {}", message));
        return false;
    }
    if (!gait_) {
        config_.gait = params;
        return true;
    }
    // Staged by the gait until the next step boundary
    gait_->setGaitParameters(params);
    syncAppliedParameters();
    return true;
}

void GaitController::syncAppliedParameters() {
    if (!gait_->hasPendingParameters()) {
        config_.gait = gait_->getGaitParameters();
    }
}

bool GaitController::isWalking() const {
    return gait_ && gait_->isWalking();
}

bool GaitController::isSettled() const {
    return gait_ && gait_->getPhase() == GaitStateMachine::GAIT_READY;
}

int GaitController::getStopTickBound() const {
    return gait_ ? gait_->getStopTickBound() : 0;
}

GaitStateMachine::GaitPhase GaitController::getGaitPhase() const {
    return gait_ ? gait_->getPhase() : GaitStateMachine::GAIT_RAMP_DOWN;
}

// Error handling
std::string GaitController::getErrorMessage(ErrorCode error) {
    switch (error) {
    case NO_ERROR:
        return "No errors";
    case PARAMETER_ERROR:
        return "Parameter error";
    case INTERFACE_ERROR:
        return "Missing interface";
    case ORIENTATION_ERROR:
        return "Orientation source error";
    case FEEDBACK_ERROR:
        return "Joint feedback error";
    case COMMAND_ERROR:
        return "Joint command error";
    case STATE_ERROR:
        return "Controller state error";
    default:
        return "Unknown error";
    }
}

void GaitController::setError(ErrorCode error, const std::string &message) {
    last_error_ = error;
    last_error_message_ = message;
    logError("{}: {}", getErrorMessage(error), message);
}
