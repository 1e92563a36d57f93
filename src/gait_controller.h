#ifndef GAIT_CONTROLLER_H
#define GAIT_CONTROLLER_H

#include "balance_corrector.h"
#include "biped_model.h"
#include "gait_config.h"
#include "gait_state_machine.h"
#include "joint_command_mapper.h"
#include "joint_feedback_cache.h"
#include <fmt/format.h>
#include <memory>
#include <string>
#include <utility>

/**
 * @brief Biped gait controller.
 *
 * Runs one control tick per update():
 * feedback -> balance corrector -> gait state machine -> command mapper -> command sink.
 *
 * The configuration is validated once by initialize(). An uninitialised
 * controller refuses to tick. After initialisation every tick produces a
 * full command set: feedback gaps are filled from the cache, orientation
 * dropouts freeze the balance corrector and failed sends are counted.
 */
class GaitController {
  public:
    // Error control
    enum ErrorCode {
        NO_ERROR = 0,
        PARAMETER_ERROR = 1,   // Invalid configuration or gait parameters
        INTERFACE_ERROR = 2,   // Missing collaborator interface
        ORIENTATION_ERROR = 3, // Orientation source failed to initialise
        FEEDBACK_ERROR = 4,    // Joint feedback source failed
        COMMAND_ERROR = 5,     // Command sink failed
        STATE_ERROR = 6        // Operation not valid in the current state
    };

    /**
     * @brief Runtime counters.
     */
    struct ControllerStatistics {
        unsigned long tick_count = 0;
        unsigned long command_failures = 0;
        unsigned long orientation_dropouts = 0;
        unsigned long feedback_misses = 0; //< Ticks with at least one missing joint
    };

    /** Construct with the default joint name table. */
    explicit GaitController(const GaitConfiguration &config);
    GaitController(const GaitConfiguration &config, const JointNameMap &joint_names);
    ~GaitController();

    GaitController(const GaitController &) = delete;
    GaitController &operator=(const GaitController &) = delete;

    /**
     * @brief Validate the configuration and bind the collaborators.
     * @param orientation Orientation source, may be null (balance stays frozen)
     * @param feedback Joint feedback source
     * @param commands Joint command sink
     * @return false with last error set when the controller cannot start
     */
    bool initialize(IOrientationInterface *orientation, IJointFeedbackInterface *feedback,
                    IJointCommandInterface *commands);

    /**
     * @brief Run one control tick.
     * @param dt Time since the previous tick in seconds
     * @return false only when the controller is not initialised
     */
    bool update(double dt);

    /** Enable walking once READY. */
    bool startWalking();
    /** Finish the current step and settle back to READY. */
    bool stopWalking();
    /** Return to RAMP_DOWN. */
    bool reset();

    /**
     * @brief Change gait parameters between steps.
     *
     * While walking the change is staged; getConfiguration() reports the
     * new parameters once the gait has applied them.
     * @return false with PARAMETER_ERROR if the parameters are invalid
     */
    bool setGaitParameters(const GaitParameters &params);

    bool isInitialized() const { return initialized_; }
    bool isWalking() const;
    /** True when the gait is standing in READY. */
    bool isSettled() const;
    /** Ticks the gait may still need to reach READY after a stop. */
    int getStopTickBound() const;

    GaitStateMachine::GaitPhase getGaitPhase() const;
    const GaitStateMachine *getGaitStateMachine() const { return gait_.get(); }
    const BalanceCorrector *getBalanceCorrector() const { return balance_.get(); }
    const JointFeedbackCache &getFeedbackCache() const { return feedback_cache_; }
    const JointCommandSet &getLastCommands() const { return last_commands_; }
    const GaitConfiguration &getConfiguration() const { return config_; }
    const ControllerStatistics &getStatistics() const { return statistics_; }

    ErrorCode getLastError() const { return last_error_; }
    static std::string getErrorMessage(ErrorCode error);
    const std::string &getLastErrorMessage() const { return last_error_message_; }

  private:
    GaitConfiguration config_;
    JointNameMap joint_names_;

    IOrientationInterface *orientation_;
    IJointFeedbackInterface *feedback_;
    IJointCommandInterface *commands_;

    std::unique_ptr<GaitStateMachine> gait_;
    std::unique_ptr<BalanceCorrector> balance_;
    std::unique_ptr<JointCommandMapper> mapper_;
    JointFeedbackCache feedback_cache_;

    JointCommandSet last_commands_;
    ControllerStatistics statistics_;
    bool initialized_;
    bool feedback_degraded_;
    bool orientation_degraded_;
    unsigned long consecutive_command_failures_;

    ErrorCode last_error_;
    std::string last_error_message_;

    void setError(ErrorCode error, const std::string &message);
    void syncAppliedParameters();

    template <typename... Args>
    void logDebug(fmt::format_string<Args...> format, Args &&...args) const {
#ifdef DEBUG_LOGGING
        fmt::print(stderr, "DEBUG: [GaitController] {}\n", fmt::format(format, std::forward<Args>(args)...));
#else
        (void)format;
        ((void)args, ...);
#endif
    }

    template <typename... Args>
    void logError(fmt::format_string<Args...> format, Args &&...args) const {
        fmt::print(stderr, "ERROR: [GaitController] {}\n", fmt::format(format, std::forward<Args>(args)...));
    }
};

#endif // GAIT_CONTROLLER_H
