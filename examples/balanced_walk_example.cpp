#include "BipedMotion.h"
#include "mock_interfaces.h"
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fmt/format.h>

namespace {

ControlLoop *active_loop = nullptr;

void handleSignal(int) {
    if (active_loop) {
        active_loop->requestStop();
    }
}

GaitPreset parsePreset(const char *name) {
    if (std::strcmp(name, "gentle") == 0) {
        return GAIT_PRESET_GENTLE;
    }
    if (std::strcmp(name, "tall") == 0) {
        return GAIT_PRESET_TALL;
    }
    if (std::strcmp(name, "imu") == 0) {
        return GAIT_PRESET_IMU_BALANCED;
    }
    return GAIT_PRESET_ZMP;
}

} // namespace

int main(int argc, char **argv) {
    GaitPreset preset = argc > 1 ? parsePreset(argv[1]) : GAIT_PRESET_IMU_BALANCED;
    unsigned long ticks = argc > 2 ? std::strtoul(argv[2], nullptr, 10) : 500;

    ExampleOrientation orientation;
    ExampleFeedback feedback;
    ExampleCommands commands(&feedback);

    GaitConfiguration config = createGaitConfiguration(preset);
    GaitController controller(config);
    if (!controller.initialize(&orientation, &feedback, &commands)) {
        fmt::print(stderr, "Initialisation failed: {}\n", controller.getLastErrorMessage());
        return 1;
    }

    fmt::print("Walking with '{}' for {} ticks ({} s period)\n", config.name, ticks, config.control_period);
    controller.startWalking();

    ControlLoop loop(controller);
    active_loop = &loop;
    std::signal(SIGINT, handleSignal);
    bool ok = loop.run(ticks);
    active_loop = nullptr;

    const GaitController::ControllerStatistics &stats = controller.getStatistics();
    fmt::print("Phase {} after {} ticks, {} steps, {} settle ticks, {} overruns\n",
               GaitStateMachine::getPhaseName(controller.getGaitPhase()), stats.tick_count,
               controller.getGaitStateMachine()->getState().completed_steps, loop.getSettleTickCount(),
               loop.getOverrunCount());
    fmt::print("Left knee {:.2f} deg, right knee {:.2f} deg\n", commands.last_degrees[LEFT_KNEE],
               commands.last_degrees[RIGHT_KNEE]);
    return ok ? 0 : 1;
}
