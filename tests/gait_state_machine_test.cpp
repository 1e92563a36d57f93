#include "../src/gait_config.h"
#include "../src/gait_config_factory.h"
#include "../src/gait_state_machine.h"
#include "../src/joint_command_mapper.h"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>

static GaitConfiguration makeWalkConfig() {
    GaitConfiguration config = createGentleWalkConfig(true);
    config.geometry.initial_leg_height = config.geometry.nominal_leg_height;
    return config;
}

// Tick until READY, bounded
static void rampToReady(GaitStateMachine &gait) {
    for (int i = 0; i < 1000 && gait.getPhase() != GaitStateMachine::GAIT_READY; ++i) {
        gait.update();
    }
    assert(gait.getPhase() == GaitStateMachine::GAIT_READY);
}

// Enable walking and run the READY tick that enters DOUBLE_SUPPORT
static void enterWalking(GaitStateMachine &gait) {
    rampToReady(gait);
    gait.setWalkingEnabled(true);
    gait.update();
    assert(gait.getPhase() == GaitStateMachine::GAIT_DOUBLE_SUPPORT);
    assert(gait.getState().step_cycle_counter == 1);
}

static bool anglesEqual(const LegJointAngles &a, const LegJointAngles &b, double tolerance) {
    return std::abs(a.hip_pitch - b.hip_pitch) <= tolerance && std::abs(a.hip_roll - b.hip_roll) <= tolerance &&
           std::abs(a.knee - b.knee) <= tolerance && std::abs(a.ankle_pitch - b.ankle_pitch) <= tolerance;
}

void testStandUp() {
    std::cout << "Testing stand-up ramp..." << std::endl;
    LegGeometry geometry;
    geometry.initial_leg_height = 180.0;
    geometry.nominal_leg_height = 170.0;
    GaitParameters params;
    params.ramp_step = 1.0;
    GaitStateMachine gait(geometry, params);

    assert(gait.getPhase() == GaitStateMachine::GAIT_RAMP_DOWN);
    double previous_height = gait.getState().leg_height;
    assert(previous_height == 180.0);

    for (int tick = 1; tick <= 9; ++tick) {
        gait.update();
        assert(gait.getPhase() == GaitStateMachine::GAIT_RAMP_DOWN);
        assert(gait.getState().leg_height < previous_height);
        previous_height = gait.getState().leg_height;
        // Feet together under the hip while lowering
        assert(gait.getFootTarget(LEFT_LEG).y == 0.0);
        assert(gait.getFootTarget(RIGHT_LEG).y == 0.0);
        assert(gait.getFootTarget(LEFT_LEG).x == -geometry.hip_forward_offset);
    }

    gait.update();
    assert(gait.getPhase() == GaitStateMachine::GAIT_READY);
    assert(std::abs(gait.getFootTarget(LEFT_LEG).z - 170.0) < 1e-9);
    assert(std::abs(gait.getFootTarget(RIGHT_LEG).z - 170.0) < 1e-9);

    // Never revisits RAMP_DOWN without reset
    for (int tick = 0; tick < 200; ++tick) {
        gait.update();
        assert(gait.getPhase() != GaitStateMachine::GAIT_RAMP_DOWN);
        if (tick == 20) {
            gait.setWalkingEnabled(true);
        }
        if (tick == 120) {
            gait.requestStop();
        }
    }

    gait.reset();
    assert(gait.getPhase() == GaitStateMachine::GAIT_RAMP_DOWN);
    assert(gait.getState().leg_height == 180.0);
    assert(!gait.isWalkingEnabled());
}

void testReadyStance() {
    std::cout << "Testing ready stance..." << std::endl;
    GaitConfiguration config = makeWalkConfig();
    GaitStateMachine gait(config.geometry, config.gait);
    rampToReady(gait);
    gait.update();

    const Point3D &left = gait.getFootTarget(LEFT_LEG);
    const Point3D &right = gait.getFootTarget(RIGHT_LEG);
    assert(left.y == -config.gait.base_stance_width);
    assert(right.y == config.gait.base_stance_width);
    assert(left.z == config.geometry.nominal_leg_height);
    assert(right.z == config.geometry.nominal_leg_height);
    assert(gait.getState().foot_lift == 0.0);
    assert(gait.getPhase() == GaitStateMachine::GAIT_READY);
}

void testSingleStep() {
    std::cout << "Testing single step..." << std::endl;
    GaitConfiguration config = makeWalkConfig();
    config.gait.step_cycle_length = 20;
    config.gait.double_support_fraction = 0.4;
    config.gait.step_length = 10.0;
    GaitStateMachine gait(config.geometry, config.gait);
    enterWalking(gait);

    const LegSide first_stance = gait.getState().stance_foot;
    int toggles = 0;
    LegSide stance = first_stance;
    bool saw_single_support = false;
    for (int tick = 0; tick < 20; ++tick) {
        gait.update();
        if (gait.getState().stance_foot != stance) {
            toggles++;
            stance = gait.getState().stance_foot;
        }
        if (gait.getPhase() == GaitStateMachine::GAIT_SINGLE_SUPPORT) {
            saw_single_support = true;
        }
    }

    assert(saw_single_support);
    assert(toggles == 1);
    assert(gait.getState().stance_foot != first_stance);
    assert(gait.getState().accumulated_forward_offset == 0.0);
    assert(gait.getState().step_cycle_counter == 1);
    assert(gait.getState().completed_steps == 1);
    assert(gait.getState().foot_lift == 0.0);
    assert(gait.getPhase() == GaitStateMachine::GAIT_DOUBLE_SUPPORT);
}

void testStepCycleInvariants() {
    std::cout << "Testing step-cycle invariants..." << std::endl;
    const int cycle_lengths[] = {4, 8, 20, 7};
    const double fractions[] = {0.2, 0.3, 0.4, 0.0};

    for (int variant = 0; variant < 4; ++variant) {
        GaitConfiguration config = makeWalkConfig();
        config.gait.step_cycle_length = cycle_lengths[variant];
        config.gait.double_support_fraction = fractions[variant];
        config.gait.max_foot_lift = 8.0;
        GaitStateMachine gait(config.geometry, config.gait);
        enterWalking(gait);

        const int L = config.gait.step_cycle_length;
        for (int tick = 0; tick < 10 * L; ++tick) {
            gait.update();
            const GaitStateMachine::GaitState &state = gait.getState();
            assert(state.step_cycle_counter >= 0 && state.step_cycle_counter <= L);
            assert(state.foot_lift >= 0.0);
            if (state.step_cycle_counter <= config.gait.double_support_fraction * L) {
                assert(state.foot_lift == 0.0);
            }
            if (gait.getPhase() == GaitStateMachine::GAIT_DOUBLE_SUPPORT) {
                assert(state.foot_lift == 0.0);
            }
            // Stance foot is never lifted
            assert(std::abs(gait.getFootTarget(state.stance_foot).z - config.geometry.nominal_leg_height) < 1e-9);
        }
        assert(gait.getState().completed_steps >= 9);
    }
}

void testSwingLiftProfile() {
    std::cout << "Testing swing lift profile..." << std::endl;
    GaitConfiguration config = makeWalkConfig();
    config.gait.step_cycle_length = 20;
    config.gait.double_support_fraction = 0.4;
    config.gait.max_foot_lift = 4.0;
    GaitStateMachine gait(config.geometry, config.gait);
    enterWalking(gait);

    double peak = 0.0;
    for (int tick = 0; tick < 19; ++tick) {
        int counter = gait.getState().step_cycle_counter;
        LegSide swing = gait.getState().stance_foot == LEFT_LEG ? RIGHT_LEG : LEFT_LEG;
        gait.update();
        double lift = gait.getState().foot_lift;
        double expected = 0.0;
        if (counter > 8) {
            expected = 4.0 * std::sin(M_PI * (counter - 8) / 12.0);
        }
        assert(std::abs(lift - expected) < 1e-9);
        assert(std::abs(gait.getFootTarget(swing).z - (config.geometry.nominal_leg_height - lift)) < 1e-9);
        peak = std::max(peak, lift);
    }
    assert(std::abs(peak - 4.0) < 1e-9);
}

void testLateralShift() {
    std::cout << "Testing lateral weight shift..." << std::endl;
    GaitConfiguration config = makeWalkConfig();
    config.gait.step_cycle_length = 20;
    config.gait.lateral_foot_shift = 6.0;
    config.gait.enable_lateral_motion = true;
    GaitStateMachine gait(config.geometry, config.gait);
    enterWalking(gait);

    for (int tick = 0; tick < 40; ++tick) {
        int counter = gait.getState().step_cycle_counter;
        LegSide stance = gait.getState().stance_foot;
        gait.update();
        double expected = 6.0 * std::sin(M_PI * counter / 20.0);
        if (stance == RIGHT_LEG) {
            expected = -expected;
        }
        assert(std::abs(gait.getState().lateral_offset - expected) < 1e-9);
        assert(std::abs(gait.getFootTarget(LEFT_LEG).y - (-expected - config.gait.base_stance_width)) < 1e-9);
        assert(std::abs(gait.getFootTarget(RIGHT_LEG).y - (expected + config.gait.base_stance_width)) < 1e-9);
    }

    // Preset amplitude is reached exactly at mid-step, never exceeded
    GaitConfiguration zmp = createZmpWalkConfig();
    zmp.geometry.initial_leg_height = zmp.geometry.nominal_leg_height;
    GaitStateMachine fast(zmp.geometry, zmp.gait);
    enterWalking(fast);
    double peak = 0.0;
    for (int tick = 0; tick < 40; ++tick) {
        fast.update();
        peak = std::max(peak, std::abs(fast.getState().lateral_offset));
    }
    assert(std::abs(peak - zmp.gait.lateral_foot_shift) < 1e-9);

    config.gait.enable_lateral_motion = false;
    GaitStateMachine still(config.geometry, config.gait);
    enterWalking(still);
    for (int tick = 0; tick < 40; ++tick) {
        still.update();
        assert(still.getState().lateral_offset == 0.0);
    }
}

void testForwardTrajectory() {
    std::cout << "Testing forward trajectory..." << std::endl;
    GaitConfiguration config = makeWalkConfig();
    config.gait.step_cycle_length = 20;
    config.gait.double_support_fraction = 0.4;
    config.gait.step_length = 10.0;
    GaitStateMachine gait(config.geometry, config.gait);
    enterWalking(gait);

    // First step starts from zero baselines: stance foot retreats, swing foot advances
    for (int tick = 0; tick < 19; ++tick) {
        gait.update();
    }
    const GaitStateMachine::GaitState &state = gait.getState();
    LegSide stance = state.stance_foot;
    LegSide swing = stance == LEFT_LEG ? RIGHT_LEG : LEFT_LEG;
    assert(state.forward_offset[stance] < 0.0);
    assert(state.forward_offset[swing] > 0.0);
    assert(state.forward_offset[swing] <= config.gait.step_length + 1e-9);

    // Cycle end: swing foot reaches the step length, stance foot reaches -step_length
    gait.update();
    assert(std::abs(state.forward_offset[swing] - config.gait.step_length) < 1e-9);
    assert(std::abs(state.forward_offset[stance] + config.gait.step_length) < 1e-9);

    // Baselines snapshot for the next step
    assert(state.previous_stance_offset == state.forward_offset[state.stance_foot]);
    assert(std::abs(state.previous_stance_offset - config.gait.step_length) < 1e-9);

    // Trajectories stay finite over many steps
    for (int tick = 0; tick < 400; ++tick) {
        gait.update();
        assert(std::isfinite(state.forward_offset[LEFT_LEG]));
        assert(std::isfinite(state.forward_offset[RIGHT_LEG]));
        // Feet in double support travel together, so the trailing foot may reach two step lengths back
        assert(std::abs(state.forward_offset[LEFT_LEG]) <= 2.0 * config.gait.step_length + 1e-9);
        assert(std::abs(state.forward_offset[RIGHT_LEG]) <= 2.0 * config.gait.step_length + 1e-9);
    }
}

void testDenominatorGuard() {
    std::cout << "Testing single-support denominator guard..." << std::endl;
    GaitConfiguration config = makeWalkConfig();
    config.gait.step_cycle_length = 4;
    config.gait.double_support_fraction = 1.0 - 1e-12;
    GaitStateMachine gait(config.geometry, config.gait);
    enterWalking(gait);

    for (int tick = 0; tick < 40; ++tick) {
        gait.update();
        const JointAngles &angles = gait.getJointAngles();
        for (int side = 0; side < NUM_BIPED_LEGS; ++side) {
            const LegJointAngles &leg = angles[static_cast<LegSide>(side)];
            assert(std::isfinite(leg.hip_pitch) && std::isfinite(leg.hip_roll));
            assert(std::isfinite(leg.knee) && std::isfinite(leg.ankle_pitch));
        }
        assert(std::isfinite(gait.getState().foot_lift));
    }
}

void testSymmetry() {
    std::cout << "Testing left/right symmetry..." << std::endl;
    GaitConfiguration config = createZmpWalkConfig();
    config.geometry.initial_leg_height = config.geometry.nominal_leg_height;
    config.gait.step_cycle_length = 12;

    GaitParameters left_first = config.gait;
    left_first.initial_stance_foot = LEFT_LEG;
    left_first.base_stance_width = 2.0;

    GaitParameters right_first = config.gait;
    right_first.initial_stance_foot = RIGHT_LEG;
    right_first.base_stance_width = -2.0;

    GaitStateMachine a(config.geometry, left_first);
    GaitStateMachine b(config.geometry, right_first);
    enterWalking(a);
    enterWalking(b);

    // Mirrored actuators are mounted with opposite signs
    const JointId left_joints[] = {LEFT_HIP_ROLL, LEFT_HIP_PITCH, LEFT_KNEE, LEFT_ANKLE};
    const JointId right_joints[] = {RIGHT_HIP_ROLL, RIGHT_HIP_PITCH, RIGHT_KNEE, RIGHT_ANKLE};
    JointCommandMapper mapper(createDefaultJointNameMap(), config.enable_arm_swing);

    for (int tick = 0; tick < 60; ++tick) {
        a.update();
        b.update();
        assert(a.getPhase() == b.getPhase());
        assert(std::abs(a.getState().lateral_offset + b.getState().lateral_offset) < 1e-12);
        assert(anglesEqual(a.getJointAngles()[LEFT_LEG], b.getJointAngles()[RIGHT_LEG], 1e-12));
        assert(anglesEqual(a.getJointAngles()[RIGHT_LEG], b.getJointAngles()[LEFT_LEG], 1e-12));

        JointCommandSet ca = mapper.map(a.getJointAngles());
        JointCommandSet cb = mapper.map(b.getJointAngles());
        for (int j = 0; j < 4; ++j) {
            assert(std::abs(ca[left_joints[j]].degrees + cb[right_joints[j]].degrees) < 1e-9);
            assert(std::abs(ca[right_joints[j]].degrees + cb[left_joints[j]].degrees) < 1e-9);
        }
        assert(ca[LEFT_HIP_YAW].degrees == 0.0 && cb[RIGHT_HIP_YAW].degrees == 0.0);
        assert(std::abs(ca[LEFT_SHOULDER_PITCH].degrees - cb[RIGHT_SHOULDER_PITCH].degrees) < 1e-9);
        assert(ca[LEFT_SHOULDER_PITCH].active == cb[RIGHT_SHOULDER_PITCH].active);
    }
}

void testSafeStop() {
    std::cout << "Testing safe stop..." << std::endl;
    GaitConfiguration config = makeWalkConfig();
    config.gait.step_cycle_length = 20;
    config.gait.double_support_fraction = 0.4;
    config.gait.settle_ticks = 10;

    // Stop requested in every tick position of a step
    for (int delay = 0; delay < 20; ++delay) {
        GaitStateMachine gait(config.geometry, config.gait);
        enterWalking(gait);
        for (int tick = 0; tick < 20 + delay; ++tick) {
            gait.update();
        }
        bool stopped_in_single_support = gait.getPhase() == GaitStateMachine::GAIT_SINGLE_SUPPORT;
        int steps_before = gait.getState().completed_steps;

        gait.requestStop();
        GaitStateMachine::GaitPhase previous = gait.getPhase();
        int ticks = 0;
        while (gait.getPhase() != GaitStateMachine::GAIT_READY) {
            gait.update();
            ticks++;
            assert(ticks <= config.gait.step_cycle_length + config.gait.settle_ticks);

            // Settling only starts from double support
            if (gait.getPhase() == GaitStateMachine::GAIT_STOPPING) {
                assert(previous == GaitStateMachine::GAIT_DOUBLE_SUPPORT ||
                       previous == GaitStateMachine::GAIT_STOPPING);
                assert(gait.getState().foot_lift == 0.0);
                assert(gait.getFootTarget(LEFT_LEG).z == config.geometry.nominal_leg_height);
                assert(gait.getFootTarget(RIGHT_LEG).z == config.geometry.nominal_leg_height);
            }
            previous = gait.getPhase();
        }

        // A swing in progress is completed before settling
        if (stopped_in_single_support) {
            assert(gait.getState().completed_steps == steps_before + 1);
        }

        // Ready stance reached
        gait.update();
        assert(gait.getPhase() == GaitStateMachine::GAIT_READY);
        assert(std::abs(gait.getFootTarget(LEFT_LEG).x + config.geometry.hip_forward_offset) < 1e-9);
        assert(std::abs(gait.getFootTarget(RIGHT_LEG).x + config.geometry.hip_forward_offset) < 1e-9);
        assert(gait.getFootTarget(LEFT_LEG).y == -config.gait.base_stance_width);
    }
}

void testPendingParameters() {
    std::cout << "Testing parameter changes at step boundaries..." << std::endl;
    GaitConfiguration config = makeWalkConfig();
    config.gait.step_cycle_length = 20;
    config.gait.step_length = 10.0;
    GaitStateMachine gait(config.geometry, config.gait);

    // Applied immediately while standing
    GaitParameters standing = config.gait;
    standing.base_stance_width = 3.0;
    gait.setGaitParameters(standing);
    assert(!gait.hasPendingParameters());
    assert(gait.getGaitParameters().base_stance_width == 3.0);

    enterWalking(gait);
    for (int tick = 0; tick < 5; ++tick) {
        gait.update();
    }

    GaitParameters slower = standing;
    slower.step_length = 4.0;
    slower.step_cycle_length = 30;
    gait.setGaitParameters(slower);
    assert(gait.hasPendingParameters());

    int steps = gait.getState().completed_steps;
    while (gait.getState().completed_steps == steps) {
        assert(gait.getGaitParameters().step_length == 10.0);
        assert(gait.getGaitParameters().step_cycle_length == 20);
        gait.update();
    }
    assert(!gait.hasPendingParameters());
    assert(gait.getGaitParameters().step_length == 4.0);
    assert(gait.getGaitParameters().step_cycle_length == 30);

    for (int tick = 0; tick < 60; ++tick) {
        gait.update();
        assert(gait.getState().step_cycle_counter <= 30);
    }
}

void testBalanceApplication() {
    std::cout << "Testing balance correction application..." << std::endl;
    GaitConfiguration config = makeWalkConfig();
    GaitStateMachine gait(config.geometry, config.gait);
    rampToReady(gait);

    const double pitch = 0.1;
    const double roll = 0.04;
    gait.setBalanceCorrection(pitch, roll);
    gait.update();

    const JointAngles &raw = gait.getRawJointAngles();
    const JointAngles &out = gait.getJointAngles();
    LegSide stance = gait.getState().stance_foot;
    LegSide swing = stance == LEFT_LEG ? RIGHT_LEG : LEFT_LEG;
    double bias = config.gait.hip_pitch_bias - pitch;
    double roll_comp = ROLL_COMPENSATION_FRACTION * roll;
    double ankle_comp = ANKLE_PITCH_COMPENSATION_RATIO * pitch;

    assert(std::abs(gait.getEffectiveHipPitchBias() - bias) < 1e-12);
    assert(std::abs(out[LEFT_LEG].hip_pitch - (raw[LEFT_LEG].hip_pitch + bias)) < 1e-12);
    assert(std::abs(out[RIGHT_LEG].hip_pitch - (raw[RIGHT_LEG].hip_pitch + bias)) < 1e-12);
    assert(std::abs(out[stance].ankle_pitch - (raw[stance].ankle_pitch + roll_comp + ankle_comp)) < 1e-12);
    assert(std::abs(out[swing].ankle_pitch - (raw[swing].ankle_pitch - (roll_comp - ankle_comp))) < 1e-12);
    assert(std::abs(out[LEFT_LEG].hip_roll - (raw[LEFT_LEG].hip_roll + roll_comp)) < 1e-12);
    assert(std::abs(out[RIGHT_LEG].hip_roll - (raw[RIGHT_LEG].hip_roll - roll_comp)) < 1e-12);
    assert(out[LEFT_LEG].knee == raw[LEFT_LEG].knee);
}

int main() {
    testStandUp();
    testReadyStance();
    testSingleStep();
    testStepCycleInvariants();
    testSwingLiftProfile();
    testLateralShift();
    testForwardTrajectory();
    testDenominatorGuard();
    testSymmetry();
    testSafeStop();
    testPendingParameters();
    testBalanceApplication();
    std::cout << "gait_state_machine_test executed successfully" << std::endl;
    return 0;
}
