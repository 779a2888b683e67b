#include <gtest/gtest.h>
#include <random>
#include "logic/fsm_tick.hpp"
#include "logic/fsm_state.hpp"

static const LedOutputs LEDS_A = {true, false, false, false};
static const LedOutputs LEDS_B = {false, true, false, false};
static const LedOutputs LEDS_C = {false, false, true, false};
static const LedOutputs LEDS_D = {false, false, false, true};

class FsmTickTest : public ::testing::Test {
protected:
    FsmTickState state = {};
    LedOutputs out = {};
    uint8_t flags = 0;

    void tick(bool raw_button, bool raw_reset, uint32_t count = 1) {
        for (uint32_t i = 0; i < count; i++) {
            FsmInputs in = {raw_button, raw_reset};
            flags = fsm_tick_update(state, in, &out);
        }
    }

    /* Raw reset low for 3 ticks, then 3 idle ticks: reset gating ends after tick 6 */
    void bring_up() {
        tick(true, false, 3);
        tick(true, true, 3);
    }

    /* Button low for hold ticks, then released */
    void press(uint32_t hold, uint32_t release = 4) {
        tick(false, true, hold);
        tick(true, true, release);
    }
};

// ============================================================================
// Test Suite: FsmTick_PowerOn
// ============================================================================

TEST_F(FsmTickTest, PowerOnRegisters) {
    EXPECT_EQ(state.regs.state, FsmState::A);
    EXPECT_EQ(state.regs.button_unit.sync, SYNC_IDLE_BITS);
    EXPECT_EQ(state.regs.reset_unit.sync, SYNC_IDLE_BITS);
    EXPECT_TRUE(state.regs.button_unit.level);
    EXPECT_TRUE(state.regs.reset_unit.level);
    EXPECT_TRUE(state.regs.pressed_n);
    EXPECT_EQ(state.tick_count, 0U);
}

TEST_F(FsmTickTest, IdleInputsHoldA) {
    for (int i = 0; i < 50; i++) {
        tick(true, true);
        EXPECT_EQ(out, LEDS_A);
        EXPECT_EQ(flags, 0U);
    }
    EXPECT_EQ(state.tick_count, 50U);
    EXPECT_EQ(state.press_count, 0U);
}

TEST_F(FsmTickTest, NullOutputPointerAllowed) {
    FsmInputs in = {true, true};
    fsm_tick_update(state, in, nullptr);
    EXPECT_EQ(state.tick_count, 1U);
}

TEST_F(FsmTickTest, InitRestoresPowerOn) {
    bring_up();
    press(3);
    ASSERT_EQ(state.regs.state, FsmState::B);

    fsm_tick_init(state);
    EXPECT_EQ(state.regs.state, FsmState::A);
    EXPECT_EQ(state.regs.button_unit.sync, SYNC_IDLE_BITS);
    EXPECT_EQ(state.tick_count, 0U);
    EXPECT_EQ(state.press_count, 0U);
    EXPECT_EQ(state.reset_ticks, 0U);
}

// ============================================================================
// Test Suite: FsmTick_Reset
// ============================================================================

TEST_F(FsmTickTest, ResetGatingTimeline) {
    tick(true, false);   /* stage 1 only */
    EXPECT_EQ(flags, FSM_FLAG_RAW_RESET);

    tick(true, false);   /* stage 2 low: debounced reset asserts */
    EXPECT_TRUE(flags & FSM_FLAG_RESET_ACTIVE);
    EXPECT_FALSE(state.regs.reset_unit.level);

    tick(true, false);
    tick(true, true);    /* raw released, stage 2 still low */
    tick(true, true);    /* stage 2 high, debounced level still low */
    EXPECT_FALSE(state.regs.reset_unit.level);
    EXPECT_TRUE(flags & FSM_FLAG_RESET_ACTIVE);

    tick(true, true);    /* level rises; clear still held at this edge */
    EXPECT_TRUE(state.regs.reset_unit.level);
    EXPECT_TRUE(flags & FSM_FLAG_RESET_ACTIVE);

    tick(true, true);    /* clocked logic runs */
    EXPECT_FALSE(flags & FSM_FLAG_RESET_ACTIVE);
    EXPECT_EQ(state.reset_ticks, 5U);
}

TEST_F(FsmTickTest, ResetMidSequenceReturnsToA) {
    bring_up();
    press(3);
    press(3);
    ASSERT_EQ(state.regs.state, FsmState::C);
    ASSERT_EQ(out, LEDS_C);

    /* Button held down while reset asserts */
    tick(false, false);
    tick(false, false);
    EXPECT_TRUE(flags & FSM_FLAG_RESET_ACTIVE);
    EXPECT_EQ(state.regs.state, FsmState::A);
    EXPECT_EQ(out, LEDS_A);
}

TEST_F(FsmTickTest, ResetHeldIgnoresPresses) {
    bring_up();
    tick(true, false, 2);
    for (int i = 0; i < 5; i++) {
        tick(false, false, 3);
        tick(true, false, 4);
        EXPECT_EQ(state.regs.state, FsmState::A);
        EXPECT_EQ(out, LEDS_A);
        EXPECT_TRUE(state.regs.pressed_n);
    }
}

TEST_F(FsmTickTest, RawResetForcesButtonLevelHigh) {
    bring_up();
    tick(false, true, 4);
    ASSERT_FALSE(state.regs.button_unit.level);

    tick(false, false);
    EXPECT_TRUE(state.regs.button_unit.level);
}

TEST_F(FsmTickTest, PressDuringResetReleaseDoesNotAdvance) {
    /* One-tick press while raw reset is low: the trailing edge reaches the
     * press detector on the tick the debounced level rises, where the clear
     * held at that edge swallows it */
    tick(true, false, 2);
    tick(false, false);
    tick(true, true, 2);
    EXPECT_FALSE(state.regs.reset_unit.level);

    tick(true, true);
    EXPECT_TRUE(state.regs.reset_unit.level);
    EXPECT_TRUE(flags & FSM_FLAG_RESET_ACTIVE);
    EXPECT_TRUE(state.regs.pressed_n);

    tick(true, true, 8);
    EXPECT_EQ(state.regs.state, FsmState::A);
    EXPECT_EQ(state.press_count, 0U);
}

// ============================================================================
// Test Suite: FsmTick_Press
// ============================================================================

TEST_F(FsmTickTest, PressEventOnThirdReleaseTick) {
    bring_up();
    tick(false, true, 3);

    tick(true, true);
    EXPECT_FALSE(flags & FSM_FLAG_PRESS_EVENT);
    tick(true, true);
    EXPECT_FALSE(flags & FSM_FLAG_PRESS_EVENT);
    tick(true, true);
    EXPECT_TRUE(flags & FSM_FLAG_PRESS_EVENT);
    EXPECT_FALSE(state.regs.pressed_n);
    EXPECT_EQ(state.regs.state, FsmState::A);  /* state register loads next tick */

    tick(true, true);
    EXPECT_FALSE(flags & FSM_FLAG_PRESS_EVENT);
    EXPECT_TRUE(flags & FSM_FLAG_STATE_CHANGED);
    EXPECT_EQ(state.regs.state, FsmState::B);
    EXPECT_EQ(out, LEDS_B);
    EXPECT_EQ(state.press_count, 1U);
}

TEST_F(FsmTickTest, LongHoldAdvancesOnce) {
    bring_up();
    for (int i = 0; i < 200; i++) {
        tick(false, true);
        EXPECT_EQ(state.regs.state, FsmState::A) << "advanced while held at i=" << i;
    }
    tick(true, true, 10);
    EXPECT_EQ(state.regs.state, FsmState::B);
    EXPECT_EQ(state.press_count, 1U);
}

TEST_F(FsmTickTest, SingleTickPressStillCounts) {
    /* The single-stage filter passes a one-tick pulse */
    bring_up();
    press(1);
    EXPECT_EQ(state.regs.state, FsmState::B);
}

TEST_F(FsmTickTest, SynchronizerLatencyInFullCore) {
    bring_up();
    tick(false, true);
    EXPECT_TRUE(sync_stage2(state.regs.button_unit.sync));
    EXPECT_TRUE(state.regs.button_unit.level);
    tick(false, true);
    EXPECT_FALSE(sync_stage2(state.regs.button_unit.sync));
    EXPECT_TRUE(state.regs.button_unit.level);
    tick(false, true);
    EXPECT_FALSE(state.regs.button_unit.level);
}

// ============================================================================
// Test Suite: FsmTick_Scenario
// ============================================================================

TEST_F(FsmTickTest, FourPressCyclesWalkAllStates) {
    bring_up();
    EXPECT_EQ(out, LEDS_A);

    press(3);
    EXPECT_EQ(out, LEDS_B);
    press(3);
    EXPECT_EQ(out, LEDS_C);
    press(3);
    EXPECT_EQ(out, LEDS_D);
    press(3);
    EXPECT_EQ(out, LEDS_A);

    EXPECT_EQ(state.press_count, 4U);
}

TEST_F(FsmTickTest, BackToBackPressesWithMinimalRelease) {
    /* Three release ticks: the advance lands on the first tick of the next press */
    bring_up();
    press(3, 3);
    EXPECT_EQ(state.regs.state, FsmState::A);
    tick(false, true);
    EXPECT_EQ(state.regs.state, FsmState::B);
}

// ============================================================================
// Test Suite: FsmTick_Undefined
// ============================================================================

TEST_F(FsmTickTest, UndefinedStateRecoversToA) {
    bring_up();
    state.regs.state = static_cast<FsmState>(9);

    tick(true, true);
    EXPECT_TRUE(flags & FSM_FLAG_STATE_UNDEFINED);
    EXPECT_TRUE(flags & FSM_FLAG_STATE_CHANGED);
    EXPECT_EQ(state.regs.state, FsmState::A);
    EXPECT_EQ(out, LEDS_A);

    tick(true, true);
    EXPECT_FALSE(flags & FSM_FLAG_STATE_UNDEFINED);
}

// ============================================================================
// Test Suite: FsmTick_Properties (random stimulus)
// ============================================================================

TEST_F(FsmTickTest, RandomStimulusInvariants) {
    std::mt19937 rng(12345U);
    std::bernoulli_distribution button_low(0.4);
    std::bernoulli_distribution reset_low(0.05);

    for (int i = 0; i < 20000; i++) {
        FsmState before = state.regs.state;
        bool pressed_before = state.regs.pressed_n;

        tick(!button_low(rng), !reset_low(rng));

        /* Exactly one indicator lit */
        EXPECT_EQ(out.lit_count(), 1U);
        EXPECT_EQ(out, fsm_decode_outputs(state.regs.state));

        if (flags & FSM_FLAG_RESET_ACTIVE) {
            EXPECT_EQ(state.regs.state, FsmState::A);
            EXPECT_EQ(out, LEDS_A);
            EXPECT_TRUE(state.regs.pressed_n);
        } else if (!pressed_before) {
            EXPECT_EQ(state.regs.state, fsm_successor(before));
        } else {
            EXPECT_EQ(state.regs.state, before);
        }

        /* Press detector never fires on consecutive ticks */
        if (!pressed_before) {
            EXPECT_TRUE(state.regs.pressed_n);
        }
    }
}
