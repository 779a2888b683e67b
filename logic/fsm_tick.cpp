/*
 * FSM Tick Logic Implementation
 */

#include "logic/fsm_tick.hpp"
#include "logic/fsm_state.hpp"
#include "utils/press_detect.hpp"
#include <cstdint>

void fsm_tick_init(FsmTickState &state) {
    state = FsmTickState{};
}

uint8_t fsm_tick_update(FsmTickState &state, const FsmInputs &in, LedOutputs *out) {
    uint8_t status_flags = 0;

    /* All loads below read prev; writes land in next */
    const FsmRegisters prev = state.regs;
    FsmRegisters next = prev;

    if (!fsm_state_is_defined(prev.state)) {
        status_flags |= FSM_FLAG_STATE_UNDEFINED;
    }
    if (!in.raw_reset) {
        status_flags |= FSM_FLAG_RAW_RESET;
    }

    /* === Signal conditioning === */
    sync_debounce_step(next.reset_unit, DebounceMode::ClearOnSyncLow,
                       in.raw_reset, true);
    sync_debounce_step(next.button_unit, DebounceMode::ClearOnRawReset,
                       in.raw_button, in.raw_reset);

    /* Debounced reset is an asynchronous clear: it blocks this edge if it was
     * already asserted, and it also takes hold as soon as the new level drops */
    bool reset_active = !prev.reset_unit.level || !next.reset_unit.level;

    /* === Press detector === */
    next.pressed_n = press_detect_next(reset_active, prev.button_unit.level,
                                       sync_stage2(prev.button_unit.sync));

    /* === State register === */
    next.state = fsm_next_state(prev.state, reset_active, prev.pressed_n);

    /* === Commit === */
    state.regs = next;

    if (state.tick_count < UINT32_MAX) {
        state.tick_count++;
    }
    if (reset_active) {
        status_flags |= FSM_FLAG_RESET_ACTIVE;
        if (state.reset_ticks < UINT32_MAX) {
            state.reset_ticks++;
        }
    } else if (!prev.pressed_n && state.press_count < UINT32_MAX) {
        state.press_count++;
    }
    if (!next.pressed_n) {
        status_flags |= FSM_FLAG_PRESS_EVENT;
    }
    if (next.state != prev.state) {
        status_flags |= FSM_FLAG_STATE_CHANGED;
    }

    if (out != nullptr) {
        *out = fsm_decode_outputs(next.state);
    }

    return status_flags;
}
