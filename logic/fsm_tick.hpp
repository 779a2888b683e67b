/*
 * FSM Tick Logic - Per-tick register transfer for the clocked core
 * Synchronizers, debouncers, press detector and state register,
 * evaluated from one snapshot and committed together
 */

#ifndef FSM_TICK_HPP
#define FSM_TICK_HPP

#include "types.h"
#include "utils/sync_debounce.hpp"
#include <cstdint>

/*============================================================================
 * Raw Input Snapshot
 *============================================================================
 * Raw pin samples for one tick. Both are active-low: false = asserted.
 */
struct FsmInputs {
    bool raw_button;
    bool raw_reset;
};

/*============================================================================
 * Register Set
 *============================================================================
 * Every value that persists across ticks in the modelled circuit.
 * Default member values are the power-on state.
 */
struct FsmRegisters {
    SyncDebounceState button_unit = {};  /* level: true = not pressed */
    SyncDebounceState reset_unit = {};   /* level: true = reset inactive */
    bool pressed_n = true;               /* Press detector, false = press */
    FsmState state = FsmState::A;
};

/*============================================================================
 * FSM Tick State
 *============================================================================
 * Register set plus bookkeeping counters. The counters observe the
 * circuit and never feed back into it.
 */
struct FsmTickState {
    FsmRegisters regs = {};
    uint32_t tick_count = 0;
    uint32_t press_count = 0;    /* Ticks on which the state advanced on a press */
    uint32_t reset_ticks = 0;    /* Ticks on which reset gated the clocked logic */
};

/* Restore power-on registers and clear counters */
void fsm_tick_init(FsmTickState &state);

/*============================================================================
 * FSM Tick Update
 *============================================================================
 * One clock edge:
 * - Synchronizers shift in the raw samples
 * - Debouncers, press detector and state register load from the
 *   pre-tick snapshot; reset-dominant branches win on the same tick
 * - Outputs are decoded from the committed state
 *
 * out may be nullptr when the caller only needs the registers.
 * Returns: status_flags bitfield (FSM_FLAG_*)
 */
uint8_t fsm_tick_update(FsmTickState &state, const FsmInputs &in, LedOutputs *out);

#endif // FSM_TICK_HPP
