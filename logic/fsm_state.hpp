/*
 * FSM State Core - Pure Algorithms (no SDK dependencies)
 * Transition function and Moore output decoder for the four-state cycle
 */

#ifndef FSM_STATE_HPP
#define FSM_STATE_HPP

#include "types.h"
#include <cstdint>

/* True for A-D, false for any other underlying value */
bool fsm_state_is_defined(FsmState s);

/*
 * Cyclic successor A->B->C->D->A.
 * Undefined values map to A.
 */
FsmState fsm_successor(FsmState s);

/*
 * State register update for one tick.
 *
 * Reset dominates: reset_active forces A regardless of the press input.
 * Otherwise a press (pressed_n == false) advances to the successor and
 * anything else holds the current state.
 */
FsmState fsm_next_state(FsmState current, bool reset_active, bool pressed_n);

/*
 * Moore output decoder.
 *   A -> (1,0,0,0)   B -> (0,1,0,0)
 *   C -> (0,0,1,0)   D -> (0,0,0,1)
 *   undefined -> (0,0,0,0)
 */
LedOutputs fsm_decode_outputs(FsmState s);

/*
 * Render outputs as four '0'/'1' characters, led1 first ("1000" for A).
 * buf must hold at least 5 bytes; returns buf.
 */
char *fsm_format_leds(const LedOutputs &leds, char *buf);

/* Single-letter name ("A".."D"), "?" for undefined values */
const char *fsm_state_name(FsmState s);

/*
 * Parse a single-letter state name (case-insensitive).
 * Returns false and leaves *out untouched if the text is not A-D.
 */
bool fsm_state_parse(const char *text, FsmState *out);

#endif // FSM_STATE_HPP
