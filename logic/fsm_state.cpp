/*
 * FSM State Core Implementation
 */

#include "logic/fsm_state.hpp"

bool fsm_state_is_defined(FsmState s) {
    return static_cast<uint8_t>(s) < FSM_STATE_COUNT;
}

FsmState fsm_successor(FsmState s) {
    switch (s) {
        case FsmState::A: return FsmState::B;
        case FsmState::B: return FsmState::C;
        case FsmState::C: return FsmState::D;
        case FsmState::D: return FsmState::A;
    }
    /* Undefined value - recover to the reset state */
    return FsmState::A;
}

FsmState fsm_next_state(FsmState current, bool reset_active, bool pressed_n) {
    if (reset_active) {
        return FsmState::A;
    }

    if (!pressed_n) {
        return fsm_successor(current);
    }

    /* Hold, except an undefined value never survives a tick */
    return fsm_state_is_defined(current) ? current : FsmState::A;
}

LedOutputs fsm_decode_outputs(FsmState s) {
    LedOutputs out = {};
    switch (s) {
        case FsmState::A: out.led1 = true; break;
        case FsmState::B: out.led2 = true; break;
        case FsmState::C: out.led3 = true; break;
        case FsmState::D: out.led4 = true; break;
    }
    return out;
}

char *fsm_format_leds(const LedOutputs &leds, char *buf) {
    buf[0] = leds.led1 ? '1' : '0';
    buf[1] = leds.led2 ? '1' : '0';
    buf[2] = leds.led3 ? '1' : '0';
    buf[3] = leds.led4 ? '1' : '0';
    buf[4] = '\0';
    return buf;
}

const char *fsm_state_name(FsmState s) {
    switch (s) {
        case FsmState::A: return "A";
        case FsmState::B: return "B";
        case FsmState::C: return "C";
        case FsmState::D: return "D";
    }
    return "?";
}

bool fsm_state_parse(const char *text, FsmState *out) {
    if (text == nullptr || text[0] == '\0' || text[1] != '\0') {
        return false;
    }

    switch (text[0]) {
        case 'A': case 'a': *out = FsmState::A; return true;
        case 'B': case 'b': *out = FsmState::B; return true;
        case 'C': case 'c': *out = FsmState::C; return true;
        case 'D': case 'd': *out = FsmState::D; return true;
        default: return false;
    }
}
