/*
 * Fsm_Core Implementation
 */

#include "logic/fsm_core.hpp"

LedOutputs Fsm_Core::advance(bool raw_button, bool raw_reset) {
    FsmInputs in = {raw_button, raw_reset};
    last_flags_ = fsm_tick_update(state_, in, &outputs_);
    return outputs_;
}
