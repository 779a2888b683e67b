/*
 * Fsm_Core - Owned clocked core
 * Holds the register set privately; advance() is the only mutator
 */

#ifndef FSM_CORE_HPP
#define FSM_CORE_HPP

#include "types.h"
#include "logic/fsm_tick.hpp"
#include <cstdint>

class Fsm_Core {
public:
    /* Constructed in the power-on state: A, synchronizers idle, levels inactive */
    Fsm_Core() = default;

    /*
     * Apply one clock tick with the given raw samples (active-low).
     * Returns the decoded outputs after the tick.
     */
    LedOutputs advance(bool raw_button, bool raw_reset);

    FsmState state() const { return state_.regs.state; }
    LedOutputs outputs() const { return outputs_; }
    const FsmRegisters &registers() const { return state_.regs; }

    uint8_t last_flags() const { return last_flags_; }
    uint32_t tick_count() const { return state_.tick_count; }
    uint32_t press_count() const { return state_.press_count; }
    uint32_t reset_ticks() const { return state_.reset_ticks; }

private:
    FsmTickState state_ = {};
    LedOutputs outputs_ = {true, false, false, false};
    uint8_t last_flags_ = 0;
};

#endif // FSM_CORE_HPP
