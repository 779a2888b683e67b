/*
 * Core 1 FSM Loop - Hardware Integration Layer
 * Fixed-rate tick: sample pins, advance the clocked core, drive LEDs,
 * publish the result to Core 0
 */

#ifndef CORE1_FSM_HPP
#define CORE1_FSM_HPP

#include "types.h"
#include <cstdint>

class Input_Pins;
class Led_Bank;

struct Core1Context {
    Input_Pins *inputs;
    Led_Bank *leds;
};

/* Latest tick result, copied out under the spin lock */
struct FsmSnapshot {
    FsmState state = FsmState::A;
    LedOutputs leds = {true, false, false, false};
    uint8_t status_flags = 0;
    uint32_t tick_count = 0;
    uint32_t press_count = 0;
    uint32_t reset_ticks = 0;
};

struct JitterStats {
    uint32_t min_us = UINT32_MAX;
    uint32_t max_us = 0;
    uint32_t last_us = 0;
};

/* Claim the spin lock. Call on Core 0 before multicore_launch_core1(). */
void core1_fsm_init();

void core1_entry();

FsmSnapshot core1_get_fsm_state();
JitterStats core1_get_jitter_stats();
uint32_t core1_get_dropped_frames();

#endif // CORE1_FSM_HPP
