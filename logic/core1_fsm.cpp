/*
 * Core 1 FSM Loop - Hardware Integration Layer
 * Fixed-rate tick: sample pins, advance the clocked core, drive LEDs,
 * publish the result to Core 0
 */

#include "logic/core1_fsm.hpp"
#include "logic/fsm_core.hpp"
#include "drivers/input_pins.hpp"
#include "drivers/led_bank.hpp"
#include "config.h"

#include "pico/stdlib.h"
#include "pico/multicore.h"
#include "hardware/sync.h"
#include "hardware/watchdog.h"

static spin_lock_t *fsm_lock = nullptr;
static FsmSnapshot shared_state = {};
static JitterStats jitter = {};
static uint32_t dropped_frames = 0;

void core1_fsm_init() {
    if (fsm_lock == nullptr) {
        fsm_lock = spin_lock_init(spin_lock_claim_unused(true));
    }
}

__not_in_flash_func(void) core1_entry() {
    uint32_t data = multicore_fifo_pop_blocking();
    auto *ctx = reinterpret_cast<Core1Context *>(data);

    auto *inputs = ctx->inputs;
    auto *leds = ctx->leds;

    /* Owned by this loop only; Core 0 sees published copies */
    static Fsm_Core core;

    absolute_time_t deadline = get_absolute_time();

    while (true) {
        absolute_time_t start = get_absolute_time();
        deadline = delayed_by_us(deadline, FSM_TICK_PERIOD_US);

        FsmInputs in = inputs->sample();
        LedOutputs out = core.advance(in.raw_button, in.raw_reset);
        leds->write(out);

        FsmSnapshot snap = {};
        snap.state = core.state();
        snap.leds = out;
        snap.status_flags = core.last_flags();
        snap.tick_count = core.tick_count();
        snap.press_count = core.press_count();
        snap.reset_ticks = core.reset_ticks();

        uint32_t irq_state = spin_lock_blocking(fsm_lock);
        shared_state = snap;
        spin_unlock(fsm_lock, irq_state);

        if (!multicore_fifo_push_timeout_us(snap.tick_count, FSM_FIFO_TIMEOUT_US)) {
            if (dropped_frames < UINT32_MAX) {
                dropped_frames++;
            }
        }

        watchdog_update();

        uint32_t elapsed = absolute_time_diff_us(start, get_absolute_time());
        if (elapsed < jitter.min_us) {
            jitter.min_us = elapsed;
        }
        if (elapsed > jitter.max_us) {
            jitter.max_us = elapsed;
        }
        jitter.last_us = elapsed;

        sleep_until(deadline);
    }
}

FsmSnapshot core1_get_fsm_state() {
    uint32_t irq_state = spin_lock_blocking(fsm_lock);
    FsmSnapshot copy = shared_state;
    spin_unlock(fsm_lock, irq_state);
    return copy;
}

JitterStats core1_get_jitter_stats() {
    return jitter;
}

uint32_t core1_get_dropped_frames() {
    return dropped_frames;
}
