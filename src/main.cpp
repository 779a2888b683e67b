/*
 * RP2350 Quad-State Button FSM - Main Entry Point
 * Initializes pins, launches the Core 1 tick loop, reports state on Core 0
 */

#include "config.h"
#include "types.h"

#include "drivers/input_pins.hpp"
#include "drivers/led_bank.hpp"
#include "logic/core1_fsm.hpp"
#include "logic/fsm_state.hpp"
#include "utils/stdio_status.hpp"

#include "pico/stdlib.h"
#include "pico/stdio_usb.h"
#include "pico/multicore.h"
#include "hardware/watchdog.h"

#include <cstdio>

int main() {
    stdio_init_all();

    // Wait for USB host serial connection, then proceed regardless.
    // Without this, early printf output is buffered and lost.
    for (uint32_t waited = 0; waited < CONSOLE_USB_WAIT_MS && !stdio_usb_connected();
         waited += 100U) {
        sleep_ms(100);
    }

    printf("\n========================================\n");
    printf("RP2350 Quad-State Button FSM\n");
    printf("Build: %s %s\n", __DATE__, __TIME__);
    printf("Board: %s\n", PICO_BOARD);
    printf("SDK:   %s\n", PICO_SDK_VERSION_STRING);
    printf("Tick:  %lu us\n", static_cast<unsigned long>(FSM_TICK_PERIOD_US));
    printf("========================================\n\n");
    stdio_flush();

    Stdio_Status status;

    if (watchdog_caused_reboot()) {
        status.show_error("Sys", "Rebooted by watchdog", StatusSeverity::Warning);
    }

    static Input_Pins inputs;
    static Led_Bank leds;

    status.show_status("Init", "Input pins...");
    bool inputs_ok = inputs.init();
    if (inputs_ok) {
        status.show_status("Init", "Input pins OK");
    } else {
        /* Sampling falls back to released levels: core stays in A */
        status.show_error("Init", "Input pins FAILED", StatusSeverity::Error);
    }

    status.show_status("Init", "LED bank...");
    bool leds_ok = leds.init();
    if (leds_ok) {
        status.show_status("Init", "LED bank OK");
    } else {
        status.show_error("Init", "LED bank FAILED - outputs disabled",
                          StatusSeverity::Warning);
    }
    stdio_flush();

    {
        char summary[48];
        snprintf(summary, sizeof(summary), "inputs=%s leds=%s",
                 inputs_ok ? "OK" : "FAIL", leds_ok ? "OK" : "FAIL");
        status.show_status("Init", summary);
    }

    // Enable watchdog - fed by Core 1 every tick and Core 0 every loop
    watchdog_enable(FSM_WATCHDOG_TIMEOUT_MS, true);
    status.show_status("Sys", "Watchdog enabled");

    // Launch Core 1 tick loop
    core1_fsm_init();
    static Core1Context fsm_ctx = {&inputs, &leds};
    multicore_launch_core1(core1_entry);
    multicore_fifo_push_blocking(reinterpret_cast<uint32_t>(&fsm_ctx));
    status.show_status("Sys", "Tick loop launched");
    status.show_status("Sys", "Entering main loop");
    stdio_flush();

    // Main loop - Core 0 only observes published snapshots
    FsmSnapshot prev = core1_get_fsm_state();
    bool prev_reset = (prev.status_flags & FSM_FLAG_RESET_ACTIVE) != 0;
    uint32_t last_heartbeat_ms = to_ms_since_boot(get_absolute_time());

    while (true) {
        watchdog_update();

        // Drain FIFO notifications from Core 1 (non-blocking)
        uint32_t seq;
        while (multicore_fifo_pop_timeout_us(0, &seq)) {
            // Sequence number consumed - latest state read below
        }

        FsmSnapshot snap = core1_get_fsm_state();

        /* Reset edges */
        bool curr_reset = (snap.status_flags & FSM_FLAG_RESET_ACTIVE) != 0;
        if (curr_reset != prev_reset) {
            status.show_reset(curr_reset, snap.tick_count);
        }
        prev_reset = curr_reset;

        /* State changes; several ticks may pass between polls */
        if (snap.state != prev.state) {
            status.show_state(snap.state, snap.leds, snap.tick_count);
        }
        if (snap.status_flags & FSM_FLAG_STATE_UNDEFINED) {
            status.show_error("FSM", "Undefined state recovered to A",
                              StatusSeverity::Warning);
        }
        prev = snap;

        uint32_t now = to_ms_since_boot(get_absolute_time());
        if ((now - last_heartbeat_ms) >= CONSOLE_HEARTBEAT_MS) {
            JitterStats js = core1_get_jitter_stats();
            uint32_t drops = core1_get_dropped_frames();
            char led_buf[5];

            printf("[heartbeat] uptime=%lu ms  state=%s  leds=%s  ticks=%lu  "
                   "presses=%lu  reset_ticks=%lu  flags=0x%02X  "
                   "jitter=%lu/%lu/%lu us  drops=%lu\n",
                   static_cast<unsigned long>(now),
                   fsm_state_name(snap.state),
                   fsm_format_leds(snap.leds, led_buf),
                   static_cast<unsigned long>(snap.tick_count),
                   static_cast<unsigned long>(snap.press_count),
                   static_cast<unsigned long>(snap.reset_ticks),
                   snap.status_flags,
                   static_cast<unsigned long>(js.min_us),
                   static_cast<unsigned long>(js.last_us),
                   static_cast<unsigned long>(js.max_us),
                   static_cast<unsigned long>(drops));
            last_heartbeat_ms = now;
        }
        stdio_flush();

        sleep_ms(CONSOLE_LOOP_SLEEP_MS);
    }
}
