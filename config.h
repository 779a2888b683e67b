/*
 * Hardware Configuration for RP2350 Quad-State Button FSM
 * Pin map, tick rate and console timing
 */

#ifndef QUADFSM_CONFIG_H
#define QUADFSM_CONFIG_H

/*============================================================================
 * Raw Inputs (active-low, internal pull-up)
 *============================================================================*/
#define FSM_BUTTON_PIN          6U       /* GP6: advance push-button */
#define FSM_RESET_PIN           7U       /* GP7: reset push-button */

/*============================================================================
 * Indicator Outputs (active-high)
 *============================================================================*/
#define FSM_LED1_PIN            16U      /* Lit in state A */
#define FSM_LED2_PIN            17U      /* Lit in state B */
#define FSM_LED3_PIN            18U      /* Lit in state C */
#define FSM_LED4_PIN            19U      /* Lit in state D */

/*============================================================================
 * Clocked Core (Core 1 tick loop)
 *============================================================================*/
#define FSM_TICK_PERIOD_US      1000U    /* 1kHz tick rate */
#define FSM_FIFO_TIMEOUT_US     0U       /* Non-blocking FIFO push */
#define FSM_WATCHDOG_TIMEOUT_MS 100U     /* 100 missed ticks = reboot */

/*============================================================================
 * Reference Clock
 *============================================================================
 * The reference circuit is clocked at 50MHz; the firmware tick rate above is
 * the rate at which the same register-transfer model is stepped.
 */
#define FSM_REFERENCE_CLOCK_HZ  50000000U

/*============================================================================
 * Console
 *============================================================================*/
#define CONSOLE_USB_WAIT_MS         5000U    /* Max wait for USB CDC host */
#define CONSOLE_LOOP_SLEEP_MS       10U      /* Core 0 poll period */
#define CONSOLE_HEARTBEAT_MS        5000U    /* Heartbeat line interval */

#endif /* QUADFSM_CONFIG_H */
