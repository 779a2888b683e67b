/*
 * Core Type Definitions for the Quad-State Button FSM
 * Shared by the clocked core, the firmware harness and the host trace tool
 */

#ifndef QUADFSM_TYPES_H
#define QUADFSM_TYPES_H

#include <stdint.h>
#include <stdbool.h>

/*============================================================================
 * Per-Tick Status Flags
 *============================================================================*/

/* Bitfield returned by fsm_tick_update() - describes what happened on a tick */
#define FSM_FLAG_RESET_ACTIVE       (1U << 0U)  /* Debounced reset active after tick */
#define FSM_FLAG_RAW_RESET          (1U << 1U)  /* Raw reset sample asserted this tick */
#define FSM_FLAG_PRESS_EVENT        (1U << 2U)  /* Press detector reports a press */
#define FSM_FLAG_STATE_CHANGED      (1U << 3U)  /* State differs from previous tick */
#define FSM_FLAG_STATE_UNDEFINED    (1U << 4U)  /* State held an undefined value before tick */

/*============================================================================
 * Synchronizer Register Layout
 *============================================================================
 * Two-stage shift register packed into the low bits of a uint8_t:
 *   bit 0 - first stage (sample captured on this tick)
 *   bit 1 - second stage (sample captured on the previous tick)
 * Raw inputs are active-low, so the idle (inactive) value is both bits set.
 */
#define SYNC_STAGE1_BIT     (1U << 0U)
#define SYNC_STAGE2_BIT     (1U << 1U)
#define SYNC_MASK           (SYNC_STAGE1_BIT | SYNC_STAGE2_BIT)
#define SYNC_IDLE_BITS      SYNC_MASK

#ifdef __cplusplus

/*============================================================================
 * FSM State
 *============================================================================
 * Closed set of four states. Any other underlying value is "undefined":
 * it decodes to all outputs off and transitions to A on the next tick.
 */
enum class FsmState : uint8_t { A = 0, B = 1, C = 2, D = 3 };

static constexpr uint8_t FSM_STATE_COUNT = 4;

/*============================================================================
 * Indicator Outputs
 *============================================================================*/
struct LedOutputs {
    bool led1 = false;
    bool led2 = false;
    bool led3 = false;
    bool led4 = false;

    uint8_t lit_count() const {
        return static_cast<uint8_t>(led1) + static_cast<uint8_t>(led2) +
               static_cast<uint8_t>(led3) + static_cast<uint8_t>(led4);
    }

    bool operator==(const LedOutputs &o) const {
        return led1 == o.led1 && led2 == o.led2 && led3 == o.led3 && led4 == o.led4;
    }
    bool operator!=(const LedOutputs &o) const { return !(*this == o); }
};

#endif /* __cplusplus */

#endif /* QUADFSM_TYPES_H */
