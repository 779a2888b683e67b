/*
 * Synchronize + Debounce - Pure logic, no GPIO dependency
 * Two-stage synchronizer feeding a single-stage debounce register.
 * One unit per asynchronous input (button, reset). Testable on host.
 */

#ifndef SYNC_DEBOUNCE_HPP
#define SYNC_DEBOUNCE_HPP

#include "types.h"
#include <cstdint>

/*
 * How the debounce register of a unit is cleared.
 *
 * ClearOnRawReset: level is forced high ("not pressed") while the raw,
 *   unsynchronized reset sample is asserted. Otherwise it takes the value
 *   of synchronizer stage 2 on every tick.
 *
 * ClearOnSyncLow: level drops low immediately while synchronizer stage 2 is
 *   low. It rises again only on the tick after stage 2 has gone high.
 */
enum class DebounceMode : uint8_t { ClearOnRawReset, ClearOnSyncLow };

struct SyncDebounceState {
    uint8_t sync = SYNC_IDLE_BITS;  /* Two-stage shift register (SYNC_*_BIT) */
    bool level = true;              /* Debounced level, active-low */
};

/*
 * Shift a raw sample into a two-stage synchronizer.
 * new stage 1 = raw sample, new stage 2 = previous stage 1.
 */
uint8_t sync_shift(uint8_t sync, bool raw_sample);

/* Second synchronizer stage as a level */
inline bool sync_stage2(uint8_t sync) {
    return (sync & SYNC_STAGE2_BIT) != 0U;
}

/*
 * Advance one unit by one tick.
 *
 * @param state        Persistent unit state (caller-owned)
 * @param mode         Clear rule for the debounce register
 * @param raw_sample   Raw input sample for this tick (active-low)
 * @param raw_reset_n  Raw reset sample for this tick (active-low); only
 *                     consulted by DebounceMode::ClearOnRawReset
 * @return The debounced level after the tick
 */
bool sync_debounce_step(SyncDebounceState &state, DebounceMode mode,
                        bool raw_sample, bool raw_reset_n);

#endif /* SYNC_DEBOUNCE_HPP */
