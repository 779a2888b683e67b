/*
 * Synchronize + Debounce Implementation
 */

#include "utils/sync_debounce.hpp"

uint8_t sync_shift(uint8_t sync, bool raw_sample) {
    uint8_t next = static_cast<uint8_t>((sync << 1U) & SYNC_STAGE2_BIT);
    if (raw_sample) {
        next |= SYNC_STAGE1_BIT;
    }
    return next;
}

bool sync_debounce_step(SyncDebounceState &state, DebounceMode mode,
                        bool raw_sample, bool raw_reset_n) {
    /* Both the synchronizer and the debounce register read pre-tick values */
    bool prev_stage2 = sync_stage2(state.sync);
    state.sync = sync_shift(state.sync, raw_sample);

    switch (mode) {
        case DebounceMode::ClearOnRawReset:
            /* Asynchronous clear dominates the clocked load */
            if (!raw_reset_n) {
                state.level = true;
            } else {
                state.level = prev_stage2;
            }
            break;

        case DebounceMode::ClearOnSyncLow:
            /* Clear held at the edge while stage 2 was low, and reapplied
             * combinationally as soon as the new stage 2 reads low */
            state.level = prev_stage2 && sync_stage2(state.sync);
            break;
    }

    return state.level;
}
