/*
 * Press Detector Implementation
 */

#include "utils/press_detect.hpp"

bool press_detect_next(bool reset_active, bool button_level, bool button_stage2) {
    if (reset_active) {
        return true;
    }

    /* Debounce register lags stage 2 by one tick: low-then-high is a release */
    return !(!button_level && button_stage2);
}
