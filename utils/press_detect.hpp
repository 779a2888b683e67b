/*
 * Press Detector - Trailing-edge detection of a debounced press
 * Pure logic, no GPIO dependency. Testable on host.
 */

#ifndef PRESS_DETECT_HPP
#define PRESS_DETECT_HPP

/*
 * Next value of the press detector register (active-low).
 *
 * @param reset_active   true while the debounced reset is asserted
 * @param button_level   Debounced button level before the tick (false = pressed)
 * @param button_stage2  Button synchronizer stage 2 before the tick
 * @return false ("press") exactly when the debounced level still reads
 *         pressed but stage 2 has already returned high; true otherwise
 *         and always true under reset
 */
bool press_detect_next(bool reset_active, bool button_level, bool button_stage2);

#endif /* PRESS_DETECT_HPP */
