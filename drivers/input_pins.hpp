/*
 * Input_Pins - Raw button and reset sampling
 * GP6 (button) and GP7 (reset), active-low with internal pull-ups
 */

#ifndef INPUT_PINS_HPP
#define INPUT_PINS_HPP

#include "config.h"
#include "logic/fsm_tick.hpp"
#include <cstdint>

class Input_Pins {
public:
    /*
     * Configure both pins as inputs with pull-ups.
     * Returns true on success (idempotent).
     */
    bool init();

    /*
     * Sample both pins once. Values are the raw pin levels, so
     * false = asserted. Returns released (idle) levels before init().
     */
    FsmInputs sample() const;

private:
    bool initialized_ = false;
};

#endif // INPUT_PINS_HPP
