/*
 * Input_Pins Implementation
 */

#include "drivers/input_pins.hpp"
#include "hardware/gpio.h"

bool Input_Pins::init() {
    if (initialized_) {
        return true;
    }

    /* Pull-ups must be on before the first sample or the pins float low
     * and read as a held reset */
    gpio_init(FSM_BUTTON_PIN);
    gpio_set_dir(FSM_BUTTON_PIN, GPIO_IN);
    gpio_pull_up(FSM_BUTTON_PIN);

    gpio_init(FSM_RESET_PIN);
    gpio_set_dir(FSM_RESET_PIN, GPIO_IN);
    gpio_pull_up(FSM_RESET_PIN);

    initialized_ = true;
    return true;
}

FsmInputs Input_Pins::sample() const {
    if (!initialized_) {
        return FsmInputs{true, true};
    }

    FsmInputs in = {};
    in.raw_button = gpio_get(FSM_BUTTON_PIN);
    in.raw_reset = gpio_get(FSM_RESET_PIN);
    return in;
}
