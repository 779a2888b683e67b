/*
 * Led_Bank Implementation
 */

#include "drivers/led_bank.hpp"
#include "hardware/gpio.h"

bool Led_Bank::init() {
    if (initialized_) {
        return true;
    }

    for (uint8_t i = 0; i < LED_COUNT; i++) {
        gpio_init(LED_PINS[i]);
        gpio_set_dir(LED_PINS[i], GPIO_OUT);
        gpio_put(LED_PINS[i], false);
    }

    initialized_ = true;
    return true;
}

void Led_Bank::write(const LedOutputs &leds) {
    if (!initialized_) {
        return;
    }

    /* Single masked write so all four pins change on the same cycle */
    uint32_t mask = 0;
    uint32_t value = 0;
    const bool levels[LED_COUNT] = {leds.led1, leds.led2, leds.led3, leds.led4};
    for (uint8_t i = 0; i < LED_COUNT; i++) {
        mask |= (1U << LED_PINS[i]);
        if (levels[i]) {
            value |= (1U << LED_PINS[i]);
        }
    }
    gpio_put_masked(mask, value);
}
