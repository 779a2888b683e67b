/*
 * Led_Bank - Four indicator outputs
 * GP16-GP19, active-high push-pull
 */

#ifndef LED_BANK_HPP
#define LED_BANK_HPP

#include "config.h"
#include "types.h"
#include <cstdint>

class Led_Bank {
public:
    /*
     * Configure the four LED pins as outputs, all off.
     * Returns true on success (idempotent).
     */
    bool init();

    /* Drive all four pins from one decoded output set. No-op before init(). */
    void write(const LedOutputs &leds);

private:
    static constexpr uint8_t LED_COUNT = 4;
    static constexpr uint32_t LED_PINS[LED_COUNT] = {
        FSM_LED1_PIN, FSM_LED2_PIN, FSM_LED3_PIN, FSM_LED4_PIN
    };

    bool initialized_ = false;
};

#endif // LED_BANK_HPP
