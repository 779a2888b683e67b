/*
 * Status_Interface - Abstract console output for FSM and harness events
 * Decouples the tick harness from where status lines end up (USB CDC, host stdout)
 */

#ifndef STATUS_INTERFACE_HPP
#define STATUS_INTERFACE_HPP

#include "types.h"
#include <cstdint>

enum class StatusSeverity : uint8_t { Info, Warning, Error, Fatal };

class Status_Interface {
public:
    virtual ~Status_Interface() = default;
    virtual void show_status(const char *tag, const char *msg) = 0;
    virtual void show_error(const char *tag, const char *msg, StatusSeverity sev) = 0;
    virtual void show_state(FsmState state, const LedOutputs &leds, uint32_t tick) = 0;
    virtual void show_reset(bool asserted, uint32_t tick) = 0;
};

#endif // STATUS_INTERFACE_HPP
