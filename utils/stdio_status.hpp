/*
 * Stdio_Status - printf-based status console
 * USB CDC serial on the device, stdout on the host
 */

#ifndef STDIO_STATUS_HPP
#define STDIO_STATUS_HPP

#include "status_interface.hpp"

class Stdio_Status final : public Status_Interface {
public:
    void show_status(const char *tag, const char *msg) override;
    void show_error(const char *tag, const char *msg, StatusSeverity sev) override;
    void show_state(FsmState state, const LedOutputs &leds, uint32_t tick) override;
    void show_reset(bool asserted, uint32_t tick) override;
};

#endif // STDIO_STATUS_HPP
