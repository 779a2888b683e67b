/*
 * Stdio_Status Implementation - printf-based status console
 */

#include "utils/stdio_status.hpp"
#include "logic/fsm_state.hpp"

#include <cstdio>

static const char *severity_label(StatusSeverity sev) {
    switch (sev) {
        case StatusSeverity::Info:    return "INFO";
        case StatusSeverity::Warning: return "WARN";
        case StatusSeverity::Error:   return "ERROR";
        case StatusSeverity::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

void Stdio_Status::show_status(const char *tag, const char *msg) {
    printf("[INFO]  %s: %s\n", tag, msg);
}

void Stdio_Status::show_error(const char *tag, const char *msg, StatusSeverity sev) {
    printf("[%s] %s: %s\n", severity_label(sev), tag, msg);
}

void Stdio_Status::show_state(FsmState state, const LedOutputs &leds, uint32_t tick) {
    char buf[5];
    printf("[FSM] state %s leds=%s tick=%lu\n", fsm_state_name(state),
           fsm_format_leds(leds, buf), static_cast<unsigned long>(tick));
}

void Stdio_Status::show_reset(bool asserted, uint32_t tick) {
    printf("[RESET] %s tick=%lu\n", asserted ? "asserted" : "released",
           static_cast<unsigned long>(tick));
}
