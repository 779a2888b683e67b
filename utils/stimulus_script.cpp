/*
 * Stimulus Script Implementation
 */

#include "utils/stimulus_script.hpp"
#include "logic/fsm_state.hpp"

#include <cstdlib>
#include <cstring>

static constexpr size_t TOKEN_LEN = 16;

static bool parse_u32(const char *text, uint32_t *out) {
    if (text[0] < '0' || text[0] > '9') {
        return false;
    }
    char *end = nullptr;
    unsigned long v = strtoul(text, &end, 10);
    if (*end != '\0' || v > UINT32_MAX) {
        return false;
    }
    *out = static_cast<uint32_t>(v);
    return true;
}

static bool parse_bit(const char *text, bool *out) {
    if (strcmp(text, "0") == 0) {
        *out = false;
        return true;
    }
    if (strcmp(text, "1") == 0) {
        *out = true;
        return true;
    }
    return false;
}

static bool parse_leds(const char *text, LedOutputs *out) {
    if (strlen(text) != 4U) {
        return false;
    }
    bool bits[4];
    for (size_t i = 0; i < 4U; i++) {
        char s[2] = {text[i], '\0'};
        if (!parse_bit(s, &bits[i])) {
            return false;
        }
    }
    out->led1 = bits[0];
    out->led2 = bits[1];
    out->led3 = bits[2];
    out->led4 = bits[3];
    return true;
}

ReadResult stimulus_read_line(FILE *in, char *buf, size_t len) {
    if (fgets(buf, static_cast<int>(len), in) == nullptr) {
        return ReadResult::End;
    }

    size_t n = strlen(buf);
    if (n + 1U < len || buf[n - 1U] == '\n') {
        return ReadResult::Line;
    }

    /* Buffer full with no newline: complete only if the line ends here */
    int c = fgetc(in);
    if (c == EOF || c == '\n') {
        return ReadResult::Line;
    }
    ungetc(c, in);
    return ReadResult::TooLong;
}

ParseResult stimulus_parse_line(const char *text, uint32_t line_no,
                                StimulusCommand *out, char *err, size_t err_len) {
    char buf[STIMULUS_MAX_LINE];
    snprintf(buf, sizeof(buf), "%s", text);

    char *hash = strchr(buf, '#');
    if (hash != nullptr) {
        *hash = '\0';
    }

    char tok[5][TOKEN_LEN] = {};
    int n = sscanf(buf, "%15s %15s %15s %15s %15s", tok[0], tok[1], tok[2], tok[3], tok[4]);
    if (n <= 0) {
        return ParseResult::Blank;
    }

    StimulusCommand cmd = {};
    cmd.line = line_no;
    int args = n - 1;

    if (strcmp(tok[0], "tick") == 0) {
        cmd.op = StimulusOp::Tick;
        if (args < 2 || args > 3) {
            snprintf(err, err_len, "tick takes <button> <reset> [count]");
            return ParseResult::Error;
        }
        if (!parse_bit(tok[1], &cmd.raw_button) || !parse_bit(tok[2], &cmd.raw_reset)) {
            snprintf(err, err_len, "tick samples must be 0 or 1");
            return ParseResult::Error;
        }
        if (args == 3 && (!parse_u32(tok[3], &cmd.count) || cmd.count == 0U)) {
            snprintf(err, err_len, "invalid tick count '%s'", tok[3]);
            return ParseResult::Error;
        }
    } else if (strcmp(tok[0], "press") == 0) {
        cmd.op = StimulusOp::Press;
        if (args < 1 || args > 2) {
            snprintf(err, err_len, "press takes <hold> [release]");
            return ParseResult::Error;
        }
        if (!parse_u32(tok[1], &cmd.count) || cmd.count == 0U) {
            snprintf(err, err_len, "invalid hold ticks '%s'", tok[1]);
            return ParseResult::Error;
        }
        if (args == 2 && !parse_u32(tok[2], &cmd.release)) {
            snprintf(err, err_len, "invalid release ticks '%s'", tok[2]);
            return ParseResult::Error;
        }
    } else if (strcmp(tok[0], "reset") == 0) {
        cmd.op = StimulusOp::Reset;
        if (args != 1) {
            snprintf(err, err_len, "reset takes <ticks>");
            return ParseResult::Error;
        }
        if (!parse_u32(tok[1], &cmd.count) || cmd.count == 0U) {
            snprintf(err, err_len, "invalid reset ticks '%s'", tok[1]);
            return ParseResult::Error;
        }
    } else if (strcmp(tok[0], "expect") == 0) {
        cmd.op = StimulusOp::Expect;
        if (args != 1 || !parse_leds(tok[1], &cmd.leds)) {
            snprintf(err, err_len, "expect takes four 0/1 digits, e.g. 1000");
            return ParseResult::Error;
        }
    } else if (strcmp(tok[0], "expect_state") == 0) {
        cmd.op = StimulusOp::ExpectState;
        if (args != 1 || !fsm_state_parse(tok[1], &cmd.state)) {
            snprintf(err, err_len, "expect_state takes one of A, B, C, D");
            return ParseResult::Error;
        }
    } else {
        snprintf(err, err_len, "unknown command '%s'", tok[0]);
        return ParseResult::Error;
    }

    *out = cmd;
    return ParseResult::Command;
}

void Stimulus_Runner::step(bool raw_button, bool raw_reset, uint32_t ticks) {
    for (uint32_t i = 0; i < ticks; i++) {
        LedOutputs leds = core_.advance(raw_button, raw_reset);
        if (trace_ != nullptr) {
            char buf[5];
            fprintf(trace_, "tick=%lu btn=%d rst=%d state=%s leds=%s flags=0x%02X\n",
                    static_cast<unsigned long>(core_.tick_count()),
                    raw_button ? 1 : 0, raw_reset ? 1 : 0,
                    fsm_state_name(core_.state()), fsm_format_leds(leds, buf),
                    core_.last_flags());
        }
    }
}

bool Stimulus_Runner::execute(const StimulusCommand &cmd) {
    switch (cmd.op) {
        case StimulusOp::Tick:
            step(cmd.raw_button, cmd.raw_reset, cmd.count);
            return true;

        case StimulusOp::Press:
            step(false, true, cmd.count);
            step(true, true, cmd.release);
            return true;

        case StimulusOp::Reset:
            step(true, false, cmd.count);
            return true;

        case StimulusOp::Expect: {
            LedOutputs got = core_.outputs();
            if (got != cmd.leds) {
                char exp_buf[5];
                char got_buf[5];
                fprintf(stderr, "ERROR: line %lu: tick=%lu expected leds=%s got=%s\n",
                        static_cast<unsigned long>(cmd.line),
                        static_cast<unsigned long>(core_.tick_count()),
                        fsm_format_leds(cmd.leds, exp_buf), fsm_format_leds(got, got_buf));
                return false;
            }
            checks_passed_++;
            return true;
        }

        case StimulusOp::ExpectState:
            if (core_.state() != cmd.state) {
                fprintf(stderr, "ERROR: line %lu: tick=%lu expected state=%s got=%s\n",
                        static_cast<unsigned long>(cmd.line),
                        static_cast<unsigned long>(core_.tick_count()),
                        fsm_state_name(cmd.state), fsm_state_name(core_.state()));
                return false;
            }
            checks_passed_++;
            return true;
    }
    return false;
}
