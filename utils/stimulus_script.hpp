/*
 * Stimulus Script - Line-oriented tick stimulus for the host trace tool
 *
 * One command per line, '#' starts a comment:
 *   tick <button> <reset> [count]   raw samples (0/1) for count ticks
 *   press <hold> [release]          button low for hold ticks, then high
 *   reset <ticks>                   raw reset low, button released
 *   expect <l1l2l3l4>               check current outputs, e.g. 0100
 *   expect_state <A|B|C|D>          check current state
 */

#ifndef STIMULUS_SCRIPT_HPP
#define STIMULUS_SCRIPT_HPP

#include "types.h"
#include "logic/fsm_core.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>

/* Release ticks used by "press" when none are given. Four ticks lets the
 * press detector fire and the state register load before the next command. */
static constexpr uint32_t PRESS_DEFAULT_RELEASE_TICKS = 4;

static constexpr size_t STIMULUS_MAX_LINE = 256;

enum class StimulusOp : uint8_t { Tick, Press, Reset, Expect, ExpectState };

struct StimulusCommand {
    StimulusOp op = StimulusOp::Tick;
    bool raw_button = true;
    bool raw_reset = true;
    uint32_t count = 1;          /* Tick/Reset: ticks, Press: hold ticks */
    uint32_t release = PRESS_DEFAULT_RELEASE_TICKS;
    LedOutputs leds = {};        /* Expect */
    FsmState state = FsmState::A;  /* ExpectState */
    uint32_t line = 0;
};

enum class ParseResult : uint8_t { Command, Blank, Error };

enum class ReadResult : uint8_t { Line, TooLong, End };

/*
 * Read one script line into buf (fgets semantics). A final line without a
 * trailing newline that exactly fills buf is a complete line, not TooLong.
 */
ReadResult stimulus_read_line(FILE *in, char *buf, size_t len);

/*
 * Parse one script line.
 *
 * @param text     Line text (trailing newline allowed)
 * @param line_no  1-based line number, copied into out->line
 * @param out      Filled on ParseResult::Command
 * @param err      Receives a message on ParseResult::Error
 * @param err_len  Size of err in bytes
 */
ParseResult stimulus_parse_line(const char *text, uint32_t line_no,
                                StimulusCommand *out, char *err, size_t err_len);

/*
 * Executes parsed commands against an Fsm_Core.
 * Per-tick trace lines go to trace (nullptr = silent); expectation
 * failures are reported on stderr.
 */
class Stimulus_Runner {
public:
    Stimulus_Runner(Fsm_Core &core, FILE *trace) : core_(core), trace_(trace) {}

    /* Returns false on a failed expectation */
    bool execute(const StimulusCommand &cmd);

    uint32_t checks_passed() const { return checks_passed_; }

private:
    void step(bool raw_button, bool raw_reset, uint32_t ticks);

    Fsm_Core &core_;
    FILE *trace_;
    uint32_t checks_passed_ = 0;
};

#endif // STIMULUS_SCRIPT_HPP
