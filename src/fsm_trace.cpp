/*
 * quad_fsm_trace - Host driver for the clocked core
 * Runs a stimulus script tick by tick and prints one trace line per tick
 *
 * Usage: quad_fsm_trace [-q] [script]
 *   script  stimulus file (stdin when omitted or "-")
 *   -q      suppress per-tick lines, print the summary only
 *
 * Exit status: 0 OK, 1 parse or expectation failure, 2 usage error
 */

#include "logic/fsm_core.hpp"
#include "logic/fsm_state.hpp"
#include "utils/stimulus_script.hpp"

#include <cstdio>
#include <cstring>

static void usage(const char *argv0) {
    fprintf(stderr, "usage: %s [-q] [script]\n", argv0);
}

int main(int argc, char **argv) {
    bool quiet = false;
    const char *path = nullptr;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-q") == 0) {
            quiet = true;
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            usage(argv[0]);
            return 0;
        } else if (path == nullptr) {
            path = argv[i];
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    FILE *in = stdin;
    if (path != nullptr && strcmp(path, "-") != 0) {
        in = fopen(path, "r");
        if (in == nullptr) {
            fprintf(stderr, "ERROR: cannot open '%s'\n", path);
            return 2;
        }
    }

    Fsm_Core core;
    Stimulus_Runner runner(core, quiet ? nullptr : stdout);

    char line[STIMULUS_MAX_LINE];
    char err[96];
    uint32_t line_no = 0;
    int rc = 0;

    ReadResult rd;
    while ((rd = stimulus_read_line(in, line, sizeof(line))) != ReadResult::End) {
        line_no++;

        if (rd == ReadResult::TooLong) {
            fprintf(stderr, "ERROR: line %lu: line too long\n",
                    static_cast<unsigned long>(line_no));
            rc = 1;
            break;
        }

        StimulusCommand cmd;
        ParseResult res = stimulus_parse_line(line, line_no, &cmd, err, sizeof(err));
        if (res == ParseResult::Blank) {
            continue;
        }
        if (res == ParseResult::Error) {
            fprintf(stderr, "ERROR: line %lu: %s\n", static_cast<unsigned long>(line_no), err);
            rc = 1;
            break;
        }
        if (!runner.execute(cmd)) {
            rc = 1;
            break;
        }
    }

    if (in != stdin) {
        fclose(in);
    }

    if (rc == 0) {
        char buf[5];
        printf("OK ticks=%lu presses=%lu reset_ticks=%lu checks=%lu state=%s leds=%s\n",
               static_cast<unsigned long>(core.tick_count()),
               static_cast<unsigned long>(core.press_count()),
               static_cast<unsigned long>(core.reset_ticks()),
               static_cast<unsigned long>(runner.checks_passed()),
               fsm_state_name(core.state()), fsm_format_leds(core.outputs(), buf));
    }
    return rc;
}
