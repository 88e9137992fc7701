/**
 * Float Script Implementation
 */

#include "float_script.hpp"
#include "../lib/log.h"
#include <string.h>
#include <stdlib.h>
#include <errno.h>
#include <limits.h>
#include <cmath>

namespace drift {

static bool parse_float_value(const char* text, float* value) {
    char* endptr = nullptr;
    errno = 0;
    float parsed = strtof(text, &endptr);
    if (endptr == text || *endptr != '\0' || errno == ERANGE) {
        return false;
    }
    *value = parsed;
    return true;
}

static bool parse_int_value(const char* text, int* value) {
    char* endptr = nullptr;
    errno = 0;
    long parsed = strtol(text, &endptr, 10);
    if (endptr == text || *endptr != '\0' || errno == ERANGE || parsed < 0 || parsed > INT_MAX) {
        return false;
    }
    *value = (int)parsed;
    return true;
}

bool parse_float_args(int argc, char** argv, FloatOptions* opts) {
    opts->script_file = nullptr;
    opts->containing_width = 800;
    opts->max_floats = 0;
    opts->validate = false;
    opts->dump = false;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-w") == 0 || strcmp(argv[i], "--width") == 0) {
            if (i + 1 >= argc) {
                log_error("Error: -w/--width requires an argument");
                return false;
            }
            if (!parse_float_value(argv[++i], &opts->containing_width) ||
                !std::isfinite(opts->containing_width) || opts->containing_width < 0) {
                log_error("Error: invalid width '%s'", argv[i]);
                return false;
            }
        }
        else if (strcmp(argv[i], "--max-floats") == 0) {
            if (i + 1 >= argc) {
                log_error("Error: --max-floats requires an argument");
                return false;
            }
            if (!parse_int_value(argv[++i], &opts->max_floats)) {
                log_error("Error: invalid float limit '%s'", argv[i]);
                return false;
            }
        }
        else if (strcmp(argv[i], "--validate") == 0) {
            opts->validate = true;
        }
        else if (strcmp(argv[i], "--dump") == 0) {
            opts->dump = true;
        }
        else if ((argv[i][0] != '-' || strcmp(argv[i], "-") == 0) && !opts->script_file) {
            opts->script_file = argv[i];
        }
        else {
            log_error("Error: unknown option %s", argv[i]);
            return false;
        }
    }

    if (!opts->script_file) {
        log_error("Error: script file required");
        log_error("Usage: drift-float <script> [-w width] [--max-floats N] [--validate] [--dump]");
        return false;
    }
    return true;
}

static bool parse_side(const char* word, FloatSide* side) {
    if (strcmp(word, "left") == 0) { *side = FloatSide::Left; return true; }
    if (strcmp(word, "right") == 0) { *side = FloatSide::Right; return true; }
    return false;
}

static bool parse_clear_side(const char* word, ClearSide* side) {
    if (strcmp(word, "left") == 0) { *side = ClearSide::Left; return true; }
    if (strcmp(word, "right") == 0) { *side = ClearSide::Right; return true; }
    if (strcmp(word, "both") == 0) { *side = ClearSide::Both; return true; }
    return false;
}

static void print_placement(FILE* out, const char* label, FloatPlacement placement) {
    if (placement.ok()) {
        fprintf(out, "%s %g %g\n", label, placement.origin.x, placement.origin.y);
    } else {
        fprintf(out, "error %s\n", float_error_name(placement.error));
    }
}

bool run_float_command(FloatContext& ctx, char* line, int line_no, FILE* out) {
    char* hash = strchr(line, '#');
    if (hash) *hash = '\0';

    char verb[16] = {0};
    char word[16] = {0};
    float a = 0, b = 0, c = 0;
    int n;

    if (sscanf(line, " %15s", verb) != 1) {
        return true;  // blank
    }

    FloatSide side;
    ClearSide clear;
    if (parse_side(verb, &side)) {
        n = sscanf(line, " %*s %f %f %f", &a, &b, &c);
        if (n < 2) goto malformed;
        print_placement(out, verb, ctx.add_float(side, a, b, n == 3 ? c : 0));
        return true;
    }
    if (strcmp(verb, "probe") == 0) {
        n = sscanf(line, " %*s %15s %f %f %f", word, &a, &b, &c);
        if (n < 3 || !parse_side(word, &side)) goto malformed;
        print_placement(out, "probe", ctx.find_placement(side, a, b, n == 4 ? c : 0));
        return true;
    }
    if (strcmp(verb, "clear") == 0) {
        if (sscanf(line, " %*s %15s", word) != 1 || !parse_clear_side(word, &clear)) goto malformed;
        fprintf(out, "clear %s %g\n", clear_side_name(clear), ctx.clearance_y(clear));
        return true;
    }
    if (strcmp(verb, "width") == 0) {
        if (sscanf(line, " %*s %f", &a) != 1) goto malformed;
        fprintf(out, "width %g %g\n", a, ctx.available_width_at(a));
        return true;
    }
    if (strcmp(verb, "space") == 0) {
        if (sscanf(line, " %*s %f %f", &a, &b) != 2) goto malformed;
        FloatAvailableSpace space = ctx.available_space(a, b);
        fprintf(out, "space %g %g\n", space.left, space.right);
        return true;
    }

malformed:
    log_error("line %d: malformed command: %s", line_no, line);
    return false;
}

int run_float_script(FloatContext& ctx, FILE* script, FILE* out) {
    char line[512];
    int line_no = 0;
    int malformed = 0;
    while (fgets(line, sizeof(line), script)) {
        line_no++;
        line[strcspn(line, "\r\n")] = '\0';
        if (!run_float_command(ctx, line, line_no, out)) {
            malformed++;
        }
    }
    return malformed;
}

}  // namespace drift
