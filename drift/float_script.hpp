#pragma once

/**
 * Float Script - the line-oriented command language of drift-float
 *
 * Commands, one per line ('#' starts a comment):
 *   left W H [MIN_TOP]              place a left float
 *   right W H [MIN_TOP]             place a right float
 *   probe left|right W H [MIN_TOP]  where the float would go, not recorded
 *   clear left|right|both           clearance y
 *   width Y                         available width at Y
 *   space Y H                       free [left, right) over [Y, Y + H)
 *
 * Each command prints one line, e.g. "left 0 20" or "error invalid-width".
 */

#include "float_context.hpp"
#include <stdio.h>

namespace drift {

struct FloatOptions {
    const char* script_file;    // "-" reads stdin
    float containing_width;
    int max_floats;
    bool validate;
    bool dump;
};

/**
 * Parse drift-float's command line. Logs the problem and returns false on
 * unknown options, missing or malformed option values, or no script.
 */
bool parse_float_args(int argc, char** argv, FloatOptions* opts);

/**
 * Execute one script line, writing its result line to out.
 * Blank and comment-only lines print nothing. Returns false on a
 * malformed command. The line may be modified.
 */
bool run_float_command(FloatContext& ctx, char* line, int line_no, FILE* out);

/**
 * Run every line of script through ctx.
 * @return number of malformed lines
 */
int run_float_script(FloatContext& ctx, FILE* script, FILE* out);

}  // namespace drift
