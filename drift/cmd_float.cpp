/**
 * drift-float - run a float placement script through a FloatContext
 *
 * Usage:
 *   drift-float script.txt [-w 800] [--max-floats N] [--validate] [--dump]
 *
 * Options:
 *   -w, --width WIDTH        Containing block width (default: 800)
 *   --max-floats N           Reject floats beyond N (default: unlimited)
 *   --validate               Check the band profile after every float
 *   --dump                   Log the final band profile at DEBUG level
 *
 * The script ('-' reads stdin) uses the commands listed in float_script.hpp.
 * Exit status is 1 on a usage or I/O error, or when any line is malformed.
 */

#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include "../lib/log.h"
#include "float_script.hpp"

using namespace drift;

int main(int argc, char** argv) {
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: Failed to parse log.conf, using defaults\n");
        }
    }
    log_init("");

    FloatOptions opts;
    if (!parse_float_args(argc, argv, &opts)) {
        log_fini();
        return 1;
    }

    bool from_stdin = strcmp(opts.script_file, "-") == 0;
    FILE* script = from_stdin ? stdin : fopen(opts.script_file, "r");
    if (!script) {
        log_error("Error: cannot open %s", opts.script_file);
        log_fini();
        return 1;
    }

    FloatContextConfig config = FloatContextConfig::with_width(opts.containing_width);
    config.max_floats = opts.max_floats;
    config.validate_invariants = opts.validate;
    FloatContext ctx(config);

    log_debug("drift-float: script=%s width=%.1f", opts.script_file, opts.containing_width);

    int malformed = run_float_script(ctx, script, stdout);
    if (!from_stdin) {
        fclose(script);
    }

    if (opts.dump) {
        ctx.dump();
    }
    log_info("drift-float: %d floats, %d bands, %d malformed lines",
             ctx.float_count(), (int)ctx.band_count(), malformed);
    log_fini();
    return malformed > 0 ? 1 : 0;
}
