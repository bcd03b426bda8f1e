#include "cmd_raster.hpp"
#include "svg_thorvg.hpp"
#include "../lib/log.h"
#include <stdio.h>
#include <string.h>
#include <unistd.h>

static void print_help(const char* prog) {
    printf("svgraster - SVG to raster image converter\n\n");
    printf("Usage:\n");
    printf("  %s render <input.svg> [options] -o <output.png|output.jpg>\n", prog);
    printf("  %s list [--input-dir <dir>]\n", prog);
    printf("  %s load <name.svg> [--input-dir <dir>] [-o <preview.png>]\n", prog);
    printf("  %s hash <file>\n", prog);
    printf("\nRender options:\n");
    printf("  -w, --width <px>         Output width in pixels, overrides --scale\n");
    printf("  -s, --scale <factor>     Scale factor over the intrinsic size (default 1.0)\n");
    printf("  -b, --background <c>     #RRGGBB, 'transparent' or 'none' (default transparent)\n");
    printf("  --border-width <px>      Border added on every side (default 0)\n");
    printf("  --border-color <c>       Border color (default #000000)\n");
    printf("  -q, --quality <1-100>    JPEG quality (default 90)\n");
    printf("  -o, --output <file>      Output file, .jpg/.jpeg writes JPEG, anything else PNG\n");
    printf("\nThe input directory defaults to $SVGRASTER_INPUT_DIR, then ./input\n");
}

int main(int argc, char* argv[]) {
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: Failed to parse log.conf, using defaults\n");
        }
    }
    log_init("");
    log_debug("main() started with %d arguments", argc);

    if (argc < 2 || strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0) {
        print_help(argv[0]);
        log_finish();
        return argc < 2 ? 1 : 0;
    }

    const char* command = argv[1];
    int cmd_argc = argc - 2;
    char** cmd_argv = argv + 2;
    int exit_code = 1;

    if (strcmp(command, "list") == 0) {
        exit_code = cmd_list(cmd_argc, cmd_argv);
    }
    else if (strcmp(command, "hash") == 0) {
        exit_code = cmd_hash(cmd_argc, cmd_argv);
    }
    else if (strcmp(command, "render") == 0 || strcmp(command, "load") == 0) {
        if (!raster_engine_init(0)) {
            fprintf(stderr, "Error: RENDER_FAILURE: could not initialize the vector renderer\n");
            log_finish();
            return 1;
        }
        exit_code = strcmp(command, "render") == 0 ? cmd_render(cmd_argc, cmd_argv) : cmd_load(cmd_argc, cmd_argv);
        raster_engine_term();
    }
    else {
        fprintf(stderr, "Unknown command: %s\n", command);
        print_help(argv[0]);
    }

    log_debug("%s completed with result: %d", command, exit_code);
    log_finish();
    return exit_code;
}
