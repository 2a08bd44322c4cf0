#include "args.hpp"
#include <cstring>
#include <cstdlib>
#include <cstdio>

namespace chromadex {

static int clamp_int(int val, int min_val, int max_val, int default_val) {
    if (val < min_val || val > max_val) return default_val;
    return val;
}

static bool validate_path(const std::string& path) {
    if (path.empty()) return false;
    if (path.find('\0') != std::string::npos) return false;
    return true;
}

static Command parse_command(const char* s) {
    if (strcmp(s, "extract") == 0) return Command::Extract;
    if (strcmp(s, "search") == 0) return Command::Search;
    if (strcmp(s, "show") == 0) return Command::Show;
    if (strcmp(s, "index") == 0) return Command::Index;
    if (strcmp(s, "serve") == 0) return Command::Serve;
    return Command::None;
}

static bool takes_target(Command command) {
    return command == Command::Extract || command == Command::Search || command == Command::Show;
}

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            args.show_help = true;
            return args;
        }

        if (strcmp(arg, "--config") == 0) {
            if (i + 1 < argc) {
                args.config_path = argv[++i];
                if (!validate_path(args.config_path)) args.config_path.clear();
            }
        }
        else if (strcmp(arg, "--db") == 0) {
            if (i + 1 < argc) {
                args.db_path = argv[++i];
                if (!validate_path(args.db_path)) args.db_path.clear();
            }
        }
        else if (strcmp(arg, "--catalog") == 0) {
            if (i + 1 < argc) {
                args.catalog_path = argv[++i];
                if (!validate_path(args.catalog_path)) args.catalog_path.clear();
            }
        }
        else if (strcmp(arg, "--client") == 0) {
            if (i + 1 < argc) args.client = argv[++i];
        }
        else if (strcmp(arg, "--log-level") == 0) {
            if (i + 1 < argc) args.log_level = argv[++i];
        }
        else if (strcmp(arg, "--host") == 0) {
            if (i + 1 < argc) args.host = argv[++i];
        }
        else if (strcmp(arg, "-p") == 0 || strcmp(arg, "--port") == 0) {
            if (i + 1 < argc) args.port = clamp_int(std::atoi(argv[++i]), 1, 65535, 0);
        }
        else if (strcmp(arg, "-n") == 0 || strcmp(arg, "--limit") == 0) {
            // Out-of-range limits are passed through and rejected by the service.
            if (i + 1 < argc) args.limit = std::atoi(argv[++i]);
        }
        else if (strcmp(arg, "--offset") == 0) {
            if (i + 1 < argc) args.offset = std::atoi(argv[++i]);
        }
        else if (strcmp(arg, "--start-page") == 0) {
            if (i + 1 < argc) args.start_page = clamp_int(std::atoi(argv[++i]), 1, 1000000, 0);
        }
        else if (strcmp(arg, "--end-page") == 0) {
            if (i + 1 < argc) args.end_page = clamp_int(std::atoi(argv[++i]), 0, 1000000, -1);
        }
        else if (strcmp(arg, "--interval") == 0) {
            if (i + 1 < argc) args.interval_sec = clamp_int(std::atoi(argv[++i]), 0, 86400 * 7, -1);
        }
        else if (strcmp(arg, "-j") == 0 || strcmp(arg, "--workers") == 0) {
            if (i + 1 < argc) args.workers = clamp_int(std::atoi(argv[++i]), 1, 256, 0);
        }
        else if (strcmp(arg, "--seed") == 0) {
            if (i + 1 < argc) {
                args.seed = std::strtoll(argv[++i], nullptr, 0);
                args.seed_set = true;
            }
        }
        else if (strcmp(arg, "--cyclic") == 0) {
            args.cyclic = true;
            args.cyclic_set = true;
        }
        else if (strcmp(arg, "--no-cyclic") == 0) {
            args.cyclic = false;
            args.cyclic_set = true;
        }
        else if (strcmp(arg, "--rewrite") == 0) {
            args.rewrite = true;
        }
        else if (strcmp(arg, "--pretty") == 0) {
            args.pretty = true;
        }
        else if (arg[0] == '-' && arg[1] != '\0') {
            args.error = std::string("unknown option ") + arg;
            return args;
        }
        else if (args.command == Command::None) {
            args.command = parse_command(arg);
            if (args.command == Command::None) {
                args.error = std::string("unknown command ") + arg;
                return args;
            }
        }
        else if (takes_target(args.command) && args.target.empty()) {
            args.target = arg;
        }
        else {
            args.error = std::string("unexpected argument ") + arg;
            return args;
        }
    }

    if (args.error.empty() && takes_target(args.command) && args.target.empty()) {
        args.error = "missing argument for command";
    }

    return args;
}

void print_help(const char* prog) {
    printf("Usage: %s [OPTIONS] <COMMAND> [ARG]\n\n", prog);
    printf("COMMANDS:\n");
    printf("  extract <FILE|URL>      Extract the color palette of an image\n");
    printf("  search <HEX>            Find indexed images containing a color (e.g. ff00aa)\n");
    printf("  show <ID>               Show an indexed image and its palette\n");
    printf("  index                   Run the Unsplash indexer until interrupted\n");
    printf("  serve                   Serve the HTTP API and index in the background\n\n");
    printf("OPTIONS:\n");
    printf("      --config <FILE>     Config file path (default: platform-specific)\n");
    printf("      --db <FILE>         SQLite database path (default: chromadex.db)\n");
    printf("      --catalog <FILE>    JSON color-name catalog (default: built-in)\n");
    printf("      --client <ID>       Client identity used for rate limiting (default: cli)\n");
    printf("  -n, --limit <N>         Search result count (default: 30, range: 1-100)\n");
    printf("      --offset <N>        Search result offset (default: 0)\n");
    printf("      --start-page <N>    First feed page to index (default: 1)\n");
    printf("      --end-page <N>      Last feed page to index, 0 for unbounded (default: 300)\n");
    printf("      --cyclic            Restart from the first page after the last (default)\n");
    printf("      --no-cyclic         Stop after the last page\n");
    printf("      --rewrite           Re-index images that are already stored\n");
    printf("      --interval <SEC>    Pause between feed pages (default: 600)\n");
    printf("  -j, --workers <N>       Extraction worker threads (default: 2, range: 1-256)\n");
    printf("      --seed <N>          Clustering seed\n");
    printf("      --host <ADDR>       HTTP listen address (default: 0.0.0.0)\n");
    printf("  -p, --port <N>          HTTP listen port (default: 8080)\n");
    printf("      --log-level <LVL>   debug, info, warning, error, off (default: info)\n");
    printf("      --pretty            Indent JSON output\n");
    printf("  -h, --help              Show this help\n");
    printf("\nENVIRONMENT:\n");
    printf("  UNSPLASH_API_ACCESS_KEY Unsplash access key for the indexer\n");
}

}
