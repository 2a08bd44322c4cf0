#pragma once

#include <cstdint>
#include <string>

namespace chromadex {

enum class Command {
    None,
    Extract,
    Search,
    Show,
    Index,
    Serve
};

struct Args {
    Command command = Command::None;
    // File path or URL for extract, hex for search, id for show.
    std::string target;

    std::string config_path;
    std::string db_path;
    std::string catalog_path;
    std::string client = "cli";
    std::string log_level;
    std::string host;

    // -1 means unset.
    int limit = -1;
    int offset = 0;
    int start_page = 0;
    int end_page = -1;
    int interval_sec = -1;
    int workers = 0;
    int port = 0;

    bool cyclic = true;
    bool cyclic_set = false;
    bool rewrite = false;
    int64_t seed = 0;
    bool seed_set = false;

    bool pretty = false;
    bool show_help = false;
    std::string error;
};

Args parse_args(int argc, char* argv[]);
void print_help(const char* prog);

}
