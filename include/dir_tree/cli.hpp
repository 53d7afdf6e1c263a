#pragma once
#include <string>
#include "dir_tree/types.hpp"

namespace dir_tree {
    void print_help(const std::string& program_name);
    CliParseResult parse_cli(int argc, char* argv[]);
}
