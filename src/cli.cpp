#include <vector>
#include <utility>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <iostream>
#include "dir_tree/cli.hpp"

namespace dir_tree {

    namespace {
        void append_usage(std::ostream& out, const std::string& program_name) {
            out << "Usage: " << program_name << " [options] <path>\n"
                << "\n"
                << "Build a directory tree and print it as JSON:\n"
                << "  - Directories become nested objects, empty ones are kept as {}\n"
                << "  - Files carry their size and last modification time\n"
                << "  - Entries are listed case-insensitively by name\n"
                << "  - Unreadable directories are logged and left empty\n"
                << "\n"
                << "Options:\n"
                << "  -d, --depth <n>          Recursion depth (-1 for unlimited). Default: 3\n"
                << "  -H, --human-readable     Show human-readable sizes and timestamps\n"
                << "  -l, --logfile <file>     Also append log records to <file>\n"
                << "  -v, --verbose            Include debug log records\n"
                << "  -h, -help, --help        Show this help message and exit\n";
        }

        bool parse_depth(const std::string& text, int& depth) {
            if (text.empty()) {
                return false;
            }
            errno = 0;
            char* end = nullptr;
            const long value = std::strtol(text.c_str(), &end, 10);
            if (errno != 0 || end == nullptr || *end != '\0' || value < INT_MIN || value > INT_MAX) {
                return false;
            }
            depth = static_cast<int>(value);
            return true;
        }

        // Splits "--name=value" into its parts; plain arguments come back unchanged.
        std::pair<std::string, std::optional<std::string>> split_inline_value(const std::string& argument) {
            if (argument.rfind("--", 0) == 0) {
                const auto equals = argument.find('=');
                if (equals != std::string::npos) {
                    return {argument.substr(0, equals), argument.substr(equals + 1)};
                }
            }
            return {argument, std::nullopt};
        }
    }

    void print_help(const std::string& program_name) {
        append_usage(std::cout, program_name);
    }

    CliParseResult parse_cli(int argc, char* argv[]) {
        CliParseResult result;
        bool literal_mode = false;
        std::vector<std::string> positional;

        for (int index = 1; index < argc; ++index) {
            std::string argument = argv[index];
            if (!literal_mode) {
                if (argument == "--") {
                    literal_mode = true;
                    continue;
                }
                if (argument == "-h" || argument == "--help" || argument == "-help") {
                    result.show_help = true;
                    continue;
                }
                if (argument == "-H" || argument == "--human-readable") {
                    result.human_readable = true;
                    continue;
                }
                if (argument == "-v" || argument == "--verbose") {
                    result.verbose = true;
                    continue;
                }

                auto [name, inline_value] = split_inline_value(argument);
                if (name == "-d" || name == "--depth" || name == "-l" || name == "--logfile") {
                    std::string value;
                    if (inline_value) {
                        value = *inline_value;
                    } else if (index + 1 < argc) {
                        value = argv[++index];
                    } else {
                        result.valid = false;
                        result.error_message = "Missing value for option: " + name;
                        return result;
                    }

                    if (name == "-d" || name == "--depth") {
                        if (!parse_depth(value, result.depth)) {
                            result.valid = false;
                            result.error_message = "Invalid depth: " + value;
                            return result;
                        }
                        if (result.depth < -1) {
                            result.valid = false;
                            result.error_message = "Depth must be -1 (unlimited) or >= 0, got " + value;
                            return result;
                        }
                    } else {
                        result.logfile = value;
                    }
                    continue;
                }

                if (argument.size() > 1 && argument.front() == '-') {
                    result.valid = false;
                    result.error_message = "Unknown option: " + argument;
                    return result;
                }
            }
            positional.push_back(argument);
        }

        if (!result.show_help) {
            if (positional.empty()) {
                result.valid = false;
                result.error_message = "Missing path argument.";
            } else if (positional.size() > 1) {
                result.valid = false;
                result.error_message = "Unexpected extra argument: " + positional[1];
            } else {
                result.path = positional.front();
            }
        } else if (!positional.empty()) {
            result.path = positional.front();
        }

        return result;
    }
}
