#pragma once
#include <cstdint>
#include <variant>
#include <optional>
#include <filesystem>
#include <string>
#include <vector>

namespace dir_tree {
    struct CliParseResult {
        bool valid = true;
        bool show_help = false;
        bool human_readable = false;
        bool verbose = false;
        int depth = 3;
        std::optional<std::string> path;
        std::optional<std::string> logfile;
        std::string error_message;
    };

    struct TreeOptions {
        int depth = 3;
        bool human_readable = false;
    };

    // Raw values (bytes, seconds since epoch) or their human-readable renderings.
    using SizeValue = std::variant<uintmax_t, std::string>;
    using TimeValue = std::variant<double, std::string>;

    // Default-constructed metadata is "empty": the file could not be inspected.
    struct FileMetadata {
        std::optional<SizeValue> size;
        std::optional<TimeValue> modified_time;

        bool empty() const {
            return !size && !modified_time;
        }
    };

    struct DirEntry;

    struct DirTree {
        std::vector<DirEntry> entries;

        bool empty() const;
    };

    struct DirEntry {
        std::string name;
        bool is_directory = false;
        FileMetadata file;
        DirTree children;
    };

    inline bool DirTree::empty() const {
        return entries.empty();
    }

    struct TreeStats {
        std::size_t file_count = 0;
        std::size_t directory_count = 0;
        std::size_t skipped_count = 0;
        std::size_t warning_count = 0;
    };

    struct TreeReport {
        std::filesystem::path input_path;
        bool target_exists = false;
        std::optional<std::string> error;
        DirTree tree;
        TreeStats stats;
    };
}
