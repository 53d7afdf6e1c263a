#pragma once
#include <memory>
#include <filesystem>
#include <spdlog/logger.h>
#include "dir_tree/types.hpp"

namespace dir_tree {
    using LoggerPtr = std::shared_ptr<spdlog::logger>;

    /**
     * Reads size and modification time of a single file.
     * Returns empty metadata (and logs a warning) when the file is gone or cannot be stat'ed.
     */
    FileMetadata collect_file_info(const std::filesystem::path& path, bool human_readable,
                                   const LoggerPtr& logger = nullptr);

    /**
     * Walks `path` down to `options.depth` levels (-1 for unlimited).
     *
     * Unreadable directories become empty subtrees and are logged as warnings;
     * only invalid input (bad depth, missing path, non-directory root) sets `error`.
     */
    TreeReport collect_dir_tree(const std::filesystem::path& path, const TreeOptions& options,
                                const LoggerPtr& logger = nullptr);
}
