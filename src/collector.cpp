#include <cerrno>
#include <vector>
#include <utility>
#include <cstring>
#include <algorithm>
#include <sys/stat.h>
#include <system_error>
#include "dir_tree/log.hpp"
#include "dir_tree/utils.hpp"
#include "dir_tree/collector.hpp"

namespace dir_tree {

    namespace {
        using Path = std::filesystem::path;

        constexpr double kNanosecond = 1e-9;

        std::string entry_name(const Path& path) {
            Path current = path;
            while (current.has_relative_path() && (current.filename().empty() || current.filename() == ".")) {
                current = current.parent_path();
            }
            return current.filename().string();
        }

        bool sorts_before(const std::filesystem::directory_entry& lhs, const std::filesystem::directory_entry& rhs) {
            const std::string left = lhs.path().filename().string();
            const std::string right = rhs.path().filename().string();
            const std::string left_key = to_lowercase(left);
            const std::string right_key = to_lowercase(right);
            if (left_key != right_key) {
                return left_key < right_key;
            }
            return left < right;
        }

        class TreeWalker {
        public:
            TreeWalker(const TreeOptions& options, LoggerPtr logger)
                : options_(options), logger_(std::move(logger)) {}

            FileMetadata file_info(const Path& path) {
                std::error_code exists_error;
                if (!std::filesystem::exists(path, exists_error)) {
                    warn("File does not exist: {}", path.string());
                    return {};
                }

                struct stat info {};
                if (stat(path.c_str(), &info) != 0) {
                    warn("Cannot access file info for: {} ({})", path.string(), std::strerror(errno));
                    return {};
                }

                const uintmax_t size = static_cast<uintmax_t>(info.st_size);
                const double modified = static_cast<double>(info.st_mtim.tv_sec)
                    + static_cast<double>(info.st_mtim.tv_nsec) * kNanosecond;

                FileMetadata metadata;
                if (options_.human_readable) {
                    metadata.size = format_size(size);
                    metadata.modified_time = format_time(modified);
                } else {
                    metadata.size = size;
                    metadata.modified_time = modified;
                }
                return metadata;
            }

            DirTree walk(const Path& path, int depth) {
                DirTree tree;
                if (depth == 0) {
                    return tree;
                }

                std::vector<std::filesystem::directory_entry> listing;
                if (!list_directory(path, listing)) {
                    return tree;
                }
                std::sort(listing.begin(), listing.end(), sorts_before);

                const int child_depth = depth > 0 ? depth - 1 : -1;
                for (const auto& entry : listing) {
                    std::error_code type_error;
                    const bool is_directory = entry.is_directory(type_error);
                    type_error.clear();
                    const bool is_regular_file = !is_directory && entry.is_regular_file(type_error);

                    DirEntry node;
                    node.name = entry.path().filename().string();

                    if (is_directory) {
                        ++stats_.directory_count;
                        node.is_directory = true;
                        node.children = walk(entry.path(), child_depth);
                    } else if (is_regular_file) {
                        ++stats_.file_count;
                        node.file = file_info(entry.path());
                    } else {
                        ++stats_.skipped_count;
                        logger_->debug("Skipping non-file, non-dir entry: {}", entry.path().string());
                        continue;
                    }
                    tree.entries.push_back(std::move(node));
                }

                return tree;
            }

            TreeStats& stats() {
                return stats_;
            }

        private:
            template <typename... Args>
            void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
                ++stats_.warning_count;
                logger_->warn(fmt, std::forward<Args>(args)...);
            }

            bool list_directory(const Path& path, std::vector<std::filesystem::directory_entry>& listing) {
                std::error_code iterator_error;
                std::filesystem::directory_iterator it(path, iterator_error);
                std::filesystem::directory_iterator end;

                if (iterator_error) {
                    report_listing_error(path, iterator_error);
                    return false;
                }

                while (it != end) {
                    listing.push_back(*it);
                    it.increment(iterator_error);
                    if (iterator_error) {
                        report_listing_error(path, iterator_error);
                        break;
                    }
                }
                return true;
            }

            void report_listing_error(const Path& path, const std::error_code& error) {
                if (error == std::errc::permission_denied) {
                    warn("Permission denied: {}", path.string());
                } else {
                    warn("Cannot read directory: {} ({})", path.string(), error.message());
                }
            }

            TreeOptions options_;
            LoggerPtr logger_;
            TreeStats stats_;
        };
    }

    FileMetadata collect_file_info(const Path& path, bool human_readable, const LoggerPtr& logger) {
        TreeOptions options;
        options.human_readable = human_readable;
        TreeWalker walker(options, resolve_logger(logger));
        return walker.file_info(path);
    }

    TreeReport collect_dir_tree(const Path& path, const TreeOptions& options, const LoggerPtr& logger) {
        TreeReport report;
        report.input_path = path;

        if (options.depth < -1) {
            report.error = "'depth' must be -1 (unlimited) or >=0, got " + std::to_string(options.depth);
            return report;
        }

        std::error_code exists_error;
        report.target_exists = std::filesystem::exists(path, exists_error);
        if (exists_error || !report.target_exists) {
            report.target_exists = false;
            report.error = "Path does not exist: " + path.string();
            return report;
        }

        std::error_code status_error;
        const auto status = std::filesystem::status(path, status_error);
        TreeWalker walker(options, resolve_logger(logger));

        if (!status_error && std::filesystem::is_regular_file(status)) {
            DirEntry node;
            node.name = entry_name(path);
            node.file = walker.file_info(path);
            ++walker.stats().file_count;
            report.tree.entries.push_back(std::move(node));
        } else if (!status_error && std::filesystem::is_directory(status)) {
            report.tree = walker.walk(path, options.depth);
        } else {
            report.error = "Not a directory: " + path.string();
        }

        report.stats = walker.stats();
        return report;
    }
}
