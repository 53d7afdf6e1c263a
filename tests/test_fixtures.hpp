#pragma once
#include <memory>
#include <random>
#include <string>
#include <sstream>
#include <fstream>
#include <filesystem>
#include <system_error>
#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>
#include "dir_tree/types.hpp"

namespace dir_tree::testing {

    inline const DirEntry* find_entry(const DirTree& tree, const std::string& name) {
        for (const auto& entry : tree.entries) {
            if (entry.name == name) {
                return &entry;
            }
        }
        return nullptr;
    }

    // Scratch directory under the system temp dir, removed with everything below it.
    class TempDir {
    public:
        TempDir() {
            std::random_device device;
            std::mt19937_64 generator(device());
            path_ = std::filesystem::temp_directory_path()
                / ("dir_tree_test_" + std::to_string(generator()));
            std::filesystem::create_directories(path_);
        }

        ~TempDir() {
            std::error_code ignored;
            std::filesystem::permissions(path_, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::add, ignored);
            std::filesystem::remove_all(path_, ignored);
        }

        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const std::filesystem::path& path() const {
            return path_;
        }

        std::filesystem::path make_dir(const std::string& relative) const {
            const auto target = path_ / relative;
            std::filesystem::create_directories(target);
            return target;
        }

        std::filesystem::path write_file(const std::string& relative, std::size_t size = 0) const {
            const auto target = path_ / relative;
            std::filesystem::create_directories(target.parent_path());
            std::ofstream out(target, std::ios::binary);
            out << std::string(size, 'x');
            return target;
        }

    private:
        std::filesystem::path path_;
    };

    struct CapturedLogger {
        std::shared_ptr<std::ostringstream> output = std::make_shared<std::ostringstream>();
        std::shared_ptr<spdlog::logger> logger;

        CapturedLogger() {
            auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(*output);
            sink->set_pattern("[%l] %v");
            logger = std::make_shared<spdlog::logger>("dir_tree_test", std::move(sink));
            logger->set_level(spdlog::level::debug);
        }

        std::string text() const {
            logger->flush();
            return output->str();
        }
    };
}
