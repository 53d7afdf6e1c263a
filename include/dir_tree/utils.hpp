#pragma once
#include <string>
#include <cstdint>

namespace dir_tree {
    std::string format_size(uintmax_t size);
    std::string format_time(double seconds);
    std::string format_timestamp(double seconds);
    std::string json_escape(const std::string& input);

    // Lowercases UTF-8 text per code point; malformed bytes are copied unchanged.
    std::string to_lowercase(const std::string& value);
}
