#include <array>
#include <cmath>
#include <ctime>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>
#include <locale.h>
#include <wctype.h>
#include "dir_tree/utils.hpp"

namespace dir_tree {

    namespace {
        constexpr std::size_t kUnitCount = 5;
        constexpr double kUnitStep = 1024.0;
        constexpr char32_t kMaxCodePoint = 0x10FFFF;

        // Case mapping for non-ASCII code points needs a Unicode LC_CTYPE,
        // independent of whatever locale the process runs under.
        locale_t unicode_ctype() {
            static const locale_t locale = newlocale(LC_CTYPE_MASK, "C.UTF-8", static_cast<locale_t>(0));
            return locale;
        }

        // Decodes one UTF-8 sequence starting at `index`; returns its length, or 0 when malformed.
        std::size_t decode_utf8(const std::string& text, std::size_t index, char32_t& code_point) {
            const auto lead = static_cast<unsigned char>(text[index]);
            std::size_t length = 0;
            if (lead < 0x80) {
                code_point = lead;
                return 1;
            } else if ((lead & 0xE0) == 0xC0) {
                length = 2;
                code_point = lead & 0x1F;
            } else if ((lead & 0xF0) == 0xE0) {
                length = 3;
                code_point = lead & 0x0F;
            } else if ((lead & 0xF8) == 0xF0) {
                length = 4;
                code_point = lead & 0x07;
            } else {
                return 0;
            }

            if (index + length > text.size()) {
                return 0;
            }
            for (std::size_t offset = 1; offset < length; ++offset) {
                const auto next = static_cast<unsigned char>(text[index + offset]);
                if ((next & 0xC0) != 0x80) {
                    return 0;
                }
                code_point = (code_point << 6) | (next & 0x3F);
            }

            static const char32_t kMinimum[] = {0, 0, 0x80, 0x800, 0x10000};
            if (code_point < kMinimum[length] || code_point > kMaxCodePoint
                || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
                return 0;
            }
            return length;
        }

        void encode_utf8(char32_t code_point, std::string& out) {
            if (code_point < 0x80) {
                out += static_cast<char>(code_point);
            } else if (code_point < 0x800) {
                out += static_cast<char>(0xC0 | (code_point >> 6));
                out += static_cast<char>(0x80 | (code_point & 0x3F));
            } else if (code_point < 0x10000) {
                out += static_cast<char>(0xE0 | (code_point >> 12));
                out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (code_point & 0x3F));
            } else {
                out += static_cast<char>(0xF0 | (code_point >> 18));
                out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (code_point & 0x3F));
            }
        }

        char32_t lower_code_point(char32_t code_point) {
            if (code_point < 0x80) {
                return static_cast<char32_t>(std::tolower(static_cast<int>(code_point)));
            }
            const locale_t locale = unicode_ctype();
            if (locale == static_cast<locale_t>(0)) {
                return code_point;
            }
            const wint_t lowered = towlower_l(static_cast<wint_t>(code_point), locale);
            return lowered > kMaxCodePoint ? code_point : static_cast<char32_t>(lowered);
        }
    }

    std::string format_size(uintmax_t size) {
        if (size < 1024) {
            return std::to_string(size) + " B";
        }

        static const char* kUnits[kUnitCount] = {"KB", "MB", "GB", "TB", "PB"};
        std::size_t unit_index = 0;
        double value = static_cast<double>(size) / kUnitStep;
        while (value >= kUnitStep && unit_index < kUnitCount - 1) {
            value /= kUnitStep;
            ++unit_index;
        }

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << value << ' ' << kUnits[unit_index];
        return oss.str();
    }

    std::string format_time(double seconds) {
        const std::time_t value = static_cast<std::time_t>(std::floor(seconds));
        std::tm tm_snapshot {};
        if (localtime_r(&value, &tm_snapshot) == nullptr) {
            tm_snapshot = std::tm {};
        }

        std::ostringstream oss;
        oss << std::put_time(&tm_snapshot, "%Y-%m-%d %H:%M");
        return oss.str();
    }

    std::string format_timestamp(double seconds) {
        std::array<char, 400> buffer {};
        auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), seconds,
                                       std::chars_format::fixed);
        if (ec != std::errc()) {
            std::ostringstream oss;
            oss << std::setprecision(17) << seconds;
            return oss.str();
        }

        std::string text(buffer.data(), end);
        if (std::isfinite(seconds) && text.find('.') == std::string::npos) {
            text += ".0";
        }
        return text;
    }

    std::string json_escape(const std::string& input) {
        std::ostringstream oss;
        for (unsigned char c : input) {
            switch (c) {
                case '"': oss << "\\\""; break;
                case '\\': oss << "\\\\"; break;
                case '\b': oss << "\\b"; break;
                case '\f': oss << "\\f"; break;
                case '\n': oss << "\\n"; break;
                case '\r': oss << "\\r"; break;
                case '\t': oss << "\\t"; break;
                default:
                    if (c < 0x20) {
                        oss << "\\u"
                            << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(c)
                            << std::dec;
                    } else {
                        oss << static_cast<char>(c);
                    }
            }
        }
        return oss.str();
    }

    std::string to_lowercase(const std::string& value) {
        std::string lowered;
        lowered.reserve(value.size());

        std::size_t index = 0;
        while (index < value.size()) {
            char32_t code_point = 0;
            const std::size_t length = decode_utf8(value, index, code_point);
            if (length == 0) {
                lowered += value[index++];
                continue;
            }
            encode_utf8(lower_code_point(code_point), lowered);
            index += length;
        }
        return lowered;
    }
}
