#include "machineuid/text.hpp"

#include <cstdint>

namespace machineuid {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

}  // namespace

std::string trim(std::string_view text) {
    auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return "";
    }
    auto last = text.find_last_not_of(kWhitespace);
    return std::string(text.substr(first, last - first + 1));
}

bool is_valid_utf8(std::string_view text) noexcept {
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        auto c = static_cast<uint8_t>(text[i]);

        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t extra = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;

        if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
            min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
            min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
            min_cp = 0x10000;
        } else {
            return false;
        }

        if (n - i <= extra) {
            return false;
        }

        for (size_t k = 1; k <= extra; ++k) {
            auto cc = static_cast<uint8_t>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }

        i += extra + 1;
    }

    return true;
}

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

}  // namespace machineuid
