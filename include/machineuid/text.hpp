#pragma once

/**
 * @file text.hpp
 * @brief String helpers shared by the identifier sources
 */

#include <string>
#include <string_view>
#include <vector>

namespace machineuid {

/// Strip leading and trailing ASCII whitespace (" \t\n\r\f\v")
[[nodiscard]] std::string trim(std::string_view text);

/// Check that text is well-formed UTF-8 (no overlongs, surrogates or values past U+10FFFF)
[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

/// Split text into lines on '\n', keeping order; a trailing '\r' is left in place
[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text);

}  // namespace machineuid
