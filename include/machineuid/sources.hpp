#pragma once

/**
 * @file sources.hpp
 * @brief Machine identifier sources
 *
 * Each platform reads its identifier through one of the strategies in
 * machineuid::source. get() picks the strategy for the compiled platform;
 * the strategies themselves are exposed so they can be driven with custom
 * paths and helpers.
 */

#include "machineuid/machineuid.hpp"

#include <string>
#include <string_view>

namespace machineuid {

/**
 * @brief Read an identifier file
 *
 * The whole file is read, checked to be UTF-8 and trimmed.
 *
 * @return The trimmed content; FileUnreadable if the file cannot be opened,
 *         read or decoded; EmptyIdentifier if only whitespace remains
 */
[[nodiscard]] Result<std::string> read_id_file(const std::string& path);

/**
 * @brief Extract the value on the first line of content containing marker
 *
 * The line is split on its last '=' and the right-hand side is stripped of
 * quote and whitespace characters. For ioreg output such as
 *
 *     "IOPlatformUUID" = "1234-5678"
 *
 * this yields 1234-5678.
 *
 * @return The value; PatternNotFound if no line contains marker;
 *         EmptyIdentifier if the line carries no value
 */
[[nodiscard]] Result<std::string> extract_marker_value(std::string_view content,
                                                       std::string_view marker);

/// Format a host id as lowercase hexadecimal (two's complement for negative ids)
[[nodiscard]] std::string format_host_id(long host_id);

namespace source {

/// Read primary_path, then fallback_path if the primary is unreadable (Linux)
[[nodiscard]] Result<std::string> file_with_fallback(const Config& config);

#if !defined(_WIN32)

/// Read primary_path, then run helper_command if the file is unreadable (BSD)
[[nodiscard]] Result<std::string> file_or_command(const Config& config);

/// Run helper_command and extract the value of the marker line (macOS)
[[nodiscard]] Result<std::string> command_marker(const Config& config);

/// Format gethostid() as hexadecimal (illumos)
[[nodiscard]] Result<std::string> host_id(const Config& config);

#else

/// Read HKEY_LOCAL_MACHINE\registry_key\registry_value (Windows)
[[nodiscard]] Result<std::string> registry(const Config& config);

#endif

}  // namespace source
}  // namespace machineuid
