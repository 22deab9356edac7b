#pragma once

/**
 * @file machineuid.hpp
 * @brief machineuid C++ library
 *
 * Reads the operating system's native machine identifier without elevated
 * privileges. One lookup strategy is compiled in per target platform.
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace machineuid {

/// Library version
constexpr const char* VERSION = "0.1.0";

/// Error codes returned by lookup operations
enum class ErrorCode {
    Success = 0,

    // File sources
    FileUnreadable,

    // Helper processes
    ProcessSpawnFailed,
    ProcessOutputUndecodable,

    // Output parsing
    PatternNotFound,

    // Windows registry
    RegistryKeyUnopenable,
    RegistryValueUnreadable,

    // Source produced nothing but whitespace
    EmptyIdentifier,

    InvalidArgument,

    Unknown
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::FileUnreadable:
            return "File unreadable";
        case ErrorCode::ProcessSpawnFailed:
            return "Process spawn failed";
        case ErrorCode::ProcessOutputUndecodable:
            return "Process output undecodable";
        case ErrorCode::PatternNotFound:
            return "Pattern not found";
        case ErrorCode::RegistryKeyUnopenable:
            return "Registry key unopenable";
        case ErrorCode::RegistryValueUnreadable:
            return "Registry value unreadable";
        case ErrorCode::EmptyIdentifier:
            return "Empty identifier";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Result type for operations that can fail
 * @tparam T The success value type
 */
template <typename T> class Result {
  public:
    /// Construct a success result
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        r.error_ = ErrorCode::Success;
        return r;
    }

    /// Construct an error result
    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    /// Check if the result is successful
    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }

    /// Check if the result is an error
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }

    /// Get the value (undefined behavior if is_error())
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    /// Get the error code
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }

    /// Get the error message
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    std::optional<T> value_;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/// Well-known identifier locations
namespace paths {
constexpr const char* DBUS_MACHINE_ID = "/var/lib/dbus/machine-id";
constexpr const char* ETC_MACHINE_ID = "/etc/machine-id";
constexpr const char* ETC_HOSTID = "/etc/hostid";
}  // namespace paths

/**
 * @brief Lookup configuration
 *
 * default_config() fills every field with the constants of the compiled
 * platform. Fields a platform does not use are left empty.
 */
struct Config {
    /// File read first (Linux, BSD)
    std::string primary_path;

    /// File read when the primary is unreadable (Linux)
    std::string fallback_path;

    /// Helper program and its arguments (BSD, macOS)
    std::vector<std::string> helper_command;

    /// Substring identifying the line of helper output holding the ID (macOS)
    std::string marker;

    /// Subkey under HKEY_LOCAL_MACHINE (Windows)
    std::string registry_key;

    /// String value under registry_key (Windows)
    std::string registry_value;

    /// Enable debug logging
    bool debug = false;
};

/// Get the configuration for the compiled platform
[[nodiscard]] Config default_config();

/**
 * @brief Get the platform name
 *
 * @return "linux", "freebsd", "dragonfly", "openbsd", "netbsd", "macos",
 *         "windows" or "illumos"
 */
[[nodiscard]] std::string get_platform_name();

/**
 * @brief Read the machine identifier
 *
 * The identifier is read fresh on every call. A successful result is never
 * empty and carries no surrounding whitespace.
 *
 * Thread Safety: safe to call concurrently; the library holds no state.
 */
[[nodiscard]] Result<std::string> get();

/// Read the machine identifier using explicit sources
[[nodiscard]] Result<std::string> get(const Config& config);

}  // namespace machineuid
