#pragma once

/**
 * @file json.hpp
 * @brief JSON rendering of lookup results
 *
 * Uses nlohmann/json to turn a lookup into a machine-readable report.
 */

#include "machineuid.hpp"

#include <nlohmann/json.hpp>

namespace machineuid {
namespace json {

using nlohmann::json;

// ==================== Error Codes ====================

/// Stable snake_case key for an error code
[[nodiscard]] constexpr const char* error_code_to_key(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "success";
        case ErrorCode::FileUnreadable:
            return "file_unreadable";
        case ErrorCode::ProcessSpawnFailed:
            return "process_spawn_failed";
        case ErrorCode::ProcessOutputUndecodable:
            return "process_output_undecodable";
        case ErrorCode::PatternNotFound:
            return "pattern_not_found";
        case ErrorCode::RegistryKeyUnopenable:
            return "registry_key_unopenable";
        case ErrorCode::RegistryValueUnreadable:
            return "registry_value_unreadable";
        case ErrorCode::EmptyIdentifier:
            return "empty_identifier";
        case ErrorCode::InvalidArgument:
            return "invalid_argument";
        case ErrorCode::Unknown:
            return "unknown";
    }
    return "unknown";
}

// ==================== Serialization ====================

/// Convert Config to JSON object (empty fields are omitted)
[[nodiscard]] inline json config_to_json(const Config& config) {
    json j = json::object();
    if (!config.primary_path.empty()) {
        j["primary_path"] = config.primary_path;
    }
    if (!config.fallback_path.empty()) {
        j["fallback_path"] = config.fallback_path;
    }
    if (!config.helper_command.empty()) {
        j["helper_command"] = config.helper_command;
    }
    if (!config.marker.empty()) {
        j["marker"] = config.marker;
    }
    if (!config.registry_key.empty()) {
        j["registry_key"] = config.registry_key;
    }
    if (!config.registry_value.empty()) {
        j["registry_value"] = config.registry_value;
    }
    return j;
}

/**
 * @brief Build a report for a lookup result
 *
 * Success: {"platform": ..., "machine_id": ...}
 * Failure: {"platform": ..., "error": {"code": ..., "message": ...}}
 */
[[nodiscard]] inline json result_to_json(const Result<std::string>& result,
                                         const std::string& platform) {
    json j = json::object();
    j["platform"] = platform;

    if (result.is_ok()) {
        j["machine_id"] = result.value();
        return j;
    }

    json error = json::object();
    error["code"] = error_code_to_key(result.error_code());
    error["message"] = result.error_message().empty()
                           ? std::string(error_code_to_string(result.error_code()))
                           : result.error_message();
    j["error"] = error;
    return j;
}

}  // namespace json
}  // namespace machineuid
