#include "machineuid/sources.hpp"
#include "machineuid/text.hpp"

#if !defined(_WIN32)
#include "machineuid/process.hpp"

#include <unistd.h>
#endif

#include <boost/log/trivial.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace machineuid {

namespace {

constexpr std::string_view kQuoteAndWhitespace = "\" \t\n\r\f\v";

std::string strip_quotes(std::string_view text) {
    auto first = text.find_first_not_of(kQuoteAndWhitespace);
    if (first == std::string_view::npos) {
        return "";
    }
    auto last = text.find_last_not_of(kQuoteAndWhitespace);
    return std::string(text.substr(first, last - first + 1));
}

}  // namespace

Result<std::string> read_id_file(const std::string& path) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec) {
        return Result<std::string>::error(ErrorCode::FileUnreadable,
                                          "Cannot open " + path + ": " + ec.message());
    }
    if (std::filesystem::is_directory(status)) {
        return Result<std::string>::error(ErrorCode::FileUnreadable, path + " is a directory");
    }

    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string>::error(ErrorCode::FileUnreadable, "Cannot open " + path);
    }

    // istream::read turns a failing underflow into badbit instead of throwing
    std::string content;
    char buffer[4096];
    while (true) {
        file.read(buffer, sizeof(buffer));
        content.append(buffer, static_cast<size_t>(file.gcount()));
        if (!file) {
            break;
        }
    }
    if (file.bad()) {
        return Result<std::string>::error(ErrorCode::FileUnreadable, "Cannot read " + path);
    }

    if (!is_valid_utf8(content)) {
        return Result<std::string>::error(ErrorCode::FileUnreadable,
                                          path + " is not valid UTF-8");
    }

    auto value = trim(content);
    if (value.empty()) {
        return Result<std::string>::error(ErrorCode::EmptyIdentifier, path + " is empty");
    }
    return Result<std::string>::ok(std::move(value));
}

Result<std::string> extract_marker_value(std::string_view content, std::string_view marker) {
    if (marker.empty()) {
        return Result<std::string>::error(ErrorCode::InvalidArgument, "Empty marker");
    }

    for (auto line : split_lines(content)) {
        if (line.find(marker) == std::string_view::npos) {
            continue;
        }

        auto eq = line.rfind('=');
        auto value = strip_quotes(eq == std::string_view::npos ? line : line.substr(eq + 1));
        if (value.empty()) {
            return Result<std::string>::error(ErrorCode::EmptyIdentifier,
                                              "No value on the " + std::string(marker) + " line");
        }
        return Result<std::string>::ok(std::move(value));
    }

    return Result<std::string>::error(ErrorCode::PatternNotFound,
                                      "No line containing " + std::string(marker));
}

std::string format_host_id(long host_id) {
    std::ostringstream ss;
    ss << std::hex << static_cast<unsigned long>(host_id);
    return ss.str();
}

namespace source {

Result<std::string> file_with_fallback(const Config& config) {
    if (config.debug) {
        BOOST_LOG_TRIVIAL(debug) << "machineuid: reading " << config.primary_path;
    }

    auto primary = read_id_file(config.primary_path);
    if (primary.is_ok() || config.fallback_path.empty()) {
        return primary;
    }

    if (config.debug) {
        BOOST_LOG_TRIVIAL(debug) << "machineuid: " << primary.error_message()
                                 << ", falling back to " << config.fallback_path;
    }

    auto fallback = read_id_file(config.fallback_path);
    if (fallback.is_ok()) {
        return fallback;
    }
    return Result<std::string>::error(fallback.error_code(),
                                      primary.error_message() + "; " + fallback.error_message());
}

#if !defined(_WIN32)

Result<std::string> file_or_command(const Config& config) {
    if (config.debug) {
        BOOST_LOG_TRIVIAL(debug) << "machineuid: reading " << config.primary_path;
    }

    auto from_file = read_id_file(config.primary_path);
    if (from_file.is_ok()) {
        return from_file;
    }

    if (config.debug) {
        BOOST_LOG_TRIVIAL(debug) << "machineuid: " << from_file.error_message()
                                 << ", running `" << describe_command(config.helper_command)
                                 << "`";
    }

    auto from_command = command_stdout(config.helper_command);
    if (from_command.is_ok()) {
        return from_command;
    }
    return Result<std::string>::error(
        from_command.error_code(), from_file.error_message() + "; " + from_command.error_message());
}

Result<std::string> command_marker(const Config& config) {
    if (config.debug) {
        BOOST_LOG_TRIVIAL(debug) << "machineuid: running `"
                                 << describe_command(config.helper_command) << "`";
    }

    auto output = run_command(config.helper_command);
    if (output.is_error()) {
        return Result<std::string>::error(output.error_code(), output.error_message());
    }

    const auto& data = output.value().stdout_data;
    if (!is_valid_utf8(data)) {
        return Result<std::string>::error(ErrorCode::ProcessOutputUndecodable,
                                          "Output of `" + describe_command(config.helper_command) +
                                              "` is not valid UTF-8");
    }

    auto value = extract_marker_value(data, config.marker);
    if (value.error_code() == ErrorCode::PatternNotFound) {
        return Result<std::string>::error(ErrorCode::PatternNotFound,
                                          "No matching " + config.marker + " in `" +
                                              describe_command(config.helper_command) +
                                              "` output");
    }
    return value;
}

Result<std::string> host_id(const Config& config) {
    auto value = format_host_id(gethostid());
    if (config.debug) {
        BOOST_LOG_TRIVIAL(debug) << "machineuid: read host id from gethostid()";
    }
    return Result<std::string>::ok(std::move(value));
}

#endif

}  // namespace source
}  // namespace machineuid
