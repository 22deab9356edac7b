#include "machineuid/sources.hpp"

#if defined(_WIN32)

#include "machineuid/text.hpp"

#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include <boost/log/trivial.hpp>

#include <vector>

namespace machineuid {
namespace source {

namespace {

// Closes the key on scope exit
class RegistryKey {
  public:
    RegistryKey() = default;
    ~RegistryKey() {
        if (key_ != nullptr) {
            RegCloseKey(key_);
        }
    }

    RegistryKey(const RegistryKey&) = delete;
    RegistryKey& operator=(const RegistryKey&) = delete;

    HKEY* out() { return &key_; }
    HKEY get() const { return key_; }

  private:
    HKEY key_ = nullptr;
};

std::wstring to_wide(const std::string& text) {
    if (text.empty()) {
        return std::wstring();
    }
    int size = MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()),
                                   nullptr, 0);
    std::wstring wide(static_cast<size_t>(size), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), &wide[0], size);
    return wide;
}

std::string to_utf8(const std::wstring& wide) {
    if (wide.empty()) {
        return std::string();
    }
    int size = WideCharToMultiByte(CP_UTF8, 0, wide.data(), static_cast<int>(wide.size()),
                                   nullptr, 0, nullptr, nullptr);
    std::string text(static_cast<size_t>(size), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wide.data(), static_cast<int>(wide.size()), &text[0], size,
                        nullptr, nullptr);
    return text;
}

#if !defined(_WIN64)
// A 32-bit process on 64-bit Windows sees a redirected view of HKLM\SOFTWARE
bool is_wow64_process() {
    BOOL wow64 = FALSE;
    if (!IsWow64Process(GetCurrentProcess(), &wow64)) {
        return false;
    }
    return wow64 == TRUE;
}
#endif

}  // namespace

Result<std::string> registry(const Config& config) {
    const std::string key_name = "HKEY_LOCAL_MACHINE\\" + config.registry_key;

    REGSAM access = KEY_READ;
#if !defined(_WIN64)
    if (is_wow64_process()) {
        access |= KEY_WOW64_64KEY;
    }
#endif

    if (config.debug) {
        BOOST_LOG_TRIVIAL(debug) << "machineuid: opening " << key_name
                                 << ((access & KEY_WOW64_64KEY) ? " (64-bit view)" : "");
    }

    RegistryKey key;
    LSTATUS status =
        RegOpenKeyExW(HKEY_LOCAL_MACHINE, to_wide(config.registry_key).c_str(), 0, access, key.out());
    if (status != ERROR_SUCCESS) {
        return Result<std::string>::error(ErrorCode::RegistryKeyUnopenable,
                                          "Cannot open " + key_name + " (error " +
                                              std::to_string(status) + ")");
    }

    const std::wstring value_name = to_wide(config.registry_value);
    DWORD type = 0;
    DWORD size = 0;
    status = RegQueryValueExW(key.get(), value_name.c_str(), nullptr, &type, nullptr, &size);
    if (status != ERROR_SUCCESS) {
        return Result<std::string>::error(ErrorCode::RegistryValueUnreadable,
                                          "Cannot read " + key_name + "\\" +
                                              config.registry_value + " (error " +
                                              std::to_string(status) + ")");
    }
    if (type != REG_SZ && type != REG_EXPAND_SZ) {
        return Result<std::string>::error(ErrorCode::RegistryValueUnreadable,
                                          key_name + "\\" + config.registry_value +
                                              " is not a string value");
    }

    std::vector<wchar_t> buffer(size / sizeof(wchar_t) + 1, L'\0');
    DWORD buffer_size = static_cast<DWORD>(buffer.size() * sizeof(wchar_t));
    status = RegQueryValueExW(key.get(), value_name.c_str(), nullptr, &type,
                              reinterpret_cast<LPBYTE>(buffer.data()), &buffer_size);
    if (status != ERROR_SUCCESS) {
        return Result<std::string>::error(ErrorCode::RegistryValueUnreadable,
                                          "Cannot read " + key_name + "\\" +
                                              config.registry_value + " (error " +
                                              std::to_string(status) + ")");
    }

    // The stored string may or may not carry its terminator
    auto value = trim(to_utf8(std::wstring(buffer.data())));
    if (value.empty()) {
        return Result<std::string>::error(ErrorCode::EmptyIdentifier,
                                          key_name + "\\" + config.registry_value + " is empty");
    }
    return Result<std::string>::ok(std::move(value));
}

}  // namespace source
}  // namespace machineuid

#endif
