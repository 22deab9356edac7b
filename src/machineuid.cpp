#include "machineuid/machineuid.hpp"
#include "machineuid/sources.hpp"

#include <boost/log/trivial.hpp>

// Platform detection
#if defined(__linux__)
#define MACHINEUID_PLATFORM_LINUX 1
#define MACHINEUID_PLATFORM_NAME "linux"
#elif defined(__FreeBSD__)
#define MACHINEUID_PLATFORM_BSD 1
#define MACHINEUID_PLATFORM_NAME "freebsd"
#elif defined(__DragonFly__)
#define MACHINEUID_PLATFORM_BSD 1
#define MACHINEUID_PLATFORM_NAME "dragonfly"
#elif defined(__OpenBSD__)
#define MACHINEUID_PLATFORM_BSD 1
#define MACHINEUID_PLATFORM_NAME "openbsd"
#elif defined(__NetBSD__)
#define MACHINEUID_PLATFORM_BSD 1
#define MACHINEUID_PLATFORM_NAME "netbsd"
#elif defined(__APPLE__)
#define MACHINEUID_PLATFORM_MACOS 1
#define MACHINEUID_PLATFORM_NAME "macos"
#elif defined(_WIN32) || defined(_WIN64)
#define MACHINEUID_PLATFORM_WINDOWS 1
#define MACHINEUID_PLATFORM_NAME "windows"
#elif defined(__illumos__) || (defined(__sun) && defined(__SVR4))
#define MACHINEUID_PLATFORM_ILLUMOS 1
#define MACHINEUID_PLATFORM_NAME "illumos"
#else
#error "machineuid: unsupported platform"
#endif

namespace machineuid {

Config default_config() {
    Config config;

#if defined(MACHINEUID_PLATFORM_LINUX)
    // Fedora 20 and some containers only ship /etc/machine-id
    config.primary_path = paths::DBUS_MACHINE_ID;
    config.fallback_path = paths::ETC_MACHINE_ID;
#elif defined(MACHINEUID_PLATFORM_BSD)
    config.primary_path = paths::ETC_HOSTID;
    config.helper_command = {"kenv", "-q", "smbios.system.uuid"};
#elif defined(MACHINEUID_PLATFORM_MACOS)
    config.helper_command = {"ioreg", "-rd1", "-c", "IOPlatformExpertDevice"};
    config.marker = "IOPlatformUUID";
#elif defined(MACHINEUID_PLATFORM_WINDOWS)
    config.registry_key = "SOFTWARE\\Microsoft\\Cryptography";
    config.registry_value = "MachineGuid";
#endif

    return config;
}

std::string get_platform_name() {
    return MACHINEUID_PLATFORM_NAME;
}

Result<std::string> get() {
    return get(default_config());
}

Result<std::string> get(const Config& config) {
#if defined(MACHINEUID_PLATFORM_LINUX)
    auto result = source::file_with_fallback(config);
#elif defined(MACHINEUID_PLATFORM_BSD)
    auto result = source::file_or_command(config);
#elif defined(MACHINEUID_PLATFORM_MACOS)
    auto result = source::command_marker(config);
#elif defined(MACHINEUID_PLATFORM_WINDOWS)
    auto result = source::registry(config);
#elif defined(MACHINEUID_PLATFORM_ILLUMOS)
    auto result = source::host_id(config);
#endif

    if (config.debug) {
        if (result.is_ok()) {
            BOOST_LOG_TRIVIAL(debug) << "machineuid: identifier read on " << MACHINEUID_PLATFORM_NAME;
        } else {
            BOOST_LOG_TRIVIAL(debug) << "machineuid: lookup failed ("
                                     << error_code_to_string(result.error_code())
                                     << "): " << result.error_message();
        }
    }

    return result;
}

}  // namespace machineuid
