#include <gtest/gtest.h>
#include <machineuid/machineuid.hpp>

#include <cctype>
#include <cstdlib>
#include <string>
#include <vector>

namespace machineuid {
namespace {

bool running_on_ci() {
#if defined(_WIN32) || defined(_WIN64)
    char* ci_env = nullptr;
    size_t len = 0;
    bool is_ci = false;
    if (_dupenv_s(&ci_env, &len, "CI") == 0 && ci_env != nullptr) {
        is_ci = (std::string(ci_env) == "true");
        free(ci_env);
    }
    return is_ci;
#else
    const char* ci_env = std::getenv("CI");
    return ci_env != nullptr && std::string(ci_env) == "true";
#endif
}

// ==================== Platform Name Tests ====================

TEST(PlatformTest, GetPlatformNameMatchesBuild) {
    auto platform = get_platform_name();

#if defined(__linux__)
    EXPECT_EQ(platform, "linux");
#elif defined(__FreeBSD__)
    EXPECT_EQ(platform, "freebsd");
#elif defined(__DragonFly__)
    EXPECT_EQ(platform, "dragonfly");
#elif defined(__OpenBSD__)
    EXPECT_EQ(platform, "openbsd");
#elif defined(__NetBSD__)
    EXPECT_EQ(platform, "netbsd");
#elif defined(__APPLE__)
    EXPECT_EQ(platform, "macos");
#elif defined(_WIN32) || defined(_WIN64)
    EXPECT_EQ(platform, "windows");
#elif defined(__illumos__) || (defined(__sun) && defined(__SVR4))
    EXPECT_EQ(platform, "illumos");
#endif
}

// ==================== Default Config Tests ====================

TEST(DefaultConfigTest, UsesPlatformSources) {
    auto config = default_config();

    EXPECT_FALSE(config.debug);
#if defined(__linux__)
    EXPECT_EQ(config.primary_path, "/var/lib/dbus/machine-id");
    EXPECT_EQ(config.fallback_path, "/etc/machine-id");
    EXPECT_TRUE(config.helper_command.empty());
#elif defined(__FreeBSD__) || defined(__DragonFly__) || defined(__OpenBSD__) || defined(__NetBSD__)
    EXPECT_EQ(config.primary_path, "/etc/hostid");
    EXPECT_EQ(config.helper_command,
              (std::vector<std::string>{"kenv", "-q", "smbios.system.uuid"}));
#elif defined(__APPLE__)
    EXPECT_EQ(config.helper_command,
              (std::vector<std::string>{"ioreg", "-rd1", "-c", "IOPlatformExpertDevice"}));
    EXPECT_EQ(config.marker, "IOPlatformUUID");
#elif defined(_WIN32) || defined(_WIN64)
    EXPECT_EQ(config.registry_key, "SOFTWARE\\Microsoft\\Cryptography");
    EXPECT_EQ(config.registry_value, "MachineGuid");
#endif
}

// ==================== Machine ID Tests ====================

TEST(MachineIdTest, SuccessfulLookupIsTrimmedAndNonEmpty) {
    auto result = get();

    // May fail in sandboxed environments; a success must be well-formed
    if (result.is_ok()) {
        const auto& id = result.value();
        ASSERT_FALSE(id.empty());
        EXPECT_FALSE(std::isspace(static_cast<unsigned char>(id.front())));
        EXPECT_FALSE(std::isspace(static_cast<unsigned char>(id.back())));
    } else {
        EXPECT_FALSE(result.error_message().empty());
    }
}

TEST(MachineIdTest, LookupIsConsistent) {
    auto first = get();
    auto second = get();

    ASSERT_EQ(first.is_ok(), second.is_ok());
    if (first.is_ok()) {
        EXPECT_EQ(first.value(), second.value());
    } else {
        EXPECT_EQ(first.error_code(), second.error_code());
    }
}

TEST(MachineIdTest, DebugLoggingDoesNotChangeResult) {
    auto config = default_config();
    config.debug = true;

    auto quiet = get();
    auto verbose = get(config);

    ASSERT_EQ(quiet.is_ok(), verbose.is_ok());
    if (quiet.is_ok()) {
        EXPECT_EQ(quiet.value(), verbose.value());
    }
}

TEST(MachineIdTest, SucceedsOnCI) {
    // CI runners always carry a machine identifier; failure here means a
    // platform source regressed.
    if (!running_on_ci()) {
        GTEST_SKIP() << "Not running on CI";
    }

    auto result = get();
    EXPECT_TRUE(result.is_ok()) << "Machine ID lookup failed on CI runner. "
                                << "Platform: " << get_platform_name() << ". "
                                << error_code_to_string(result.error_code()) << ": "
                                << result.error_message();
}

}  // namespace
}  // namespace machineuid
