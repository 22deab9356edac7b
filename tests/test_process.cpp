#include <gtest/gtest.h>
#include <machineuid/process.hpp>

#if !defined(_WIN32)

#include <fcntl.h>
#include <unistd.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace machineuid {
namespace {

TEST(RunCommandTest, CapturesStdoutAndStderrSeparately) {
    auto result = run_command({"/bin/sh", "-c", "echo out; echo err >&2"});

    ASSERT_TRUE(result.is_ok()) << result.error_message();
    EXPECT_EQ(result.value().exit_code, 0);
    EXPECT_EQ(result.value().stdout_data, "out\n");
    EXPECT_EQ(result.value().stderr_data, "err\n");
}

TEST(RunCommandTest, ArgumentsAreNotShellExpanded) {
    auto result = run_command({"/bin/echo", "$HOME", "*"});

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().stdout_data, "$HOME *\n");
}

TEST(RunCommandTest, LargeOutputOnBothStreamsDoesNotDeadlock) {
    // Well past a pipe buffer on each stream
    auto result = run_command(
        {"/bin/sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo xxxxxxxxxx; echo yyyyyyyyyy >&2; "
                          "i=$((i+1)); done"});

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().stdout_data.size(), 20000u * 11u);
    EXPECT_EQ(result.value().stderr_data.size(), 20000u * 11u);
}

TEST(RunCommandTest, NonZeroExitIsError) {
    auto result = run_command({"/bin/sh", "-c", "echo 'no such variable' >&2; exit 1"});

    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error_code(), ErrorCode::ProcessSpawnFailed);
    EXPECT_NE(result.error_message().find("status 1"), std::string::npos);
    EXPECT_NE(result.error_message().find("no such variable"), std::string::npos);
}

TEST(RunCommandTest, MissingProgramIsSpawnFailure) {
    auto result = run_command({"machineuid-definitely-not-installed"});

    EXPECT_EQ(result.error_code(), ErrorCode::ProcessSpawnFailed);
    EXPECT_NE(result.error_message().find("machineuid-definitely-not-installed"),
              std::string::npos);
}

TEST(RunCommandTest, KilledBySignalIsError) {
    auto result = run_command({"/bin/sh", "-c", "kill -9 $$"});

    EXPECT_EQ(result.error_code(), ErrorCode::ProcessSpawnFailed);
    EXPECT_NE(result.error_message().find("signal"), std::string::npos);
}

TEST(RunCommandTest, HelperDoesNotInheritParentDescriptors) {
    // Single-digit descriptor so any POSIX sh can redirect from it
    constexpr int kInheritedFd = 9;
    if (fcntl(kInheritedFd, F_GETFD) != -1) {
        GTEST_SKIP() << "descriptor 9 already in use";
    }

    int fd = open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);
    ASSERT_EQ(dup2(fd, kInheritedFd), kInheritedFd);
    close(fd);

    auto result = run_command(
        {"/bin/sh", "-c", "if true 2>/dev/null <&9; then echo open; else echo closed; fi"});

    close(kInheritedFd);

    ASSERT_TRUE(result.is_ok()) << result.error_message();
    EXPECT_EQ(result.value().stdout_data, "closed\n");
}

TEST(RunCommandTest, ConcurrentCallsAreIndependent) {
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t, &failures] {
            const std::string expected = "thread-" + std::to_string(t);
            for (int i = 0; i < 10; ++i) {
                auto result = run_command({"/bin/echo", expected});
                if (result.is_error() || result.value().stdout_data != expected + "\n") {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
}

TEST(RunCommandTest, EmptyCommandIsInvalid) {
    EXPECT_EQ(run_command({}).error_code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(run_command({""}).error_code(), ErrorCode::InvalidArgument);
}

TEST(CommandStdoutTest, TrimsOutput) {
    auto result = command_stdout({"/bin/sh", "-c", "printf '  11112222-3333\\n\\n'"});

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), "11112222-3333");
}

TEST(CommandStdoutTest, InvalidUtf8IsUndecodable) {
    auto result = command_stdout({"/bin/sh", "-c", "printf '\\200abc'"});

    EXPECT_EQ(result.error_code(), ErrorCode::ProcessOutputUndecodable);
}

TEST(CommandStdoutTest, BlankOutputIsEmpty) {
    auto result = command_stdout({"/bin/sh", "-c", "echo"});

    EXPECT_EQ(result.error_code(), ErrorCode::EmptyIdentifier);
}

TEST(DescribeCommandTest, JoinsWithSpaces) {
    EXPECT_EQ(describe_command({"kenv", "-q", "smbios.system.uuid"}), "kenv -q smbios.system.uuid");
    EXPECT_EQ(describe_command({}), "");
}

}  // namespace
}  // namespace machineuid

#endif
