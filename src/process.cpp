#include "machineuid/process.hpp"

#if !defined(_WIN32)

#include "machineuid/text.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#if defined(__linux__)
#include <sys/syscall.h>
#endif

#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <system_error>

namespace machineuid {

namespace {

// Exit status used by the child when execvp fails (same as the shell's)
constexpr int kExecFailedStatus = 127;

std::string errno_message(const std::string& what) {
    return what + ": " + std::error_code(errno, std::generic_category()).message();
}

// Pipe whose ends are not inherited by helpers spawned from other threads
bool open_cloexec_pipe(int fds[2]) {
#if defined(__linux__) || defined(__FreeBSD__) || defined(__DragonFly__) || \
    defined(__OpenBSD__) || defined(__NetBSD__) || defined(__illumos__)
    return pipe2(fds, O_CLOEXEC) == 0;
#else
    if (pipe(fds) == -1) {
        return false;
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
#endif
}

// Runs in the child between fork and exec; only async-signal-safe calls
void close_inherited_descriptors(int max_fd) {
#if defined(__FreeBSD__) || defined(__DragonFly__) || defined(__OpenBSD__) || \
    defined(__NetBSD__) || defined(__illumos__)
    (void)max_fd;
    closefrom(STDERR_FILENO + 1);
#else
#if defined(__linux__) && defined(SYS_close_range)
    if (syscall(SYS_close_range, STDERR_FILENO + 1, ~0U, 0) == 0) {
        return;
    }
#endif
    for (int fd = STDERR_FILENO + 1; fd < max_fd; ++fd) {
        close(fd);
    }
#endif
}

int descriptor_limit() {
    // Bounded so a huge RLIMIT_NOFILE does not make every spawn crawl
    constexpr long kMaxScanned = 65536;
    long limit = sysconf(_SC_OPEN_MAX);
    if (limit <= 0 || limit > kMaxScanned) {
        limit = kMaxScanned;
    }
    return static_cast<int>(limit);
}

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) {
        close(fds[0]);
        fds[0] = -1;
    }
    if (fds[1] >= 0) {
        close(fds[1]);
        fds[1] = -1;
    }
}

// Drain both pipes until the child closes them. Reading them together keeps a
// chatty stderr from blocking the child while we wait on stdout.
void drain_pipes(int out_fd, int err_fd, std::string& out, std::string& err) {
    struct pollfd fds[2];
    fds[0].fd = out_fd;
    fds[0].events = POLLIN;
    fds[1].fd = err_fd;
    fds[1].events = POLLIN;

    char buffer[4096];
    int open_count = 2;

    while (open_count > 0) {
        int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                (i == 0 ? out : err).append(buffer, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            // EOF or read error: stop watching this pipe
            fds[i].fd = -1;
            --open_count;
        }
    }
}

}  // namespace

std::string describe_command(const std::vector<std::string>& argv) {
    std::ostringstream ss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            ss << ' ';
        }
        ss << argv[i];
    }
    return ss.str();
}

Result<CommandOutput> run_command(const std::vector<std::string>& argv) {
    if (argv.empty() || argv.front().empty()) {
        return Result<CommandOutput>::error(ErrorCode::InvalidArgument,
                                            "No helper command configured");
    }

    const std::string command = describe_command(argv);

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (!open_cloexec_pipe(stdout_pipe)) {
        return Result<CommandOutput>::error(ErrorCode::ProcessSpawnFailed,
                                            errno_message("pipe failed for `" + command + "`"));
    }
    if (!open_cloexec_pipe(stderr_pipe)) {
        auto message = errno_message("pipe failed for `" + command + "`");
        close_pipe(stdout_pipe);
        return Result<CommandOutput>::error(ErrorCode::ProcessSpawnFailed, message);
    }

    // Build argv before forking; only async-signal-safe calls run in the child
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);
    const int max_fd = descriptor_limit();

    pid_t pid = fork();
    if (pid == -1) {
        auto message = errno_message("fork failed for `" + command + "`");
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return Result<CommandOutput>::error(ErrorCode::ProcessSpawnFailed, message);
    }

    if (pid == 0) {
        // child
        if (dup2(stdout_pipe[1], STDOUT_FILENO) == -1 ||
            dup2(stderr_pipe[1], STDERR_FILENO) == -1) {
            _exit(kExecFailedStatus);
        }
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        close_inherited_descriptors(max_fd);

        execvp(cargv[0], cargv.data());
        _exit(kExecFailedStatus);
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    CommandOutput output;
    drain_pipes(stdout_pipe[0], stderr_pipe[0], output.stdout_data, output.stderr_data);
    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            return Result<CommandOutput>::error(
                ErrorCode::ProcessSpawnFailed,
                errno_message("waitpid failed for `" + command + "`"));
        }
    }

    if (WIFSIGNALED(status)) {
        return Result<CommandOutput>::error(
            ErrorCode::ProcessSpawnFailed,
            "`" + command + "` terminated by signal " + std::to_string(WTERMSIG(status)));
    }
    if (!WIFEXITED(status)) {
        return Result<CommandOutput>::error(ErrorCode::ProcessSpawnFailed,
                                            "`" + command + "` ended abnormally");
    }

    output.exit_code = WEXITSTATUS(status);
    if (output.exit_code == kExecFailedStatus) {
        return Result<CommandOutput>::error(ErrorCode::ProcessSpawnFailed,
                                            "Could not execute `" + command + "`");
    }
    if (!output.success()) {
        std::string message =
            "`" + command + "` exited with status " + std::to_string(output.exit_code);
        auto detail = trim(output.stderr_data);
        if (!detail.empty()) {
            message += ": " + detail;
        }
        return Result<CommandOutput>::error(ErrorCode::ProcessSpawnFailed, message);
    }

    return Result<CommandOutput>::ok(std::move(output));
}

Result<std::string> command_stdout(const std::vector<std::string>& argv) {
    auto result = run_command(argv);
    if (result.is_error()) {
        return Result<std::string>::error(result.error_code(), result.error_message());
    }

    const auto& data = result.value().stdout_data;
    if (!is_valid_utf8(data)) {
        return Result<std::string>::error(ErrorCode::ProcessOutputUndecodable,
                                          "Output of `" + describe_command(argv) +
                                              "` is not valid UTF-8");
    }

    auto value = trim(data);
    if (value.empty()) {
        return Result<std::string>::error(ErrorCode::EmptyIdentifier,
                                          "`" + describe_command(argv) + "` printed nothing");
    }
    return Result<std::string>::ok(std::move(value));
}

}  // namespace machineuid

#endif
