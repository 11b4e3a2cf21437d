#include "runtime/process_runner.hpp"

#include <algorithm>
#include <chrono>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sstream>
#include <string>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace simlab::runtime {

using core::errors::ErrorCategory;
using core::errors::LabError;

namespace {

constexpr std::int64_t kKillGraceMs = 2000;
constexpr const char* kTruncatedMarker = "\n[output truncated]\n";

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

void drain_pipe(int& fd, std::string& out, const std::size_t cap, bool& truncated) {
    if (fd < 0) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            const std::size_t room = out.size() < cap ? cap - out.size() : 0;
            std::size_t take = std::min(room, static_cast<std::size_t>(n));
            if (take < static_cast<std::size_t>(n)) {
                // Never cut inside a multi-byte character.
                while (take > 0 && (static_cast<unsigned char>(buffer[take]) & 0xC0) == 0x80) {
                    --take;
                }
            }
            out.append(buffer, take);
            if (take < static_cast<std::size_t>(n) && !truncated) {
                truncated = true;
                out += kTruncatedMarker;
            }
            continue;
        }
        if (n == 0) {
            close_fd(fd);
            return;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return;
        }
        close_fd(fd);
        return;
    }
}

// Length of the well-formed UTF-8 sequence starting at text[pos], or 0.
std::size_t utf8_sequence_length(const std::string& text, const std::size_t pos) {
    const auto byte = [&text](const std::size_t i) { return static_cast<unsigned char>(text[i]); };
    const unsigned char lead = byte(pos);
    if (lead < 0x80) {
        return 1;
    }

    std::size_t length = 0;
    unsigned char min_second = 0x80;
    unsigned char max_second = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) {
            min_second = 0xA0;
        } else if (lead == 0xED) {
            max_second = 0x9F;
        }
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) {
            min_second = 0x90;
        } else if (lead == 0xF4) {
            max_second = 0x8F;
        }
    } else {
        return 0;
    }

    if (pos + length > text.size()) {
        return 0;
    }
    if (byte(pos + 1) < min_second || byte(pos + 1) > max_second) {
        return 0;
    }
    for (std::size_t i = 2; i < length; ++i) {
        if ((byte(pos + i) & 0xC0) != 0x80) {
            return 0;
        }
    }
    return length;
}

void apply_limit(const int resource, const std::uint64_t value) {
    if (value == 0) {
        return;
    }
    struct rlimit rl;
    rl.rlim_cur = static_cast<rlim_t>(value);
    rl.rlim_max = static_cast<rlim_t>(value);
    static_cast<void>(setrlimit(resource, &rl));
}

// Inherited environment with the request's overrides applied. Built before
// fork() so the child only has to exec.
std::vector<std::string> build_environment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string line(*entry);
        const auto eq = line.find('=');
        const std::string key = line.substr(0, eq);
        bool overridden = false;
        for (const auto& [name, value] : overrides) {
            if (name == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            env.push_back(line);
        }
    }
    for (const auto& [name, value] : overrides) {
        env.push_back(name + "=" + value);
    }
    return env;
}

std::vector<char*> to_c_array(std::vector<std::string>& values) {
    std::vector<char*> pointers;
    pointers.reserve(values.size() + 1);
    for (auto& value : values) {
        pointers.push_back(value.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

}  // namespace

core::errors::Result<ProcessCapture> run_process(const ProcessRequest& request) {
    if (request.argv.empty() || request.argv.front().empty()) {
        return LabError{ErrorCategory::Input, "Process argv cannot be empty.",
                        "empty_command"};
    }

    if (request.cancel_token && request.cancel_token->load()) {
        ProcessCapture capture;
        capture.cancelled = true;
        capture.stderr_text = "Process cancelled before start.";
        return capture;
    }

    std::vector<std::string> argv_storage = request.argv;
    std::vector<std::string> env_storage = build_environment(request.environment);
    std::vector<char*> argv = to_c_array(argv_storage);
    std::vector<char*> envp = to_c_array(env_storage);
    const std::string cwd = request.working_directory.string();
    const std::string stdin_path =
        request.stdin_file.has_value() ? request.stdin_file->string() : "/dev/null";

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe(stdout_pipe) != 0) {
        return LabError{ErrorCategory::Internal, "Failed to create process pipes.",
                        "pipe_creation_failed"};
    }
    if (pipe(stderr_pipe) != 0) {
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        return LabError{ErrorCategory::Internal, "Failed to create process pipes.",
                        "pipe_creation_failed"};
    }

    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        close_fd(stdout_pipe[0]);
        close_fd(stdout_pipe[1]);
        close_fd(stderr_pipe[0]);
        close_fd(stderr_pipe[1]);
        return LabError{ErrorCategory::Internal, "Failed to fork process.", "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(setpgid(0, 0));
        if (chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        const int stdin_fd = open(stdin_path.c_str(), O_RDONLY);
        if (stdin_fd < 0) {
            _exit(126);
        }
        static_cast<void>(dup2(stdin_fd, STDIN_FILENO));
        static_cast<void>(close(stdin_fd));
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        static_cast<void>(close(stdout_pipe[0]));
        static_cast<void>(close(stdout_pipe[1]));
        static_cast<void>(close(stderr_pipe[0]));
        static_cast<void>(close(stderr_pipe[1]));

        apply_limit(RLIMIT_CPU, request.limits.cpu_seconds);
        apply_limit(RLIMIT_AS, request.limits.address_space_bytes);
        apply_limit(RLIMIT_FSIZE, request.limits.max_file_bytes);

        execvpe(argv[0], argv.data(), envp.data());
        const char prefix[] = "simlab: exec failed: ";
        static_cast<void>(write(STDERR_FILENO, prefix, sizeof(prefix) - 1));
        static_cast<void>(write(STDERR_FILENO, argv[0], std::strlen(argv[0])));
        static_cast<void>(write(STDERR_FILENO, "\n", 1));
        _exit(127);
    }

    // Set from both sides so kill(-pid) is valid even before the child runs.
    static_cast<void>(setpgid(pid, pid));
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    ProcessCapture capture;
    int stdout_fd = stdout_pipe[0];
    int stderr_fd = stderr_pipe[0];
    bool child_exited = false;
    bool killed = false;
    std::chrono::steady_clock::time_point killed_at;
    int status = 0;

    auto kill_group = [&]() {
        if (!killed) {
            static_cast<void>(kill(-pid, SIGKILL));
            static_cast<void>(kill(pid, SIGKILL));
            killed = true;
            killed_at = std::chrono::steady_clock::now();
        }
    };

    while (stdout_fd >= 0 || stderr_fd >= 0 || !child_exited) {
        if (request.cancel_token && request.cancel_token->load() && !child_exited) {
            capture.cancelled = true;
            kill_group();
        }

        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
        if (!capture.timed_out && request.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(request.timeout_ms) && !child_exited) {
            capture.timed_out = true;
            kill_group();
        }

        // A grandchild that escaped the process group may still hold the pipes
        // open. Stop listening once the grace period after the kill is over.
        if (killed && std::chrono::duration_cast<std::chrono::milliseconds>(
                          now - killed_at)
                              .count() > kKillGraceMs) {
            close_fd(stdout_fd);
            close_fd(stderr_fd);
        }
        // Descendants left behind by an exited child are killed with the group.
        if (child_exited && !killed && (stdout_fd >= 0 || stderr_fd >= 0)) {
            kill_group();
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_fd >= 0) {
            fds[nfds].fd = stdout_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_fd >= 0) {
            fds[nfds].fd = stderr_fd;
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else if (!child_exited) {
            usleep(10 * 1000);
        }

        drain_pipe(stdout_fd, capture.stdout_text, request.max_output_bytes,
                   capture.output_truncated);
        drain_pipe(stderr_fd, capture.stderr_text, request.max_output_bytes,
                   capture.output_truncated);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        if (child_exited && stdout_fd < 0 && stderr_fd < 0) {
            break;
        }
    }

    if (!child_exited) {
        static_cast<void>(waitpid(pid, &status, 0));
    }

    if (WIFEXITED(status)) {
        capture.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        capture.term_signal = WTERMSIG(status);
        capture.exit_code = 128 + capture.term_signal;
    } else {
        capture.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    capture.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return capture;
}

std::string to_valid_utf8(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t length = utf8_sequence_length(text, pos);
        if (length == 0) {
            out += "\xEF\xBF\xBD";
            ++pos;
            continue;
        }
        out.append(text, pos, length);
        pos += length;
    }
    return out;
}

bool executable_on_path(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0;
    }
    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return false;
    }
    std::istringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        const std::string candidate = dir + "/" + program;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

}  // namespace simlab::runtime
