#include "core/process_runner.hpp"

#include <sys/select.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <errno.h>
#include <cstdio>
#include <cstring>
#include <algorithm>

namespace spectre::make {

namespace {

void close_pipe(int fds[2]) {
    close(fds[0]);
    close(fds[1]);
}

struct Capture {
    std::string text;
    bool truncated = false;
    const char* name;

    explicit Capture(const char* stream_name) : name(stream_name) {}

    void append(const char* data, size_t size) {
        if (truncated) {
            return;  // keep draining so the child never blocks on a full pipe
        }
        size_t room = ProcessRunner::MAX_CAPTURE_BYTES - text.size();
        if (size > room) {
            text.append(data, room);
            text += std::string("\n[... ") + name + " truncated at 10MB ...]";
            truncated = true;
            return;
        }
        text.append(data, size);
    }
};

// Reads one chunk. Returns false once the stream reached EOF or failed.
bool drain_once(int fd, Capture& capture) {
    char buffer[4096];
    ssize_t n = read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        capture.append(buffer, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

std::string ProcessRunner::Result::combined_output() const {
    if (stdout_output.empty()) return stderr_output;
    if (stderr_output.empty()) return stdout_output;

    std::string combined = stdout_output;
    if (combined.back() != '\n') {
        combined += '\n';
    }
    combined += stderr_output;
    return combined;
}

ProcessRunner::Result ProcessRunner::run(
    const std::vector<std::string>& args,
    const std::filesystem::path& working_dir
) const {
    if (args.empty()) {
        throw std::runtime_error("Cannot execute empty command");
    }

    auto start_time = std::chrono::steady_clock::now();

    // Everything the child needs is prepared before fork
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string dir = working_dir.string();

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        throw std::runtime_error(
            std::string("Failed to create stdout pipe: ") + strerror(errno)
        );
    }

    if (pipe(stderr_pipe) != 0) {
        int saved = errno;
        close_pipe(stdout_pipe);
        throw std::runtime_error(
            std::string("Failed to create stderr pipe: ") + strerror(saved)
        );
    }

    pid_t pid = fork();

    if (pid < 0) {
        int saved = errno;
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        throw std::runtime_error(
            std::string("Failed to fork process: ") + strerror(saved)
        );
    }

    if (pid == 0) {
        // Child process
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);

        if (!dir.empty() && chdir(dir.c_str()) != 0) {
            dprintf(STDERR_FILENO, "Failed to enter %s: %s\n", dir.c_str(), strerror(errno));
            _exit(127);
        }

        execvp(argv[0], argv.data());

        // Only reached when execvp failed
        dprintf(STDERR_FILENO, "Failed to execute %s: %s\n", argv[0], strerror(errno));
        _exit(127);  // _exit: do not flush the parent's stdio buffers
    }

    // Parent process: the child is the only writer
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    Capture out("stdout");
    Capture err("stderr");
    bool stdout_open = true;
    bool stderr_open = true;

    while (stdout_open || stderr_open) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        int max_fd = -1;

        if (stdout_open) {
            FD_SET(stdout_pipe[0], &read_fds);
            max_fd = std::max(max_fd, stdout_pipe[0]);
        }
        if (stderr_open) {
            FD_SET(stderr_pipe[0], &read_fds);
            max_fd = std::max(max_fd, stderr_pipe[0]);
        }

        int ready = select(max_fd + 1, &read_fds, nullptr, nullptr, nullptr);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;  // closing the read ends below makes a writing child exit on SIGPIPE
        }

        if (stdout_open && FD_ISSET(stdout_pipe[0], &read_fds)) {
            stdout_open = drain_once(stdout_pipe[0], out);
        }
        if (stderr_open && FD_ISSET(stderr_pipe[0], &read_fds)) {
            stderr_open = drain_once(stderr_pipe[0], err);
        }
    }

    close(stdout_pipe[0]);
    close(stderr_pipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(
                std::string("Failed to wait for ") + args[0] + ": " + strerror(errno)
            );
        }
    }

    auto end_time = std::chrono::steady_clock::now();

    Result result;
    result.exit_code = decode_status(status);
    result.stdout_output = std::move(out.text);
    result.stderr_output = std::move(err.text);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    return result;
}

std::string format_command(const std::vector<std::string>& args) {
    std::string line;
    for (const auto& arg : args) {
        if (!line.empty()) {
            line += ' ';
        }
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
            line += '\'' + arg + '\'';
        } else {
            line += arg;
        }
    }
    return line;
}

} // namespace spectre::make
