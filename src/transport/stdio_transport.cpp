#include <bullvision/transport/stdio_transport.hpp>

#include <bullvision/core/log.hpp>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace bullvision {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr auto kReapInterval = std::chrono::milliseconds(20);

std::string ErrnoText(int err) {
    return std::string(std::strerror(err));
}

Error TransportError(ErrorCategory category, const std::string& operation,
                     const std::string& target, const std::string& message) {
    return Error::Make(category, operation, target, message);
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Writes to a pipe whose reader has gone must fail with EPIPE, not kill us.
void IgnoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

// Current environment with the given overrides applied, as KEY=VALUE strings.
std::vector<std::string> BuildEnvironment(
    const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        auto key = entry.substr(0, eq);
        if (overrides.count(key) == 0) {
            out.push_back(std::move(entry));
        }
    }
    for (const auto& [key, value] : overrides) {
        out.push_back(key + "=" + value);
    }
    return out;
}

std::vector<char*> CStringArray(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

std::string DescribeExit(int status) {
    if (WIFEXITED(status)) {
        return "exited with status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "killed by signal " + std::to_string(WTERMSIG(status));
    }
    return "ended";
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

StdioProcessTransport::StdioProcessTransport(StdioProcessOptions options,
                                             TextCodec codec)
    : options_(std::move(options)), codec_(std::move(codec)) {}

StdioProcessTransport::~StdioProcessTransport() {
    auto closed = CloseStreams();
    if (closed.IsErr()) {
        LogWarn("transport", closed.Error().ToString());
    }
    auto terminated = Terminate();
    if (terminated.IsErr()) {
        LogWarn("transport", terminated.Error().ToString());
    }
}

// ---------------------------------------------------------------------------
// Open
// ---------------------------------------------------------------------------

Result<void, Error> StdioProcessTransport::Open(LineHandler on_line,
                                                ClosedHandler on_closed) {
    const auto& command = options_.command;
    std::lock_guard<std::mutex> lock(mutex_);
    if (opened_) {
        return Result<void, Error>::Err(TransportError(
            ErrorCategory::Internal, "Open", command, "Transport already opened"));
    }
    opened_ = true;
    IgnoreSigpipeOnce();

    // Every descriptor is close-on-exec so concurrently launched siblings
    // never inherit our pipe ends. dup2() clears the flag on 0 and 1.
    int to_child[2] = {-1, -1};
    int from_child[2] = {-1, -1};
    int exec_status[2] = {-1, -1};
    if (::pipe2(to_child, O_CLOEXEC) != 0 || ::pipe2(from_child, O_CLOEXEC) != 0 ||
        ::pipe2(exec_status, O_CLOEXEC) != 0) {
        const int err = errno;
        for (int* p : {to_child, from_child, exec_status}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        return Result<void, Error>::Err(TransportError(
            ErrorCategory::Connection, "Launch", command,
            "Failed to create pipes: " + ErrnoText(err)));
    }

    // Prepare everything that allocates before fork().
    std::vector<std::string> argv_strings;
    argv_strings.push_back(command);
    argv_strings.insert(argv_strings.end(), options_.args.begin(), options_.args.end());
    auto env_strings = BuildEnvironment(options_.env);
    auto argv = CStringArray(argv_strings);
    auto envp = CStringArray(env_strings);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        for (int* p : {to_child, from_child, exec_status}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
        return Result<void, Error>::Err(TransportError(
            ErrorCategory::Connection, "Launch", command,
            "Failed to fork: " + ErrnoText(err)));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        ::dup2(to_child[0], STDIN_FILENO);
        ::dup2(from_child[1], STDOUT_FILENO);
        ::execvpe(argv[0], argv.data(), envp.data());
        const int err = errno;
        ssize_t ignored = ::write(exec_status[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    CloseFd(to_child[0]);
    CloseFd(from_child[1]);
    CloseFd(exec_status[1]);

    // The status pipe reads EOF once exec succeeded, or the child's errno.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_status[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    CloseFd(exec_status[0]);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        CloseFd(to_child[1]);
        CloseFd(from_child[0]);
        return Result<void, Error>::Err(TransportError(
            ErrorCategory::Connection, "Launch", command,
            "Failed to start '" + command + "': " + ErrnoText(child_errno)));
    }

    // Writes poll so that CloseStreams() can interrupt a blocked Send().
    const int flags = ::fcntl(to_child[1], F_GETFL, 0);
    ::fcntl(to_child[1], F_SETFL, flags | O_NONBLOCK);

    pid_ = pid;
    stdin_fd_ = to_child[1];
    stdout_fd_ = from_child[0];
    on_line_ = std::move(on_line);
    on_closed_ = std::move(on_closed);

    LogDebug("transport", "Started '" + command + "' (pid " + std::to_string(pid) + ")");
    reader_ = std::thread([this] { ReadLoop(); });
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Send
// ---------------------------------------------------------------------------

Result<void, Error> StdioProcessTransport::Send(std::string_view line) {
    auto encoded = codec_.Encode(line);
    if (encoded.IsErr()) {
        return Result<void, Error>::Err(encoded.Error());
    }
    std::string data = std::move(encoded).Value();
    data.push_back('\n');

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t offset = 0;
    while (offset < data.size()) {
        if (stdin_fd_ < 0 || stop_) {
            return Result<void, Error>::Err(TransportError(
                ErrorCategory::Protocol, "Send", options_.command,
                "Transport is closed"));
        }
        const ssize_t written =
            ::write(stdin_fd_, data.data() + offset, data.size() - offset);
        if (written > 0) {
            offset += static_cast<std::size_t>(written);
            continue;
        }
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{stdin_fd_, POLLOUT, 0};
            ::poll(&pfd, 1, kPollIntervalMs);
            continue;
        }
        return Result<void, Error>::Err(TransportError(
            ErrorCategory::Protocol, "Send", options_.command,
            "Write to server stdin failed: " + ErrnoText(errno)));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Reader thread
// ---------------------------------------------------------------------------

void StdioProcessTransport::DeliverLines(std::string& buffer) {
    std::size_t start = 0;
    for (;;) {
        auto nl = buffer.find('\n', start);
        if (nl == std::string::npos) break;
        std::string_view raw(buffer.data() + start, nl - start);
        if (!raw.empty() && raw.back() == '\r') {
            raw.remove_suffix(1);
        }
        if (!raw.empty() && on_line_) {
            on_line_(codec_.Decode(raw));
        }
        start = nl + 1;
    }
    buffer.erase(0, start);
}

void StdioProcessTransport::ReadLoop() {
    std::array<char, 4096> chunk{};
    std::string buffer;
    std::string reason;

    while (!stop_) {
        pollfd pfd{stdout_fd_, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            reason = "poll failed: " + ErrnoText(errno);
            break;
        }
        if (rc == 0) continue;

        const ssize_t n = ::read(stdout_fd_, chunk.data(), chunk.size());
        if (n > 0) {
            buffer.append(chunk.data(), static_cast<std::size_t>(n));
            DeliverLines(buffer);
            if (buffer.size() > options_.max_line_bytes) {
                reason = "inbound message exceeds " +
                         std::to_string(options_.max_line_bytes) + " bytes";
                break;
            }
            continue;
        }
        if (n == 0) {
            reason = "server closed its output stream";
            if (!buffer.empty()) {
                reason += " (" + std::to_string(buffer.size()) +
                          " bytes of an unterminated message discarded)";
            }
            break;
        }
        if (errno == EINTR || errno == EAGAIN) continue;
        reason = "read failed: " + ErrnoText(errno);
        break;
    }

    eof_ = true;
    if (!stop_ && on_closed_) {
        LogDebug("transport", "'" + options_.command + "': " + reason);
        on_closed_(reason);
    }
}

// ---------------------------------------------------------------------------
// Shutdown
// ---------------------------------------------------------------------------

Result<void, Error> StdioProcessTransport::CloseStreams() {
    stop_ = true;

    int close_error = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stdin_fd_ >= 0 && ::close(stdin_fd_) != 0) {
            close_error = errno;
        }
        stdin_fd_ = -1;
    }

    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            return Result<void, Error>::Err(TransportError(
                ErrorCategory::Internal, "CloseStreams", options_.command,
                "CloseStreams called from the reader thread"));
        }
        reader_.join();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        CloseFd(stdout_fd_);
    }

    if (close_error != 0) {
        return Result<void, Error>::Err(TransportError(
            ErrorCategory::Cleanup, "CloseStreams", options_.command,
            "Closing server stdin failed: " + ErrnoText(close_error)));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> StdioProcessTransport::Terminate() {
    pid_t pid = -1;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pid = pid_;
        pid_ = -1;
    }
    if (pid <= 0) {
        return Result<void, Error>::Ok();
    }

    int status = 0;
    auto reaped = [&]() {
        pid_t r = 0;
        do {
            r = ::waitpid(pid, &status, WNOHANG);
        } while (r < 0 && errno == EINTR);
        return r;
    };

    pid_t r = reaped();
    if (r == 0) {
        ::kill(pid, SIGTERM);
        const auto deadline = std::chrono::steady_clock::now() + options_.shutdown_grace;
        while ((r = reaped()) == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kReapInterval);
        }
    }
    if (r == 0) {
        LogWarn("transport", "'" + options_.command + "' (pid " + std::to_string(pid) +
                             ") ignored SIGTERM, sending SIGKILL");
        ::kill(pid, SIGKILL);
        do {
            r = ::waitpid(pid, &status, 0);
        } while (r < 0 && errno == EINTR);
    }
    if (r < 0) {
        return Result<void, Error>::Err(TransportError(
            ErrorCategory::Cleanup, "Terminate", options_.command,
            "waitpid failed: " + ErrnoText(errno)));
    }

    LogDebug("transport", "'" + options_.command + "' (pid " + std::to_string(pid) +
                          ") " + DescribeExit(status));
    return Result<void, Error>::Ok();
}

bool StdioProcessTransport::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stdin_fd_ >= 0 && !eof_ && !stop_;
}

pid_t StdioProcessTransport::Pid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

} // namespace bullvision
