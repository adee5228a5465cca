#pragma once

#include <bullvision/transport/i_transport.hpp>
#include <bullvision/transport/text_codec.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>
#include <vector>

namespace bullvision {

// ---------------------------------------------------------------------------
// StdioProcessOptions — what to launch and how to talk to it.
// ---------------------------------------------------------------------------
struct StdioProcessOptions {
    std::string command;                      // resolved via PATH
    std::vector<std::string> args;
    std::map<std::string, std::string> env;   // overrides on top of ours
    std::chrono::milliseconds shutdown_grace{3000};
    std::size_t max_line_bytes = 16 * 1024 * 1024;
};

// ---------------------------------------------------------------------------
// StdioProcessTransport — ITransport over a child process's stdin/stdout.
//
// The child's stderr is inherited. A dedicated reader thread polls the
// child's stdout and hands complete lines to the LineHandler.
// ---------------------------------------------------------------------------
class StdioProcessTransport : public ITransport {
public:
    StdioProcessTransport(StdioProcessOptions options, TextCodec codec);
    ~StdioProcessTransport() override;

    [[nodiscard]] Result<void, Error> Open(LineHandler on_line,
                                           ClosedHandler on_closed) override;
    [[nodiscard]] Result<void, Error> Send(std::string_view line) override;
    [[nodiscard]] Result<void, Error> CloseStreams() override;
    [[nodiscard]] Result<void, Error> Terminate() override;
    [[nodiscard]] bool IsOpen() const override;

    /// Child pid, or -1 when no child is running.
    [[nodiscard]] pid_t Pid() const;

private:
    void ReadLoop();
    void DeliverLines(std::string& buffer);

    StdioProcessOptions options_;
    TextCodec codec_;
    LineHandler on_line_;
    ClosedHandler on_closed_;

    mutable std::mutex mutex_;    // guards pid_, stdin_fd_, stdout_fd_
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    bool opened_ = false;

    std::atomic<bool> stop_{false};
    std::atomic<bool> eof_{false};
    std::thread reader_;
};

} // namespace bullvision
