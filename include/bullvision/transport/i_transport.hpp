#pragma once

#include <bullvision/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace bullvision {

/// Invoked once per complete inbound line (UTF-8, newline stripped).
using LineHandler = std::function<void(const std::string& line)>;

/// Invoked at most once when the inbound stream ends without a local close.
using ClosedHandler = std::function<void(const std::string& reason)>;

// ---------------------------------------------------------------------------
// ITransport — abstract line-oriented duplex channel to one tool server.
//
// Handlers run on the transport's reader thread. They must not call
// CloseStreams() or Terminate() on the transport that invokes them.
// ---------------------------------------------------------------------------
class ITransport {
public:
    ITransport() = default;
    virtual ~ITransport() = default;

    // Non-copyable, non-movable (polymorphic base).
    ITransport(const ITransport&) = delete;
    ITransport& operator=(const ITransport&) = delete;
    ITransport(ITransport&&) = delete;
    ITransport& operator=(ITransport&&) = delete;

    /// Launch the peer and start delivering lines. Fails with
    /// ErrorCategory::Connection when the peer cannot be started.
    [[nodiscard]] virtual Result<void, Error> Open(LineHandler on_line,
                                                   ClosedHandler on_closed) = 0;

    /// Write one message line; the transport appends the newline.
    [[nodiscard]] virtual Result<void, Error> Send(std::string_view line) = 0;

    /// Close both streams and stop the reader. Idempotent.
    [[nodiscard]] virtual Result<void, Error> CloseStreams() = 0;

    /// Stop the peer process (graceful signal, then forced) and reap it.
    /// Idempotent.
    [[nodiscard]] virtual Result<void, Error> Terminate() = 0;

    [[nodiscard]] virtual bool IsOpen() const = 0;
};

} // namespace bullvision
