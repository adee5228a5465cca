#pragma once

#include <bullvision/core/result.hpp>
#include <bullvision/server/tool_server_spec.hpp>
#include <bullvision/transport/i_transport.hpp>

#include <chrono>
#include <functional>
#include <memory>

namespace bullvision {

/// Builds the transport for one backend. Swapped out in tests.
using TransportFactory =
    std::function<Result<std::unique_ptr<ITransport>, Error>(const ToolServerSpec& spec)>;

/// Factory for StdioProcessTransport. Fails with ErrorCategory::Config when
/// the server names an unsupported encoding.
TransportFactory MakeStdioTransportFactory(std::chrono::milliseconds shutdown_grace);

} // namespace bullvision
