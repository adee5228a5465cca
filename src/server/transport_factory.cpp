#include <bullvision/server/transport_factory.hpp>

#include <bullvision/transport/stdio_transport.hpp>
#include <bullvision/transport/text_codec.hpp>

namespace bullvision {

TransportFactory MakeStdioTransportFactory(std::chrono::milliseconds shutdown_grace) {
    return [shutdown_grace](const ToolServerSpec& spec)
               -> Result<std::unique_ptr<ITransport>, Error> {
        using R = Result<std::unique_ptr<ITransport>, Error>;

        auto codec = TextCodec::Create(spec.encoding);
        if (codec.IsErr()) {
            auto err = codec.Error();
            err.target = spec.name.Value();
            return R::Err(std::move(err));
        }

        StdioProcessOptions options;
        options.command = spec.command;
        options.args = spec.args;
        options.env = spec.env;
        options.shutdown_grace = shutdown_grace;
        return R::Ok(std::make_unique<StdioProcessTransport>(std::move(options),
                                                             std::move(codec).Value()));
    };
}

} // namespace bullvision
