#include <fleet/client/client_app.h>
#include <fleet/client/message_handler.h>

namespace fleet::client {

Result<ClientApp> ClientApp::create(ClientFn clientFn, std::vector<Mod> mods) {
    if (!clientFn) {
        return Error{ErrorCode::InvalidArgument, "client factory is empty"};
    }

    ClientAppCallable terminal = [fn = std::move(clientFn)](Message& message,
                                                            Context& context) -> Result<Message> {
        auto client = fn(context);
        if (!client) {
            return Error{ErrorCode::InvalidState, "client factory returned no client"};
        }
        return handleLegacyMessage(message, context, *client);
    };

    auto handler = make_ffn(std::move(terminal), std::move(mods));
    if (!handler)
        return handler.error();
    return ClientApp{std::move(handler).value()};
}

} // namespace fleet::client
