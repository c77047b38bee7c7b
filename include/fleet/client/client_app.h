#pragma once

#include <functional>
#include <memory>
#include <vector>

#include <fleet/client/client.h>
#include <fleet/client/mod.h>
#include <fleet/common/context.h>
#include <fleet/common/message.h>
#include <fleet/core/types.h>

namespace fleet::client {

/**
 * @brief A node's application: a client factory wrapped in a mod chain.
 *
 * Each call obtains a Client from the factory and runs the legacy message handler
 * on it, with `mods` applied around that handler in list order.
 */
class ClientApp {
public:
    using ClientFn = std::function<std::shared_ptr<Client>(Context&)>;

    // InvalidArgument if `clientFn` or any mod is empty.
    static Result<ClientApp> create(ClientFn clientFn, std::vector<Mod> mods = {});

    Result<Message> operator()(Message& message, Context& context) const {
        return handler_(message, context);
    }

private:
    explicit ClientApp(ClientAppCallable handler) : handler_(std::move(handler)) {}

    ClientAppCallable handler_;
};

} // namespace fleet::client
