#include <fleet/client/mod.h>

#include <cstddef>
#include <memory>
#include <string>
#include <utility>

namespace fleet::client {

namespace {

// Index-driven interpreter over the mod list. Delegating from stage i builds the
// `next` callable for stage i + 1; stage mods.size() is the terminal handler.
class ModChain : public std::enable_shared_from_this<ModChain> {
public:
    ModChain(ClientAppCallable app, std::vector<Mod> mods)
        : app_(std::move(app)), mods_(std::move(mods)) {}

    Result<Message> invoke(std::size_t index, Message& message, Context& context) const {
        if (index == mods_.size()) {
            return app_(message, context);
        }
        ClientAppCallable next = [self = shared_from_this(), index](Message& m, Context& c) {
            return self->invoke(index + 1, m, c);
        };
        return mods_[index](message, context, next);
    }

private:
    ClientAppCallable app_;
    std::vector<Mod> mods_;
};

} // namespace

Result<ClientAppCallable> make_ffn(ClientAppCallable app, std::vector<Mod> mods) {
    if (!app) {
        return Error{ErrorCode::InvalidArgument, "terminal handler is empty"};
    }
    for (std::size_t i = 0; i < mods.size(); ++i) {
        if (!mods[i]) {
            return Error{ErrorCode::InvalidArgument, "mod at position " + std::to_string(i) +
                                                         " is empty"};
        }
    }

    auto chain = std::make_shared<ModChain>(std::move(app), std::move(mods));
    return ClientAppCallable{[chain](Message& message, Context& context) {
        return chain->invoke(0, message, context);
    }};
}

} // namespace fleet::client
