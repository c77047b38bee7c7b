#pragma once

#include <functional>
#include <vector>

#include <fleet/common/context.h>
#include <fleet/common/message.h>
#include <fleet/core/types.h>

namespace fleet::client {

// Terminal handler (or the remainder of a chain, as seen from a mod).
using ClientAppCallable = std::function<Result<Message>(Message&, Context&)>;

// Middleware stage. Receives the inbound message, the node context, and the next
// stage; may transform, observe, or skip the call to `next` (short-circuit).
using Mod = std::function<Result<Message>(Message&, Context&, const ClientAppCallable&)>;

/**
 * @brief Compose `mods` around `app` into a single callable.
 *
 * Invoking the result runs mods[0] first; each mod's `next` runs the following
 * mod, and the last mod's `next` runs `app`. Post-processing therefore unwinds in
 * reverse. Errors (returned or thrown) reach the caller unchanged.
 *
 * Fails with InvalidArgument if `app` or any element of `mods` is empty.
 */
Result<ClientAppCallable> make_ffn(ClientAppCallable app, std::vector<Mod> mods);

} // namespace fleet::client
