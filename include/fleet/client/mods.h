#pragma once

#include <fleet/client/mod.h>

namespace fleet::client::mods {

inline constexpr const char* kParametersSizeRecord = "parameters_size";

// Logs the inbound content size at debug level, then delegates.
Result<Message> messageSizeMod(Message& message, Context& context, const ClientAppCallable& next);

// Delegates, then records the number of arrays and bytes found in the outbound
// message's parameter records into a metrics record named "parameters_size".
Result<Message> parametersSizeMod(Message& message, Context& context,
                                  const ClientAppCallable& next);

} // namespace fleet::client::mods
