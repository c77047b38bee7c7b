#pragma once

#include <fleet/client/client.h>
#include <fleet/common/context.h>
#include <fleet/common/message.h>
#include <fleet/core/types.h>

namespace fleet::client {

// Terminal handler for the four legacy calls: decode the instruction named by the
// message's call-type tag, run it on `client`, and return a fresh message with the
// same metadata and the encoded result.
//
// NotSupported for an unknown call type; SchemaMismatch if the content does not
// decode for that type.
Result<Message> handleLegacyMessage(Message& message, Context& context, Client& client);

} // namespace fleet::client
