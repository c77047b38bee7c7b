#pragma once

#include <unordered_map>

#include <fleet/common/context.h>
#include <fleet/core/types.h>

namespace fleet::client {

// Per-node context store: one Context per run, kept for the lifetime of the node.
// Not synchronized; the owning node runs one call at a time.
class NodeState {
public:
    NodeState() = default;

    // Create an empty context for `runId` unless one exists.
    void registerContext(RunId runId);

    // NotFound if `runId` was never registered. The pointer stays valid until the
    // run's context is replaced or the store is destroyed.
    Result<Context*> retrieveContext(RunId runId);

    // Replace the context of `runId` (registering it if needed).
    void updateContext(RunId runId, Context context);

    bool hasContext(RunId runId) const { return contexts_.contains(runId); }
    std::size_t size() const noexcept { return contexts_.size(); }

private:
    std::unordered_map<RunId, Context> contexts_;
};

} // namespace fleet::client
