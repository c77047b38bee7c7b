#include <fleet/client/node_state.h>

#include <string>

namespace fleet::client {

void NodeState::registerContext(RunId runId) {
    contexts_.try_emplace(runId);
}

Result<Context*> NodeState::retrieveContext(RunId runId) {
    auto it = contexts_.find(runId);
    if (it == contexts_.end()) {
        return Error{ErrorCode::NotFound,
                     "no context registered for run " + std::to_string(runId)};
    }
    return &it->second;
}

void NodeState::updateContext(RunId runId, Context context) {
    contexts_.insert_or_assign(runId, std::move(context));
}

} // namespace fleet::client
