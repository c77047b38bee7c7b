#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <fleet/common/task.h>
#include <fleet/core/types.h>

namespace fleet::state {

// Worker-side view of the task queue.
class IFleetState {
public:
    virtual ~IFleetState() = default;

    virtual Result<Node> createNode(bool anonymous) = 0;
    virtual Result<void> deleteNode(NodeId nodeId) = 0;

    // Undelivered instructions addressed to `nodeId`, oldest first, at most `limit`
    // (all when unset). Each instruction is delivered once.
    virtual Result<std::vector<TaskIns>> pullTaskIns(NodeId nodeId,
                                                     std::optional<std::size_t> limit) = 0;

    // Store a result. Its ancestry must name a known instruction. Returns the
    // assigned result id.
    virtual Result<std::string> pushTaskRes(const TaskRes& taskRes) = 0;
};

} // namespace fleet::state
