#pragma once

#include <string>
#include <vector>

#include <fleet/common/task.h>
#include <fleet/core/types.h>

namespace fleet::server {

/**
 * @brief Orchestrator-side view of the task queue.
 *
 * Implementations must tolerate concurrent use from many proxies.
 */
class IDriver {
public:
    virtual ~IDriver() = default;

    // Enqueue an instruction for taskIns.task.consumer. Returns the assigned task id.
    // UnknownNode if the consumer is not registered.
    virtual Result<std::string> pushTaskIns(const TaskIns& taskIns) = 0;

    // Results answering any of `taskIds` that are ready now. Never blocks; each
    // result is handed out once.
    virtual Result<std::vector<TaskRes>> pullTaskRes(const std::vector<std::string>& taskIds) = 0;

    // Nodes currently available to `runId`.
    virtual Result<std::vector<Node>> getNodes(RunId runId) = 0;
};

} // namespace fleet::server
