#pragma once

#include <string>
#include <vector>

#include <fleet/common/record_set.h>
#include <fleet/core/types.h>

namespace fleet {

struct Node {
    NodeId nodeId{0};
    bool anonymous{false};

    bool operator==(const Node&) const = default;
};

// Queue-transport envelope body shared by instructions and results.
struct Task {
    Node producer;
    Node consumer;
    std::string createdAt;
    std::string deliveredAt;
    std::string ttl;
    // For a TaskRes, the first entry is the id of the TaskIns it answers.
    std::vector<std::string> ancestry;
    std::string taskType;
    RecordSet recordset;

    bool operator==(const Task&) const = default;
};

// Instruction, orchestrator to node.
struct TaskIns {
    std::string taskId;
    std::string groupId;
    RunId runId{0};
    Task task;

    bool operator==(const TaskIns&) const = default;
};

// Result, node to orchestrator.
struct TaskRes {
    std::string taskId;
    std::string groupId;
    RunId runId{0};
    Task task;

    bool operator==(const TaskRes&) const = default;

    // True when this result answers the instruction `taskInsId` of run `run`.
    bool answers(const std::string& taskInsId, RunId run) const {
        return runId == run && !task.ancestry.empty() && task.ancestry.front() == taskInsId;
    }
};

} // namespace fleet
