#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <fleet/server/driver/driver.h>
#include <fleet/state/fleet_state.h>

namespace fleet::state {

/**
 * @brief Process-local task queue serving both the orchestrator and worker nodes.
 *
 * Tasks are stored serialized, so a pushed task cannot change afterwards. A
 * result and the instruction it answers are dropped once the driver pulls the
 * result. All operations take one mutex; no operation blocks waiting for work.
 */
class InMemoryState final : public server::IDriver, public IFleetState {
public:
    InMemoryState() = default;

    InMemoryState(const InMemoryState&) = delete;
    InMemoryState& operator=(const InMemoryState&) = delete;

    RunId createRun();

    // IDriver
    Result<std::string> pushTaskIns(const TaskIns& taskIns) override;
    Result<std::vector<TaskRes>> pullTaskRes(const std::vector<std::string>& taskIds) override;
    Result<std::vector<Node>> getNodes(RunId runId) override;

    // IFleetState
    Result<Node> createNode(bool anonymous) override;
    Result<void> deleteNode(NodeId nodeId) override;
    Result<std::vector<TaskIns>> pullTaskIns(NodeId nodeId,
                                             std::optional<std::size_t> limit) override;
    Result<std::string> pushTaskRes(const TaskRes& taskRes) override;

    std::size_t numTaskIns() const;
    std::size_t numTaskRes() const;

    // Overwrite the stored bytes of the result answering `taskInsId`. False if none.
    bool replaceTaskResBytesForTest(const std::string& taskInsId, std::vector<uint8_t> bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = taskRes_.find(taskInsId);
        if (it == taskRes_.end())
            return false;
        it->second.bytes = std::move(bytes);
        return true;
    }

private:
    struct StoredTask {
        std::vector<uint8_t> bytes;
        NodeId consumer{0};
    };

    mutable std::mutex mutex_;
    std::unordered_set<RunId> runs_;
    std::unordered_map<NodeId, Node> nodes_;
    // Undelivered instruction ids per consumer, oldest first.
    std::unordered_map<NodeId, std::deque<std::string>> pending_;
    // Instructions stay until their result is pulled by the driver.
    std::unordered_map<std::string, StoredTask> taskIns_;
    // Keyed by the id of the instruction each result answers.
    std::unordered_map<std::string, StoredTask> taskRes_;
    RunId nextRunId_{1};
};

} // namespace fleet::state
