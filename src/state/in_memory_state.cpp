#include <fleet/state/in_memory_state.h>

#include <fleet/common/serde.h>
#include <fleet/core/uuid.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fleet::state {

namespace {

// ISO 8601 UTC with microseconds, e.g. 2026-10-01T14:30:00.123456Z
std::string nowIso() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto micros =
        std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() %
        1000000;

    std::tm tm_utc;
#ifdef _WIN32
    gmtime_s(&tm_utc, &time_t_now);
#else
    gmtime_r(&time_t_now, &tm_utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(6)
        << micros << 'Z';
    return oss.str();
}

} // namespace

RunId InMemoryState::createRun() {
    std::lock_guard<std::mutex> lock(mutex_);
    RunId runId = nextRunId_++;
    runs_.insert(runId);
    spdlog::debug("[InMemoryState] created run {}", runId);
    return runId;
}

Result<std::string> InMemoryState::pushTaskIns(const TaskIns& taskIns) {
    if (!taskIns.taskId.empty()) {
        return Error{ErrorCode::InvalidArgument, "TaskIns must not carry a task id before push"};
    }
    if (taskIns.task.taskType.empty()) {
        return Error{ErrorCode::InvalidArgument, "TaskIns has no call type"};
    }

    TaskIns stored = taskIns;
    stored.taskId = core::generateUUID();
    stored.task.createdAt = nowIso();

    auto bytes = serde::encodeTaskIns(stored);
    if (!bytes)
        return bytes.error();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!runs_.contains(stored.runId)) {
        return Error{ErrorCode::InvalidArgument,
                     "unknown run " + std::to_string(stored.runId)};
    }
    const NodeId consumer = stored.task.consumer.nodeId;
    if (!nodes_.contains(consumer)) {
        spdlog::warn("[InMemoryState] rejecting TaskIns for unknown node {}", consumer);
        return Error{ErrorCode::UnknownNode, "node " + std::to_string(consumer) +
                                                 " is not registered"};
    }

    taskIns_.emplace(stored.taskId, StoredTask{std::move(bytes).value(), consumer});
    pending_[consumer].push_back(stored.taskId);
    spdlog::debug("[InMemoryState] queued TaskIns {} ({}) for node {}", stored.taskId,
                  stored.task.taskType, consumer);
    return stored.taskId;
}

Result<std::vector<TaskRes>> InMemoryState::pullTaskRes(const std::vector<std::string>& taskIds) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Decode the whole batch before removing anything, so a failure loses nothing.
    std::vector<std::string> answered;
    std::vector<TaskRes> out;
    for (const auto& id : taskIds) {
        auto it = taskRes_.find(id);
        if (it == taskRes_.end() ||
            std::find(answered.begin(), answered.end(), id) != answered.end())
            continue;
        auto res = serde::decodeTaskRes(it->second.bytes);
        if (!res) {
            spdlog::warn("[InMemoryState] TaskRes for TaskIns {} is unreadable: {}", id,
                         res.error().message);
            return res.error();
        }
        res.value().task.deliveredAt = nowIso();
        out.push_back(std::move(res).value());
        answered.push_back(id);
    }

    for (const auto& id : answered) {
        taskRes_.erase(id);
        taskIns_.erase(id);
    }
    if (!answered.empty())
        spdlog::debug("[InMemoryState] delivered {} TaskRes", answered.size());
    return out;
}

Result<std::vector<Node>> InMemoryState::getNodes(RunId runId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Node> out;
    if (!runs_.contains(runId))
        return out;
    out.reserve(nodes_.size());
    for (const auto& [id, node] : nodes_)
        out.push_back(node);
    return out;
}

Result<Node> InMemoryState::createNode(bool anonymous) {
    std::lock_guard<std::mutex> lock(mutex_);
    NodeId id = core::generateNodeId();
    while (nodes_.contains(id))
        id = core::generateNodeId();
    Node node{id, anonymous};
    nodes_.emplace(id, node);
    spdlog::debug("[InMemoryState] registered node {}", id);
    return node;
}

Result<void> InMemoryState::deleteNode(NodeId nodeId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (nodes_.erase(nodeId) == 0) {
        return Error{ErrorCode::UnknownNode, "node " + std::to_string(nodeId) +
                                                 " is not registered"};
    }
    if (auto it = pending_.find(nodeId); it != pending_.end()) {
        for (const auto& id : it->second)
            taskIns_.erase(id);
        pending_.erase(it);
    }
    spdlog::debug("[InMemoryState] removed node {}", nodeId);
    return Result<void>();
}

Result<std::vector<TaskIns>> InMemoryState::pullTaskIns(NodeId nodeId,
                                                        std::optional<std::size_t> limit) {
    if (limit && *limit == 0) {
        return Error{ErrorCode::InvalidArgument, "limit must be positive"};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!nodes_.contains(nodeId)) {
        return Error{ErrorCode::UnknownNode, "node " + std::to_string(nodeId) +
                                                 " is not registered"};
    }

    std::vector<TaskIns> out;
    auto it = pending_.find(nodeId);
    if (it == pending_.end())
        return out;

    auto& queue = it->second;
    const std::size_t count = limit ? std::min(*limit, queue.size()) : queue.size();
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto ins = serde::decodeTaskIns(taskIns_.at(queue[i]).bytes);
        if (!ins)
            return ins.error();
        ins.value().task.deliveredAt = nowIso();
        out.push_back(std::move(ins).value());
    }
    queue.erase(queue.begin(), queue.begin() + static_cast<std::ptrdiff_t>(count));
    if (queue.empty())
        pending_.erase(it);
    return out;
}

Result<std::string> InMemoryState::pushTaskRes(const TaskRes& taskRes) {
    if (taskRes.task.ancestry.empty()) {
        return Error{ErrorCode::InvalidArgument, "TaskRes has no ancestry"};
    }

    TaskRes stored = taskRes;
    stored.taskId = core::generateUUID();
    stored.task.createdAt = nowIso();

    auto bytes = serde::encodeTaskRes(stored);
    if (!bytes)
        return bytes.error();

    const std::string& parent = stored.task.ancestry.front();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!taskIns_.contains(parent)) {
        return Error{ErrorCode::NotFound, "TaskRes answers unknown TaskIns " + parent};
    }
    if (taskRes_.contains(parent)) {
        return Error{ErrorCode::InvalidState, "TaskIns " + parent + " already has a result"};
    }
    taskRes_.emplace(parent, StoredTask{std::move(bytes).value(), stored.task.producer.nodeId});
    spdlog::debug("[InMemoryState] stored TaskRes {} for TaskIns {}", stored.taskId, parent);
    return stored.taskId;
}

std::size_t InMemoryState::numTaskIns() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return taskIns_.size();
}

std::size_t InMemoryState::numTaskRes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return taskRes_.size();
}

} // namespace fleet::state
