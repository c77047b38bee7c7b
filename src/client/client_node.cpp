#include <fleet/client/client_node.h>

#include <spdlog/spdlog.h>

namespace fleet::client {

ClientNode::ClientNode(std::shared_ptr<state::IFleetState> state, Node node, ClientApp app,
                       std::chrono::milliseconds pollInterval)
    : state_(std::move(state)), node_(node), app_(std::move(app)), pollInterval_(pollInterval) {
    if (pollInterval_.count() <= 0) {
        pollInterval_ = std::chrono::milliseconds{100};
    }
}

ClientNode::~ClientNode() {
    stop();
}

Result<std::size_t> ClientNode::processPending() {
    if (!state_) {
        return Error{ErrorCode::InvalidState, "node has no fleet state"};
    }

    auto pulled = state_->pullTaskIns(node_.nodeId, std::nullopt);
    if (!pulled)
        return pulled.error();

    std::size_t pushed = 0;
    for (const auto& taskIns : pulled.value()) {
        auto handled = handle(taskIns);
        if (!handled) {
            spdlog::warn("[ClientNode] node {}: task {} ({}) failed: {}", node_.nodeId,
                         taskIns.taskId, taskIns.task.taskType, handled.error().message);
            continue;
        }
        ++pushed;
    }
    return pushed;
}

Result<void> ClientNode::handle(const TaskIns& taskIns) {
    const RunId runId = taskIns.runId;
    nodeState_.registerContext(runId);
    auto context = nodeState_.retrieveContext(runId);
    if (!context)
        return context.error();

    Message message(Metadata(runId, taskIns.taskId, taskIns.groupId, taskIns.task.ttl,
                             taskIns.task.taskType),
                    taskIns.task.recordset);

    auto out = app_(message, *context.value());
    if (!out)
        return out.error();

    TaskRes taskRes;
    taskRes.groupId = taskIns.groupId;
    taskRes.runId = runId;
    taskRes.task.producer = node_;
    taskRes.task.consumer = Node{0, true};
    taskRes.task.ttl = taskIns.task.ttl;
    taskRes.task.ancestry = {taskIns.taskId};
    taskRes.task.taskType = taskIns.task.taskType;
    taskRes.task.recordset = std::move(out.value().content());

    auto resId = state_->pushTaskRes(taskRes);
    if (!resId)
        return resId.error();

    spdlog::debug("[ClientNode] node {}: answered task {} with {}", node_.nodeId, taskIns.taskId,
                  resId.value());
    return Result<void>();
}

void ClientNode::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true))
        return;
    stopRequested_.store(false);
    worker_ = std::thread([this] { loop(); });
    spdlog::info("[ClientNode] node {} started", node_.nodeId);
}

void ClientNode::stop() {
    if (!running_.load())
        return;
    {
        std::lock_guard<std::mutex> lock(waitMutex_);
        stopRequested_.store(true);
    }
    waitCv_.notify_all();
    if (worker_.joinable())
        worker_.join();
    running_.store(false);
    spdlog::info("[ClientNode] node {} stopped", node_.nodeId);
}

void ClientNode::loop() {
    while (!stopRequested_.load()) {
        auto processed = processPending();
        if (!processed) {
            spdlog::warn("[ClientNode] node {}: pull failed: {}", node_.nodeId,
                         processed.error().message);
        }

        std::unique_lock<std::mutex> lock(waitMutex_);
        waitCv_.wait_for(lock, pollInterval_, [this] { return stopRequested_.load(); });
    }
}

} // namespace fleet::client
