#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include <fleet/client/client_app.h>
#include <fleet/client/node_state.h>
#include <fleet/common/task.h>
#include <fleet/state/fleet_state.h>

namespace fleet::client {

/**
 * @brief Worker loop for one registered node.
 *
 * Pulls the node's instructions from the fleet state, runs each through the
 * ClientApp with the Context of its run, and pushes the outbound message back as
 * a TaskRes answering that instruction. An instruction whose app call fails gets
 * no result; the orchestrator side observes it as a timeout.
 */
class ClientNode {
public:
    ClientNode(std::shared_ptr<state::IFleetState> state, Node node, ClientApp app,
               std::chrono::milliseconds pollInterval = std::chrono::milliseconds{100});
    ~ClientNode();

    ClientNode(const ClientNode&) = delete;
    ClientNode& operator=(const ClientNode&) = delete;

    // Handle every instruction currently queued for this node. Returns how many
    // results were pushed. Not safe to call while the background loop runs.
    Result<std::size_t> processPending();

    void start();
    void stop();
    bool running() const noexcept { return running_.load(); }

    const Node& node() const noexcept { return node_; }
    const NodeState& nodeState() const noexcept { return nodeState_; }

private:
    Result<void> handle(const TaskIns& taskIns);
    void loop();

    std::shared_ptr<state::IFleetState> state_;
    Node node_;
    ClientApp app_;
    std::chrono::milliseconds pollInterval_;
    NodeState nodeState_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    std::mutex waitMutex_;
    std::condition_variable waitCv_;
    std::thread worker_;
};

} // namespace fleet::client
