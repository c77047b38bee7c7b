#include <fleet/server/client_manager.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <random>
#include <set>

namespace fleet::server {

ClientManager::ClientManager(std::shared_ptr<IDriver> driver, RunId runId, ProxyOptions options)
    : driver_(std::move(driver)), runId_(runId), options_(std::move(options)) {}

Result<std::size_t> ClientManager::syncWithDriver() {
    if (!driver_) {
        return Error{ErrorCode::InvalidState, "client manager has no driver"};
    }
    auto nodes = driver_->getNodes(runId_);
    if (!nodes)
        return nodes.error();

    std::set<NodeId> current;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& node : nodes.value()) {
        current.insert(node.nodeId);
        if (proxies_.contains(node.nodeId))
            continue;
        proxies_.emplace(node.nodeId, std::make_shared<DriverClientProxy>(
                                          node.nodeId, driver_, node.anonymous, runId_, options_));
        spdlog::info("[ClientManager] node {} joined run {}", node.nodeId, runId_);
    }
    for (auto it = proxies_.begin(); it != proxies_.end();) {
        if (!current.contains(it->first)) {
            spdlog::info("[ClientManager] node {} left run {}", it->first, runId_);
            it = proxies_.erase(it);
        } else {
            ++it;
        }
    }
    return proxies_.size();
}

std::shared_ptr<DriverClientProxy> ClientManager::get(NodeId nodeId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = proxies_.find(nodeId);
    return it == proxies_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<DriverClientProxy>> ClientManager::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<DriverClientProxy>> out;
    out.reserve(proxies_.size());
    for (const auto& [id, proxy] : proxies_)
        out.push_back(proxy);
    return out;
}

std::size_t ClientManager::numAvailable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proxies_.size();
}

std::vector<std::shared_ptr<DriverClientProxy>> ClientManager::sample(std::size_t n) const {
    auto pool = all();
    std::vector<std::shared_ptr<DriverClientProxy>> out;
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::sample(pool.begin(), pool.end(), std::back_inserter(out), n, rng);
    return out;
}

} // namespace fleet::server
