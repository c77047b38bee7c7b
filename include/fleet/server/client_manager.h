#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <fleet/server/driver/driver.h>
#include <fleet/server/driver/driver_client_proxy.h>

namespace fleet::server {

// Keeps one proxy per node currently available to a run.
class ClientManager {
public:
    ClientManager(std::shared_ptr<IDriver> driver, RunId runId, ProxyOptions options = {});

    // Fetch the node list from the driver; create proxies for new nodes and drop
    // proxies whose node disappeared. Returns the number of available proxies.
    Result<std::size_t> syncWithDriver();

    std::shared_ptr<DriverClientProxy> get(NodeId nodeId) const;
    std::vector<std::shared_ptr<DriverClientProxy>> all() const;
    std::size_t numAvailable() const;

    // Up to `n` distinct proxies chosen uniformly at random.
    std::vector<std::shared_ptr<DriverClientProxy>> sample(std::size_t n) const;

private:
    std::shared_ptr<IDriver> driver_;
    RunId runId_;
    ProxyOptions options_;

    mutable std::mutex mutex_;
    std::map<NodeId, std::shared_ptr<DriverClientProxy>> proxies_;
};

} // namespace fleet::server
