#include <fleet/server/driver/driver_client_proxy.h>

#include <fleet/config/config_helpers.h>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>

namespace fleet::server {

ProxyOptions resolveProxyOptions(const std::filesystem::path& configPath) {
    ProxyOptions options;

    const auto path = configPath.empty() ? config::get_config_path() : configPath;
    if (auto v = config::parse_config_value(path, "driver", "poll_interval_ms"); !v.empty()) {
        if (auto ms = config::parse_ms(v); ms && ms->count() > 0)
            options.pollInterval = *ms;
        else
            spdlog::warn("[DriverClientProxy] ignoring invalid driver.poll_interval_ms '{}'", v);
    }
    if (auto v = config::parse_config_value(path, "driver", "group_id"); !v.empty())
        options.groupId = v;
    if (auto v = config::parse_config_value(path, "driver", "ttl"); !v.empty())
        options.ttl = v;

    if (const char* env = std::getenv("FLEET_POLL_INTERVAL_MS"); env && *env) {
        if (auto ms = config::parse_ms(env); ms && ms->count() > 0)
            options.pollInterval = *ms;
        else
            spdlog::warn("[DriverClientProxy] ignoring invalid FLEET_POLL_INTERVAL_MS '{}'", env);
    }
    return options;
}

DriverClientProxy::DriverClientProxy(NodeId nodeId, std::shared_ptr<IDriver> driver,
                                     bool anonymous, RunId runId, ProxyOptions options)
    : nodeId_(nodeId), driver_(std::move(driver)), anonymous_(anonymous), runId_(runId),
      options_(std::move(options)) {
    if (options_.pollInterval.count() <= 0) {
        options_.pollInterval = ProxyOptions{}.pollInterval;
    }
}

Result<GetPropertiesRes> DriverClientProxy::getProperties(const GetPropertiesIns& ins,
                                                          Timeout timeout) const {
    return call(ins, timeout);
}

Result<GetParametersRes> DriverClientProxy::getParameters(const GetParametersIns& ins,
                                                          Timeout timeout) const {
    return call(ins, timeout);
}

Result<FitRes> DriverClientProxy::fit(const FitIns& ins, Timeout timeout) const {
    return call(ins, timeout);
}

Result<EvaluateRes> DriverClientProxy::evaluate(const EvaluateIns& ins, Timeout timeout) const {
    return call(ins, timeout);
}

Result<std::string> DriverClientProxy::push(TaskType type, RecordSet recordset) const {
    if (!driver_) {
        return Error{ErrorCode::InvalidState, "proxy has no driver"};
    }

    TaskIns taskIns;
    taskIns.groupId = options_.groupId;
    taskIns.runId = runId_;
    taskIns.task.producer = Node{0, true};
    taskIns.task.consumer = Node{nodeId_, anonymous_};
    taskIns.task.ttl = options_.ttl;
    taskIns.task.taskType = std::string(to_string(type));
    taskIns.task.recordset = std::move(recordset);

    auto taskId = driver_->pushTaskIns(taskIns);
    if (!taskId) {
        spdlog::debug("[DriverClientProxy] push to node {} failed: {}", nodeId_,
                      taskId.error().message);
        return taskId.error();
    }
    if (taskId.value().empty()) {
        return Error{ErrorCode::InvalidData, "driver returned an empty task id"};
    }
    spdlog::debug("[DriverClientProxy] pushed {} task {} to node {}", to_string(type),
                  taskId.value(), nodeId_);
    return taskId;
}

boost::asio::awaitable<Result<TaskRes>> DriverClientProxy::awaitResult(std::string taskId,
                                                                       Timeout timeout) const {
    const auto start = std::chrono::steady_clock::now();
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);

    for (;;) {
        auto pulled = driver_->pullTaskRes({taskId});
        if (!pulled)
            co_return pulled.error();

        for (auto& taskRes : pulled.value()) {
            if (taskRes.answers(taskId, runId_)) {
                co_return std::move(taskRes);
            }
            spdlog::debug("[DriverClientProxy] node {}: ignoring result {} (run {}) while "
                          "waiting for {}",
                          nodeId_, taskRes.taskId, taskRes.runId, taskId);
        }

        auto pause = options_.pollInterval;
        if (timeout) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            if (elapsed >= *timeout) {
                spdlog::debug("[DriverClientProxy] node {}: task {} timed out after {} ms",
                              nodeId_, taskId, elapsed.count());
                co_return Error{ErrorCode::Timeout, "no result for task " + taskId + " within " +
                                                        std::to_string(timeout->count()) + " ms"};
            }
            pause = std::min(pause, *timeout - elapsed);
        }

        timer.expires_after(pause);
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
}

} // namespace fleet::server
