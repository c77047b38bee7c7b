#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <fleet/common/recordset_compat.h>
#include <fleet/common/task.h>
#include <fleet/common/typing.h>
#include <fleet/core/types.h>
#include <fleet/server/driver/driver.h>
#include <fleet/server/driver/response_of.hpp>

namespace fleet::server {

struct ProxyOptions {
    std::chrono::milliseconds pollInterval{100}; // pause between two pulls
    std::string groupId;                         // stamped on every TaskIns
    std::string ttl{"3600"};
};

// Defaults overlaid with config file `[driver]` keys, then FLEET_POLL_INTERVAL_MS.
// An empty path resolves the standard config location.
ProxyOptions resolveProxyOptions(const std::filesystem::path& configPath = {});

/**
 * @brief Synchronous call interface for one remote node, backed by push-and-poll.
 *
 * Each call pushes exactly one TaskIns and polls for the TaskRes that answers it,
 * pausing `pollInterval` between pulls. Results that do not answer the pushed task
 * are ignored. With a timeout set, the call fails with Timeout once that much time
 * has passed without a match; with no timeout it polls until a match arrives.
 * A node whose app fails pushes no result at all, so a call without a timeout to
 * such a node never returns. Orchestration code should always pass a bound.
 *
 * A non-Ok status from the node is part of the returned response. Errors are
 * Timeout, SchemaMismatch (result does not decode for the call type), UnknownNode,
 * and whatever the driver reports for a failed push or pull.
 *
 * Holds no state across calls beyond the node and run it is bound to.
 */
class DriverClientProxy {
public:
    using Timeout = std::optional<std::chrono::milliseconds>;

    DriverClientProxy(NodeId nodeId, std::shared_ptr<IDriver> driver, bool anonymous, RunId runId,
                      ProxyOptions options = {});

    Result<GetPropertiesRes> getProperties(const GetPropertiesIns& ins, Timeout timeout) const;
    Result<GetParametersRes> getParameters(const GetParametersIns& ins, Timeout timeout) const;
    Result<FitRes> fit(const FitIns& ins, Timeout timeout) const;
    Result<EvaluateRes> evaluate(const EvaluateIns& ins, Timeout timeout) const;

    // Typed call on the caller's executor.
    template <class Ins>
    boost::asio::awaitable<Result<ResponseOfT<Ins>>> asyncCall(Ins ins, Timeout timeout) const;

    // Typed call driven to completion on a private io_context.
    template <class Ins> Result<ResponseOfT<Ins>> call(const Ins& ins, Timeout timeout) const;

    NodeId nodeId() const noexcept { return nodeId_; }
    RunId runId() const noexcept { return runId_; }
    bool anonymous() const noexcept { return anonymous_; }
    const ProxyOptions& options() const noexcept { return options_; }

private:
    Result<std::string> push(TaskType type, RecordSet recordset) const;
    boost::asio::awaitable<Result<TaskRes>> awaitResult(std::string taskId,
                                                        Timeout timeout) const;

    template <class Res> static Result<Res> decodeResult(const TaskRes& taskRes);

    NodeId nodeId_;
    std::shared_ptr<IDriver> driver_;
    bool anonymous_;
    RunId runId_;
    ProxyOptions options_;
};

template <class Res> Result<Res> DriverClientProxy::decodeResult(const TaskRes& taskRes) {
    constexpr auto expected = compat::taskTypeOf<Res>();
    if (taskRes.task.taskType != to_string(expected)) {
        return Error{ErrorCode::SchemaMismatch, "expected a '" + std::string(to_string(expected)) +
                                                    "' result, got '" + taskRes.task.taskType +
                                                    "'"};
    }
    return compat::fromRecordSet<Res>(taskRes.task.recordset);
}

template <class Ins>
boost::asio::awaitable<Result<ResponseOfT<Ins>>> DriverClientProxy::asyncCall(Ins ins,
                                                                             Timeout timeout) const {
    auto taskId = push(compat::taskTypeOf<Ins>(), compat::toRecordSet(ins));
    if (!taskId)
        co_return taskId.error();

    auto taskRes = co_await awaitResult(std::move(taskId).value(), timeout);
    if (!taskRes)
        co_return taskRes.error();

    co_return decodeResult<ResponseOfT<Ins>>(taskRes.value());
}

template <class Ins>
Result<ResponseOfT<Ins>> DriverClientProxy::call(const Ins& ins, Timeout timeout) const {
    using Res = ResponseOfT<Ins>;
    boost::asio::io_context io;
    std::optional<Result<Res>> out;
    // Result<T> has no default state, so the coroutine hands it back through `out`.
    auto done = boost::asio::co_spawn(
        io,
        [&]() -> boost::asio::awaitable<void> { out.emplace(co_await asyncCall(ins, timeout)); },
        boost::asio::use_future);
    io.run();
    done.get();
    if (!out)
        return Error{ErrorCode::InternalError, "call completed without a result"};
    return std::move(*out);
}

} // namespace fleet::server
