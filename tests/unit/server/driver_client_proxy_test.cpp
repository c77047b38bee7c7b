#include <gtest/gtest.h>

#include <fleet/common/recordset_compat.h>
#include <fleet/server/driver/driver_client_proxy.h>

#include "common/test_helpers.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <deque>
#include <optional>

namespace fleet::server::test {

using namespace std::chrono_literals;
using fleet::tests::bytes;
using fleet::tests::makeParameters;

namespace {

constexpr const char* kPushedId = "19341fd7-62e1-4eb4-beb4-9876d3acda32";
constexpr const char* kResultId = "554bd3c8-8474-4b93-a7db-c7bec1bf0012";

// Scripted queue collaborator. Each pull pops one scripted batch; once the script
// runs out every pull returns `steady`.
class FakeDriver : public IDriver {
public:
    Result<std::string> pushTaskIns(const TaskIns& taskIns) override {
        if (pushError)
            return *pushError;
        pushed.push_back(taskIns);
        return nextTaskId;
    }

    Result<std::vector<TaskRes>> pullTaskRes(const std::vector<std::string>& taskIds) override {
        ++pulls;
        lastPullIds = taskIds;
        if (pullError)
            return *pullError;
        if (!scripted.empty()) {
            auto batch = std::move(scripted.front());
            scripted.pop_front();
            return batch;
        }
        return steady;
    }

    Result<std::vector<Node>> getNodes(RunId) override { return nodes; }

    std::string nextTaskId{kPushedId};
    std::optional<Error> pushError;
    std::optional<Error> pullError;
    std::deque<std::vector<TaskRes>> scripted;
    std::vector<TaskRes> steady;
    std::vector<Node> nodes{Node{1, false}};

    std::vector<TaskIns> pushed;
    std::vector<std::string> lastPullIds;
    int pulls = 0;
};

template <typename Res>
TaskRes makeTaskRes(const Res& res, std::string answers = kPushedId, RunId runId = 0) {
    TaskRes taskRes;
    taskRes.taskId = kResultId;
    taskRes.runId = runId;
    taskRes.task.producer = Node{1, false};
    taskRes.task.consumer = Node{0, true};
    taskRes.task.ancestry = {std::move(answers)};
    taskRes.task.taskType = std::string(to_string(compat::taskTypeOf<Res>()));
    taskRes.task.recordset = compat::toRecordSet(res);
    return taskRes;
}

const Status kOk{Code::Ok, "OK"};

} // namespace

class DriverClientProxyTest : public ::testing::Test {
protected:
    void SetUp() override {
        driver = std::make_shared<FakeDriver>();
        ProxyOptions options;
        options.pollInterval = 5ms;
        proxy = std::make_unique<DriverClientProxy>(1, driver, true, 0, options);
    }

    std::shared_ptr<FakeDriver> driver;
    std::unique_ptr<DriverClientProxy> proxy;
};

TEST_F(DriverClientProxyTest, GetProperties) {
    driver->scripted.push_back(
        {makeTaskRes(GetPropertiesRes{kOk, Properties{{"tensor_type",
                                                       std::string("numpy.ndarray")}}})});

    GetPropertiesIns ins{Config{{"tensor_type", std::string("str")}}};
    auto value = proxy->getProperties(ins, std::nullopt);

    ASSERT_TRUE(value) << value.error().message;
    EXPECT_EQ(std::get<std::string>(value.value().properties.at("tensor_type")), "numpy.ndarray");

    ASSERT_EQ(driver->pushed.size(), 1u);
    const auto& pushed = driver->pushed.front();
    EXPECT_TRUE(pushed.taskId.empty());
    EXPECT_EQ(pushed.runId, 0);
    EXPECT_EQ(pushed.task.taskType, "get-properties");
    EXPECT_EQ(pushed.task.producer, (Node{0, true}));
    EXPECT_EQ(pushed.task.consumer, (Node{1, true}));
    auto sent = compat::fromRecordSet<GetPropertiesIns>(pushed.task.recordset);
    ASSERT_TRUE(sent);
    EXPECT_EQ(sent.value(), ins);
    EXPECT_EQ(driver->lastPullIds, std::vector<std::string>{kPushedId});
}

TEST_F(DriverClientProxyTest, GetParameters) {
    driver->scripted.push_back(
        {makeTaskRes(GetParametersRes{kOk, makeParameters({"abc"}, "np")})});

    auto value = proxy->getParameters(GetParametersIns{}, std::nullopt);
    ASSERT_TRUE(value);
    ASSERT_EQ(value.value().parameters.tensors.size(), 1u);
    EXPECT_EQ(value.value().parameters.tensors[0], bytes("abc"));
}

TEST_F(DriverClientProxyTest, Fit) {
    FitRes res;
    res.status = kOk;
    res.parameters = makeParameters({"abc"}, "np");
    res.numExamples = 10;
    driver->scripted.push_back({makeTaskRes(res)});

    FitIns ins{makeParameters({"ones"}), Config{}};
    auto value = proxy->fit(ins, std::nullopt);
    ASSERT_TRUE(value);
    EXPECT_EQ(value.value().parameters.tensorType, "np");
    EXPECT_EQ(value.value().parameters.tensors[0], bytes("abc"));
    EXPECT_EQ(value.value().numExamples, 10);
    EXPECT_EQ(driver->pushed.front().task.taskType, "fit");
}

TEST_F(DriverClientProxyTest, Evaluate) {
    driver->scripted.push_back({makeTaskRes(EvaluateRes{kOk, 0.0, 0, {}})});

    EvaluateIns ins{Parameters{{}, "np"}, Config{}};
    auto value = proxy->evaluate(ins, std::nullopt);
    ASSERT_TRUE(value);
    EXPECT_EQ(value.value().loss, 0.0);
    EXPECT_EQ(value.value().numExamples, 0);
}

TEST_F(DriverClientProxyTest, IgnoresResultsForOtherTasks) {
    driver->scripted.push_back({makeTaskRes(EvaluateRes{kOk, 9.0, 1, {}}, "someone-else")});
    driver->scripted.push_back({});
    driver->scripted.push_back({makeTaskRes(EvaluateRes{kOk, 0.5, 3, {}}, "someone-else"),
                                makeTaskRes(EvaluateRes{kOk, 1.5, 4, {}})});

    auto value = proxy->evaluate(EvaluateIns{}, 5s);
    ASSERT_TRUE(value) << value.error().message;
    EXPECT_EQ(value.value().loss, 1.5);
    EXPECT_EQ(value.value().numExamples, 4);
    EXPECT_EQ(driver->pulls, 3);
}

TEST_F(DriverClientProxyTest, IgnoresResultsFromOtherRuns) {
    driver->scripted.push_back({makeTaskRes(EvaluateRes{kOk, 9.0, 1, {}}, kPushedId, 99)});
    driver->scripted.push_back({makeTaskRes(EvaluateRes{kOk, 2.0, 1, {}})});

    auto value = proxy->evaluate(EvaluateIns{}, 5s);
    ASSERT_TRUE(value);
    EXPECT_EQ(value.value().loss, 2.0);
    EXPECT_EQ(driver->pulls, 2);
}

TEST_F(DriverClientProxyTest, TimesOutNotBeforeBound) {
    const auto bound = 60ms;
    const auto start = std::chrono::steady_clock::now();
    auto value = proxy->fit(FitIns{}, bound);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(value);
    EXPECT_EQ(value.error().code, ErrorCode::Timeout);
    EXPECT_GE(elapsed, bound);
    EXPECT_GT(driver->pulls, 1);
}

TEST_F(DriverClientProxyTest, ZeroTimeoutPollsOnce) {
    auto value = proxy->getProperties(GetPropertiesIns{}, 0ms);
    ASSERT_FALSE(value);
    EXPECT_EQ(value.error().code, ErrorCode::Timeout);
    EXPECT_EQ(driver->pulls, 1);
}

TEST_F(DriverClientProxyTest, ZeroTimeoutStillTakesReadyResult) {
    driver->scripted.push_back({makeTaskRes(GetPropertiesRes{kOk, {}})});
    auto value = proxy->getProperties(GetPropertiesIns{}, 0ms);
    ASSERT_TRUE(value);
}

TEST_F(DriverClientProxyTest, NonOkStatusIsAResponse) {
    driver->scripted.push_back({makeTaskRes(
        FitRes{Status{Code::FitNotImplemented, "Client does not implement `fit`"}, {}, 0, {}})});

    auto value = proxy->fit(FitIns{}, 1s);
    ASSERT_TRUE(value);
    EXPECT_EQ(value.value().status.code, Code::FitNotImplemented);
}

TEST_F(DriverClientProxyTest, PushFailurePropagates) {
    driver->pushError = Error{ErrorCode::UnknownNode, "node 1 is not registered"};

    auto value = proxy->getParameters(GetParametersIns{}, 1s);
    ASSERT_FALSE(value);
    EXPECT_EQ(value.error().code, ErrorCode::UnknownNode);
    EXPECT_EQ(driver->pulls, 0);
}

TEST_F(DriverClientProxyTest, EmptyTaskIdIsInvalidData) {
    driver->nextTaskId.clear();

    auto value = proxy->getParameters(GetParametersIns{}, 1s);
    ASSERT_FALSE(value);
    EXPECT_EQ(value.error().code, ErrorCode::InvalidData);
    EXPECT_EQ(driver->pulls, 0);
}

TEST_F(DriverClientProxyTest, PullFailurePropagates) {
    driver->pullError = Error{ErrorCode::InternalError, "queue unavailable"};

    auto value = proxy->evaluate(EvaluateIns{}, std::nullopt);
    ASSERT_FALSE(value);
    EXPECT_EQ(value.error().code, ErrorCode::InternalError);
    EXPECT_EQ(driver->pulls, 1);
}

TEST_F(DriverClientProxyTest, ResultOfOtherCallTypeIsSchemaMismatch) {
    driver->scripted.push_back({makeTaskRes(EvaluateRes{kOk, 1.0, 1, {}})});

    auto value = proxy->fit(FitIns{}, 1s);
    ASSERT_FALSE(value);
    EXPECT_EQ(value.error().code, ErrorCode::SchemaMismatch);
}

TEST_F(DriverClientProxyTest, UndecodableContentIsSchemaMismatch) {
    auto taskRes = makeTaskRes(FitRes{});
    taskRes.task.recordset.erase("fitres.num_examples");
    driver->scripted.push_back({taskRes});

    auto value = proxy->fit(FitIns{}, 1s);
    ASSERT_FALSE(value);
    EXPECT_EQ(value.error().code, ErrorCode::SchemaMismatch);
}

TEST_F(DriverClientProxyTest, AsyncCallRunsOnCallerExecutor) {
    driver->scripted.push_back({});
    driver->scripted.push_back({makeTaskRes(GetPropertiesRes{kOk, {}})});

    boost::asio::io_context io;
    std::optional<Result<GetPropertiesRes>> out;
    boost::asio::co_spawn(
        io,
        [&]() -> boost::asio::awaitable<void> {
            out.emplace(co_await proxy->asyncCall(GetPropertiesIns{}, 1s));
        },
        boost::asio::detached);
    io.run();

    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(*out);
    EXPECT_EQ(out->value().status.code, Code::Ok);
    EXPECT_EQ(driver->pulls, 2);
}

TEST(DriverClientProxyOptionsTest, NonPositivePollIntervalFallsBackToDefault) {
    ProxyOptions options;
    options.pollInterval = 0ms;
    DriverClientProxy proxy(1, std::make_shared<FakeDriver>(), false, 3, options);
    EXPECT_EQ(proxy.options().pollInterval, ProxyOptions{}.pollInterval);
    EXPECT_EQ(proxy.runId(), 3);
    EXPECT_EQ(proxy.nodeId(), 1);
}

TEST(DriverClientProxyOptionsTest, ResolvesFromConfigThenEnvironment) {
    using fleet::tests::ScopedEnv;
    auto dir = fleet::tests::make_temp_dir("fleet_proxy_opts_");
    auto path = fleet::tests::write_file(dir / "config.toml", "[driver]\n"
                                                              "poll_interval_ms = 250\n"
                                                              "group_id = \"round-7\"\n"
                                                              "ttl = 60\n");
    {
        ScopedEnv env("FLEET_POLL_INTERVAL_MS", nullptr);
        auto options = resolveProxyOptions(path);
        EXPECT_EQ(options.pollInterval, 250ms);
        EXPECT_EQ(options.groupId, "round-7");
        EXPECT_EQ(options.ttl, "60");
    }
    {
        ScopedEnv env("FLEET_POLL_INTERVAL_MS", "20");
        EXPECT_EQ(resolveProxyOptions(path).pollInterval, 20ms);
    }
    {
        ScopedEnv env("FLEET_POLL_INTERVAL_MS", "soon");
        EXPECT_EQ(resolveProxyOptions(path).pollInterval, 250ms);
    }
    std::filesystem::remove_all(dir);
}

} // namespace fleet::server::test
