#include <gtest/gtest.h>

#include <fleet/server/client_manager.h>

#include <optional>
#include <set>

namespace fleet::server::test {

namespace {

class NodeListDriver : public IDriver {
public:
    Result<std::string> pushTaskIns(const TaskIns&) override {
        return Error{ErrorCode::NotSupported, "push not scripted"};
    }
    Result<std::vector<TaskRes>> pullTaskRes(const std::vector<std::string>&) override {
        return std::vector<TaskRes>{};
    }
    Result<std::vector<Node>> getNodes(RunId runId) override {
        lastRun = runId;
        if (failure)
            return *failure;
        return nodes;
    }

    std::vector<Node> nodes;
    std::optional<Error> failure;
    RunId lastRun = -1;
};

} // namespace

class ClientManagerTest : public ::testing::Test {
protected:
    std::shared_ptr<NodeListDriver> driver = std::make_shared<NodeListDriver>();
    ClientManager manager{driver, 4};
};

TEST_F(ClientManagerTest, SyncCreatesOneProxyPerNode) {
    driver->nodes = {Node{11, false}, Node{22, true}};
    auto synced = manager.syncWithDriver();
    ASSERT_TRUE(synced);
    EXPECT_EQ(synced.value(), 2u);
    EXPECT_EQ(driver->lastRun, 4);

    auto proxy = manager.get(22);
    ASSERT_NE(proxy, nullptr);
    EXPECT_EQ(proxy->nodeId(), 22);
    EXPECT_TRUE(proxy->anonymous());
    EXPECT_EQ(proxy->runId(), 4);
    EXPECT_EQ(manager.get(33), nullptr);
}

TEST_F(ClientManagerTest, SyncKeepsExistingProxiesAndDropsDepartedNodes) {
    driver->nodes = {Node{1, false}, Node{2, false}};
    ASSERT_TRUE(manager.syncWithDriver());
    auto kept = manager.get(2);

    driver->nodes = {Node{2, false}, Node{3, false}};
    auto synced = manager.syncWithDriver();
    ASSERT_TRUE(synced);
    EXPECT_EQ(synced.value(), 2u);
    EXPECT_EQ(manager.get(1), nullptr);
    EXPECT_EQ(manager.get(2), kept);
    EXPECT_NE(manager.get(3), nullptr);
}

TEST_F(ClientManagerTest, SyncFailureKeepsCurrentProxies) {
    driver->nodes = {Node{1, false}};
    ASSERT_TRUE(manager.syncWithDriver());

    driver->failure = Error{ErrorCode::InternalError, "driver down"};
    auto synced = manager.syncWithDriver();
    ASSERT_FALSE(synced);
    EXPECT_EQ(synced.error().code, ErrorCode::InternalError);
    EXPECT_EQ(manager.numAvailable(), 1u);
}

TEST_F(ClientManagerTest, SampleReturnsDistinctProxies) {
    for (NodeId id = 1; id <= 10; ++id)
        driver->nodes.push_back(Node{id, false});
    ASSERT_TRUE(manager.syncWithDriver());

    auto picked = manager.sample(4);
    ASSERT_EQ(picked.size(), 4u);
    std::set<NodeId> ids;
    for (const auto& p : picked)
        ids.insert(p->nodeId());
    EXPECT_EQ(ids.size(), 4u);

    EXPECT_EQ(manager.sample(50).size(), 10u);
    EXPECT_EQ(manager.all().size(), 10u);
}

} // namespace fleet::server::test
