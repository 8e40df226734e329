#include <gtest/gtest.h>
#include <rlcf/graph/graph_store.h>

using namespace rlcf;
using namespace rlcf::graph;

class GraphStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = makeInMemoryGraphStore();
        ASSERT_TRUE(store_->addNode({"urn:art:1", "article"}));
        ASSERT_TRUE(store_->addNode({"urn:art:2", "article"}));
    }

    std::shared_ptr<GraphStore> store_;
};

TEST_F(GraphStoreTest, AddNodeIsIdempotentForSameType) {
    EXPECT_TRUE(store_->addNode({"urn:art:1", "article"}));
    EXPECT_EQ(store_->nodeCount(), 2u);

    auto conflicting = store_->addNode({"urn:art:1", "ruling"});
    ASSERT_FALSE(conflicting);
    EXPECT_EQ(conflicting.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(store_->getNode("urn:art:1")->type, "article");
}

TEST_F(GraphStoreTest, EdgeToUnknownNodeIsReferenceError) {
    auto r = store_->addEdge({"urn:art:1", "urn:missing", "amends"});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ReferenceError);
    EXPECT_EQ(store_->edgeCount(), 0u);
}

TEST_F(GraphStoreTest, DuplicateEdgesAreIgnored) {
    ASSERT_TRUE(store_->addEdge({"urn:art:1", "urn:art:2", "amends"}));
    ASSERT_TRUE(store_->addEdge({"urn:art:1", "urn:art:2", "amends"}));
    ASSERT_TRUE(store_->addEdge({"urn:art:1", "urn:art:2", "repeals"}));

    EXPECT_EQ(store_->edgeCount(), 2u);
    EXPECT_EQ(store_->outgoing("urn:art:1").size(), 2u);
    EXPECT_EQ(store_->incoming("urn:art:2").size(), 2u);
    EXPECT_TRUE(store_->outgoing("urn:art:2").empty());
}
