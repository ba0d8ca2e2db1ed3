// File: tests/retrieval/graph_expander_test.cpp
#include "retrieval/graph_expander.hpp"
#include "storage/memory_backend.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace engram {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

Timestamp T0() {
    return Timestamp::FromMicros(1700000000000000);
}

class GraphExpanderTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MemoryBackend>();
        // alice -0.5- acme -1.0- berlin -1.0- germany
        AddEntity("alice", "Alice");
        AddEntity("acme", "Acme");
        AddEntity("berlin", "Berlin");
        AddEntity("germany", "Germany");
        AddRelation("r1", "alice", "acme", 0.5f);
        AddRelation("r2", "acme", "berlin", 1.0f);
        AddRelation("r3", "berlin", "germany", 1.0f);
    }

    void AddEntity(const std::string& id, const std::string& label) {
        store_->UpsertEntity(EntityNode{id, label, "thing"});
    }

    void AddRelation(const std::string& id, const std::string& source,
                     const std::string& target, float weight,
                     std::optional<Timestamp> valid_to = std::nullopt) {
        RelationEdge edge;
        edge.id = id;
        edge.source = source;
        edge.target = target;
        edge.relation_type = "related_to";
        edge.weight = weight;
        edge.valid_from = T0();
        edge.valid_to = valid_to;
        edge.recorded_at = T0();
        store_->UpsertRelation(edge);
    }

    RecordID Mention(const std::string& content, const std::string& entity) {
        MemoryRecord record(RecordID::Generate(), "U1", content, MemoryTier::WORKING, T0());
        auto id = store_->UpsertByContent(record).id;
        store_->LinkRecordEntity(id, entity);
        return id;
    }

    GraphExpander Create(size_t max_depth = 2) {
        GraphExpander::Config config;
        config.max_depth = max_depth;
        return GraphExpander(store_, config);
    }

    std::shared_ptr<MemoryBackend> store_;
};

const GraphExpander::EntityHit* FindHit(const std::vector<GraphExpander::EntityHit>& hits,
                                        const std::string& id) {
    for (const auto& hit : hits) {
        if (hit.id == id) return &hit;
    }
    return nullptr;
}

// ============================================================================
// Construction Tests
// ============================================================================

TEST_F(GraphExpanderTest, DepthAboveCapIsRejected) {
    GraphExpander::Config config;
    config.max_depth = GraphExpander::kMaxDepthCap + 1;
    EXPECT_THROW(GraphExpander(store_, config), std::invalid_argument);
    EXPECT_THROW(GraphExpander(nullptr, GraphExpander::Config{}), std::invalid_argument);
}

// ============================================================================
// Expansion Tests
// ============================================================================

TEST_F(GraphExpanderTest, ProximityFallsWithHopsAndWeights) {
    auto hits = Create(2).Expand({"acme"}, T0() + std::chrono::hours(1));

    ASSERT_EQ(4u, hits.size());
    EXPECT_EQ("acme", hits[0].id);
    EXPECT_FLOAT_EQ(1.0f, hits[0].proximity);

    auto* berlin = FindHit(hits, "berlin");
    ASSERT_NE(nullptr, berlin);
    EXPECT_EQ(1u, berlin->hops);
    EXPECT_FLOAT_EQ(0.5f, berlin->proximity);

    auto* alice = FindHit(hits, "alice");
    ASSERT_NE(nullptr, alice);
    EXPECT_FLOAT_EQ(0.25f, alice->proximity);

    auto* germany = FindHit(hits, "germany");
    ASSERT_NE(nullptr, germany);
    EXPECT_EQ(2u, germany->hops);
    EXPECT_NEAR(1.0f / 3.0f, germany->proximity, 1e-6f);
}

TEST_F(GraphExpanderTest, DepthLimitsReach) {
    auto hits = Create(1).Expand({"alice"}, T0() + std::chrono::hours(1));
    ASSERT_EQ(2u, hits.size());
    EXPECT_EQ(nullptr, FindHit(hits, "berlin"));

    EXPECT_EQ(1u, Create(0).Expand({"alice"}, T0()).size());
}

TEST_F(GraphExpanderTest, ExpiredRelationsAreNotFollowed) {
    AddRelation("r2", "acme", "berlin", 1.0f, T0() + std::chrono::hours(2));

    auto during = Create(2).Expand({"acme"}, T0() + std::chrono::hours(1));
    auto after = Create(2).Expand({"acme"}, T0() + std::chrono::hours(3));

    EXPECT_NE(nullptr, FindHit(during, "berlin"));
    EXPECT_EQ(nullptr, FindHit(after, "berlin"));
}

TEST_F(GraphExpanderTest, StopHaltsExpansion) {
    auto hits = Create(3).Expand({"alice"}, T0(), []() { return true; });
    ASSERT_EQ(1u, hits.size());
    EXPECT_EQ("alice", hits[0].id);
}

TEST_F(GraphExpanderTest, EntityBudgetCapsVisits) {
    GraphExpander::Config config;
    config.max_depth = 3;
    config.max_entities = 2;
    GraphExpander expander(store_, config);

    EXPECT_EQ(2u, expander.Expand({"alice"}, T0() + std::chrono::hours(1)).size());
}

// ============================================================================
// Record Ranking Tests
// ============================================================================

TEST_F(GraphExpanderTest, RankRecordsByMentionedEntities) {
    auto about_acme = Mention("acme quarterly report", "acme");
    auto about_berlin = Mention("berlin office opening", "berlin");
    auto about_germany = Mention("german tax rules", "germany");

    auto ranked = Create(2).RankRecords("news about Acme", T0() + std::chrono::hours(1), 10);

    ASSERT_EQ(3u, ranked.size());
    EXPECT_EQ(about_acme, ranked[0].id);
    EXPECT_EQ(about_berlin, ranked[1].id);
    EXPECT_EQ(about_germany, ranked[2].id);
    EXPECT_GT(ranked[1].score, ranked[2].score);
}

TEST_F(GraphExpanderTest, RankRecordsWithoutEntitiesIsEmpty) {
    Mention("acme quarterly report", "acme");
    EXPECT_TRUE(Create(2).RankRecords("weather tomorrow", T0(), 10).empty());
    EXPECT_TRUE(Create(2).RankRecords("acme", T0(), 0).empty());
}

TEST_F(GraphExpanderTest, RankRecordsRespectsK) {
    Mention("acme quarterly report", "acme");
    Mention("berlin office opening", "berlin");
    EXPECT_EQ(1u, Create(2).RankRecords("acme", T0() + std::chrono::hours(1), 1).size());
}

TEST_F(GraphExpanderTest, RankRecordsFiltersBeforeCut) {
    Mention("acme quarterly report", "acme");
    Mention("acme hiring plan", "acme");
    MemoryRecord other(RecordID("zz"), "U2", "acme supplier list", MemoryTier::WORKING, T0());
    store_->LinkRecordEntity(store_->UpsertByContent(other).id, "acme");

    RecordFilter filter;
    filter.owner = "U2";
    auto ranked = Create(2).RankRecords("acme", T0() + std::chrono::hours(1), 1, filter);

    ASSERT_EQ(1u, ranked.size());
    EXPECT_EQ("zz", ranked[0].id.value());
}

} // namespace
} // namespace engram
