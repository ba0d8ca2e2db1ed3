// File: tests/lifecycle/lifecycle_coordinator_test.cpp
#include "lifecycle/lifecycle_coordinator.hpp"
#include "lifecycle/record_lock_table.hpp"
#include "llm/hashing_language_model.hpp"
#include "storage/memory_backend.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace engram {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

/// Reports the configured dimension but returns two-element vectors
class ShortVectorModel : public HashingLanguageModel {
public:
    Embedding Embed(const std::string& /*text*/) override {
        return Embedding{1.0f, 0.0f};
    }
};

class LifecycleCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MemoryBackend>();
        llm_ = std::make_shared<HashingLanguageModel>();
        config_.retrieval.poll_interval = std::chrono::milliseconds(1);
        Rebuild();
    }

    void Rebuild() {
        coordinator_.reset();
        coordinator_ = std::make_unique<LifecycleCoordinator>(store_, llm_, config_);
        coordinator_->SetLogStream(&log_);
    }

    SearchRequest Request(const std::string& query, const std::string& owner = "U1") {
        SearchRequest request;
        request.query = query;
        request.filters.owner = owner;
        return request;
    }

    std::shared_ptr<MemoryBackend> store_;
    std::shared_ptr<HashingLanguageModel> llm_;
    LifecycleCoordinator::Config config_;
    std::ostringstream log_;
    std::unique_ptr<LifecycleCoordinator> coordinator_;
};

// ============================================================================
// Construction Tests
// ============================================================================

TEST_F(LifecycleCoordinatorTest, ConstructorValidates) {
    EXPECT_THROW(LifecycleCoordinator(nullptr, llm_, config_), std::invalid_argument);

    config_.default_importance = 2.0f;
    EXPECT_THROW(LifecycleCoordinator(store_, llm_, config_), std::invalid_argument);
}

TEST_F(LifecycleCoordinatorTest, ConstructorRejectsModelOfOtherDimension) {
    HashingLanguageModel::Config small;
    small.dimension = 128;
    auto model = std::make_shared<HashingLanguageModel>(small);

    EXPECT_THROW(LifecycleCoordinator(store_, model, config_), std::invalid_argument);

    config_.embedding_dimension = 128;
    EXPECT_NO_THROW(LifecycleCoordinator(store_, model, config_));
}

TEST_F(LifecycleCoordinatorTest, SynchronousEmbedOfWrongLengthStoresNothing) {
    LifecycleCoordinator coordinator(store_, std::make_shared<ShortVectorModel>(), config_);
    coordinator.SetLogStream(&log_);

    IngestOptions options;
    options.embed = true;
    EXPECT_THROW(coordinator.Ingest("user prefers dark mode", "U1", {}, options), DimensionMismatch);
    EXPECT_EQ(0u, store_->Count(RecordFilter{}));
}

TEST_F(LifecycleCoordinatorTest, AttachEmbeddingRejectsWrongLength) {
    LifecycleCoordinator coordinator(store_, std::make_shared<ShortVectorModel>(), config_);
    coordinator.SetLogStream(&log_);
    auto id = coordinator.Ingest("user prefers dark mode", "U1");

    try {
        coordinator.AttachEmbedding(id);
        FAIL() << "expected DimensionMismatch";
    } catch (const DimensionMismatch& e) {
        EXPECT_EQ(256u, e.expected());
        EXPECT_EQ(2u, e.actual());
    }
    EXPECT_FALSE(coordinator.Get(id).HasEmbedding());

    // Nothing of the wrong length reached the store, so vector search still works
    IngestOptions options;
    options.embed = true;
    coordinator_->Ingest("user prefers dark mode in the editor", "U1", {}, options);
    auto result = coordinator_->Search(Request("dark mode"));
    EXPECT_FALSE(result.partial);
}

// ============================================================================
// Ingest Tests
// ============================================================================

TEST_F(LifecycleCoordinatorTest, IngestCreatesWorkingRecord) {
    auto id = coordinator_->Ingest("User prefers dark mode", "U1", {"ui"});

    MemoryRecord record = coordinator_->Get(id);
    EXPECT_EQ("U1", record.GetOwner());
    EXPECT_EQ(MemoryTier::WORKING, record.GetTier());
    EXPECT_FLOAT_EQ(0.5f, record.GetImportance());
    EXPECT_EQ(1u, record.GetAccessCount());
    EXPECT_EQ(1u, record.GetTags().count("ui"));
    EXPECT_FALSE(record.HasEmbedding());
}

TEST_F(LifecycleCoordinatorTest, IdenticalIngestIsIdempotent) {
    auto first = coordinator_->Ingest("User prefers dark mode", "U1", {"ui"});
    auto second = coordinator_->Ingest("User prefers dark mode", "U1", {"preferences"});

    EXPECT_EQ(first, second);
    MemoryRecord record = coordinator_->Get(first);
    EXPECT_EQ(2u, record.GetAccessCount());
    EXPECT_EQ(2u, record.GetTags().size());
    EXPECT_EQ(1u, store_->Count(RecordFilter{}));

    auto result = coordinator_->Search(Request("dark mode"));
    ASSERT_EQ(1u, result.items.size());
    EXPECT_EQ(first, result.items[0].id);
}

TEST_F(LifecycleCoordinatorTest, ConcurrentIdenticalIngestConverges) {
    const int kThreads = 16;
    std::vector<RecordID> ids(kThreads);
    std::vector<std::thread> threads;

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([this, &ids, i]() {
            ids[i] = coordinator_->Ingest("shared fact", "U1");
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& id : ids) {
        EXPECT_EQ(ids[0], id);
    }
    EXPECT_EQ(1u, store_->Count(RecordFilter{}));
    EXPECT_EQ(static_cast<uint32_t>(kThreads), coordinator_->Get(ids[0]).GetAccessCount());
}

TEST_F(LifecycleCoordinatorTest, SameContentOtherOwnerIsSeparate) {
    auto mine = coordinator_->Ingest("shared fact", "U1");
    auto theirs = coordinator_->Ingest("shared fact", "U2");
    EXPECT_NE(mine, theirs);
}

TEST_F(LifecycleCoordinatorTest, IngestOptionsApply) {
    IngestOptions options;
    options.tier = MemoryTier::SHORT_TERM;
    options.importance = 0.9f;
    options.metadata["source"] = "chat";
    options.embed = true;

    auto id = coordinator_->Ingest("quarterly review on monday", "U1", {}, options);
    MemoryRecord record = coordinator_->Get(id);

    EXPECT_EQ(MemoryTier::SHORT_TERM, record.GetTier());
    EXPECT_FLOAT_EQ(0.9f, record.GetImportance());
    EXPECT_FLOAT_EQ(0.9f, record.GetDecayWeight());
    EXPECT_EQ("chat", record.GetMetadata().at("source"));
    EXPECT_EQ(llm_->Dimension(), record.GetEmbedding().size());
}

TEST_F(LifecycleCoordinatorTest, IngestValidation) {
    EXPECT_THROW(coordinator_->Ingest("   ", "U1"), ValidationError);
    EXPECT_THROW(coordinator_->Ingest("fact", ""), ValidationError);

    config_.max_content_bytes = 8;
    Rebuild();
    EXPECT_THROW(coordinator_->Ingest("far too long for the limit", "U1"), ValidationError);
}

TEST_F(LifecycleCoordinatorTest, GetUnknownIdThrows) {
    EXPECT_THROW(coordinator_->Get(RecordID("missing")), NotFoundError);
}

// ============================================================================
// Explicit Lifecycle Tests
// ============================================================================

TEST_F(LifecycleCoordinatorTest, PromoteMovesOneTierForward) {
    auto id = coordinator_->Ingest("fact", "U1");

    EXPECT_EQ(MemoryTier::SHORT_TERM, coordinator_->Promote(id).GetTier());
    EXPECT_EQ(MemoryTier::LONG_TERM, coordinator_->Promote(id).GetTier());
    EXPECT_THROW(coordinator_->Promote(id), InvalidRecordState);
    EXPECT_EQ(MemoryTier::LONG_TERM, coordinator_->Get(id).GetTier());
}

TEST_F(LifecycleCoordinatorTest, ArchiveIsIdempotentAndBlocksPromotion) {
    auto id = coordinator_->Ingest("fact", "U1");

    MemoryRecord archived = coordinator_->Archive(id);
    EXPECT_TRUE(archived.IsArchived());
    uint64_t version = archived.GetVersion();

    EXPECT_EQ(version, coordinator_->Archive(id).GetVersion());
    EXPECT_THROW(coordinator_->Promote(id), InvalidRecordState);
    EXPECT_TRUE(coordinator_->Search(Request("fact")).items.empty());
}

TEST_F(LifecycleCoordinatorTest, RecordAccessCounts) {
    auto id = coordinator_->Ingest("fact", "U1");
    coordinator_->RecordAccess(id);
    EXPECT_EQ(2u, coordinator_->Get(id).GetAccessCount());
}

// ============================================================================
// Merge Tests
// ============================================================================

TEST_F(LifecycleCoordinatorTest, MergeUnionsAndTombstones) {
    IngestOptions important;
    important.importance = 0.9f;
    auto keep = coordinator_->Ingest("user prefers dark mode", "U1", {"ui"}, important);
    auto drop = coordinator_->Ingest("user likes dark themes", "U1", {"themes"});
    coordinator_->LinkEntity(drop, EntityNode{"dark-mode", "dark mode", "preference"});

    RecordID survivor = coordinator_->Merge(keep, drop, Timestamp::Now());

    EXPECT_EQ(keep, survivor);
    MemoryRecord merged = coordinator_->Get(keep);
    EXPECT_EQ(2u, merged.GetTags().size());
    EXPECT_EQ(2u, merged.GetAccessCount());
    EXPECT_EQ(drop.value(), merged.GetMetadata().at(DeduplicationEngine::kMergedFromKey));

    // The old id resolves to the survivor
    EXPECT_EQ(keep, coordinator_->ResolveId(drop));
    EXPECT_EQ(keep, coordinator_->Get(drop).GetID());
    EXPECT_FALSE(store_->Get(drop).has_value());

    // Entity links moved across
    auto mentions = store_->RecordsForEntities({"dark-mode"});
    ASSERT_EQ(1u, mentions.size());
    EXPECT_EQ(keep, mentions[0].record);
}

TEST_F(LifecycleCoordinatorTest, MergeRejectsSelfAndMissing) {
    auto id = coordinator_->Ingest("fact", "U1");
    EXPECT_THROW(coordinator_->Merge(id, id, Timestamp::Now()), ValidationError);
    EXPECT_THROW(coordinator_->Merge(id, RecordID("missing"), Timestamp::Now()), NotFoundError);
}

TEST_F(LifecycleCoordinatorTest, ContentOfMergedRecordReingestsOnSurvivorOwner) {
    IngestOptions important;
    important.importance = 0.9f;
    auto keep = coordinator_->Ingest("user prefers dark mode", "U1", {}, important);
    auto drop = coordinator_->Ingest("user likes dark themes", "U1");
    coordinator_->Merge(keep, drop, Timestamp::Now());

    // The discarded content is no longer held, so it becomes a new record
    auto again = coordinator_->Ingest("user likes dark themes", "U1");
    EXPECT_NE(keep, again);
    EXPECT_NE(drop, again);
}

// ============================================================================
// Consolidation Tests
// ============================================================================

TEST_F(LifecycleCoordinatorTest, TickEmbedsAndPromotesImportantRecord) {
    IngestOptions important;
    important.importance = 0.9f;
    auto id = coordinator_->Ingest("deadline for the tax filing is april", "U1", {}, important);

    coordinator_->RunConsolidationTick(Timestamp::Now() + std::chrono::hours(1));

    MemoryRecord record = coordinator_->Get(id);
    EXPECT_EQ(MemoryTier::SHORT_TERM, record.GetTier());
    EXPECT_TRUE(record.HasEmbedding());
}

TEST_F(LifecycleCoordinatorTest, TickRespectsMinimumDwell) {
    IngestOptions important;
    important.importance = 0.9f;
    auto id = coordinator_->Ingest("fresh important fact", "U1", {}, important);

    coordinator_->RunConsolidationTick(Timestamp::Now() + std::chrono::minutes(1));
    EXPECT_EQ(MemoryTier::WORKING, coordinator_->Get(id).GetTier());
}

TEST_F(LifecycleCoordinatorTest, TickArchivesFadedRecord) {
    IngestOptions trivial;
    trivial.importance = 0.1f;
    auto id = coordinator_->Ingest("the coffee machine was empty", "U1", {}, trivial);

    coordinator_->RunConsolidationTick(Timestamp::Now() + std::chrono::hours(24 * 10));

    MemoryRecord record = coordinator_->Get(id);
    EXPECT_TRUE(record.IsArchived());
    EXPECT_LT(record.GetDecayWeight(), config_.scoring.archival_floor);
    EXPECT_TRUE(coordinator_->Search(Request("coffee machine")).items.empty());
}

TEST_F(LifecycleCoordinatorTest, TickMergesSemanticDuplicates) {
    auto a = coordinator_->Ingest("User prefers dark mode", "U1", {"ui"});
    auto b = coordinator_->Ingest("user prefers dark mode!", "U1", {"settings"});
    ASSERT_NE(a, b);

    auto jobs = coordinator_->RunConsolidationTick(Timestamp::Now() + std::chrono::minutes(1));

    size_t merged = 0;
    for (const auto& job : jobs) {
        merged += job.merged;
    }
    EXPECT_EQ(1u, merged);
    EXPECT_EQ(1u, store_->Count(RecordFilter{}));
    EXPECT_EQ(coordinator_->ResolveId(a), coordinator_->ResolveId(b));
    EXPECT_EQ(2u, coordinator_->Get(a).GetTags().size());
}

TEST_F(LifecycleCoordinatorTest, KeywordTagsOnlyForUntaggedRecords) {
    auto plain = coordinator_->Ingest("Deploy the cluster, the cluster runs nightly", "U1");
    auto labelled = coordinator_->Ingest("release notes for the cluster", "U1", {"release"});

    EXPECT_TRUE(coordinator_->AttachKeywordTags(plain, 2));
    EXPECT_EQ((MemoryRecord::TagSet{"cluster", "deploy"}), coordinator_->Get(plain).GetTags());
    EXPECT_FALSE(coordinator_->AttachKeywordTags(plain, 2));

    EXPECT_FALSE(coordinator_->AttachKeywordTags(labelled, 2));
    EXPECT_EQ(MemoryRecord::TagSet{"release"}, coordinator_->Get(labelled).GetTags());
}

TEST_F(LifecycleCoordinatorTest, TickTagsUntaggedRecords) {
    auto id = coordinator_->Ingest("quarterly budget review with finance", "U1");

    auto jobs = coordinator_->RunConsolidationTick(Timestamp::Now() + std::chrono::minutes(1));

    EXPECT_EQ(1u, jobs.front().tagged);
    EXPECT_EQ(1u, coordinator_->Get(id).GetTags().count("budget"));
}

TEST_F(LifecycleCoordinatorTest, ConsolidateGroupSummarizesAndArchivesMembers) {
    auto a = coordinator_->Ingest("Deploy runs nightly.", "U1", {"ops"});
    auto b = coordinator_->Ingest("Deploys start at two.", "U1");
    const Timestamp now = Timestamp::Now();

    auto summary_id = coordinator_->ConsolidateGroup({a, b}, now);
    ASSERT_TRUE(summary_id.has_value());

    MemoryRecord summary = coordinator_->Get(*summary_id);
    EXPECT_EQ("Deploy runs nightly. Deploys start at two.", summary.GetContent());
    EXPECT_EQ(MemoryTier::LONG_TERM, summary.GetTier());
    EXPECT_FLOAT_EQ(0.8f, summary.GetImportance());
    EXPECT_TRUE(summary.HasEmbedding());
    EXPECT_EQ(1u, summary.GetTags().count("ops"));
    EXPECT_EQ(a.value() + "," + b.value(), summary.GetMetadata().at("consolidated_from"));

    for (const auto& id : {a, b}) {
        MemoryRecord member = coordinator_->Get(id);
        EXPECT_TRUE(member.IsArchived());
        EXPECT_EQ(summary_id->value(), member.GetMetadata().at("consolidated_into"));
    }
}

TEST_F(LifecycleCoordinatorTest, ConsolidateGroupNeedsTwoLiveMembersOfOneOwner) {
    auto a = coordinator_->Ingest("Deploy runs nightly.", "U1");
    auto b = coordinator_->Ingest("Deploys start at two.", "U1");
    auto other = coordinator_->Ingest("Deploys start at three.", "U2");
    const Timestamp now = Timestamp::Now();

    EXPECT_THROW(coordinator_->ConsolidateGroup({a, other}, now), ValidationError);

    coordinator_->Archive(b);
    EXPECT_FALSE(coordinator_->ConsolidateGroup({a, b}, now).has_value());
    EXPECT_FALSE(coordinator_->Get(a).IsArchived());

    LifecycleCoordinator without_model(store_, nullptr, config_);
    without_model.SetLogStream(&log_);
    EXPECT_FALSE(without_model.ConsolidateGroup({a, other}, now).has_value());
}

TEST_F(LifecycleCoordinatorTest, TickConsolidatesCrowdedShortTermTier) {
    config_.consolidation.enable_merge = false;
    config_.consolidation.group_trigger_size = 2;
    config_.consolidation.group_similarity_threshold = 0.5f;
    Rebuild();

    IngestOptions short_term;
    short_term.tier = MemoryTier::SHORT_TERM;
    auto a = coordinator_->Ingest("nightly deploy runs at two am", "U1", {}, short_term);
    auto b = coordinator_->Ingest("nightly deploy runs at three am", "U1", {}, short_term);
    auto unrelated = coordinator_->Ingest("coffee order is oat latte", "U1", {}, short_term);

    auto jobs = coordinator_->RunConsolidationTick(Timestamp::Now() + std::chrono::minutes(1));

    size_t grouped = 0;
    for (const auto& job : jobs) {
        grouped += job.grouped;
    }
    EXPECT_EQ(2u, grouped);
    EXPECT_TRUE(coordinator_->Get(a).IsArchived());
    EXPECT_TRUE(coordinator_->Get(b).IsArchived());
    EXPECT_FALSE(coordinator_->Get(unrelated).IsArchived());

    RecordFilter long_term;
    long_term.tier = MemoryTier::LONG_TERM;
    EXPECT_EQ(1u, store_->Count(long_term));
}

TEST_F(LifecycleCoordinatorTest, WithoutModelTickStillScores) {
    coordinator_.reset();
    LifecycleCoordinator coordinator(store_, nullptr, config_);
    coordinator.SetLogStream(&log_);
    IngestOptions trivial;
    trivial.importance = 0.1f;
    auto id = coordinator.Ingest("short lived note", "U1", {}, trivial);

    coordinator.RunConsolidationTick(Timestamp::Now() + std::chrono::hours(24 * 10));

    EXPECT_FALSE(coordinator.Get(id).HasEmbedding());
    EXPECT_TRUE(coordinator.Get(id).IsArchived());
}

// ============================================================================
// Search and Graph Tests
// ============================================================================

TEST_F(LifecycleCoordinatorTest, SearchCountsAccess) {
    auto id = coordinator_->Ingest("user prefers dark mode", "U1");

    auto result = coordinator_->Search(Request("dark mode"));
    ASSERT_EQ(1u, result.items.size());
    EXPECT_EQ(2u, result.items[0].record.GetAccessCount());
    EXPECT_EQ(2u, coordinator_->Get(id).GetAccessCount());
}

TEST_F(LifecycleCoordinatorTest, SearchAccessCountingCanBeDisabled) {
    config_.record_access_on_search = false;
    Rebuild();
    auto id = coordinator_->Ingest("user prefers dark mode", "U1");

    coordinator_->Search(Request("dark mode"));
    EXPECT_EQ(1u, coordinator_->Get(id).GetAccessCount());
}

TEST_F(LifecycleCoordinatorTest, SearchIsScopedToOwner) {
    coordinator_->Ingest("user prefers dark mode", "U1");
    EXPECT_TRUE(coordinator_->Search(Request("dark mode", "U2")).items.empty());
}

TEST_F(LifecycleCoordinatorTest, GraphLinksReachRecords) {
    auto id = coordinator_->Ingest("signed the lease for the new office", "U1");
    coordinator_->LinkEntity(id, EntityNode{"office", "office", "place"});
    coordinator_->LinkEntity(id, EntityNode{"acme", "Acme", "company"});

    RelationEdge edge;
    edge.id = "acme-office";
    edge.source = "acme";
    edge.target = "office";
    edge.relation_type = "occupies";
    edge.valid_from = Timestamp::Now() - std::chrono::hours(1);
    edge.recorded_at = Timestamp::Now();
    coordinator_->AddRelation(edge);

    auto result = coordinator_->Search(Request("where does Acme work"));
    ASSERT_FALSE(result.items.empty());
    EXPECT_EQ(id, result.items[0].id);
    EXPECT_EQ(1u, result.items[0].signals.count(Signal::GRAPH));
}

TEST_F(LifecycleCoordinatorTest, GraphValidation) {
    auto id = coordinator_->Ingest("fact", "U1");
    EXPECT_THROW(coordinator_->LinkEntity(id, EntityNode{"", "x", "t"}), ValidationError);
    EXPECT_THROW(coordinator_->LinkEntity(RecordID("missing"), EntityNode{"e", "E", "t"}), NotFoundError);

    RelationEdge edge;
    edge.id = "r";
    edge.source = "a";
    edge.target = "b";
    edge.valid_from = Timestamp::Now();
    edge.valid_to = edge.valid_from;
    EXPECT_THROW(coordinator_->AddRelation(edge), ValidationError);

    edge.valid_to.reset();
    edge.weight = -1.0f;
    EXPECT_THROW(coordinator_->AddRelation(edge), ValidationError);
}

// ============================================================================
// Lock Table Tests
// ============================================================================

TEST(RecordLockTableTest, PairOnSameStripeLocksOnce) {
    // With one stripe both keys share a mutex; locking it twice would deadlock
    RecordLockTable table(1);
    {
        auto pair = table.LockPair("a", "b");
    }
    auto lock = table.Lock("a");
    EXPECT_TRUE(lock.owns_lock());
}

TEST(RecordLockTableTest, StripeIsStable) {
    RecordLockTable table(16);
    EXPECT_EQ(16u, table.StripeCount());
    EXPECT_EQ(table.StripeOf("record-1"), table.StripeOf("record-1"));
    EXPECT_LT(table.StripeOf("record-1"), 16u);
}

} // namespace
} // namespace engram
