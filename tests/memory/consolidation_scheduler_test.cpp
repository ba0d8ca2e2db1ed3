// File: tests/memory/consolidation_scheduler_test.cpp
#include "memory/consolidation_scheduler.hpp"
#include "storage/memory_backend.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <cstdio>
#include <limits>
#include <map>
#include <optional>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace engram {
namespace {

// ============================================================================
// Helper Classes
// ============================================================================

Timestamp T0() {
    return Timestamp::FromMicros(1700000000000000);
}

/// Mutator writing straight to the store, with scripted failures
class ScriptedMutator : public RecordMutator {
public:
    explicit ScriptedMutator(std::shared_ptr<MemoryStore> store) : store_(std::move(store)) {}

    bool AttachEmbedding(const RecordID& id) override {
        ++embed_calls;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failing.count(id) > 0) {
                throw std::runtime_error("embedding service rejected " + id.value());
            }
            if (vanished.count(id) > 0) {
                throw NotFoundError("record " + id.value() + " is gone");
            }
        }
        auto record = Load(id);
        auto it = embeddings.find(record.GetContent());
        record.SetEmbedding(it != embeddings.end() ? it->second : Embedding{0.0f, 1.0f});
        return store_->UpdateIfVersion(record, record.GetVersion());
    }

    bool AttachSummary(const RecordID& id) override {
        auto record = Load(id);
        record.SetSummary(record.GetContent().substr(0, 10));
        return store_->UpdateIfVersion(record, record.GetVersion());
    }

    bool AttachKeywordTags(const RecordID& id, size_t max_tags) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tagged.insert(id);
        }
        auto record = Load(id);
        record.AddTags({"kw" + std::to_string(max_tags)});
        return store_->UpdateIfVersion(record, record.GetVersion());
    }

    void ApplyScore(const RecordID& /*id*/, Timestamp /*now*/) override {
        ++score_calls;
    }

    bool PromoteIfEligible(const RecordID& id, Timestamp now) override {
        {
            // One promotion per scripted id, so the next tier's job leaves it alone
            std::lock_guard<std::mutex> lock(mutex_);
            if (promote.erase(id) == 0) {
                return false;
            }
        }
        auto record = Load(id);
        auto next = NextTier(record.GetTier());
        if (!next) {
            return false;
        }
        record.AdvanceTier(*next, now);
        return store_->UpdateIfVersion(record, record.GetVersion());
    }

    bool ArchiveIfEligible(const RecordID& id, Timestamp now) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (archive.count(id) == 0) {
                return false;
            }
        }
        auto record = Load(id);
        record.MarkArchived(now);
        return store_->UpdateIfVersion(record, record.GetVersion());
    }

    RecordID Merge(const RecordID& a, const RecordID& b, Timestamp now) override {
        auto plan = DeduplicationEngine::PlanMerge(Load(a), Load(b), now);
        if (!store_->UpdateIfVersion(plan.merged, plan.merged.GetVersion())) {
            throw InvalidRecordState("merge lost a race");
        }
        store_->PutTombstone(plan.discarded_id, plan.survivor_id);
        store_->Delete(plan.discarded_id);
        return plan.survivor_id;
    }

    std::optional<RecordID> ConsolidateGroup(const std::vector<RecordID>& members,
                                             Timestamp now) override {
        if (!summarizer_available) {
            return std::nullopt;
        }
        for (const auto& id : members) {
            auto record = Load(id);
            record.MarkArchived(now);
            store_->UpdateIfVersion(record, record.GetVersion());
        }
        groups.push_back(members);
        return RecordID("g" + std::to_string(groups.size()));
    }

    void SetFailing(const RecordID& id, bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail) {
            failing.insert(id);
        } else {
            failing.erase(id);
        }
    }

    std::atomic<int> embed_calls{0};
    std::atomic<int> score_calls{0};
    std::set<RecordID> promote;
    std::set<RecordID> archive;
    std::set<RecordID> vanished;
    std::set<RecordID> tagged;
    std::map<std::string, Embedding> embeddings;
    std::vector<std::vector<RecordID>> groups;
    bool summarizer_available{true};

private:
    MemoryRecord Load(const RecordID& id) {
        auto record = store_->Get(id);
        if (!record) {
            throw NotFoundError("record " + id.value() + " not found");
        }
        return *record;
    }

    std::shared_ptr<MemoryStore> store_;
    std::mutex mutex_;
    std::set<RecordID> failing;
};

class ConsolidationSchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MemoryBackend>();
        dedup_ = std::make_shared<DeduplicationEngine>(store_, DeduplicationEngine::Config{});
        mutator_ = std::make_unique<ScriptedMutator>(store_);

        config_.batch_size = 5;
        config_.max_parallelism = 3;
        config_.retry_budget = 2;
        config_.interval = std::chrono::milliseconds(20);
        config_.enable_merge = false;
    }

    std::unique_ptr<ConsolidationScheduler> CreateScheduler() {
        auto scheduler = std::make_unique<ConsolidationScheduler>(store_, dedup_, mutator_.get(), config_);
        scheduler->SetLogStream(&log_);
        return scheduler;
    }

    RecordID Insert(int n, const std::string& content = "", MemoryTier tier = MemoryTier::WORKING) {
        char id[8];
        std::snprintf(id, sizeof(id), "r%02d", n);
        MemoryRecord record(RecordID(id), "U1",
                            content.empty() ? "fact " + std::to_string(n) : content, tier, T0());
        return store_->UpsertByContent(record).id;
    }

    const ConsolidationJob& JobFor(const std::vector<ConsolidationJob>& jobs, MemoryTier tier) {
        for (const auto& job : jobs) {
            if (job.tier == tier) return job;
        }
        throw std::logic_error("no job for tier");
    }

    std::shared_ptr<MemoryBackend> store_;
    std::shared_ptr<DeduplicationEngine> dedup_;
    std::unique_ptr<ScriptedMutator> mutator_;
    ConsolidationScheduler::Config config_;
    std::ostringstream log_;
};

// ============================================================================
// Construction Tests
// ============================================================================

TEST_F(ConsolidationSchedulerTest, ConstructorValidates) {
    EXPECT_THROW(ConsolidationScheduler(store_, dedup_, nullptr, config_), std::invalid_argument);
    EXPECT_THROW(ConsolidationScheduler(nullptr, dedup_, mutator_.get(), config_), std::invalid_argument);

    config_.batch_size = 0;
    EXPECT_THROW(ConsolidationScheduler(store_, dedup_, mutator_.get(), config_), std::invalid_argument);
}

TEST_F(ConsolidationSchedulerTest, CursorNamePerTier) {
    EXPECT_EQ("consolidation.WORKING", ConsolidationScheduler::CursorName(MemoryTier::WORKING));
    EXPECT_EQ("consolidation.LONG_TERM", ConsolidationScheduler::CursorName(MemoryTier::LONG_TERM));
}

// ============================================================================
// Tick Tests
// ============================================================================

TEST_F(ConsolidationSchedulerTest, TickVisitsEveryRecordInPages) {
    for (int i = 0; i < 12; ++i) {
        Insert(i);
    }
    auto scheduler = CreateScheduler();

    auto jobs = scheduler->RunTick(T0() + std::chrono::hours(1));
    ASSERT_EQ(3u, jobs.size());

    const auto& working = JobFor(jobs, MemoryTier::WORKING);
    EXPECT_EQ(JobStatus::DONE, working.status);
    EXPECT_EQ(3u, working.batches);
    EXPECT_EQ(12u, working.records_seen);
    EXPECT_EQ(12u, working.embedded);
    EXPECT_EQ(0u, working.failed);
    EXPECT_EQ(12, mutator_->score_calls.load());

    for (const auto& id : {"r00", "r05", "r11"}) {
        EXPECT_TRUE(store_->Get(RecordID(id))->HasEmbedding());
    }
}

TEST_F(ConsolidationSchedulerTest, SecondTickDoesNotReembed) {
    Insert(0);
    auto scheduler = CreateScheduler();

    scheduler->RunTick(T0());
    auto jobs = scheduler->RunTick(T0());

    EXPECT_EQ(0u, JobFor(jobs, MemoryTier::WORKING).embedded);
    EXPECT_EQ(1, mutator_->embed_calls.load());
}

TEST_F(ConsolidationSchedulerTest, LongContentGetsSummary) {
    config_.summarize_min_chars = 20;
    auto id = Insert(0, "a long piece of content that needs a summary");
    auto short_id = Insert(1, "short");
    auto scheduler = CreateScheduler();

    auto jobs = scheduler->RunTick(T0());

    EXPECT_EQ(1u, JobFor(jobs, MemoryTier::WORKING).summarized);
    EXPECT_FALSE(store_->Get(id)->GetSummary().empty());
    EXPECT_TRUE(store_->Get(short_id)->GetSummary().empty());
}

TEST_F(ConsolidationSchedulerTest, PromotesAndArchivesThroughMutator) {
    auto promoted = Insert(0);
    auto archived = Insert(1);
    Insert(2);
    mutator_->promote.insert(promoted);
    mutator_->archive.insert(archived);
    auto scheduler = CreateScheduler();

    auto jobs = scheduler->RunTick(T0() + std::chrono::hours(1));

    EXPECT_EQ(1u, JobFor(jobs, MemoryTier::WORKING).promoted);
    EXPECT_EQ(0u, JobFor(jobs, MemoryTier::SHORT_TERM).promoted);
    EXPECT_EQ(1u, JobFor(jobs, MemoryTier::WORKING).archived);
    EXPECT_EQ(MemoryTier::SHORT_TERM, store_->Get(promoted)->GetTier());
    EXPECT_TRUE(store_->Get(archived)->IsArchived());
}

TEST_F(ConsolidationSchedulerTest, VanishedRecordIsSkipped) {
    auto id = Insert(0);
    mutator_->vanished.insert(id);
    auto scheduler = CreateScheduler();

    auto jobs = scheduler->RunTick(T0());
    EXPECT_EQ(1u, JobFor(jobs, MemoryTier::WORKING).skipped);
    EXPECT_EQ(0u, JobFor(jobs, MemoryTier::WORKING).failed);
    EXPECT_FALSE(scheduler->IsDeadLettered(id));
}

TEST_F(ConsolidationSchedulerTest, ResumesFromPersistedCursor) {
    for (int i = 0; i < 12; ++i) {
        Insert(i);
    }
    // A previous tick stopped after the first page
    store_->SaveCursor(ConsolidationScheduler::CursorName(MemoryTier::WORKING), RecordID("r04"));
    auto scheduler = CreateScheduler();

    auto jobs = scheduler->RunTick(T0());
    const auto& working = JobFor(jobs, MemoryTier::WORKING);

    ASSERT_TRUE(working.resumed_after.has_value());
    EXPECT_EQ(RecordID("r04"), *working.resumed_after);
    EXPECT_EQ(7u, working.records_seen);
    EXPECT_FALSE(store_->LoadCursor(ConsolidationScheduler::CursorName(MemoryTier::WORKING)).has_value());
    EXPECT_FALSE(store_->Get(RecordID("r00"))->HasEmbedding());
}

TEST_F(ConsolidationSchedulerTest, MergePassCollapsesSemanticDuplicates) {
    config_.enable_merge = true;
    mutator_->embeddings["user prefers dark mode"] = {1.0f, 0.0f};
    mutator_->embeddings["the user prefers dark mode"] = {0.999f, 0.01f};
    auto a = Insert(0, "user prefers dark mode");
    auto b = Insert(1, "the user prefers dark mode");
    auto other = Insert(2, "meeting moved to thursday");
    auto scheduler = CreateScheduler();

    auto jobs = scheduler->RunTick(T0());

    EXPECT_EQ(1u, JobFor(jobs, MemoryTier::WORKING).merged);
    EXPECT_EQ(2u, store_->Count(RecordFilter{}));
    EXPECT_TRUE(store_->Get(other).has_value());

    // Equal importance and access: the smaller id survives
    EXPECT_TRUE(store_->Get(a).has_value());
    EXPECT_EQ(a, store_->GetTombstone(b));
}

TEST_F(ConsolidationSchedulerTest, MergeDisabled) {
    config_.enable_merge = false;
    mutator_->embeddings["x one"] = {1.0f, 0.0f};
    mutator_->embeddings["x two"] = {1.0f, 0.0f};
    Insert(0, "x one");
    Insert(1, "x two");
    auto scheduler = CreateScheduler();

    auto jobs = scheduler->RunTick(T0());
    EXPECT_EQ(0u, JobFor(jobs, MemoryTier::WORKING).merged);
    EXPECT_EQ(2u, store_->Count(RecordFilter{}));
}

// ============================================================================
// Keyword Tag Tests
// ============================================================================

TEST_F(ConsolidationSchedulerTest, UntaggedContentGetsKeywordTags) {
    auto plain = Insert(0, "deploy the cluster tonight");
    auto tiny = Insert(1, "ok then");
    MemoryRecord labelled(RecordID("r02"), "U1", "release notes for the cluster", MemoryTier::WORKING, T0());
    labelled.AddTags({"release"});
    store_->UpsertByContent(labelled);
    auto scheduler = CreateScheduler();

    auto jobs = scheduler->RunTick(T0());

    EXPECT_EQ(1u, JobFor(jobs, MemoryTier::WORKING).tagged);
    EXPECT_EQ(std::set<RecordID>{plain}, mutator_->tagged);
    EXPECT_EQ(1u, store_->Get(plain)->GetTags().count("kw5"));
    EXPECT_TRUE(store_->Get(tiny)->GetTags().empty());
}

TEST_F(ConsolidationSchedulerTest, KeywordTaggingDisabled) {
    config_.max_keyword_tags = 0;
    Insert(0, "deploy the cluster tonight");
    auto scheduler = CreateScheduler();

    auto jobs = scheduler->RunTick(T0());
    EXPECT_EQ(0u, JobFor(jobs, MemoryTier::WORKING).tagged);
    EXPECT_TRUE(mutator_->tagged.empty());
}

// ============================================================================
// Group Consolidation Tests
// ============================================================================

class GroupConsolidationTest : public ConsolidationSchedulerTest {
protected:
    void SetUp() override {
        ConsolidationSchedulerTest::SetUp();
        config_.group_trigger_size = 3;
        config_.max_keyword_tags = 0;
        mutator_->embeddings["deploy runs nightly"] = {1.0f, 0.0f};
        mutator_->embeddings["coffee order is oat latte"] = {0.0f, 1.0f};
        mutator_->embeddings["nightly deploy at two"] = {0.95f, 0.05f};
        mutator_->embeddings["likes oat milk in coffee"] = {0.05f, 0.95f};
        mutator_->embeddings["office moved to floor six"] = {0.7f, 0.7f};
        Insert(0, "deploy runs nightly", MemoryTier::SHORT_TERM);
        Insert(1, "coffee order is oat latte", MemoryTier::SHORT_TERM);
        Insert(2, "nightly deploy at two", MemoryTier::SHORT_TERM);
        Insert(3, "likes oat milk in coffee", MemoryTier::SHORT_TERM);
        Insert(4, "office moved to floor six", MemoryTier::SHORT_TERM);
    }
};

TEST_F(GroupConsolidationTest, SimilarShortTermRecordsAreGrouped) {
    auto scheduler = CreateScheduler();

    auto jobs = scheduler->RunTick(T0());
    const auto& short_term = JobFor(jobs, MemoryTier::SHORT_TERM);

    EXPECT_EQ(JobStatus::DONE, short_term.status);
    EXPECT_EQ(4u, short_term.grouped);
    EXPECT_EQ(0u, JobFor(jobs, MemoryTier::WORKING).grouped);

    ASSERT_EQ(2u, mutator_->groups.size());
    EXPECT_EQ((std::vector<RecordID>{RecordID("r00"), RecordID("r02")}), mutator_->groups[0]);
    EXPECT_EQ((std::vector<RecordID>{RecordID("r01"), RecordID("r03")}), mutator_->groups[1]);
    EXPECT_FALSE(store_->Get(RecordID("r04"))->IsArchived());
    EXPECT_TRUE(store_->Get(RecordID("r02"))->IsArchived());
}

TEST_F(GroupConsolidationTest, SmallTierIsLeftAlone) {
    config_.group_trigger_size = 5;
    auto scheduler = CreateScheduler();

    auto jobs = scheduler->RunTick(T0());
    EXPECT_EQ(0u, JobFor(jobs, MemoryTier::SHORT_TERM).grouped);
    EXPECT_TRUE(mutator_->groups.empty());
}

TEST_F(GroupConsolidationTest, GroupSizeIsCapped) {
    config_.group_similarity_threshold = 0.01f;
    config_.group_max_size = 2;
    auto scheduler = CreateScheduler();

    scheduler->RunTick(T0());
    ASSERT_FALSE(mutator_->groups.empty());
    for (const auto& group : mutator_->groups) {
        EXPECT_EQ(2u, group.size());
    }
}

TEST_F(GroupConsolidationTest, NoSummarizerLeavesRecordsLive) {
    mutator_->summarizer_available = false;
    auto scheduler = CreateScheduler();

    auto jobs = scheduler->RunTick(T0());
    EXPECT_EQ(0u, JobFor(jobs, MemoryTier::SHORT_TERM).grouped);
    EXPECT_EQ(0u, JobFor(jobs, MemoryTier::SHORT_TERM).failed);
    EXPECT_FALSE(store_->Get(RecordID("r00"))->IsArchived());
}

TEST_F(ConsolidationSchedulerTest, GroupSettingsValidate) {
    config_.group_similarity_threshold = std::numeric_limits<float>::quiet_NaN();
    EXPECT_THROW(ConsolidationScheduler(store_, dedup_, mutator_.get(), config_), std::invalid_argument);

    config_.group_similarity_threshold = 0.8f;
    config_.group_max_size = 1;
    EXPECT_THROW(ConsolidationScheduler(store_, dedup_, mutator_.get(), config_), std::invalid_argument);
}

// ============================================================================
// Failure Handling Tests
// ============================================================================

TEST_F(ConsolidationSchedulerTest, RepeatedFailuresAreDeadLettered) {
    auto bad = Insert(0);
    auto good = Insert(1);
    mutator_->SetFailing(bad, true);
    auto scheduler = CreateScheduler();

    auto first = scheduler->RunTick(T0());
    EXPECT_EQ(1u, JobFor(first, MemoryTier::WORKING).failed);
    EXPECT_EQ(JobStatus::DONE, JobFor(first, MemoryTier::WORKING).status);
    EXPECT_FALSE(scheduler->IsDeadLettered(bad));

    scheduler->RunTick(T0());
    EXPECT_TRUE(scheduler->IsDeadLettered(bad));
    EXPECT_FALSE(scheduler->IsDeadLettered(good));

    auto letters = scheduler->GetDeadLetters();
    ASSERT_EQ(1u, letters.size());
    EXPECT_EQ(2u, letters[0].failures);
    EXPECT_NE(std::string::npos, letters[0].last_error.find("rejected"));

    // Dead-lettered records are no longer attempted
    int calls_before = mutator_->embed_calls.load();
    auto third = scheduler->RunTick(T0());
    EXPECT_EQ(1u, JobFor(third, MemoryTier::WORKING).skipped);
    EXPECT_EQ(0u, JobFor(third, MemoryTier::WORKING).failed);
    EXPECT_EQ(calls_before, mutator_->embed_calls.load());
    EXPECT_NE(std::string::npos, log_.str().find("dead-lettered"));
}

TEST_F(ConsolidationSchedulerTest, SuccessResetsFailureCount) {
    auto id = Insert(0);
    auto scheduler = CreateScheduler();

    mutator_->SetFailing(id, true);
    scheduler->RunTick(T0());
    mutator_->SetFailing(id, false);
    scheduler->RunTick(T0());

    // Strip the embedding so the next tick calls the mutator again
    auto record = *store_->Get(id);
    record.SetEmbedding({});
    ASSERT_TRUE(store_->UpdateIfVersion(record, record.GetVersion()));

    mutator_->SetFailing(id, true);
    scheduler->RunTick(T0());
    EXPECT_FALSE(scheduler->IsDeadLettered(id));
}

TEST_F(ConsolidationSchedulerTest, ClearDeadLetterAllowsRetry) {
    auto id = Insert(0);
    mutator_->SetFailing(id, true);
    auto scheduler = CreateScheduler();
    scheduler->RunTick(T0());
    scheduler->RunTick(T0());
    ASSERT_TRUE(scheduler->IsDeadLettered(id));

    mutator_->SetFailing(id, false);
    EXPECT_TRUE(scheduler->ClearDeadLetter(id));
    EXPECT_FALSE(scheduler->ClearDeadLetter(id));

    auto jobs = scheduler->RunTick(T0());
    EXPECT_EQ(1u, JobFor(jobs, MemoryTier::WORKING).embedded);
    EXPECT_TRUE(store_->Get(id)->HasEmbedding());
}

// ============================================================================
// History and Background Tests
// ============================================================================

TEST_F(ConsolidationSchedulerTest, JobHistoryIsBounded) {
    config_.job_history_size = 4;
    auto scheduler = CreateScheduler();

    scheduler->RunTick(T0());
    scheduler->RunTick(T0());

    auto history = scheduler->GetRecentJobs();
    ASSERT_EQ(4u, history.size());
    EXPECT_LT(history.front().id, history.back().id);
    EXPECT_EQ(MemoryTier::LONG_TERM, history.back().tier);
}

TEST_F(ConsolidationSchedulerTest, NotifyTierSizeTriggersAtThreshold) {
    config_.fill_trigger_threshold = 10;
    auto scheduler = CreateScheduler();

    EXPECT_FALSE(scheduler->NotifyTierSize(MemoryTier::WORKING, 9));
    EXPECT_TRUE(scheduler->NotifyTierSize(MemoryTier::WORKING, 10));
}

TEST_F(ConsolidationSchedulerTest, BackgroundThreadRunsTicks) {
    Insert(0);
    auto scheduler = CreateScheduler();

    scheduler->Start();
    EXPECT_TRUE(scheduler->IsRunning());
    scheduler->Trigger();

    for (int i = 0; i < 200 && scheduler->GetRecentJobs().empty(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    scheduler->Stop();

    EXPECT_FALSE(scheduler->IsRunning());
    EXPECT_FALSE(scheduler->GetRecentJobs().empty());
    EXPECT_TRUE(store_->Get(RecordID("r00"))->HasEmbedding());
}

TEST_F(ConsolidationSchedulerTest, StopWithoutStartIsHarmless) {
    auto scheduler = CreateScheduler();
    EXPECT_NO_THROW(scheduler->Stop());
    EXPECT_FALSE(scheduler->IsRunning());
}

} // namespace
} // namespace engram
