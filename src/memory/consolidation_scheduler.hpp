// File: src/memory/consolidation_scheduler.hpp
//
// Consolidation Scheduler
//
// Background maintenance of the record tiers. One tick walks every tier in
// order (WORKING, SHORT_TERM, LONG_TERM), page by page from a persisted
// cursor, and for each live record:
//   1. attaches a missing embedding
//   2. attaches a summary to long content
//   3. tags untagged content with its top keywords
//   4. rescales its decay weight
//   5. promotes it, or else archives it, when eligible
// followed by a semantic merge pass over the page. After the SHORT_TERM
// walk, owners holding more than group_trigger_size SHORT_TERM records
// have their similar records summarized into one LONG_TERM record.
//
// All writes go through a RecordMutator, so the per-record locking and
// the merge/tombstone rules live in one place.

#pragma once

#include "core/debug_log.hpp"
#include "core/memory_record.hpp"
#include "core/types.hpp"
#include "memory/deduplication_engine.hpp"
#include "storage/memory_store.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace engram {

/// Write operations the scheduler needs
///
/// Each call re-reads the record under its lock. A record that disappeared
/// in the meantime raises NotFoundError.
class RecordMutator {
public:
    virtual ~RecordMutator() = default;

    /// Embed the content if the record has no embedding yet
    /// @return true if an embedding was stored
    virtual bool AttachEmbedding(const RecordID& id) = 0;

    /// Summarize the content if the record has no summary yet
    /// @return true if a summary was stored
    virtual bool AttachSummary(const RecordID& id) = 0;

    /// Tag an untagged record with up to `max_tags` keywords from its content
    /// @return true if tags were stored
    virtual bool AttachKeywordTags(const RecordID& id, size_t max_tags) = 0;

    /// Recompute and store the decay weight
    virtual void ApplyScore(const RecordID& id, Timestamp now) = 0;

    /// @return true if the record moved to the next tier
    virtual bool PromoteIfEligible(const RecordID& id, Timestamp now) = 0;

    /// @return true if the record was archived
    virtual bool ArchiveIfEligible(const RecordID& id, Timestamp now) = 0;

    /// Merge two records; returns the survivor id
    virtual RecordID Merge(const RecordID& a, const RecordID& b, Timestamp now) = 0;

    /// Summarize a group of one owner's records into a new LONG_TERM record
    /// and archive the members
    /// @return Id of the summary record, or nullopt when no summarizer is available
    ///         or fewer than two members are still live
    virtual std::optional<RecordID> ConsolidateGroup(const std::vector<RecordID>& members,
                                                     Timestamp now) = 0;
};

enum class JobStatus : uint8_t {
    PENDING,
    RUNNING,
    DONE,
    FAILED,
};

const char* ToString(JobStatus status);

/// One tier pass of one tick
struct ConsolidationJob {
    uint64_t id{0};
    MemoryTier tier{MemoryTier::WORKING};
    JobStatus status{JobStatus::PENDING};

    std::optional<RecordID> resumed_after;   ///< Cursor the job started from
    Timestamp started_at;
    Timestamp finished_at;
    std::string error;

    size_t batches{0};
    size_t records_seen{0};
    size_t embedded{0};
    size_t summarized{0};
    size_t tagged{0};
    size_t promoted{0};
    size_t archived{0};
    size_t merged{0};
    size_t grouped{0};        ///< Records folded into a group summary
    size_t failed{0};
    size_t skipped{0};
};

/// A record that kept failing and is no longer attempted
struct DeadLetterEntry {
    RecordID id;
    uint32_t failures{0};
    std::string last_error;
    Timestamp since;
};

/// Periodic and on-demand consolidation
class ConsolidationScheduler {
public:
    /// Configuration for consolidation
    struct Config {
        std::chrono::milliseconds interval{std::chrono::minutes(5)};  ///< Between background ticks
        size_t batch_size{500};               ///< Records per page
        size_t max_parallelism{5};            ///< Workers per page
        uint32_t retry_budget{3};             ///< Failures before dead-lettering
        size_t fill_trigger_threshold{1000};  ///< Tier size that triggers an early tick
        size_t job_history_size{32};          ///< Jobs kept for GetRecentJobs
        size_t summarize_min_chars{500};      ///< Content longer than this gets a summary
        bool enable_merge{true};              ///< Run the semantic merge pass
        size_t max_keyword_tags{5};           ///< Keywords added to untagged records; 0 disables
        size_t keyword_min_chars{10};         ///< Shorter content is not tagged
        bool enable_group_consolidation{true};
        size_t group_trigger_size{100};       ///< Owner's SHORT_TERM count that starts grouping
        size_t group_scan_limit{200};         ///< SHORT_TERM records grouped per owner and tick
        float group_similarity_threshold{0.8f};
        size_t group_max_size{10};

        bool IsValid() const;
    };

    /// @param mutator Not owned; must outlive the scheduler
    /// @throws std::invalid_argument on null dependencies or invalid config
    ConsolidationScheduler(std::shared_ptr<MemoryStore> store,
                           std::shared_ptr<DeduplicationEngine> dedup,
                           RecordMutator* mutator,
                           const Config& config);

    /// Destructor - stops the background thread
    ~ConsolidationScheduler();

    ConsolidationScheduler(const ConsolidationScheduler&) = delete;
    ConsolidationScheduler& operator=(const ConsolidationScheduler&) = delete;

    // ========================================================================
    // Ticks
    // ========================================================================

    /// Run one full tick now (blocks; ticks never overlap)
    /// @return One job per tier
    std::vector<ConsolidationJob> RunTick();
    std::vector<ConsolidationJob> RunTick(Timestamp now);

    // ========================================================================
    // Background operation
    // ========================================================================

    void Start();
    void Stop();
    bool IsRunning() const { return running_.load(); }

    /// Wake the background thread for an early tick
    void Trigger();

    /// Report a tier's size; triggers a tick when it crosses the fill threshold
    /// @return true if a tick was triggered
    bool NotifyTierSize(MemoryTier tier, size_t count);

    // ========================================================================
    // Inspection
    // ========================================================================

    /// Most recent jobs, oldest first
    std::vector<ConsolidationJob> GetRecentJobs() const;

    std::vector<DeadLetterEntry> GetDeadLetters() const;
    bool IsDeadLettered(const RecordID& id) const;

    /// Let a dead-lettered record be attempted again
    /// @return false if the record was not dead-lettered
    bool ClearDeadLetter(const RecordID& id);

    const Config& GetConfig() const { return config_; }

    /// Cursor name under which a tier's progress is persisted
    static std::string CursorName(MemoryTier tier);

    void SetLogStream(std::ostream* os) { log_.SetStream(os); }
    void SetDebugEnabled(bool enabled) { log_.SetDebugEnabled(enabled); }

private:
    /// What happened to one record in one tick
    struct RecordOutcome {
        bool embedded{false};
        bool summarized{false};
        bool tagged{false};
        bool promoted{false};
        bool archived{false};
        bool failed{false};
        bool skipped{false};
    };

    std::shared_ptr<MemoryStore> store_;
    std::shared_ptr<DeduplicationEngine> dedup_;
    RecordMutator* mutator_;
    Config config_;

    // Ticks
    std::mutex tick_mutex_;
    std::atomic<uint64_t> next_job_id_{1};

    // Failure bookkeeping (written by page workers)
    mutable std::mutex state_mutex_;
    std::unordered_map<RecordID, uint32_t> failure_counts_;
    std::map<RecordID, DeadLetterEntry> dead_letters_;
    std::deque<ConsolidationJob> history_;

    // Background thread
    std::atomic<bool> running_{false};
    std::unique_ptr<std::thread> background_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    bool trigger_pending_{false};

    DebugLog log_{"Consolidation"};

    ConsolidationJob RunTierJob(MemoryTier tier, Timestamp now);
    void ProcessPage(const std::vector<MemoryRecord>& records, Timestamp now, ConsolidationJob& job);
    RecordOutcome ProcessRecord(const MemoryRecord& record, Timestamp now, uint64_t job_id);
    void MergePass(const std::vector<MemoryRecord>& records, Timestamp now, ConsolidationJob& job);
    void GroupPass(const std::set<std::string>& owners, Timestamp now, ConsolidationJob& job);
    void ConsolidateOwner(const std::string& owner, Timestamp now, ConsolidationJob& job);

    void RecordFailure(const RecordID& id, const std::string& error);
    void RecordSuccess(const RecordID& id);
    void PushHistory(const ConsolidationJob& job);

    void BackgroundLoop();
};

} // namespace engram
