// File: src/memory/consolidation_scheduler.cpp
//
// Implementation of Consolidation Scheduler

#include "memory/consolidation_scheduler.hpp"
#include "core/errors.hpp"
#include "util/vector_math.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>

namespace engram {

const char* ToString(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING: return "PENDING";
        case JobStatus::RUNNING: return "RUNNING";
        case JobStatus::DONE: return "DONE";
        case JobStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

bool ConsolidationScheduler::Config::IsValid() const {
    return interval.count() > 0 &&
           batch_size > 0 &&
           max_parallelism > 0 &&
           retry_budget > 0 &&
           fill_trigger_threshold > 0 &&
           job_history_size > 0 &&
           group_trigger_size > 0 &&
           group_scan_limit >= 2 &&
           group_max_size >= 2 &&
           std::isfinite(group_similarity_threshold) &&
           group_similarity_threshold > 0.0f && group_similarity_threshold <= 1.0f;
}

// ============================================================================
// Construction
// ============================================================================

ConsolidationScheduler::ConsolidationScheduler(std::shared_ptr<MemoryStore> store,
                                               std::shared_ptr<DeduplicationEngine> dedup,
                                               RecordMutator* mutator,
                                               const Config& config)
    : store_(std::move(store)), dedup_(std::move(dedup)), mutator_(mutator), config_(config) {
    if (!store_ || !dedup_ || !mutator_) {
        throw std::invalid_argument("ConsolidationScheduler requires store, dedup engine and mutator");
    }
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid ConsolidationScheduler configuration");
    }
}

ConsolidationScheduler::~ConsolidationScheduler() {
    Stop();
}

std::string ConsolidationScheduler::CursorName(MemoryTier tier) {
    return std::string("consolidation.") + ToString(tier);
}

// ============================================================================
// Ticks
// ============================================================================

std::vector<ConsolidationJob> ConsolidationScheduler::RunTick() {
    return RunTick(Timestamp::Now());
}

std::vector<ConsolidationJob> ConsolidationScheduler::RunTick(Timestamp now) {
    std::lock_guard<std::mutex> tick_lock(tick_mutex_);

    std::vector<ConsolidationJob> jobs;
    for (MemoryTier tier : AllTiers()) {
        jobs.push_back(RunTierJob(tier, now));
        PushHistory(jobs.back());
    }
    return jobs;
}

ConsolidationJob ConsolidationScheduler::RunTierJob(MemoryTier tier, Timestamp now) {
    ConsolidationJob job;
    job.id = next_job_id_.fetch_add(1);
    job.tier = tier;
    job.started_at = Timestamp::Now();
    job.status = JobStatus::RUNNING;

    const std::string cursor = CursorName(tier);

    try {
        job.resumed_after = store_->LoadCursor(cursor);

        PageRequest request;
        request.filter.tier = tier;
        request.filter.include_archived = false;
        request.after = job.resumed_after;
        request.limit = config_.batch_size;

        const bool group = tier == MemoryTier::SHORT_TERM && config_.enable_group_consolidation;
        std::set<std::string> owners;

        while (true) {
            RecordPage page = store_->ListPage(request);
            ++job.batches;
            job.records_seen += page.records.size();
            if (group) {
                for (const auto& record : page.records) {
                    owners.insert(record.GetOwner());
                }
            }

            ProcessPage(page.records, now, job);
            if (config_.enable_merge) {
                MergePass(page.records, now, job);
            }

            if (!page.next_after) {
                break;
            }
            // Persist progress so an interrupted tick resumes here
            store_->SaveCursor(cursor, *page.next_after);
            request.after = page.next_after;
        }

        store_->ClearCursor(cursor);
        if (group) {
            GroupPass(owners, now, job);
        }
        job.status = JobStatus::DONE;
    } catch (const std::exception& e) {
        job.status = JobStatus::FAILED;
        job.error = e.what();
        log_.Error("job " + std::to_string(job.id) + " (" + ToString(tier) + ") failed: " + e.what());
    }

    job.finished_at = Timestamp::Now();
    log_.Debug("job " + std::to_string(job.id) + " " + ToString(tier) + ": " +
               std::to_string(job.records_seen) + " seen, " +
               std::to_string(job.promoted) + " promoted, " +
               std::to_string(job.archived) + " archived, " +
               std::to_string(job.merged) + " merged, " +
               std::to_string(job.grouped) + " grouped, " +
               std::to_string(job.failed) + " failed");
    return job;
}

void ConsolidationScheduler::ProcessPage(const std::vector<MemoryRecord>& records,
                                         Timestamp now,
                                         ConsolidationJob& job) {
    if (records.empty()) {
        return;
    }

    // Each worker writes only its own slots
    std::vector<RecordOutcome> outcomes(records.size());
    std::atomic<size_t> next{0};
    const uint64_t job_id = job.id;

    auto worker = [&]() {
        for (size_t i = next.fetch_add(1); i < records.size(); i = next.fetch_add(1)) {
            outcomes[i] = ProcessRecord(records[i], now, job_id);
        }
    };

    size_t workers = std::min(config_.max_parallelism, records.size());
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& outcome : outcomes) {
        job.embedded += outcome.embedded ? 1 : 0;
        job.summarized += outcome.summarized ? 1 : 0;
        job.tagged += outcome.tagged ? 1 : 0;
        job.promoted += outcome.promoted ? 1 : 0;
        job.archived += outcome.archived ? 1 : 0;
        job.failed += outcome.failed ? 1 : 0;
        job.skipped += outcome.skipped ? 1 : 0;
    }
}

ConsolidationScheduler::RecordOutcome ConsolidationScheduler::ProcessRecord(const MemoryRecord& record,
                                                                            Timestamp now,
                                                                            uint64_t job_id) {
    RecordOutcome outcome;
    const RecordID& id = record.GetID();

    if (IsDeadLettered(id)) {
        outcome.skipped = true;
        return outcome;
    }

    try {
        if (!record.HasEmbedding()) {
            outcome.embedded = mutator_->AttachEmbedding(id);
        }
        if (record.GetSummary().empty() &&
            record.GetContent().size() > config_.summarize_min_chars) {
            outcome.summarized = mutator_->AttachSummary(id);
        }
        if (config_.max_keyword_tags > 0 && record.GetTags().empty() &&
            record.GetContent().size() >= config_.keyword_min_chars) {
            outcome.tagged = mutator_->AttachKeywordTags(id, config_.max_keyword_tags);
        }

        mutator_->ApplyScore(id, now);

        outcome.promoted = mutator_->PromoteIfEligible(id, now);
        if (!outcome.promoted) {
            outcome.archived = mutator_->ArchiveIfEligible(id, now);
        }
        RecordSuccess(id);
    } catch (const NotFoundError&) {
        // Merged or deleted since the page was read
        outcome.skipped = true;
    } catch (const std::exception& e) {
        outcome.failed = true;
        log_.Warning("job " + std::to_string(job_id) + ": record " + id.value() +
                     " (" + ToString(record.GetTier()) + ") failed: " + e.what());
        RecordFailure(id, e.what());
    }
    return outcome;
}

void ConsolidationScheduler::MergePass(const std::vector<MemoryRecord>& records,
                                       Timestamp now,
                                       ConsolidationJob& job) {
    std::set<RecordID> gone;

    for (const auto& snapshot : records) {
        const RecordID& id = snapshot.GetID();
        if (gone.count(id) > 0 || IsDeadLettered(id)) {
            continue;
        }

        try {
            // The page copy predates this tick's embeddings
            auto current = store_->Get(id);
            if (!current || current->IsArchived() || !current->HasEmbedding()) {
                continue;
            }

            auto duplicates = dedup_->FindSemanticDuplicates(current->GetOwner(),
                                                             current->GetEmbedding(),
                                                             std::nullopt, id);
            for (const auto& duplicate : duplicates) {
                if (gone.count(duplicate.id) > 0 || IsDeadLettered(duplicate.id)) {
                    continue;
                }
                RecordID survivor = mutator_->Merge(id, duplicate.id, now);
                RecordID loser = survivor == id ? duplicate.id : id;
                gone.insert(loser);
                ++job.merged;
                log_.Debug("merged " + loser.value() + " into " + survivor.value() +
                           " (similarity " + std::to_string(duplicate.similarity) + ")");
                if (loser == id) {
                    break;
                }
            }
        } catch (const NotFoundError&) {
            // Lost a race with another writer; the next tick sees the new state
            continue;
        } catch (const std::exception& e) {
            ++job.failed;
            log_.Warning("job " + std::to_string(job.id) + ": merge of " + id.value() +
                         " failed: " + e.what());
            RecordFailure(id, e.what());
        }
    }
}

void ConsolidationScheduler::GroupPass(const std::set<std::string>& owners,
                                       Timestamp now,
                                       ConsolidationJob& job) {
    for (const auto& owner : owners) {
        ConsolidateOwner(owner, now, job);
    }
}

void ConsolidationScheduler::ConsolidateOwner(const std::string& owner,
                                              Timestamp now,
                                              ConsolidationJob& job) {
    RecordFilter filter;
    filter.owner = owner;
    filter.tier = MemoryTier::SHORT_TERM;
    filter.include_archived = false;
    if (store_->Count(filter) <= config_.group_trigger_size) {
        return;
    }

    PageRequest request;
    request.filter = filter;
    request.limit = config_.group_scan_limit;
    RecordPage page = store_->ListPage(request);
    std::vector<MemoryRecord> candidates;
    for (auto& record : page.records) {
        if (record.HasEmbedding() && !IsDeadLettered(record.GetID())) {
            candidates.push_back(std::move(record));
        }
    }

    // Greedy: each unused record seeds a group of the unused records close to it
    std::vector<bool> used(candidates.size(), false);
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (used[i]) {
            continue;
        }
        const Embedding& seed = candidates[i].GetEmbedding();
        std::vector<size_t> members{i};
        for (size_t j = i + 1; j < candidates.size() && members.size() < config_.group_max_size; ++j) {
            const Embedding& other = candidates[j].GetEmbedding();
            if (!used[j] && other.size() == seed.size() &&
                CosineSimilarity(seed, other) >= config_.group_similarity_threshold) {
                members.push_back(j);
            }
        }
        if (members.size() < 2) {
            continue;
        }

        std::vector<RecordID> ids;
        for (size_t m : members) {
            used[m] = true;
            ids.push_back(candidates[m].GetID());
        }

        try {
            auto summary_id = mutator_->ConsolidateGroup(ids, now);
            if (!summary_id) {
                continue;
            }
            job.grouped += ids.size();
            log_.Debug("consolidated " + std::to_string(ids.size()) + " records of " + owner +
                       " into " + summary_id->value());
        } catch (const NotFoundError&) {
            continue;
        } catch (const std::exception& e) {
            ++job.failed;
            log_.Warning("job " + std::to_string(job.id) + ": group of " + ids.front().value() +
                         " failed: " + e.what());
            RecordFailure(ids.front(), e.what());
        }
    }
}

// ============================================================================
// Failure bookkeeping
// ============================================================================

void ConsolidationScheduler::RecordFailure(const RecordID& id, const std::string& error) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    uint32_t failures = ++failure_counts_[id];
    if (failures >= config_.retry_budget && dead_letters_.count(id) == 0) {
        dead_letters_.emplace(id, DeadLetterEntry{id, failures, error, Timestamp::Now()});
        log_.Error("record " + id.value() + " dead-lettered after " +
                   std::to_string(failures) + " failures: " + error);
    }
}

void ConsolidationScheduler::RecordSuccess(const RecordID& id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    failure_counts_.erase(id);
}

void ConsolidationScheduler::PushHistory(const ConsolidationJob& job) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    history_.push_back(job);
    while (history_.size() > config_.job_history_size) {
        history_.pop_front();
    }
}

std::vector<ConsolidationJob> ConsolidationScheduler::GetRecentJobs() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return std::vector<ConsolidationJob>(history_.begin(), history_.end());
}

std::vector<DeadLetterEntry> ConsolidationScheduler::GetDeadLetters() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<DeadLetterEntry> entries;
    entries.reserve(dead_letters_.size());
    for (const auto& [id, entry] : dead_letters_) {
        entries.push_back(entry);
    }
    return entries;
}

bool ConsolidationScheduler::IsDeadLettered(const RecordID& id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return dead_letters_.count(id) > 0;
}

bool ConsolidationScheduler::ClearDeadLetter(const RecordID& id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    failure_counts_.erase(id);
    return dead_letters_.erase(id) > 0;
}

// ============================================================================
// Background operation
// ============================================================================

void ConsolidationScheduler::Start() {
    if (running_.load()) {
        return;  // Already running
    }

    running_.store(true);
    background_thread_ = std::make_unique<std::thread>(&ConsolidationScheduler::BackgroundLoop, this);
}

void ConsolidationScheduler::Stop() {
    if (!running_.load()) {
        return;  // Not running
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_.store(false);
    }
    wake_cv_.notify_all();

    if (background_thread_ && background_thread_->joinable()) {
        background_thread_->join();
    }

    background_thread_.reset();
}

void ConsolidationScheduler::Trigger() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        trigger_pending_ = true;
    }
    wake_cv_.notify_all();
}

bool ConsolidationScheduler::NotifyTierSize(MemoryTier tier, size_t count) {
    if (count < config_.fill_trigger_threshold) {
        return false;
    }
    log_.Debug(std::string(ToString(tier)) + " holds " + std::to_string(count) +
               " records, triggering consolidation");
    Trigger();
    return true;
}

void ConsolidationScheduler::BackgroundLoop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, config_.interval, [this] {
                return !running_.load() || trigger_pending_;
            });
            if (!running_.load()) {
                break;
            }
            trigger_pending_ = false;
        }

        try {
            RunTick();
        } catch (const std::exception& e) {
            // Nobody to rethrow to on this thread; the next interval retries
            log_.Error(std::string("background tick failed: ") + e.what());
        }
    }
}

} // namespace engram
