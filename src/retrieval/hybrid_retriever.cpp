// File: src/retrieval/hybrid_retriever.cpp
//
// Implementation of Hybrid Retriever

#include "retrieval/hybrid_retriever.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <atomic>
#include <cmath>
#include <functional>
#include <future>
#include <set>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <unordered_map>

namespace engram {

namespace {

// State shared between Search and one detached signal thread. The thread
// holds its own reference, so Search may return while it still runs.
struct SignalTask {
    std::promise<std::vector<ScoredID>> promise;
    std::atomic<bool> abandoned{false};
};

using SignalFn = std::function<std::vector<ScoredID>(const GraphExpander::StopFn&)>;

struct PendingSignal {
    Signal signal;
    std::shared_ptr<SignalTask> task;
    std::future<std::vector<ScoredID>> future;
};

// Start a signal thread that owns one already-acquired slot
PendingSignal Launch(Signal signal, SignalFn fn, std::shared_ptr<Semaphore> slots) {
    auto task = std::make_shared<SignalTask>();
    PendingSignal pending{signal, task, task->promise.get_future()};

    try {
        std::thread([task, slots, fn = std::move(fn)]() {
            SemaphoreGuard slot(*slots, std::adopt_lock);
            GraphExpander::StopFn stop = [task]() { return task->abandoned.load(); };
            try {
                task->promise.set_value(fn(stop));
            } catch (...) {
                // Handed to Search through the future
                task->promise.set_exception(std::current_exception());
            }
        }).detach();
    } catch (const std::system_error&) {
        slots->Release();
        throw;
    }

    return pending;
}

bool IsFiniteNonNegative(float value) {
    return std::isfinite(value) && value >= 0.0f;
}

void Abandon(std::vector<PendingSignal>& pending) {
    for (auto& p : pending) {
        p.task->abandoned.store(true);
    }
}

bool IsReady(std::future<std::vector<ScoredID>>& future) {
    return future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace

const char* ToString(Signal signal) {
    switch (signal) {
        case Signal::VECTOR: return "VECTOR";
        case Signal::KEYWORD: return "KEYWORD";
        case Signal::GRAPH: return "GRAPH";
    }
    return "UNKNOWN";
}

// ============================================================================
// Filters and candidates
// ============================================================================

RecordFilter SearchFilters::ToRecordFilter() const {
    RecordFilter filter;
    filter.owner = owner;
    filter.tiers = tiers;
    filter.required_tags = required_tags;
    filter.created_after = created_after;
    filter.created_before = created_before;
    filter.include_archived = include_archived;
    return filter;
}

bool SearchFilters::Matches(const MemoryRecord& record) const {
    return ToRecordFilter().Matches(record);
}

std::vector<Signal> RetrievalCandidate::Sources() const {
    std::vector<Signal> sources;
    for (const auto& [signal, hit] : signals) {
        sources.push_back(signal);
    }
    return sources;
}

// ============================================================================
// HybridRetriever::Config
// ============================================================================

bool HybridRetriever::Config::IsValid() const {
    if (per_signal_k == 0 || default_token_budget == 0) {
        return false;
    }
    if (!IsFiniteNonNegative(rrf_k)) {
        return false;
    }
    if (!IsFiniteNonNegative(vector_weight) || !IsFiniteNonNegative(keyword_weight) ||
        !IsFiniteNonNegative(graph_weight)) {
        return false;
    }
    if (max_graph_depth > GraphExpander::kMaxDepthCap) {
        return false;
    }
    if (poll_interval.count() <= 0 || max_concurrent_signals == 0) {
        return false;
    }
    return enable_vector || enable_keyword || enable_graph;
}

// ============================================================================
// HybridRetriever
// ============================================================================

HybridRetriever::HybridRetriever(std::shared_ptr<MemoryStore> store,
                                 std::shared_ptr<ILanguageModel> llm,
                                 const Config& config)
    : store_(std::move(store)), llm_(std::move(llm)), config_(config) {
    if (!store_) {
        throw std::invalid_argument("HybridRetriever requires a store");
    }
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid HybridRetriever configuration");
    }

    GraphExpander::Config graph_config;
    graph_config.max_depth = config_.max_graph_depth;
    graph_ = std::make_shared<GraphExpander>(store_, graph_config);
    signal_slots_ = std::make_shared<Semaphore>(config_.max_concurrent_signals);
}

float HybridRetriever::WeightFor(Signal signal) const {
    switch (signal) {
        case Signal::VECTOR: return config_.vector_weight;
        case Signal::KEYWORD: return config_.keyword_weight;
        case Signal::GRAPH: return config_.graph_weight;
    }
    return 0.0f;
}

SearchResult HybridRetriever::Search(const SearchRequest& request) const {
    if (request.query.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ValidationError("Search query is empty");
    }
    if (request.limit == 0) {
        throw ValidationError("Search limit must be positive");
    }
    request.cancel.ThrowIfCancelled("search");

    SearchResult result;
    const Timestamp now = Timestamp::Now();
    const size_t k = config_.per_signal_k;
    const std::string query = request.query;

    // Every signal applies the caller filters before its top-K cut
    const RecordFilter store_filter = request.filters.ToRecordFilter();

    // ------------------------------------------------------------------
    // 1. Candidate generation, one thread per signal, bounded by the
    //    retriever-wide slot count
    // ------------------------------------------------------------------
    std::vector<std::pair<Signal, SignalFn>> signals;
    auto store = store_;

    if (config_.enable_vector && llm_) {
        auto llm = llm_;
        signals.emplace_back(Signal::VECTOR, [store, llm, query, k, store_filter](const auto&) {
            return store->VectorTopK(llm->Embed(query), k, store_filter);
        });
    }
    if (config_.enable_keyword) {
        signals.emplace_back(Signal::KEYWORD, [store, query, k, store_filter](const auto&) {
            return store->KeywordTopK(query, k, store_filter);
        });
    }
    if (config_.enable_graph) {
        auto graph = graph_;
        signals.emplace_back(Signal::GRAPH, [graph, query, k, now, store_filter](const auto& stop) {
            return graph->RankRecords(query, now, k, store_filter, stop);
        });
    }

    std::vector<PendingSignal> pending;
    for (auto& [signal, fn] : signals) {
        bool acquired = false;
        while (!acquired) {
            if (request.cancel.IsCancelled()) {
                Abandon(pending);
                throw OperationCancelled("search cancelled");
            }
            if (request.deadline && std::chrono::steady_clock::now() >= *request.deadline) {
                break;
            }
            acquired = signal_slots_->TryAcquireFor(config_.poll_interval);
        }
        if (!acquired) {
            result.cancelled_signals.push_back(signal);
            log_.Debug(std::string(ToString(signal)) + " signal found no free slot before the deadline");
            continue;
        }
        try {
            pending.push_back(Launch(signal, std::move(fn), signal_slots_));
        } catch (const std::system_error&) {
            Abandon(pending);
            throw;
        }
    }

    if (config_.classify_intent && llm_) {
        try {
            result.intent = llm_->ClassifyIntent(query);
        } catch (const UpstreamUnavailable& e) {
            log_.Warning(std::string("intent classification failed: ") + e.what());
        }
    }

    // ------------------------------------------------------------------
    // 2. Collect signals until done, deadline or cancellation
    // ------------------------------------------------------------------
    std::map<Signal, std::vector<ScoredID>> rankings;

    while (!pending.empty()) {
        if (request.cancel.IsCancelled()) {
            Abandon(pending);
            throw OperationCancelled("search cancelled");
        }

        for (auto it = pending.begin(); it != pending.end();) {
            if (!IsReady(it->future)) {
                ++it;
                continue;
            }
            try {
                rankings[it->signal] = it->future.get();
            } catch (const std::exception& e) {
                result.failed_signals.push_back(it->signal);
                log_.Warning(std::string(ToString(it->signal)) + " signal failed: " + e.what());
            }
            it = pending.erase(it);
        }
        if (pending.empty()) {
            break;
        }

        auto wait = config_.poll_interval;
        if (request.deadline) {
            auto clock_now = std::chrono::steady_clock::now();
            if (clock_now >= *request.deadline) {
                for (auto& p : pending) {
                    p.task->abandoned.store(true);
                    result.cancelled_signals.push_back(p.signal);
                    log_.Debug(std::string(ToString(p.signal)) + " signal missed the deadline");
                }
                pending.clear();
                break;
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *request.deadline - clock_now) + std::chrono::milliseconds(1);
            wait = std::min(wait, remaining);
        }
        pending.front().future.wait_for(wait);
    }

    std::sort(result.failed_signals.begin(), result.failed_signals.end());
    std::sort(result.cancelled_signals.begin(), result.cancelled_signals.end());
    result.partial = !result.failed_signals.empty() || !result.cancelled_signals.empty();

    if (rankings.empty() && result.cancelled_signals.empty()) {
        throw UpstreamUnavailable(UpstreamKind::UNAVAILABLE, "every retrieval signal failed");
    }

    // ------------------------------------------------------------------
    // 3. Load candidates and apply caller filters before fusion
    // ------------------------------------------------------------------
    std::unordered_map<RecordID, MemoryRecord> records;
    std::set<RecordID> missing;
    for (const auto& [signal, ranking] : rankings) {
        for (const auto& hit : ranking) {
            if (records.count(hit.id) > 0 || missing.count(hit.id) > 0) {
                continue;
            }
            auto record = store_->Get(hit.id);
            if (record) {
                records.emplace(hit.id, std::move(*record));
            } else {
                missing.insert(hit.id);
            }
        }
    }
    result.candidates_considered = records.size();

    std::map<Signal, std::vector<ScoredID>> filtered;
    for (const auto& [signal, ranking] : rankings) {
        auto& kept = filtered[signal];
        for (const auto& hit : ranking) {
            auto it = records.find(hit.id);
            if (it != records.end() && request.filters.Matches(it->second)) {
                kept.push_back(hit);
            }
        }
    }

    // ------------------------------------------------------------------
    // 4. Fuse and order
    // ------------------------------------------------------------------
    std::map<Signal, float> weights;
    for (const auto& [signal, ranking] : filtered) {
        weights[signal] = WeightFor(signal);
    }

    auto candidates = FuseRankings(filtered, weights, config_.rrf_k);
    for (auto& candidate : candidates) {
        const MemoryRecord& record = records.at(candidate.id);
        candidate.importance = record.GetImportance();
        candidate.last_accessed = record.GetLastAccessed();
        candidate.record = record;
    }
    SortCandidates(candidates);

    // ------------------------------------------------------------------
    // 5. Context assembly; the first candidate that does not fit ends it
    // ------------------------------------------------------------------
    const size_t budget = request.token_budget.value_or(config_.default_token_budget);
    for (auto& candidate : candidates) {
        if (result.items.size() >= request.limit) {
            break;
        }
        size_t tokens = candidate.record.EstimateTokens();
        if (result.tokens_used + tokens > budget) {
            break;
        }
        result.tokens_used += tokens;
        result.items.push_back(std::move(candidate));
    }

    log_.Debug("query returned " + std::to_string(result.items.size()) + " of " +
               std::to_string(candidates.size()) + " candidates" +
               (result.partial ? " (partial)" : ""));
    return result;
}

std::vector<RetrievalCandidate> HybridRetriever::FuseRankings(
        const std::map<Signal, std::vector<ScoredID>>& rankings,
        const std::map<Signal, float>& weights,
        float k) {
    std::map<RecordID, RetrievalCandidate> fused;

    for (const auto& [signal, ranking] : rankings) {
        auto weight_it = weights.find(signal);
        float weight = weight_it == weights.end() ? 1.0f : weight_it->second;

        size_t rank = 0;
        for (const auto& hit : ranking) {
            auto& candidate = fused[hit.id];
            candidate.id = hit.id;
            if (candidate.signals.count(signal) > 0) {
                continue;  // keep the best position only
            }
            ++rank;
            candidate.signals[signal] = SignalHit{rank, hit.score};
            candidate.fused_score += weight / (static_cast<float>(rank) + k);
        }
    }

    std::vector<RetrievalCandidate> candidates;
    candidates.reserve(fused.size());
    for (auto& [id, candidate] : fused) {
        candidates.push_back(std::move(candidate));
    }
    SortCandidates(candidates);
    return candidates;
}

void HybridRetriever::SortCandidates(std::vector<RetrievalCandidate>& candidates) {
    std::sort(candidates.begin(), candidates.end(),
              [](const RetrievalCandidate& a, const RetrievalCandidate& b) {
                  if (a.fused_score != b.fused_score) return a.fused_score > b.fused_score;
                  if (a.importance != b.importance) return a.importance > b.importance;
                  if (a.last_accessed != b.last_accessed) return a.last_accessed > b.last_accessed;
                  return a.id < b.id;
              });
}

} // namespace engram
