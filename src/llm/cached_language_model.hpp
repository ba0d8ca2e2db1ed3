// File: src/llm/cached_language_model.hpp
#pragma once

#include "core/debug_log.hpp"
#include "llm/language_model.hpp"
#include "storage/lru_cache.hpp"
#include "util/retry.hpp"
#include "util/semaphore.hpp"
#include <chrono>
#include <memory>

namespace engram {

/// Guarded front for an upstream language model
///
/// - Embeddings and intents are kept in bounded LRU caches keyed by text.
/// - At most `max_concurrent_calls` upstream calls are in flight; a caller
///   that cannot get a slot within `call_timeout` fails with TIMEOUT.
/// - Retryable upstream failures are retried with exponential backoff.
/// - Embeddings of the wrong length are rejected with DimensionMismatch.
class CachedLanguageModel : public ILanguageModel {
public:
    struct Config {
        size_t cache_capacity{1024};
        size_t max_concurrent_calls{4};
        std::chrono::milliseconds call_timeout{10000};
        RetryPolicy retry;

        bool IsValid() const {
            return cache_capacity > 0 && max_concurrent_calls > 0 &&
                   call_timeout.count() > 0 && retry.IsValid();
        }
    };

    /// @throws std::invalid_argument if upstream is null or config invalid
    CachedLanguageModel(std::shared_ptr<ILanguageModel> upstream, const Config& config);

    Embedding Embed(const std::string& text) override;
    std::string Summarize(const std::vector<std::string>& texts) override;
    QueryIntent ClassifyIntent(const std::string& text) override;
    size_t Dimension() const override { return upstream_->Dimension(); }

    LRUCache<std::string, Embedding>::Stats GetEmbeddingCacheStats() const {
        return embedding_cache_.GetStats();
    }

    /// Set output stream for log messages
    void SetLogStream(std::ostream* os) { log_.SetStream(os); }

private:
    std::shared_ptr<ILanguageModel> upstream_;
    Config config_;

    LRUCache<std::string, Embedding> embedding_cache_;
    LRUCache<std::string, QueryIntent> intent_cache_;
    Semaphore call_slots_;

    DebugLog log_{"LanguageModel"};

    /// Run one upstream call inside a concurrency slot, with retries
    template <typename Fn>
    auto Call(const std::string& operation, Fn&& fn) -> decltype(fn());
};

} // namespace engram
