// File: src/llm/cached_language_model.cpp
#include "llm/cached_language_model.hpp"
#include "core/errors.hpp"
#include <stdexcept>

namespace engram {

CachedLanguageModel::CachedLanguageModel(std::shared_ptr<ILanguageModel> upstream,
                                         const Config& config)
    : upstream_(std::move(upstream)),
      config_(config),
      embedding_cache_(config.cache_capacity),
      intent_cache_(config.cache_capacity),
      call_slots_(config.max_concurrent_calls) {
    if (!upstream_) {
        throw std::invalid_argument("CachedLanguageModel requires an upstream model");
    }
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid CachedLanguageModel configuration");
    }
}

template <typename Fn>
auto CachedLanguageModel::Call(const std::string& operation, Fn&& fn) -> decltype(fn()) {
    return RetryWithBackoff(config_.retry, operation, log_, [&]() {
        if (!call_slots_.TryAcquireFor(config_.call_timeout)) {
            throw UpstreamUnavailable(UpstreamKind::TIMEOUT,
                                      operation + ": no free upstream slot within timeout");
        }
        SemaphoreGuard slot(call_slots_, std::adopt_lock);
        return fn();
    });
}

Embedding CachedLanguageModel::Embed(const std::string& text) {
    if (auto cached = embedding_cache_.Get(text)) {
        return *cached;
    }

    Embedding embedding = Call("embed", [&]() { return upstream_->Embed(text); });

    if (embedding.size() != upstream_->Dimension()) {
        throw DimensionMismatch(upstream_->Dimension(), embedding.size());
    }

    embedding_cache_.Put(text, embedding);
    return embedding;
}

std::string CachedLanguageModel::Summarize(const std::vector<std::string>& texts) {
    std::string summary = Call("summarize", [&]() { return upstream_->Summarize(texts); });
    if (summary.empty()) {
        throw UpstreamUnavailable(UpstreamKind::INVALID_RESPONSE, "summarize returned nothing");
    }
    return summary;
}

QueryIntent CachedLanguageModel::ClassifyIntent(const std::string& text) {
    if (auto cached = intent_cache_.Get(text)) {
        return *cached;
    }

    QueryIntent intent = Call("classify_intent", [&]() { return upstream_->ClassifyIntent(text); });
    intent_cache_.Put(text, intent);
    return intent;
}

} // namespace engram
