// File: src/llm/language_model.hpp
#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace engram {

/// What a query is trying to do, used to annotate search results
enum class QueryIntent : uint8_t {
    STANDARD = 0,
    FACTUAL,
    PATTERN,
    DECISION,
    LEARNING,
    DEBUG,
    PLANNING,
    ANALYSIS,
    SYNTHESIS,
};

const char* ToString(QueryIntent intent);

/// Language-model service used for embedding, summarization and intent
///
/// Implementations must be thread-safe. Failures are reported as
/// UpstreamUnavailable with RATE_LIMITED, TIMEOUT, INVALID_RESPONSE or
/// UNAVAILABLE.
class ILanguageModel {
public:
    virtual ~ILanguageModel() = default;

    /// Dense embedding of `text`; its length is Dimension()
    virtual Embedding Embed(const std::string& text) = 0;

    /// One summary covering all `texts`
    virtual std::string Summarize(const std::vector<std::string>& texts) = 0;

    virtual QueryIntent ClassifyIntent(const std::string& text) = 0;

    /// Length of every embedding this model returns
    virtual size_t Dimension() const = 0;
};

} // namespace engram
