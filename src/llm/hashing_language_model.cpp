// File: src/llm/hashing_language_model.cpp
#include "llm/hashing_language_model.hpp"
#include "util/text.hpp"
#include "util/vector_math.hpp"
#include <stdexcept>
#include <initializer_list>

namespace engram {

namespace {

// 64-bit FNV-1a
uint64_t Fnv1a(const std::string& str) {
    uint64_t hash = 14695981039346656037ull;
    for (unsigned char c : str) {
        hash ^= c;
        hash *= 1099511628211ull;
    }
    return hash;
}

bool ContainsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

HashingLanguageModel::HashingLanguageModel()
    : HashingLanguageModel(Config{}) {}

HashingLanguageModel::HashingLanguageModel(const Config& config)
    : config_(config) {
    if (config_.dimension == 0) {
        throw std::invalid_argument("HashingLanguageModel dimension must be positive");
    }
}

void HashingLanguageModel::AddFeature(Embedding& vec, const std::string& feature, float weight) const {
    uint64_t hash = Fnv1a(feature);
    size_t slot = static_cast<size_t>(hash % config_.dimension);
    float sign = ((hash >> 63) & 1u) ? -1.0f : 1.0f;
    vec[slot] += sign * weight;
}

Embedding HashingLanguageModel::Embed(const std::string& text) {
    Embedding vec(config_.dimension, 0.0f);

    std::vector<std::string> tokens = text::ContentTokens(text);
    for (size_t i = 0; i < tokens.size(); ++i) {
        AddFeature(vec, tokens[i], 1.0f);
        if (i + 1 < tokens.size()) {
            AddFeature(vec, tokens[i] + " " + tokens[i + 1], 0.5f);
        }
    }

    NormalizeL2(vec);
    return vec;
}

std::string HashingLanguageModel::Summarize(const std::vector<std::string>& texts) {
    std::string summary;
    for (const auto& text : texts) {
        for (const auto& sentence : text::SplitSentences(text)) {
            size_t needed = summary.empty() ? sentence.size() : sentence.size() + 1;
            if (summary.size() + needed > config_.summary_max_chars) {
                if (summary.empty()) {
                    // First sentence alone is too long: cut it
                    return sentence.substr(0, config_.summary_max_chars);
                }
                return summary;
            }
            if (!summary.empty()) {
                summary += ' ';
            }
            summary += sentence;
        }
    }
    return summary;
}

QueryIntent HashingLanguageModel::ClassifyIntent(const std::string& text) {
    std::string query = text::ToLower(text);

    // More specific patterns first
    if (ContainsAny(query, {"what is", "who is", "when was", "when did", "where is", "tell me about"})) {
        return QueryIntent::FACTUAL;
    }
    if (ContainsAny(query, {"how to", "understand", "tutorial"})) {
        return QueryIntent::LEARNING;
    }
    if (ContainsAny(query, {"what patterns", "trends", "habits", "usual", "typical", "how often"})) {
        return QueryIntent::PATTERN;
    }
    if (ContainsAny(query, {"should i", "what should", "decide", "choice", "better", "recommend"})) {
        return QueryIntent::DECISION;
    }
    if (ContainsAny(query, {"error", "problem", "issue", "bug", "broken", "wrong"})) {
        return QueryIntent::DEBUG;
    }
    if (ContainsAny(query, {"plan", "schedule", "timeline", "steps", "roadmap"})) {
        return QueryIntent::PLANNING;
    }
    if (ContainsAny(query, {"analyze", "examine", "review", "evaluate", "compare"})) {
        return QueryIntent::ANALYSIS;
    }
    if (ContainsAny(query, {"combine", "integrate", "synthesize", "merge", "unify"})) {
        return QueryIntent::SYNTHESIS;
    }
    if (ContainsAny(query, {"learn", "explain"})) {
        return QueryIntent::LEARNING;
    }
    return QueryIntent::STANDARD;
}

} // namespace engram
