// File: src/llm/hashing_language_model.hpp
#pragma once

#include "llm/language_model.hpp"

namespace engram {

/// Offline language model
///
/// - Embed: signed feature hashing of content tokens and adjacent token
///   pairs, L2-normalized. Texts sharing vocabulary land close together.
/// - Summarize: leading sentences up to a character budget.
/// - ClassifyIntent: keyword rules.
///
/// Deterministic and dependency-free; suitable for tests, examples and
/// deployments without a model service. It does not understand language.
class HashingLanguageModel : public ILanguageModel {
public:
    struct Config {
        size_t dimension{256};
        size_t summary_max_chars{280};
    };

    HashingLanguageModel();
    explicit HashingLanguageModel(const Config& config);

    Embedding Embed(const std::string& text) override;
    std::string Summarize(const std::vector<std::string>& texts) override;
    QueryIntent ClassifyIntent(const std::string& text) override;
    size_t Dimension() const override { return config_.dimension; }

private:
    Config config_;

    void AddFeature(Embedding& vec, const std::string& feature, float weight) const;
};

} // namespace engram
