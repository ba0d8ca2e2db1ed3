// File: src/util/text.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace engram {
namespace text {

/// Lowercase ASCII copy of `str`
std::string ToLower(const std::string& str);

/// Split into lowercase alphanumeric tokens; everything else separates
///
/// Non-ASCII bytes count as word characters and are kept unchanged.
std::vector<std::string> Tokenize(const std::string& str);

/// Tokenize and drop common English stop words and one-character tokens
std::vector<std::string> ContentTokens(const std::string& str);

/// Most frequent content tokens, ties broken by first appearance
std::vector<std::string> TopKeywords(const std::string& str, size_t max_keywords);

/// Split into sentences on '.', '!', '?' and newlines; trims whitespace
std::vector<std::string> SplitSentences(const std::string& str);

} // namespace text
} // namespace engram
