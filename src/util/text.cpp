// File: src/util/text.cpp
#include "util/text.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace engram {
namespace text {

namespace {

const std::unordered_set<std::string>& StopWords() {
    static const std::unordered_set<std::string> words = {
        "a", "an", "and", "are", "as", "at", "be", "but", "by", "do", "does",
        "for", "from", "has", "have", "how", "i", "in", "is", "it", "its",
        "me", "my", "of", "on", "or", "so", "that", "the", "this", "to",
        "was", "we", "what", "when", "where", "which", "who", "why", "with",
        "you", "your",
    };
    return words;
}

std::string Trim(const std::string& str) {
    size_t begin = 0;
    while (begin < str.size() && std::isspace(static_cast<unsigned char>(str[begin]))) {
        ++begin;
    }
    size_t end = str.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
        --end;
    }
    return str.substr(begin, end - begin);
}

} // namespace

std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> Tokenize(const std::string& str) {
    std::vector<std::string> tokens;
    std::string current;
    for (char ch : str) {
        auto c = static_cast<unsigned char>(ch);
        if (c >= 0x80) {
            // UTF-8 lead and continuation bytes stay inside the word
            current.push_back(ch);
        } else if (std::isalnum(c)) {
            current.push_back(static_cast<char>(std::tolower(c)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::vector<std::string> ContentTokens(const std::string& str) {
    std::vector<std::string> tokens = Tokenize(str);
    const auto& stop = StopWords();
    tokens.erase(std::remove_if(tokens.begin(), tokens.end(),
                                [&stop](const std::string& t) {
                                    return t.size() < 2 || stop.count(t) > 0;
                                }),
                 tokens.end());
    return tokens;
}

std::vector<std::string> TopKeywords(const std::string& str, size_t max_keywords) {
    std::vector<std::string> order;
    std::unordered_map<std::string, size_t> counts;
    for (auto& token : ContentTokens(str)) {
        if (counts[token]++ == 0) {
            order.push_back(std::move(token));
        }
    }

    // stable_sort keeps first-appearance order among equal counts
    std::stable_sort(order.begin(), order.end(),
                     [&counts](const std::string& a, const std::string& b) {
                         return counts[a] > counts[b];
                     });
    if (order.size() > max_keywords) {
        order.resize(max_keywords);
    }
    return order;
}

std::vector<std::string> SplitSentences(const std::string& str) {
    std::vector<std::string> sentences;
    std::string current;
    for (char c : str) {
        current.push_back(c);
        if (c == '.' || c == '!' || c == '?' || c == '\n') {
            std::string trimmed = Trim(current);
            if (!trimmed.empty()) {
                sentences.push_back(trimmed);
            }
            current.clear();
        }
    }
    std::string trimmed = Trim(current);
    if (!trimmed.empty()) {
        sentences.push_back(trimmed);
    }
    return sentences;
}

} // namespace text
} // namespace engram
