// File: src/llm/language_model.cpp
#include "llm/language_model.hpp"

namespace engram {

const char* ToString(QueryIntent intent) {
    switch (intent) {
        case QueryIntent::STANDARD: return "STANDARD";
        case QueryIntent::FACTUAL: return "FACTUAL";
        case QueryIntent::PATTERN: return "PATTERN";
        case QueryIntent::DECISION: return "DECISION";
        case QueryIntent::LEARNING: return "LEARNING";
        case QueryIntent::DEBUG: return "DEBUG";
        case QueryIntent::PLANNING: return "PLANNING";
        case QueryIntent::ANALYSIS: return "ANALYSIS";
        case QueryIntent::SYNTHESIS: return "SYNTHESIS";
    }
    return "UNKNOWN";
}

} // namespace engram
