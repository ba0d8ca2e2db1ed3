// File: src/util/vector_math.cpp
#include "util/vector_math.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace engram {

float CosineSimilarity(const Embedding& a, const Embedding& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatch(a.size(), b.size());
    }

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }

    if (norm_a <= 0.0 || norm_b <= 0.0) {
        return 0.0f;
    }

    double similarity = dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
    return static_cast<float>(std::clamp(similarity, -1.0, 1.0));
}

void NormalizeL2(Embedding& v) {
    double norm = 0.0;
    for (float x : v) {
        norm += static_cast<double>(x) * x;
    }
    if (norm <= 0.0) {
        return;
    }
    auto inv = static_cast<float>(1.0 / std::sqrt(norm));
    for (float& x : v) {
        x *= inv;
    }
}

} // namespace engram
