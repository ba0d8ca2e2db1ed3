// File: src/util/vector_math.hpp
#pragma once

#include "core/types.hpp"

namespace engram {

/// Cosine similarity in [-1, 1]; 0 when either vector has zero norm
/// @throws DimensionMismatch if the lengths differ
float CosineSimilarity(const Embedding& a, const Embedding& b);

/// Scale to unit length in place (zero vectors are left alone)
void NormalizeL2(Embedding& v);

} // namespace engram
