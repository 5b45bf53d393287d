#pragma once

#include <span>

namespace verity::vector {

// Cosine similarity; 0 when either vector is empty or zero-norm, or the dimensions differ
double cosineSimilarity(std::span<const float> a, std::span<const float> b);

// 1 - cosine similarity (pgvector's <=> operator)
double cosineDistance(std::span<const float> a, std::span<const float> b);

double l2Norm(std::span<const float> v);

} // namespace verity::vector
