#pragma once

#include <vector>

namespace rag_core {

// Cosine similarity in [-1, 1]. Zero when either vector has no magnitude or
// the dimensions differ.
float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

// Unit-length copy of v; a zero vector is returned unchanged.
std::vector<float> l2_normalized(const std::vector<float> &v);

}  // namespace rag_core
