#include "rag_core/index/similarity.hpp"

#include <faiss/utils/distances.h>

#include <cmath>

namespace rag_core {

float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.empty() || a.size() != b.size()) {
    return 0.0f;
  }
  const float norm_a = faiss::fvec_norm_L2sqr(a.data(), a.size());
  const float norm_b = faiss::fvec_norm_L2sqr(b.data(), b.size());
  if (norm_a <= 0.0f || norm_b <= 0.0f) {
    return 0.0f;
  }
  const float dot = faiss::fvec_inner_product(a.data(), b.data(), a.size());
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

std::vector<float> l2_normalized(const std::vector<float> &v) {
  std::vector<float> out = v;
  if (!out.empty() && faiss::fvec_norm_L2sqr(out.data(), out.size()) > 0.0f) {
    faiss::fvec_renorm_L2(out.size(), 1, out.data());
  }
  return out;
}

}  // namespace rag_core
