#pragma once
#include <cstdint>
#include <utility>
#include <vector>

namespace moviesim {

// (column, weight) pairs, sorted by column, no duplicate columns
using SparseVector = std::vector<std::pair<uint32_t, float>>;

namespace sparse {

double dot(const SparseVector& a, const SparseVector& b);

double l2_norm(const SparseVector& v);

// scale in place so that l2_norm(v) == 1; zero vectors are left as is
void l2_normalize(SparseVector& v);

}  // namespace sparse

}  // namespace moviesim
