#include "moviesim/SparseVector.hpp"
#include <cmath>

namespace moviesim {
namespace sparse {

double dot(const SparseVector& a, const SparseVector& b) {
    size_t i = 0, j = 0;
    double s = 0.0;
    while (i < a.size() && j < b.size()) {
        if (a[i].first == b[j].first) {
            s += (double)a[i].second * (double)b[j].second;
            ++i; ++j;
        } else if (a[i].first < b[j].first) {
            ++i;
        } else {
            ++j;
        }
    }
    return s;
}

double l2_norm(const SparseVector& v) {
    double norm2 = 0.0;
    for (const auto& kv : v) norm2 += (double)kv.second * (double)kv.second;
    return std::sqrt(norm2);
}

void l2_normalize(SparseVector& v) {
    double n = l2_norm(v);
    if (n == 0.0) return;
    for (auto& kv : v) kv.second = (float)((double)kv.second / n);
}

}  // namespace sparse
}  // namespace moviesim
