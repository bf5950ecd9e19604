#include "crossword_csp/domain.hpp"
#include <algorithm>

namespace crossword_csp {

Domain::Domain()
    : n_(0) {}

Domain::Domain(size_t universe)
    : sparse_(universe)
    , n_(universe) {
    values_.reserve(universe);
    for (size_t v = 0; v < universe; ++v) {
        sparse_[v] = v;
        values_.push_back(static_cast<value_type>(v));
    }
}

Domain::Domain(size_t universe, std::vector<value_type> values)
    : sparse_(universe, SIZE_MAX)
    , n_(0) {
    // 重複と範囲外を除去してソート
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    values.erase(std::remove_if(values.begin(), values.end(),
                                [universe](value_type v) { return v >= universe; }),
                 values.end());

    values_ = std::move(values);
    n_ = values_.size();
    for (size_t i = 0; i < n_; ++i) {
        sparse_[values_[i]] = i;
    }
}

bool Domain::remove(value_type value) {
    if (!contains(value)) {
        return false;
    }
    swap_at(sparse_[value], n_ - 1);
    --n_;
    return true;
}

std::vector<Domain::value_type> Domain::values() const {
    std::vector<value_type> result(begin(), end());
    std::sort(result.begin(), result.end());
    return result;
}

void Domain::swap_at(size_t i, size_t j) {
    if (i == j) return;
    value_type vi = values_[i];
    value_type vj = values_[j];
    values_[i] = vj;
    values_[j] = vi;
    sparse_[vj] = i;
    sparse_[vi] = j;
}

} // namespace crossword_csp
