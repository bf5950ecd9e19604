#include "crossword_csp/assignment.hpp"
#include <iterator>
#include <stdexcept>

namespace crossword_csp {

namespace {

/**
 * @brief 2スロットの単語の組が制約を満たすか
 */
bool pair_consistent(const Slot& sx, const std::string& wx,
                     const Slot& sy, const std::string& wy,
                     const std::optional<Overlap>& overlap) {
    if (wx == wy) {
        return false;
    }
    if (wx.size() != sx.length || wy.size() != sy.length) {
        return false;
    }
    if (overlap && wx[overlap->first] != wy[overlap->second]) {
        return false;
    }
    return true;
}

}  // namespace

PartialAssignment::PartialAssignment(size_t num_slots)
    : values_(num_slots, UNASSIGNED) {}

PartialAssignment PartialAssignment::extended(size_t slot_idx, WordId word) const {
    if (slot_idx >= values_.size()) {
        throw std::out_of_range("Slot index out of range");
    }
    if (is_assigned(slot_idx)) {
        throw std::invalid_argument("Slot is already assigned");
    }
    PartialAssignment result(*this);
    result.values_[slot_idx] = word;
    result.assigned_count_++;
    return result;
}

Assignment PartialAssignment::to_assignment(const Geometry& geometry,
                                            const Vocabulary& vocabulary) const {
    Assignment result;
    for (size_t i = 0; i < values_.size(); ++i) {
        if (is_assigned(i)) {
            result.emplace(geometry.slot(i), vocabulary.word(values_[i]));
        }
    }
    return result;
}

bool is_consistent(const Assignment& assignment, const Geometry& geometry) {
    for (auto it = assignment.begin(); it != assignment.end(); ++it) {
        const size_t x = geometry.index_of(it->first);
        // 1語だけでも長さは検査する
        if (it->second.size() != it->first.length) {
            return false;
        }
        for (auto jt = std::next(it); jt != assignment.end(); ++jt) {
            const size_t y = geometry.index_of(jt->first);
            if (!pair_consistent(it->first, it->second, jt->first, jt->second,
                                 geometry.overlap(x, y))) {
                return false;
            }
        }
    }
    return true;
}

bool is_consistent(const PartialAssignment& assignment, const Geometry& geometry,
                   const Vocabulary& vocabulary) {
    const size_t n = assignment.num_slots();
    for (size_t x = 0; x < n; ++x) {
        if (!assignment.is_assigned(x)) continue;
        const auto& sx = geometry.slot(x);
        const auto& wx = vocabulary.word(assignment.value(x));
        if (wx.size() != sx.length) {
            return false;
        }
        for (size_t y = x + 1; y < n; ++y) {
            if (!assignment.is_assigned(y)) continue;
            if (!pair_consistent(sx, wx, geometry.slot(y), vocabulary.word(assignment.value(y)),
                                 geometry.overlap(x, y))) {
                return false;
            }
        }
    }
    return true;
}

bool is_consistent_with(const PartialAssignment& assignment, size_t slot_idx, WordId word,
                        const Geometry& geometry, const Vocabulary& vocabulary) {
    const auto& sx = geometry.slot(slot_idx);
    const auto& wx = vocabulary.word(word);
    if (wx.size() != sx.length) {
        return false;
    }
    for (size_t y = 0; y < assignment.num_slots(); ++y) {
        if (y == slot_idx || !assignment.is_assigned(y)) continue;
        if (!pair_consistent(sx, wx, geometry.slot(y), vocabulary.word(assignment.value(y)),
                             geometry.overlap(slot_idx, y))) {
            return false;
        }
    }
    return true;
}

bool is_complete(const Assignment& assignment, const Geometry& geometry) {
    return assignment.size() == geometry.num_slots();
}

} // namespace crossword_csp
