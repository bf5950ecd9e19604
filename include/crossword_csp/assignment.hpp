/**
 * @file assignment.hpp
 * @brief 割当（スロット -> 単語）と整合性検査
 */
#ifndef CROSSWORD_CSP_ASSIGNMENT_HPP
#define CROSSWORD_CSP_ASSIGNMENT_HPP

#include "crossword_csp/geometry.hpp"
#include "crossword_csp/vocabulary.hpp"
#include <map>
#include <string>
#include <vector>
#include <limits>

namespace crossword_csp {

/**
 * @brief 割当を表す型（部分割当も可）
 */
using Assignment = std::map<Slot, std::string>;

/**
 * @brief 探索用の部分割当（スロットインデックス -> WordId）
 *
 * 値として扱い、拡張は常にコピー（extended）で行う。
 * 親の割当を変更しないため、バックトラック時の復元は不要。
 */
class PartialAssignment {
public:
    static constexpr WordId UNASSIGNED = std::numeric_limits<WordId>::max();

    explicit PartialAssignment(size_t num_slots);

    size_t num_slots() const { return values_.size(); }
    size_t assigned_count() const { return assigned_count_; }

    /**
     * @brief 全スロットに割当があるか（個数の一致で判定）
     */
    bool is_complete() const { return assigned_count_ == values_.size(); }

    bool is_assigned(size_t slot_idx) const { return values_[slot_idx] != UNASSIGNED; }

    /**
     * @brief 割り当てられた単語ID
     * @pre is_assigned(slot_idx)
     */
    WordId value(size_t slot_idx) const { return values_[slot_idx]; }

    /**
     * @brief slot_idx -> word を追加した新しい割当を返す
     * @throws std::out_of_range slot_idx が範囲外
     * @throws std::invalid_argument 既に割り当て済み
     */
    PartialAssignment extended(size_t slot_idx, WordId word) const;

    /**
     * @brief Slot -> 単語 の形式に変換
     */
    Assignment to_assignment(const Geometry& geometry, const Vocabulary& vocabulary) const;

private:
    std::vector<WordId> values_;
    size_t assigned_count_ = 0;
};

/**
 * @brief 割当が整合しているか
 *
 * 割当済みの異なる2スロットの全ての組について、
 * 単語が異なること、単語長がスロット長と一致すること、
 * 交差があれば交差位置の文字が一致することを確認する。
 *
 * @throws std::out_of_range 盤面にないスロットを含む場合
 */
bool is_consistent(const Assignment& assignment, const Geometry& geometry);
bool is_consistent(const PartialAssignment& assignment, const Geometry& geometry,
                   const Vocabulary& vocabulary);

/**
 * @brief slot_idx に word を置いたとき、割当済みの他スロットと整合するか
 *
 * 割当が既に整合していれば、この結果は拡張後の is_consistent と一致する。
 */
bool is_consistent_with(const PartialAssignment& assignment, size_t slot_idx, WordId word,
                        const Geometry& geometry, const Vocabulary& vocabulary);

/**
 * @brief 割当が全スロットを埋めているか
 */
bool is_complete(const Assignment& assignment, const Geometry& geometry);

} // namespace crossword_csp

#endif // CROSSWORD_CSP_ASSIGNMENT_HPP
