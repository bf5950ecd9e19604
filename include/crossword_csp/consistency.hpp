/**
 * @file consistency.hpp
 * @brief ノード整合・弧整合 (AC-3) の実施
 */
#ifndef CROSSWORD_CSP_CONSISTENCY_HPP
#define CROSSWORD_CSP_CONSISTENCY_HPP

#include "crossword_csp/domain_store.hpp"
#include "crossword_csp/geometry.hpp"
#include <vector>
#include <optional>
#include <cstddef>

namespace crossword_csp {

/**
 * @brief 弧（スロットの順序対、インデックスで表す）
 */
struct Arc {
    size_t x;
    size_t y;

    bool operator==(const Arc& other) const { return x == other.x && y == other.y; }
};

/**
 * @brief 整合性処理の統計情報
 */
struct PropagationStats {
    size_t node_removed = 0;    // ノード整合で除去した値の数
    size_t revise_calls = 0;    // revise の呼び出し回数
    size_t revisions = 0;       // 定義域が変化した revise の回数
    size_t arc_removed = 0;     // 弧整合で除去した値の数
};

/**
 * @brief ノード整合を実施
 *
 * 各スロットの定義域から、長さがスロット長と異なる単語を除去する。
 * 冪等（2回目の呼び出しは何もしない）。空の定義域も許容する。
 */
void enforce_node_consistency(DomainStore& store, const Geometry& geometry,
                              PropagationStats* stats = nullptr);

/**
 * @brief x を y に対して弧整合にする
 *
 * domain(x) の単語 p は、p と異なる単語 q が domain(y) にあり、
 * 交差位置の文字が一致する場合のみ残す。
 *
 * @return domain(x) から値を除去したら true。交差がなければ false
 * @throws std::invalid_argument x == y の場合
 */
bool revise(DomainStore& store, const Geometry& geometry, size_t x, size_t y,
            PropagationStats* stats = nullptr);

/**
 * @brief AC-3 で弧整合を実施
 *
 * @param initial_arcs 最初に検査する弧。省略時は異なるスロットの全順序対
 * @return 全ての定義域が空でなければ true、空になったら false
 * @throws std::out_of_range initial_arcs に存在しないスロットがある場合
 */
bool ac3(DomainStore& store, const Geometry& geometry,
         const std::optional<std::vector<Arc>>& initial_arcs = std::nullopt,
         PropagationStats* stats = nullptr);

} // namespace crossword_csp

#endif // CROSSWORD_CSP_CONSISTENCY_HPP
