/**
 * @file solver.hpp
 * @brief クロスワード CSP ソルバー（整合性処理 + ヒューリスティック付きバックトラック）
 */
#ifndef CROSSWORD_CSP_SOLVER_HPP
#define CROSSWORD_CSP_SOLVER_HPP

#include "crossword_csp/assignment.hpp"
#include "crossword_csp/consistency.hpp"
#include "crossword_csp/domain_store.hpp"
#include "crossword_csp/geometry.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace crossword_csp {

/**
 * @brief 解のコールバック関数型
 * @return trueを返すと探索を継続、falseで停止
 */
using SolutionCallback = std::function<bool(const Assignment&)>;

/**
 * @brief 探索結果
 */
enum class SearchResult {
    SAT,      // 解が見つかった（探索を打ち切る）
    UNSAT     // この部分木に解がない（または全解探索で継続）
};

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t nodes = 0;               // 探索ノード数
    size_t fail_count = 0;          // 全ての値が失敗したノード数
    size_t max_depth = 0;
    size_t consistency_checks = 0;  // 割当時の整合性検査の回数
    size_t solutions = 0;
    PropagationStats propagation;
};

/**
 * @brief クロスワード CSP ソルバー
 *
 * 1. ノード整合（単語長）
 * 2. AC-3 による弧整合
 * 3. バックトラック探索
 *    - 変数選択: MRV（残り値最小）、同点なら次数最大
 *    - 値選択: least-constraining-value（未割当の隣接スロットとの衝突数が少ない順）
 *
 * 探索中は定義域を縮小しない。各分岐は親の割当をコピーして拡張する。
 */
class Solver {
public:
    Solver() = default;

    /**
     * @brief 最初の解を探索
     * @param store 定義域（ノード整合・弧整合で縮小される）
     * @param geometry 盤面形状
     * @return 解が見つかればその割当、なければ std::nullopt
     */
    std::optional<Assignment> solve(DomainStore& store, const Geometry& geometry);

    /**
     * @brief 全ての解を探索
     * @param callback 解が見つかるたびに呼ばれるコールバック
     * @return 見つかった解の数
     */
    size_t solve_all(DomainStore& store, const Geometry& geometry, SolutionCallback callback);

    /**
     * @brief 次に割り当てるスロットを選択
     *
     * 未割当スロットのうち定義域が最小のもの、同点なら次数が最大のもの。
     * さらに同点ならスロット順で先のもの。
     *
     * @pre 未割当のスロットが存在すること
     */
    size_t select_unassigned_slot(const PartialAssignment& assignment,
                                  const DomainStore& store, const Geometry& geometry) const;

    /**
     * @brief スロットの候補単語を衝突数の昇順で並べる
     *
     * 衝突数: 未割当の隣接スロット n の定義域の単語 v のうち、
     * 交差位置の文字が一致しないものの数の合計。
     * 同数の場合は WordId（辞書順）の昇順。
     */
    std::vector<WordId> order_domain_values(size_t slot_idx, const PartialAssignment& assignment,
                                            const DomainStore& store,
                                            const Geometry& geometry) const;

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    /**
     * @brief ノード整合 + AC-3
     * @return 矛盾がなければ true
     */
    bool presolve(DomainStore& store, const Geometry& geometry);

    /**
     * @brief 再帰的なバックトラック探索
     * @param find_all trueなら全解探索モード
     */
    SearchResult run_search(const DomainStore& store, const Geometry& geometry,
                            const PartialAssignment& assignment, size_t depth,
                            const SolutionCallback& callback, bool find_all);

    bool verbose_ = false;
    SolverStats stats_;
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_SOLVER_HPP
