/**
 * @file domain.hpp
 * @brief 単語定義域クラス（Sparse Set ベース）
 */
#ifndef CROSSWORD_CSP_DOMAIN_HPP
#define CROSSWORD_CSP_DOMAIN_HPP

#include "crossword_csp/vocabulary.hpp"
#include <vector>
#include <cstdint>
#include <cstddef>

namespace crossword_csp {

/**
 * @brief スロットの候補単語集合
 *
 * Sparse Set を使用し、O(1) での値の存在確認と削除を実現する。
 * 値は WordId（0 以上 universe 未満）。
 * 削除のみを行い、値の追加・復元は行わない。
 */
class Domain {
public:
    using value_type = WordId;

    /**
     * @brief 空の定義域を作成
     */
    Domain();

    /**
     * @brief 0 .. universe-1 の全ての値を持つ定義域を作成
     * @param universe 値の上限（Vocabulary のサイズ）
     */
    explicit Domain(size_t universe);

    /**
     * @brief 値リストから定義域を作成
     * @param universe 値の上限
     * @param values 定義域に含める値のリスト（universe 以上の値は無視）
     */
    Domain(size_t universe, std::vector<value_type> values);

    /**
     * @brief 定義域が空かどうか
     */
    bool empty() const { return n_ == 0; }

    /**
     * @brief 定義域のサイズを取得
     */
    size_t size() const { return n_; }

    /**
     * @brief 値が定義域に含まれるか
     */
    bool contains(value_type value) const {
        return value < sparse_.size() && sparse_[value] < n_;
    }

    /**
     * @brief 値を削除
     * @return 値が削除されたら true（元々含まれていなければ false）
     */
    bool remove(value_type value);

    /**
     * @brief 全ての有効な値を昇順で取得
     */
    std::vector<value_type> values() const;

    /**
     * @brief Dense 配列の有効範囲（順序は不定）
     */
    const value_type* begin() const { return values_.data(); }
    const value_type* end() const { return values_.data() + n_; }

private:
    void swap_at(size_t i, size_t j);

    std::vector<value_type> values_;  // Dense 配列
    std::vector<size_t> sparse_;      // sparse_[val] = values_ 内のインデックス
    size_t n_;                        // 有効な値の数
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_DOMAIN_HPP
