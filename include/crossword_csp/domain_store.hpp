/**
 * @file domain_store.hpp
 * @brief スロットごとの定義域を保持するクラス
 */
#ifndef CROSSWORD_CSP_DOMAIN_STORE_HPP
#define CROSSWORD_CSP_DOMAIN_STORE_HPP

#include "crossword_csp/domain.hpp"
#include "crossword_csp/geometry.hpp"
#include "crossword_csp/vocabulary.hpp"
#include <vector>
#include <string>

namespace crossword_csp {

/**
 * @brief スロット -> 候補単語集合
 *
 * 整合性処理（ノード整合・弧整合）の間だけ縮小され、探索中は読み取り専用。
 * Vocabulary は参照で保持するため、DomainStore より長く生存させること。
 */
class DomainStore {
public:
    /**
     * @brief 全スロットの定義域を語彙全体で初期化
     */
    static DomainStore initialize(const Geometry& geometry, const Vocabulary& vocabulary);

    const Vocabulary& vocabulary() const { return *vocabulary_; }

    size_t num_slots() const { return domains_.size(); }

    /**
     * @brief スロットの定義域を取得
     * @throws std::out_of_range
     */
    Domain& domain(size_t slot_idx);
    const Domain& domain(size_t slot_idx) const;

    /**
     * @brief 定義域に残っている単語を辞書順で取得
     */
    std::vector<std::string> words(size_t slot_idx) const;

    /**
     * @brief 単語IDから単語を取得
     */
    const std::string& word(WordId id) const { return vocabulary_->word(id); }

    /**
     * @brief 全スロットの定義域サイズの合計
     */
    size_t total_size() const;

    /**
     * @brief 空の定義域があるか
     */
    bool has_empty_domain() const;

private:
    DomainStore(const Vocabulary& vocabulary, size_t num_slots);

    const Vocabulary* vocabulary_;
    std::vector<Domain> domains_;
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_DOMAIN_STORE_HPP
