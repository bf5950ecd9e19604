/**
 * @file vocabulary.hpp
 * @brief 候補単語の一覧
 */
#ifndef CROSSWORD_CSP_VOCABULARY_HPP
#define CROSSWORD_CSP_VOCABULARY_HPP

#include <vector>
#include <string>
#include <optional>
#include <cstdint>

namespace crossword_csp {

/**
 * @brief 単語ID（Vocabulary 内のインデックス）
 */
using WordId = uint32_t;

/**
 * @brief 候補単語の一覧（生成後は不変）
 *
 * 単語は辞書順にソートされ重複が除かれる。
 * WordId の大小は単語の辞書順と一致する。
 */
class Vocabulary {
public:
    Vocabulary() = default;
    explicit Vocabulary(std::vector<std::string> words);

    size_t size() const { return words_.size(); }
    bool empty() const { return words_.empty(); }

    /**
     * @brief ID から単語を取得
     * @throws std::out_of_range
     */
    const std::string& word(WordId id) const;

    /**
     * @brief 単語の ID を検索
     */
    std::optional<WordId> find(const std::string& word) const;

    const std::vector<std::string>& words() const { return words_; }

    auto begin() const { return words_.begin(); }
    auto end() const { return words_.end(); }

private:
    std::vector<std::string> words_;
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_VOCABULARY_HPP
