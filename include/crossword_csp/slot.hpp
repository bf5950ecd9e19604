/**
 * @file slot.hpp
 * @brief スロット（探索変数）の定義
 */
#ifndef CROSSWORD_CSP_SLOT_HPP
#define CROSSWORD_CSP_SLOT_HPP

#include <cstddef>
#include <functional>
#include <tuple>
#include <utility>

namespace crossword_csp {

/**
 * @brief スロットの向き
 */
enum class Direction {
    Across,  // 横
    Down     // 縦
};

/**
 * @brief 単語を1つ入れるマスの並び
 *
 * 開始行・開始列・長さ・向きの4つ組で同一性が決まる。
 * std::map / std::unordered_map のキーとして使用できる。
 */
struct Slot {
    size_t row = 0;
    size_t col = 0;
    size_t length = 0;
    Direction direction = Direction::Across;

    /**
     * @brief k 文字目のマス (行, 列) を取得
     */
    std::pair<size_t, size_t> cell(size_t k) const {
        if (direction == Direction::Across) {
            return {row, col + k};
        }
        return {row + k, col};
    }

    bool operator==(const Slot& other) const {
        return row == other.row && col == other.col &&
               length == other.length && direction == other.direction;
    }

    bool operator!=(const Slot& other) const { return !(*this == other); }

    bool operator<(const Slot& other) const {
        return std::tie(row, col, direction, length) <
               std::tie(other.row, other.col, other.direction, other.length);
    }
};

} // namespace crossword_csp

namespace std {

template <>
struct hash<crossword_csp::Slot> {
    size_t operator()(const crossword_csp::Slot& s) const noexcept {
        size_t h = std::hash<size_t>{}(s.row);
        h = h * 31 + std::hash<size_t>{}(s.col);
        h = h * 31 + std::hash<size_t>{}(s.length);
        h = h * 2 + (s.direction == crossword_csp::Direction::Down ? 1 : 0);
        return h;
    }
};

} // namespace std

#endif // CROSSWORD_CSP_SLOT_HPP
