/**
 * @file geometry.hpp
 * @brief 盤面形状クラス（スロット・交差・隣接）
 */
#ifndef CROSSWORD_CSP_GEOMETRY_HPP
#define CROSSWORD_CSP_GEOMETRY_HPP

#include "crossword_csp/slot.hpp"
#include <vector>
#include <string>
#include <optional>
#include <unordered_map>
#include <cstddef>

namespace crossword_csp {

/**
 * @brief 2つのスロットの交差位置
 *
 * first は1つ目のスロットの単語内インデックス、
 * second は2つ目のスロットの単語内インデックス。
 */
struct Overlap {
    size_t first;
    size_t second;

    bool operator==(const Overlap& other) const {
        return first == other.first && second == other.second;
    }
};

/**
 * @brief パズルの形状（生成後は不変）
 *
 * スロットは slots() 内のインデックスで参照する。
 * 交差は n x n のフラットなテーブルに事前計算し、
 * 隣接リストもスロットごとに保持する。
 */
class Geometry {
public:
    /**
     * @brief マス目の行列からスロットを導出して作成
     *
     * 横・縦それぞれ長さ 2 以上の連続したマスをスロットとする。
     * スロット順は開始マスの行優先、同じ開始マスでは Across が先。
     *
     * @param cells cells[i][j] が true ならパズルのマス
     * @throws std::invalid_argument 行の長さが揃っていない場合
     */
    explicit Geometry(std::vector<std::vector<bool>> cells);

    /**
     * @brief スロットを明示して作成
     *
     * マス目はスロットが覆うマスの和集合になる。
     *
     * @throws std::invalid_argument スロットが盤外にはみ出す、長さ 0、
     *         重複している、または2マス以上を共有している場合
     */
    Geometry(size_t height, size_t width, std::vector<Slot> slots);

    /**
     * @brief 文字列パターンから作成
     * @param rows 盤面の各行
     * @param blank パズルのマスを表す文字
     */
    static Geometry from_pattern(const std::vector<std::string>& rows, char blank = '_');

    size_t height() const { return height_; }
    size_t width() const { return width_; }

    /**
     * @brief (row, col) がパズルのマスか
     */
    bool is_cell(size_t row, size_t col) const { return cells_[row][col]; }

    const std::vector<std::vector<bool>>& cells() const { return cells_; }

    const std::vector<Slot>& slots() const { return slots_; }
    size_t num_slots() const { return slots_.size(); }

    /**
     * @brief インデックスでスロットを取得
     * @throws std::out_of_range
     */
    const Slot& slot(size_t idx) const;

    /**
     * @brief スロットのインデックスを検索
     * @throws std::out_of_range 盤面に存在しないスロットの場合
     */
    size_t index_of(const Slot& slot) const;

    /**
     * @brief スロットが盤面に含まれるか
     */
    bool contains(const Slot& slot) const;

    /**
     * @brief 交差位置を取得
     * @return 交差していなければ std::nullopt
     * @throws std::invalid_argument i == j の場合
     * @throws std::out_of_range
     */
    const std::optional<Overlap>& overlap(size_t i, size_t j) const;
    std::optional<Overlap> overlap(const Slot& x, const Slot& y) const;

    /**
     * @brief 交差するスロットのインデックス一覧（スロット順）
     */
    const std::vector<size_t>& neighbors(size_t idx) const;
    std::vector<Slot> neighbors(const Slot& slot) const;

    /**
     * @brief 次数（交差するスロットの数）
     */
    size_t degree(size_t idx) const { return neighbors(idx).size(); }

private:
    void build_overlaps();

    size_t height_ = 0;
    size_t width_ = 0;
    std::vector<std::vector<bool>> cells_;
    std::vector<Slot> slots_;
    std::unordered_map<Slot, size_t> index_;
    std::vector<std::optional<Overlap>> overlaps_;  // overlaps_[i * n + j]
    std::vector<std::vector<size_t>> neighbors_;
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_GEOMETRY_HPP
