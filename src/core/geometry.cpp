#include "crossword_csp/geometry.hpp"
#include <stdexcept>
#include <algorithm>

namespace crossword_csp {

Geometry::Geometry(std::vector<std::vector<bool>> cells)
    : cells_(std::move(cells)) {
    height_ = cells_.size();
    width_ = height_ > 0 ? cells_[0].size() : 0;
    for (const auto& row : cells_) {
        if (row.size() != width_) {
            throw std::invalid_argument("Geometry: rows have different widths");
        }
    }

    // 各マスを開始点とする横・縦の連続マスを探す
    for (size_t i = 0; i < height_; ++i) {
        for (size_t j = 0; j < width_; ++j) {
            if (!cells_[i][j]) continue;

            bool starts_across = (j == 0 || !cells_[i][j - 1]);
            if (starts_across) {
                size_t length = 1;
                while (j + length < width_ && cells_[i][j + length]) {
                    length++;
                }
                if (length > 1) {
                    slots_.push_back({i, j, length, Direction::Across});
                }
            }

            bool starts_down = (i == 0 || !cells_[i - 1][j]);
            if (starts_down) {
                size_t length = 1;
                while (i + length < height_ && cells_[i + length][j]) {
                    length++;
                }
                if (length > 1) {
                    slots_.push_back({i, j, length, Direction::Down});
                }
            }
        }
    }

    for (size_t idx = 0; idx < slots_.size(); ++idx) {
        index_[slots_[idx]] = idx;
    }
    build_overlaps();
}

Geometry::Geometry(size_t height, size_t width, std::vector<Slot> slots)
    : height_(height), width_(width),
      cells_(height, std::vector<bool>(width, false)),
      slots_(std::move(slots)) {
    for (size_t idx = 0; idx < slots_.size(); ++idx) {
        const auto& s = slots_[idx];
        if (s.length == 0) {
            throw std::invalid_argument("Geometry: slot with zero length");
        }
        auto last = s.cell(s.length - 1);
        if (last.first >= height_ || last.second >= width_) {
            throw std::invalid_argument("Geometry: slot exceeds grid bounds");
        }
        if (!index_.emplace(s, idx).second) {
            throw std::invalid_argument("Geometry: duplicate slot");
        }
        for (size_t k = 0; k < s.length; ++k) {
            auto c = s.cell(k);
            cells_[c.first][c.second] = true;
        }
    }
    build_overlaps();
}

Geometry Geometry::from_pattern(const std::vector<std::string>& rows, char blank) {
    std::vector<std::vector<bool>> cells;
    cells.reserve(rows.size());
    for (const auto& row : rows) {
        std::vector<bool> line(row.size());
        for (size_t j = 0; j < row.size(); ++j) {
            line[j] = (row[j] == blank);
        }
        cells.push_back(std::move(line));
    }
    return Geometry(std::move(cells));
}

void Geometry::build_overlaps() {
    const size_t n = slots_.size();
    overlaps_.assign(n * n, std::nullopt);
    neighbors_.assign(n, {});

    // マス -> (スロット, 単語内インデックス) の一覧
    std::vector<std::vector<std::pair<size_t, size_t>>> occupants(height_ * width_);
    for (size_t idx = 0; idx < n; ++idx) {
        const auto& s = slots_[idx];
        for (size_t k = 0; k < s.length; ++k) {
            auto c = s.cell(k);
            occupants[c.first * width_ + c.second].emplace_back(idx, k);
        }
    }

    for (const auto& occ : occupants) {
        for (size_t a = 0; a < occ.size(); ++a) {
            for (size_t b = 0; b < occ.size(); ++b) {
                if (a == b) continue;
                size_t x = occ[a].first;
                size_t y = occ[b].first;
                auto& entry = overlaps_[x * n + y];
                if (entry) {
                    throw std::invalid_argument("Geometry: slots share more than one cell");
                }
                entry = Overlap{occ[a].second, occ[b].second};
            }
        }
    }

    for (size_t x = 0; x < n; ++x) {
        for (size_t y = 0; y < n; ++y) {
            if (x != y && overlaps_[x * n + y]) {
                neighbors_[x].push_back(y);
            }
        }
    }
}

const Slot& Geometry::slot(size_t idx) const {
    if (idx >= slots_.size()) {
        throw std::out_of_range("Slot index out of range");
    }
    return slots_[idx];
}

size_t Geometry::index_of(const Slot& slot) const {
    auto it = index_.find(slot);
    if (it == index_.end()) {
        throw std::out_of_range("Slot not found in geometry");
    }
    return it->second;
}

bool Geometry::contains(const Slot& slot) const {
    return index_.count(slot) > 0;
}

const std::optional<Overlap>& Geometry::overlap(size_t i, size_t j) const {
    const size_t n = slots_.size();
    if (i >= n || j >= n) {
        throw std::out_of_range("Slot index out of range");
    }
    if (i == j) {
        throw std::invalid_argument("Overlap of a slot with itself is undefined");
    }
    return overlaps_[i * n + j];
}

std::optional<Overlap> Geometry::overlap(const Slot& x, const Slot& y) const {
    return overlap(index_of(x), index_of(y));
}

const std::vector<size_t>& Geometry::neighbors(size_t idx) const {
    if (idx >= neighbors_.size()) {
        throw std::out_of_range("Slot index out of range");
    }
    return neighbors_[idx];
}

std::vector<Slot> Geometry::neighbors(const Slot& slot) const {
    std::vector<Slot> result;
    for (size_t n : neighbors(index_of(slot))) {
        result.push_back(slots_[n]);
    }
    return result;
}

} // namespace crossword_csp
