#include "crossword_csp/consistency.hpp"
#include <array>
#include <deque>
#include <stdexcept>

namespace crossword_csp {

namespace {

using LetterCounts = std::array<size_t, 256>;

inline size_t letter_index(char c) {
    return static_cast<unsigned char>(c);
}

/**
 * @brief 定義域の単語の pos 文字目の出現数を数える
 */
LetterCounts count_letters(const DomainStore& store, const Domain& domain, size_t pos) {
    LetterCounts counts{};
    for (WordId id : domain) {
        const auto& w = store.word(id);
        if (pos < w.size()) {
            counts[letter_index(w[pos])]++;
        }
    }
    return counts;
}

}  // namespace

void enforce_node_consistency(DomainStore& store, const Geometry& geometry,
                              PropagationStats* stats) {
    for (size_t idx = 0; idx < geometry.num_slots(); ++idx) {
        const size_t length = geometry.slot(idx).length;
        auto& domain = store.domain(idx);

        std::vector<WordId> to_remove;
        for (WordId id : domain) {
            if (store.word(id).size() != length) {
                to_remove.push_back(id);
            }
        }
        for (WordId id : to_remove) {
            domain.remove(id);
        }
        if (stats) stats->node_removed += to_remove.size();
    }
}

bool revise(DomainStore& store, const Geometry& geometry, size_t x, size_t y,
            PropagationStats* stats) {
    if (stats) stats->revise_calls++;

    const auto& overlap = geometry.overlap(x, y);
    if (!overlap) {
        return false;
    }
    const size_t ox = overlap->first;
    const size_t oy = overlap->second;

    auto& dx = store.domain(x);
    const auto& dy = store.domain(y);
    const LetterCounts counts = count_letters(store, dy, oy);

    std::vector<WordId> to_remove;
    for (WordId p : dx) {
        const auto& word = store.word(p);
        if (ox >= word.size()) {
            to_remove.push_back(p);
            continue;
        }
        const char letter = word[ox];
        size_t support = counts[letter_index(letter)];
        // p 自身は p を支持しない
        if (dy.contains(p) && oy < word.size() && word[oy] == letter) {
            support--;
        }
        if (support == 0) {
            to_remove.push_back(p);
        }
    }

    for (WordId p : to_remove) {
        dx.remove(p);
    }
    if (stats && !to_remove.empty()) {
        stats->revisions++;
        stats->arc_removed += to_remove.size();
    }
    return !to_remove.empty();
}

bool ac3(DomainStore& store, const Geometry& geometry,
         const std::optional<std::vector<Arc>>& initial_arcs,
         PropagationStats* stats) {
    const size_t n = geometry.num_slots();

    // キュー + 重複防止テーブル（同じ弧を同時に2つ持たない）
    std::deque<Arc> queue;
    std::vector<char> queued(n * n, 0);
    auto enqueue = [&](size_t x, size_t y) {
        char& flag = queued[x * n + y];
        if (!flag) {
            flag = 1;
            queue.push_back({x, y});
        }
    };

    if (initial_arcs) {
        for (const auto& arc : *initial_arcs) {
            if (arc.x >= n || arc.y >= n) {
                throw std::out_of_range("Arc refers to an unknown slot");
            }
            enqueue(arc.x, arc.y);
        }
    } else {
        for (size_t x = 0; x < n; ++x) {
            for (size_t y = 0; y < n; ++y) {
                if (x != y) enqueue(x, y);
            }
        }
    }

    while (!queue.empty()) {
        Arc arc = queue.front();
        queue.pop_front();
        queued[arc.x * n + arc.y] = 0;

        if (!revise(store, geometry, arc.x, arc.y, stats)) {
            continue;
        }
        if (store.domain(arc.x).empty()) {
            return false;
        }
        // x の変化を x に依存するスロットへ伝える
        for (size_t neighbor : geometry.neighbors(arc.x)) {
            if (neighbor != arc.y) {
                enqueue(neighbor, arc.x);
            }
        }
    }

    return !store.has_empty_domain();
}

} // namespace crossword_csp
