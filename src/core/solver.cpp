#include "crossword_csp/solver.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <iostream>
#include <stdexcept>

namespace crossword_csp {

std::optional<Assignment> Solver::solve(DomainStore& store, const Geometry& geometry) {
    std::optional<Assignment> result;
    stats_ = SolverStats{};

    if (!presolve(store, geometry)) {
        if (verbose_) std::cerr << "% [verbose] presolve failed\n";
        return std::nullopt;  // UNSAT
    }

    if (verbose_) {
        std::cerr << "% [verbose] search start: " << geometry.num_slots() << " slots\n";
    }
    run_search(store, geometry, PartialAssignment(geometry.num_slots()), 0,
               [&result](const Assignment& sol) {
                   result = sol;
                   return false;  // 最初の解で停止
               }, false);

    if (verbose_) {
        std::cerr << "% [verbose] search done: " << (result ? "SAT" : "UNSAT")
                  << " nodes=" << stats_.nodes
                  << " fails=" << stats_.fail_count
                  << " max_depth=" << stats_.max_depth << "\n";
    }
    return result;
}

size_t Solver::solve_all(DomainStore& store, const Geometry& geometry, SolutionCallback callback) {
    stats_ = SolverStats{};

    if (!presolve(store, geometry)) {
        if (verbose_) std::cerr << "% [verbose] presolve failed\n";
        return 0;  // UNSAT
    }

    size_t count = 0;
    run_search(store, geometry, PartialAssignment(geometry.num_slots()), 0,
               [&count, &callback](const Assignment& sol) {
                   count++;
                   return callback(sol);  // trueなら継続
               }, true);

    if (verbose_) {
        std::cerr << "% [verbose] search done: solutions=" << count
                  << " nodes=" << stats_.nodes
                  << " fails=" << stats_.fail_count << "\n";
    }
    return count;
}

bool Solver::presolve(DomainStore& store, const Geometry& geometry) {
    if (verbose_) {
        std::cerr << "% [verbose] presolve start: " << geometry.num_slots() << " slots, "
                  << store.vocabulary().size() << " words\n";
    }

    enforce_node_consistency(store, geometry, &stats_.propagation);
    if (verbose_) {
        std::cerr << "% [verbose] node consistency: removed=" << stats_.propagation.node_removed
                  << " remaining=" << store.total_size() << "\n";
    }

    bool ok = ac3(store, geometry, std::nullopt, &stats_.propagation);
    if (verbose_) {
        std::cerr << "% [verbose] ac3: " << (ok ? "ok" : "empty domain")
                  << " revise_calls=" << stats_.propagation.revise_calls
                  << " removed=" << stats_.propagation.arc_removed
                  << " remaining=" << store.total_size() << "\n";
    }
    return ok;
}

SearchResult Solver::run_search(const DomainStore& store, const Geometry& geometry,
                                const PartialAssignment& assignment, size_t depth,
                                const SolutionCallback& callback, bool find_all) {
    // 統計更新
    stats_.nodes++;
    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }

    if (assignment.is_complete()) {
        if (!is_consistent(assignment, geometry, store.vocabulary())) {
            return SearchResult::UNSAT;
        }
        stats_.solutions++;
        if (!callback(assignment.to_assignment(geometry, store.vocabulary()))) {
            return SearchResult::SAT;
        }
        return find_all ? SearchResult::UNSAT : SearchResult::SAT;
    }

    size_t slot_idx = select_unassigned_slot(assignment, store, geometry);
    size_t solutions_before = stats_.solutions;

    for (WordId val : order_domain_values(slot_idx, assignment, store, geometry)) {
        stats_.consistency_checks++;
        if (!is_consistent_with(assignment, slot_idx, val, geometry, store.vocabulary())) {
            continue;
        }
        auto res = run_search(store, geometry, assignment.extended(slot_idx, val),
                              depth + 1, callback, find_all);
        if (res == SearchResult::SAT) {
            return res;
        }
    }

    if (stats_.solutions == solutions_before) {
        stats_.fail_count++;
    }
    return SearchResult::UNSAT;
}

size_t Solver::select_unassigned_slot(const PartialAssignment& assignment,
                                      const DomainStore& store, const Geometry& geometry) const {
    size_t best_idx = SIZE_MAX;
    size_t min_domain_size = 0;
    size_t max_degree = 0;

    for (size_t i = 0; i < geometry.num_slots(); ++i) {
        if (assignment.is_assigned(i)) continue;

        size_t domain_size = store.domain(i).size();
        size_t degree = geometry.degree(i);

        // MRV 優先: ドメインサイズが小さいものを優先、同じなら次数が大きいもの
        bool better = false;
        if (best_idx == SIZE_MAX) {
            better = true;
        } else if (domain_size < min_domain_size) {
            better = true;
        } else if (domain_size == min_domain_size && degree > max_degree) {
            better = true;
        }

        if (better) {
            best_idx = i;
            min_domain_size = domain_size;
            max_degree = degree;
        }
    }

    if (best_idx == SIZE_MAX) {
        throw std::logic_error("select_unassigned_slot: assignment is complete");
    }
    return best_idx;
}

std::vector<WordId> Solver::order_domain_values(size_t slot_idx,
                                                const PartialAssignment& assignment,
                                                const DomainStore& store,
                                                const Geometry& geometry) const {
    // 未割当の隣接スロットごとに、交差位置の文字の出現数を数えておく
    struct NeighborLetters {
        size_t offset;                  // slot_idx 側の交差位置
        size_t domain_size;
        std::array<size_t, 256> counts;
    };
    std::vector<NeighborLetters> neighbors;
    for (size_t n : geometry.neighbors(slot_idx)) {
        if (assignment.is_assigned(n)) continue;
        const auto& overlap = geometry.overlap(slot_idx, n);
        const auto& domain = store.domain(n);

        NeighborLetters nl{overlap->first, domain.size(), {}};
        for (WordId id : domain) {
            const auto& w = store.word(id);
            if (overlap->second < w.size()) {
                nl.counts[static_cast<unsigned char>(w[overlap->second])]++;
            }
        }
        neighbors.push_back(nl);
    }

    std::vector<std::pair<WordId, size_t>> scored;
    for (WordId val : store.domain(slot_idx).values()) {
        const auto& word = store.word(val);
        size_t count = 0;
        for (const auto& nl : neighbors) {
            if (nl.offset < word.size()) {
                count += nl.domain_size - nl.counts[static_cast<unsigned char>(word[nl.offset])];
            } else {
                count += nl.domain_size;
            }
        }
        scored.emplace_back(val, count);
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.second < b.second; });

    std::vector<WordId> result;
    result.reserve(scored.size());
    for (const auto& entry : scored) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace crossword_csp
