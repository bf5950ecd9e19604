#include "crossword_csp/domain_store.hpp"
#include <stdexcept>
#include <algorithm>

namespace crossword_csp {

DomainStore::DomainStore(const Vocabulary& vocabulary, size_t num_slots)
    : vocabulary_(&vocabulary)
    , domains_(num_slots, Domain(vocabulary.size())) {}

DomainStore DomainStore::initialize(const Geometry& geometry, const Vocabulary& vocabulary) {
    return DomainStore(vocabulary, geometry.num_slots());
}

Domain& DomainStore::domain(size_t slot_idx) {
    if (slot_idx >= domains_.size()) {
        throw std::out_of_range("Slot index out of range");
    }
    return domains_[slot_idx];
}

const Domain& DomainStore::domain(size_t slot_idx) const {
    if (slot_idx >= domains_.size()) {
        throw std::out_of_range("Slot index out of range");
    }
    return domains_[slot_idx];
}

std::vector<std::string> DomainStore::words(size_t slot_idx) const {
    std::vector<std::string> result;
    for (WordId id : domain(slot_idx).values()) {
        result.push_back(vocabulary_->word(id));
    }
    return result;
}

size_t DomainStore::total_size() const {
    size_t total = 0;
    for (const auto& d : domains_) {
        total += d.size();
    }
    return total;
}

bool DomainStore::has_empty_domain() const {
    return std::any_of(domains_.begin(), domains_.end(),
                       [](const Domain& d) { return d.empty(); });
}

} // namespace crossword_csp
