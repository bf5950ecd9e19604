#include "crossword_csp/vocabulary.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace crossword_csp {

Vocabulary::Vocabulary(std::vector<std::string> words)
    : words_(std::move(words)) {
    std::sort(words_.begin(), words_.end());
    words_.erase(std::unique(words_.begin(), words_.end()), words_.end());
    if (words_.size() > std::numeric_limits<WordId>::max()) {
        throw std::invalid_argument("Vocabulary: too many words");
    }
}

const std::string& Vocabulary::word(WordId id) const {
    if (id >= words_.size()) {
        throw std::out_of_range("Word ID out of range");
    }
    return words_[id];
}

std::optional<WordId> Vocabulary::find(const std::string& word) const {
    auto it = std::lower_bound(words_.begin(), words_.end(), word);
    if (it == words_.end() || *it != word) {
        return std::nullopt;
    }
    return static_cast<WordId>(it - words_.begin());
}

} // namespace crossword_csp
