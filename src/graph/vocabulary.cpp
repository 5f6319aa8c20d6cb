#include "graph/vocabulary.hpp"
#include <algorithm>
#include <utility>

namespace cg {

std::map<std::string, size_t> count_term_frequencies(
    const std::vector<std::vector<std::string>>& documents
) {
    std::map<std::string, size_t> frequencies;
    for (const auto& doc : documents) {
        for (const auto& term : doc) {
            frequencies[term]++;
        }
    }
    return frequencies;
}

Vocabulary Vocabulary::from_frequencies(
    const std::map<std::string, size_t>& frequencies,
    size_t max_terms
) {
    Vocabulary vocab;
    vocab.candidate_count_ = frequencies.size();

    std::vector<VocabularyEntry> ranked;
    ranked.reserve(frequencies.size());
    for (const auto& [term, frequency] : frequencies) {
        ranked.push_back({term, frequency});
    }

    // Descending frequency, then term text
    std::sort(ranked.begin(), ranked.end(),
        [](const VocabularyEntry& a, const VocabularyEntry& b) {
            if (a.frequency != b.frequency) return a.frequency > b.frequency;
            return a.term < b.term;
        });

    if (ranked.size() > max_terms) {
        ranked.resize(max_terms);
    }

    vocab.entries_ = std::move(ranked);
    for (size_t id = 0; id < vocab.entries_.size(); ++id) {
        vocab.ids_[vocab.entries_[id].term] = id;
    }

    return vocab;
}

Vocabulary Vocabulary::select(
    const std::vector<std::vector<std::string>>& documents,
    size_t max_terms
) {
    return from_frequencies(count_term_frequencies(documents), max_terms);
}

std::optional<size_t> Vocabulary::id_of(const std::string& term) const {
    auto it = ids_.find(term);
    if (it == ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace cg
