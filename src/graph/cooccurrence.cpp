#include "graph/cooccurrence.hpp"
#include <algorithm>
#include <stdexcept>

namespace cg {

size_t CooccurrenceTable::get(size_t a, size_t b) const {
    auto it = pairs.find(make_term_pair(a, b));
    return it == pairs.end() ? 0 : it->second;
}

void CooccurrenceTable::merge(const CooccurrenceTable& other) {
    if (occurrences.size() < other.occurrences.size()) {
        occurrences.resize(other.occurrences.size(), 0);
    }
    for (size_t i = 0; i < other.occurrences.size(); ++i) {
        occurrences[i] += other.occurrences[i];
    }
    for (const auto& [pair, count] : other.pairs) {
        pairs[pair] += count;
    }
    documents_scanned += other.documents_scanned;
}

CooccurrenceAccumulator::CooccurrenceAccumulator(const Vocabulary& vocabulary, size_t window)
    : vocabulary_(vocabulary), window_(window) {
    if (window == 0) {
        throw std::invalid_argument("Co-occurrence window must be at least 1");
    }
    table_.occurrences.assign(vocabulary_.size(), 0);
}

std::vector<size_t> CooccurrenceAccumulator::map_to_ids(
    const std::vector<std::string>& terms
) const {
    std::vector<size_t> ids;
    ids.reserve(terms.size());
    for (const auto& term : terms) {
        if (auto id = vocabulary_.id_of(term)) {
            ids.push_back(*id);
        }
    }
    return ids;
}

void CooccurrenceAccumulator::add_document(const std::vector<std::string>& terms) {
    const auto ids = map_to_ids(terms);

    for (size_t i = 0; i < ids.size(); ++i) {
        const size_t a = ids[i];
        table_.occurrences[a]++;

        const size_t end = std::min(i + window_, ids.size());
        for (size_t j = i + 1; j < end; ++j) {
            const size_t b = ids[j];
            if (a == b) continue;
            table_.pairs[make_term_pair(a, b)]++;
        }
    }

    table_.documents_scanned++;
}

CooccurrenceTable CooccurrenceAccumulator::release() {
    CooccurrenceTable result = std::move(table_);
    table_ = CooccurrenceTable{};
    table_.occurrences.assign(vocabulary_.size(), 0);
    return result;
}

} // namespace cg
