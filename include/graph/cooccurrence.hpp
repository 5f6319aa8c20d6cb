#pragma once

#include "graph/vocabulary.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cg {

/**
 * @brief Unordered pair of node ids, normalized so first < second
 */
using TermPair = std::pair<size_t, size_t>;

inline TermPair make_term_pair(size_t a, size_t b) {
    return a < b ? TermPair{a, b} : TermPair{b, a};
}

/**
 * @brief Accumulated occurrence and co-occurrence counts
 *
 * occurrences[id] counts how often a vocabulary term appeared in the
 * filtered id streams; pairs holds windowed co-occurrence counts keyed by
 * the normalized pair.
 */
struct CooccurrenceTable {
    std::vector<size_t> occurrences;
    std::map<TermPair, size_t> pairs;
    size_t documents_scanned = 0;

    /**
     * @brief Co-occurrence count for a pair, in either order
     */
    size_t get(size_t a, size_t b) const;

    /**
     * @brief Add another table's counts into this one
     */
    void merge(const CooccurrenceTable& other);
};

/**
 * @brief Windowed co-occurrence counting over vocabulary-filtered streams
 *
 * Terms outside the vocabulary are removed before the window is applied, so
 * they do not open gaps. Every pair (i, j) with i < j < i + window in the
 * filtered stream increments the count of its two ids. Repeats of the same
 * id inside a window are not recorded as pairs.
 */
class CooccurrenceAccumulator {
public:
    /**
     * @param vocabulary Kept by reference; must outlive the accumulator
     * @param window Window length, at least 1
     * @throws std::invalid_argument if window is 0
     */
    CooccurrenceAccumulator(const Vocabulary& vocabulary, size_t window);
    CooccurrenceAccumulator(Vocabulary&&, size_t) = delete;

    /**
     * @brief Scan one document's term stream
     */
    void add_document(const std::vector<std::string>& terms);

    /**
     * @brief Vocabulary ids of the in-vocabulary terms, in stream order
     */
    std::vector<size_t> map_to_ids(const std::vector<std::string>& terms) const;

    const CooccurrenceTable& table() const { return table_; }

    /**
     * @brief Hand the accumulated table to the caller, leaving an empty one
     */
    CooccurrenceTable release();

private:
    const Vocabulary& vocabulary_;
    size_t window_;
    CooccurrenceTable table_;
};

} // namespace cg
