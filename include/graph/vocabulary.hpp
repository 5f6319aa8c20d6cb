#pragma once

#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <optional>

namespace cg {

/**
 * @brief A selected term and its corpus-wide frequency
 */
struct VocabularyEntry {
    std::string term;
    size_t frequency = 0;
};

/**
 * @brief Term frequencies summed over every document's term stream
 */
std::map<std::string, size_t> count_term_frequencies(
    const std::vector<std::vector<std::string>>& documents
);

/**
 * @brief The bounded top-N term set, each term mapped to a dense node id
 *
 * Ids follow rank: id 0 is the most frequent term. Equal frequencies are
 * ordered by term text so selection does not depend on hash order.
 */
class Vocabulary {
public:
    Vocabulary() = default;

    /**
     * @brief Pick the max_terms most frequent terms
     */
    static Vocabulary from_frequencies(
        const std::map<std::string, size_t>& frequencies,
        size_t max_terms
    );

    /**
     * @brief Count frequencies over the documents, then select
     */
    static Vocabulary select(
        const std::vector<std::vector<std::string>>& documents,
        size_t max_terms
    );

    std::optional<size_t> id_of(const std::string& term) const;
    bool contains(const std::string& term) const { return ids_.count(term) > 0; }

    const std::string& term(size_t id) const { return entries_.at(id).term; }
    const std::vector<VocabularyEntry>& entries() const { return entries_; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /**
     * @brief Distinct terms seen before truncation
     */
    size_t candidate_count() const { return candidate_count_; }

private:
    std::vector<VocabularyEntry> entries_;
    std::unordered_map<std::string, size_t> ids_;
    size_t candidate_count_ = 0;
};

} // namespace cg
