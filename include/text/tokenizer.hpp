#pragma once

#include <string>
#include <vector>
#include <unordered_set>

namespace cg {

using StopwordSet = std::unordered_set<std::string>;

/**
 * @brief The built-in English stopword list
 */
StopwordSet default_stopwords();

/**
 * @brief Splits text into unigram and bigram terms
 *
 * Text is lowercased and scanned once, left to right, for word-like runs:
 * an ASCII alphanumeric followed by one or more alphanumerics, hyphens or
 * apostrophes.
 * Each run is trimmed of leading/trailing hyphens and kept when it is at
 * least min_length bytes long and not a stopword.
 *
 * Every surviving unigram is followed by the bigram it forms with the next
 * surviving unigram, so n unigrams yield 2n - 1 terms.
 */
class Tokenizer {
public:
    explicit Tokenizer(StopwordSet stopwords = default_stopwords(), size_t min_length = 3);

    std::vector<std::string> tokenize(const std::string& text) const;

    /**
     * @brief Unigrams only, in text order
     */
    std::vector<std::string> extract_words(const std::string& text) const;

    bool is_stopword(const std::string& word) const;

    const StopwordSet& stopwords() const { return stopwords_; }
    size_t min_length() const { return min_length_; }

private:
    StopwordSet stopwords_;
    size_t min_length_;
};

/**
 * @brief ASCII lowercase copy
 */
std::string to_lower_ascii(const std::string& text);

/**
 * @brief Strip leading and trailing '-' characters
 */
std::string trim_hyphens(const std::string& word);

} // namespace cg
