#include "text/tokenizer.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace {

bool is_word_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

bool is_word_char(char c) {
    return is_word_start(c) || c == '-' || c == '\'';
}

}  // namespace

namespace cg {

StopwordSet default_stopwords() {
    return {
        "the", "and", "for", "with", "that", "this", "you", "your", "from", "are", "but", "was",
        "were", "have", "has", "had", "not", "can", "will", "would", "could", "should", "about",
        "into", "out", "over", "under", "between", "within", "without", "after", "before", "when",
        "where", "how", "why", "what", "which", "while", "than", "then", "also", "just", "like",
        "some", "more", "most", "much", "many", "each", "other", "another", "been", "being", "use",
        "used", "using", "via", "a", "an", "in", "on", "of", "to", "as", "it", "is", "at", "by",
        "or", "if", "we", "i"
    };
}

std::string to_lower_ascii(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim_hyphens(const std::string& word) {
    size_t start = word.find_first_not_of('-');
    if (start == std::string::npos) {
        return "";
    }
    size_t end = word.find_last_not_of('-');
    return word.substr(start, end - start + 1);
}

Tokenizer::Tokenizer(StopwordSet stopwords, size_t min_length)
    : stopwords_(std::move(stopwords)),
      min_length_(min_length) {}

bool Tokenizer::is_stopword(const std::string& word) const {
    return stopwords_.count(word) > 0;
}

std::vector<std::string> Tokenizer::extract_words(const std::string& text) const {
    std::vector<std::string> words;
    const std::string lowered = to_lower_ascii(text);

    size_t i = 0;
    const size_t n = lowered.size();
    while (i < n) {
        if (!is_word_start(lowered[i])) {
            i++;
            continue;
        }

        size_t end = i + 1;
        while (end < n && is_word_char(lowered[end])) {
            end++;
        }

        // A run needs at least two characters
        if (end - i >= 2) {
            std::string word = trim_hyphens(lowered.substr(i, end - i));
            if (word.size() >= min_length_ && !is_stopword(word)) {
                words.push_back(std::move(word));
            }
        }
        i = end;
    }

    return words;
}

std::vector<std::string> Tokenizer::tokenize(const std::string& text) const {
    const auto words = extract_words(text);

    std::vector<std::string> terms;
    terms.reserve(words.size() * 2);

    for (size_t i = 0; i < words.size(); ++i) {
        terms.push_back(words[i]);
        if (i + 1 < words.size()) {
            // Bigrams never contain a stopword half
            if (!is_stopword(words[i]) && !is_stopword(words[i + 1])) {
                terms.push_back(words[i] + " " + words[i + 1]);
            }
        }
    }

    return terms;
}

} // namespace cg
