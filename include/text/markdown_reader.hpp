#pragma once

#include <string>
#include <vector>

namespace cg {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief A source document reduced to plain text
 */
struct TextDocument {
    std::string file_path;         ///< Path the document was read from
    std::string document_id;       ///< Path relative to the corpus root
    std::string text;              ///< Flat text, markup and code removed
    size_t word_count = 0;         ///< Whitespace-separated words in text
};

// ============================================================================
// Markdown Reader
// ============================================================================

/**
 * @brief Reads Markdown posts and reduces them to flat text
 *
 * A leading front matter block delimited by "+++" (TOML) or "---" (YAML)
 * lines is dropped, then the rest is parsed as CommonMark with libcmark.
 * Only text nodes are kept, each followed by a single space, so code blocks,
 * code spans, raw HTML, link targets and block markers all disappear.
 */
class MarkdownReader {
public:
    MarkdownReader() = default;

    /**
     * @brief Read and convert a Markdown file
     *
     * @param file_path Path to the file
     * @param root Corpus root used to build the document id (optional)
     * @return Converted document
     * @throws std::runtime_error if the file cannot be read or is not valid UTF-8
     */
    TextDocument load_document(const std::string& file_path,
                               const std::string& root = "") const;

    /**
     * @brief Convert Markdown source to flat text
     * @throws std::runtime_error if the parser cannot allocate a document
     */
    std::string to_text(const std::string& markdown) const;

    /**
     * @brief Remove a leading "+++" or "---" front matter block
     *
     * The block must open on the first line and close with a line holding
     * only the same delimiter; otherwise the input is returned unchanged.
     */
    static std::string strip_front_matter(const std::string& source);

    void set_verbose(bool verbose) { verbose_ = verbose; }

private:
    bool verbose_ = false;
};

// ============================================================================
// Utility Functions
// ============================================================================

/**
 * @brief Recursively find files whose extension is in the given list
 *
 * Unreadable directories are skipped and a missing root yields no files.
 * Results are sorted by path.
 *
 * @param root_path Directory to search
 * @param extensions Extensions including the dot, e.g. ".md"
 */
std::vector<std::string> find_documents(
    const std::string& root_path,
    const std::vector<std::string>& extensions
);

/**
 * @brief Count whitespace-separated words in text
 */
size_t count_words(const std::string& text);

/**
 * @brief Check that a byte string is well-formed UTF-8
 */
bool is_valid_utf8(const std::string& bytes);

} // namespace cg
