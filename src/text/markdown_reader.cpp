#include "text/markdown_reader.hpp"
#include <cmark.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

}  // namespace

namespace cg {

// ============================================================================
// MarkdownReader
// ============================================================================

TextDocument MarkdownReader::load_document(const std::string& file_path,
                                           const std::string& root) const {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open document: " + file_path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error("Failed to read document: " + file_path);
    }

    std::string source = buffer.str();
    if (!is_valid_utf8(source)) {
        throw std::runtime_error("Document is not valid UTF-8: " + file_path);
    }

    TextDocument doc;
    doc.file_path = file_path;
    doc.document_id = root.empty()
        ? file_path
        : fs::path(file_path).lexically_relative(root).generic_string();
    doc.text = to_text(source);
    doc.word_count = count_words(doc.text);

    if (verbose_) {
        std::cout << "  Read " << doc.document_id << " (" << doc.word_count << " words)\n";
    }

    return doc;
}

std::string MarkdownReader::strip_front_matter(const std::string& source) {
    for (const std::string delimiter : {"+++", "---"}) {
        if (source.rfind(delimiter, 0) != 0) continue;

        size_t first_newline = source.find('\n');
        if (first_newline == std::string::npos ||
            trim(source.substr(0, first_newline)) != delimiter) {
            return source;
        }

        const std::string closing = "\n" + delimiter + "\n";
        size_t end = source.find(closing, first_newline);
        if (end != std::string::npos) {
            return source.substr(end + closing.size());
        }

        const std::string trailing = "\n" + delimiter;
        if (source.size() >= trailing.size() &&
            source.compare(source.size() - trailing.size(), trailing.size(), trailing) == 0) {
            return "";
        }
        return source;
    }
    return source;
}

std::string MarkdownReader::to_text(const std::string& markdown) const {
    std::string normalized;
    normalized.reserve(markdown.size());
    for (char c : markdown) {
        if (c != '\r') normalized += c;
    }
    const std::string body = strip_front_matter(normalized);

    std::unique_ptr<cmark_node, decltype(&cmark_node_free)> root(
        cmark_parse_document(body.data(), body.size(), CMARK_OPT_DEFAULT),
        &cmark_node_free
    );
    if (!root) {
        throw std::runtime_error("Failed to parse Markdown");
    }
    cmark_consolidate_text_nodes(root.get());

    std::unique_ptr<cmark_iter, decltype(&cmark_iter_free)> iter(
        cmark_iter_new(root.get()),
        &cmark_iter_free
    );

    // Code blocks, code spans and raw HTML are leaf nodes of their own type,
    // so taking only text nodes skips them
    std::string out;
    cmark_event_type event;
    while ((event = cmark_iter_next(iter.get())) != CMARK_EVENT_DONE) {
        if (event != CMARK_EVENT_ENTER) continue;

        cmark_node* node = cmark_iter_get_node(iter.get());
        if (cmark_node_get_type(node) != CMARK_NODE_TEXT) continue;

        const char* literal = cmark_node_get_literal(node);
        if (literal != nullptr) {
            out += literal;
            out += ' ';
        }
    }

    return out;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<std::string> find_documents(
    const std::string& root_path,
    const std::vector<std::string>& extensions
) {
    std::vector<std::string> files;

    std::error_code ec;
    if (!fs::is_directory(root_path, ec)) {
        if (fs::is_regular_file(root_path, ec)) {
            std::string ext = fs::path(root_path).extension().string();
            if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
                files.push_back(root_path);
            }
        }
        return files;
    }

    fs::recursive_directory_iterator it(
        root_path, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end;

    while (!ec && it != end) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            std::string ext = it->path().extension().string();
            if (std::find(extensions.begin(), extensions.end(), ext) != extensions.end()) {
                files.push_back(it->path().string());
            }
        }
        it.increment(ec);
    }

    if (ec) {
        std::cerr << "Warning: stopped scanning " << root_path << ": " << ec.message() << "\n";
    }

    std::sort(files.begin(), files.end());
    return files;
}

size_t count_words(const std::string& text) {
    size_t count = 0;
    bool in_word = false;

    for (unsigned char c : text) {
        if (std::isspace(c)) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            count++;
        }
    }

    return count;
}

bool is_valid_utf8(const std::string& bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        size_t extra;
        unsigned int code_point;
        if (c < 0x80) {
            i++;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            code_point = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            code_point = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            code_point = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= n) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            code_point = (code_point << 6) | (cc & 0x3F);
        }

        // Overlong encodings, surrogates and out-of-range values
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && (code_point < 0x10000 || code_point > 0x10FFFF)) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }

        i += extra + 1;
    }
    return true;
}

} // namespace cg
