#include <trellis/normalize.hpp>

namespace trellis {

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string strip_line_comments(const std::string& text, const std::string& marker) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t eol = text.find('\n', pos);
        size_t line_end = (eol == std::string::npos) ? text.size() : eol;

        size_t hit = text.find(marker, pos);
        if (hit != std::string::npos && hit < line_end) {
            out.append(text, pos, hit - pos);
        } else {
            out.append(text, pos, line_end - pos);
        }

        if (eol == std::string::npos) break;
        out += '\n';
        pos = eol + 1;
    }
    return out;
}

std::string strip_block_comments(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find("/*", pos);
        if (open == std::string::npos) break;
        size_t close = text.find("*/", open + 2);
        if (close == std::string::npos) break;
        out.append(text, pos, open - pos);
        pos = close + 2;
    }
    if (pos < text.size()) {
        out.append(text, pos, std::string::npos);
    }
    return out;
}

std::string normalize_code(const std::string& text) {
    std::string stripped = strip_line_comments(text, "//");
    stripped = strip_line_comments(stripped, "#");
    stripped = strip_block_comments(stripped);

    // Semicolon removal, whitespace collapse, trim and lower-case in one pass.
    // Dropping ';' before collapsing means "a ; b" still becomes "a b".
    std::string out;
    out.reserve(stripped.size());
    bool pending_space = false;
    for (char c : stripped) {
        if (c == ';') continue;
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
        out += c;
    }
    return out;
}

} // namespace trellis
