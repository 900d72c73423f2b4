#pragma once

#include <string>

namespace trellis {

// Canonical form of pseudocode for cache fingerprints. Two inputs that differ
// only in comments, semicolons, whitespace layout or ASCII letter case
// normalize to the same string. Steps, in order:
//   1. drop `//` then `#` line comments (marker to end of line)
//   2. drop `/* ... */` block comments (shortest match, may span lines)
//   3. drop every ';'
//   4. collapse whitespace runs to a single space
//   5. trim
//   6. lower-case
std::string normalize_code(const std::string& text);

// Step 1 for a single marker. Exposed for tests.
std::string strip_line_comments(const std::string& text, const std::string& marker);

// Step 2. An unterminated "/*" is kept verbatim.
std::string strip_block_comments(const std::string& text);

} // namespace trellis
