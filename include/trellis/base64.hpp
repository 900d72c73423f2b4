#pragma once

#include <trellis/result.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace trellis {

// Standard alphabet (RFC 4648). Padding is optional; ASCII whitespace is
// skipped. Any other character is InvalidArg.
Result<std::vector<uint8_t>> decode_base64(const std::string& text);

std::string encode_base64(const std::vector<uint8_t>& bytes);

// "data:image/png;base64,AAAA" -> "AAAA". Text without a comma is returned
// unchanged.
std::string strip_data_url(const std::string& text);

// "data:image/png;base64,..." -> "image/png", or `fallback` when there is no
// data-URL header.
std::string data_url_mime_type(const std::string& text, const std::string& fallback);

} // namespace trellis
