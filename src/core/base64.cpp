#include <trellis/base64.hpp>

namespace trellis {

static const char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int decode_char(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

Result<std::vector<uint8_t>> decode_base64(const std::string& text) {
    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    uint32_t acc = 0;
    int bits = 0;
    size_t symbols = 0;
    size_t padding = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (is_space(c)) continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) {
            return TrellisError{TrellisError::InvalidArg,
                "invalid base64: data after padding at offset " + std::to_string(i)};
        }
        int v = decode_char(c);
        if (v < 0) {
            return TrellisError{TrellisError::InvalidArg,
                "invalid base64 character at offset " + std::to_string(i)};
        }
        ++symbols;
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xff));
        }
    }

    // A lone trailing symbol carries fewer than 8 bits
    if (symbols % 4 == 1 || padding > 2) {
        return TrellisError{TrellisError::InvalidArg, "invalid base64: truncated input"};
    }
    return Result<std::vector<uint8_t>>::ok(std::move(out));
}

std::string encode_base64(const std::vector<uint8_t>& bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t n = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8) | bytes[i + 2];
        out += kAlphabet[(n >> 18) & 63];
        out += kAlphabet[(n >> 12) & 63];
        out += kAlphabet[(n >> 6) & 63];
        out += kAlphabet[n & 63];
    }
    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = uint32_t(bytes[i]) << 16;
        out += kAlphabet[(n >> 18) & 63];
        out += kAlphabet[(n >> 12) & 63];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t(bytes[i]) << 16) | (uint32_t(bytes[i + 1]) << 8);
        out += kAlphabet[(n >> 18) & 63];
        out += kAlphabet[(n >> 12) & 63];
        out += kAlphabet[(n >> 6) & 63];
        out += '=';
    }
    return out;
}

std::string strip_data_url(const std::string& text) {
    auto comma = text.find(',');
    if (comma == std::string::npos) return text;
    return text.substr(comma + 1);
}

std::string data_url_mime_type(const std::string& text, const std::string& fallback) {
    if (text.compare(0, 5, "data:") != 0) return fallback;
    auto end = text.find_first_of(";,", 5);
    if (end == std::string::npos || end == 5) return fallback;
    return text.substr(5, end - 5);
}

} // namespace trellis
