#include "utf8.hpp"
#include <core/errors.hpp>
#include <fmt/format.h>
#include <cstdint>

Bytes encode_utf8(const Text& text) {
    Bytes out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char32_t cp = text[i];
        if (cp >= 0xD800 && cp <= 0xDFFF) {
            throw EncodingError(fmt::format(
                "cannot encode surrogate U+{:04X} at position {}",
                static_cast<uint32_t>(cp), i));
        }
        if (cp > 0x10FFFF) {
            throw EncodingError(fmt::format(
                "code point 0x{:X} at position {} is out of range",
                static_cast<uint32_t>(cp), i));
        }

        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }
    return out;
}

// Decodes one sequence starting at pos. Returns the number of bytes consumed,
// or 0 if the sequence is invalid.
static size_t decode_one(const Bytes& bytes, size_t pos, char32_t& cp) {
    auto b0 = static_cast<unsigned char>(bytes[pos]);
    size_t len;
    char32_t min;

    if (b0 < 0x80) {
        cp = b0;
        return 1;
    } else if ((b0 & 0xE0) == 0xC0) {
        len = 2; cp = b0 & 0x1F; min = 0x80;
    } else if ((b0 & 0xF0) == 0xE0) {
        len = 3; cp = b0 & 0x0F; min = 0x800;
    } else if ((b0 & 0xF8) == 0xF0) {
        len = 4; cp = b0 & 0x07; min = 0x10000;
    } else {
        return 0;
    }

    if (pos + len > bytes.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        auto b = static_cast<unsigned char>(bytes[pos + k]);
        if ((b & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (b & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return 0;
    return len;
}

Text decode_utf8(const Bytes& bytes) {
    Text out;
    out.reserve(bytes.size());
    size_t pos = 0;
    while (pos < bytes.size()) {
        char32_t cp = 0;
        size_t n = decode_one(bytes, pos, cp);
        if (n == 0) {
            throw EncodingError(fmt::format(
                "invalid UTF-8 byte 0x{:02x} at offset {}",
                static_cast<unsigned char>(bytes[pos]), pos));
        }
        out += cp;
        pos += n;
    }
    return out;
}

bool is_valid_utf8(const Bytes& bytes) {
    size_t pos = 0;
    while (pos < bytes.size()) {
        char32_t cp = 0;
        size_t n = decode_one(bytes, pos, cp);
        if (n == 0) return false;
        pos += n;
    }
    return true;
}
