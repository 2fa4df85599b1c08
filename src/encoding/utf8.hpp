#pragma once

#include <string>

// Text is a sequence of Unicode code points; Bytes is raw octets.
using Text = std::u32string;
using Bytes = std::string;

// Encode code points as UTF-8. Throws EncodingError on surrogates or
// values above U+10FFFF.
Bytes encode_utf8(const Text& text);

// Strict UTF-8 decode. Throws EncodingError on truncated, overlong or
// surrogate sequences and on invalid lead bytes.
Text decode_utf8(const Bytes& bytes);

bool is_valid_utf8(const Bytes& bytes);
