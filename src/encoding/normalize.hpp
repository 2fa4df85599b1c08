#pragma once

#include <vector>
#include "value.hpp"

enum class ScalarKind { Text, Bytes };

// Recursively convert every leaf of kind `from` to kind `to` (UTF-8 as the
// interchange encoding). Mappings, tuples and lists keep their shape; other
// leaves are returned unchanged. Throws EncodingError on invalid UTF-8.
Value convert(const Value& data, ScalarKind from = ScalarKind::Text,
              ScalarKind to = ScalarKind::Bytes);

// Text -> Bytes. Bytes are returned as-is; None, booleans and numbers are
// rendered as "None", "True"/"False", "42", "1.0". Containers throw
// EncodingError.
Value encode_scalar(const Value& value);

// Bytes -> Text. Anything that is not Bytes is returned as-is.
Value decode_scalar(const Value& value);

// Join path segments after coercing each one to bytes. Follows
// std::filesystem::path::operator/ (an absolute segment restarts the path).
Bytes path_join(const Value& first, const std::vector<Value>& rest = {});

// Remove leading bytes contained in `chars`. Both are coerced to bytes.
Bytes lstrip(const Value& value, const Value& chars);

// Look up `key`; a Text key is looked up in its encoded form. Throws
// NotFoundError when the result is missing or falsy.
const Value& get_value(const Mapping& mapping, const Value& key);
