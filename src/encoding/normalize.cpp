#include "normalize.hpp"
#include <core/errors.hpp>
#include <fmt/format.h>
#include <filesystem>

namespace {

bool has_kind(const Value& value, ScalarKind kind) {
    return kind == ScalarKind::Text ? value.is_text() : value.is_bytes();
}

Value convert_leaf(const Value& leaf, ScalarKind to) {
    if (to == ScalarKind::Bytes) {
        return Value::bytes(encode_utf8(leaf.as_text()));
    }
    return Value::text(decode_utf8(leaf.as_bytes()));
}

std::vector<Value> convert_items(const std::vector<Value>& items, ScalarKind from, ScalarKind to) {
    std::vector<Value> out;
    out.reserve(items.size());
    for (const auto& item : items) {
        out.push_back(convert(item, from, to));
    }
    return out;
}

// Scalars spelled the way the Mercurial side prints them: True/False, None,
// and floats in shortest round-trip form that always shows a fraction or an
// exponent (1.0, 1e+16, inf).
std::string scalar_text(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::None:
            return "None";
        case Value::Kind::Bool:
            return std::get<bool>(value.v) ? "True" : "False";
        case Value::Kind::Int:
            return fmt::format("{}", std::get<std::int64_t>(value.v));
        case Value::Kind::Float: {
            std::string s = fmt::format("{}", std::get<double>(value.v));
            if (s.find_first_of(".en") == std::string::npos) s += ".0";
            return s;
        }
        default:
            throw EncodingError(fmt::format("cannot encode {} as bytes", kind_name(value.kind())));
    }
}

} // namespace

Value convert(const Value& data, ScalarKind from, ScalarKind to) {
    if (has_kind(data, from)) {
        if (from == to) return data;
        return convert_leaf(data, to);
    }

    return std::visit([&](const auto& x) -> Value {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, Mapping>) {
            Mapping out;
            for (const auto& [key, value] : x.entries()) {
                out.set(convert(key, from, to), convert(value, from, to));
            }
            return Value(Value::Variant(std::move(out)));
        } else if constexpr (std::is_same_v<T, Tuple>) {
            return Value::tuple(convert_items(x.items, from, to));
        } else if constexpr (std::is_same_v<T, List>) {
            return Value::list(convert_items(x.items, from, to));
        } else {
            return data;
        }
    }, data.v);
}

Value encode_scalar(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::Bytes:
            return value;
        case Value::Kind::Text:
            return Value::bytes(encode_utf8(value.as_text()));
        default:
            return Value::bytes(scalar_text(value));
    }
}

Value decode_scalar(const Value& value) {
    if (!value.is_bytes()) return value;
    return Value::text(decode_utf8(value.as_bytes()));
}

Bytes path_join(const Value& first, const std::vector<Value>& rest) {
    std::filesystem::path joined(encode_scalar(first).as_bytes());
    for (const auto& segment : rest) {
        joined /= encode_scalar(segment).as_bytes();
    }
    return joined.string();
}

Bytes lstrip(const Value& value, const Value& chars) {
    Bytes s = encode_scalar(value).as_bytes();
    Bytes set = encode_scalar(chars).as_bytes();
    auto start = s.find_first_not_of(set);
    if (start == Bytes::npos) return Bytes();
    return s.substr(start);
}

const Value& get_value(const Mapping& mapping, const Value& key) {
    const Value* found = mapping.find(key);
    // Text keys are stored in their encoded form on the byte side of the
    // bridge; the encoded lookup always takes precedence.
    if (key.is_text()) {
        found = mapping.find(encode_scalar(key));
    }

    if (found && is_truthy(*found)) {
        return *found;
    }
    throw NotFoundError(fmt::format("{} is not in the dict", to_display(key)));
}
