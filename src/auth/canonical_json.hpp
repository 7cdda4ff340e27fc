#pragma once

/// @file canonical_json.hpp
/// @brief Canonical writer and strict parser for flat JSON objects.
///
/// Token headers and payloads are flat objects whose values are strings or
/// 64-bit integers. The writer emits keys in sorted order, no whitespace,
/// minimal escaping, so equal objects always serialize to equal bytes.
/// The parser accepts any well-formed flat object of that shape and
/// rejects everything else (nesting, arrays, booleans, null, fractions,
/// duplicate keys, trailing data).

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace csa::auth::detail {

using JsonScalar = std::variant<std::string, int64_t>;

/// Flat JSON object. std::map keeps keys in canonical (byte) order.
using FlatJsonObject = std::map<std::string, JsonScalar, std::less<>>;

/// Serialize @p object canonically.
[[nodiscard]] std::string writeCanonicalJson(const FlatJsonObject& object);

/// Parse a flat JSON object; nullopt if the text is not exactly one.
[[nodiscard]] std::optional<FlatJsonObject> parseFlatJson(std::string_view text);

/// Typed field access; nullopt if missing or of another type.
[[nodiscard]] std::optional<std::string> stringField(const FlatJsonObject& object,
                                                     std::string_view key);
[[nodiscard]] std::optional<int64_t> integerField(const FlatJsonObject& object,
                                                  std::string_view key);

}  // namespace csa::auth::detail
