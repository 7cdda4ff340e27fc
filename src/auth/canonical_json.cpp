/// @file canonical_json.cpp
/// @brief Canonical flat-object JSON codec used for token claims.

#include "canonical_json.hpp"

#include <charconv>

namespace csa::auth::detail {

namespace {

void appendEscaped(std::string& out, std::string_view s) {
    static constexpr char hexChars[] = "0123456789abcdef";
    out.push_back('"');
    for (char c : s) {
        auto u = static_cast<unsigned char>(c);
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (u < 0x20) {
                    out += "\\u00";
                    out.push_back(hexChars[(u >> 4) & 0x0F]);
                    out.push_back(hexChars[u & 0x0F]);
                } else {
                    out.push_back(c);
                }
                break;
        }
    }
    out.push_back('"');
}

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/// Recursive-descent cursor over the input text.
class Cursor {
public:
    explicit Cursor(std::string_view text) : text_(text) {}

    void skipWhitespace() {
        while (pos_ < text_.size() &&
               (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n' ||
                text_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool consume(char expected) {
        skipWhitespace();
        if (pos_ < text_.size() && text_[pos_] == expected) {
            ++pos_;
            return true;
        }
        return false;
    }

    [[nodiscard]] bool peek(char expected) {
        skipWhitespace();
        return pos_ < text_.size() && text_[pos_] == expected;
    }

    [[nodiscard]] bool atEnd() {
        skipWhitespace();
        return pos_ == text_.size();
    }

    std::optional<std::string> parseString() {
        skipWhitespace();
        if (pos_ >= text_.size() || text_[pos_] != '"') {
            return std::nullopt;
        }
        ++pos_;
        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return std::nullopt;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= text_.size()) {
                return std::nullopt;
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    auto cp = parseHex4();
                    if (!cp) {
                        return std::nullopt;
                    }
                    uint32_t code = *cp;
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        // High surrogate: a low surrogate escape must follow.
                        if (pos_ + 1 >= text_.size() || text_[pos_] != '\\' ||
                            text_[pos_ + 1] != 'u') {
                            return std::nullopt;
                        }
                        pos_ += 2;
                        auto low = parseHex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                            return std::nullopt;
                        }
                        code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        return std::nullopt;
                    }
                    appendUtf8(out, code);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;
    }

    std::optional<int64_t> parseInteger() {
        skipWhitespace();
        std::size_t start = pos_;
        if (pos_ < text_.size() && text_[pos_] == '-') {
            ++pos_;
        }
        std::size_t digitsStart = pos_;
        while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') {
            ++pos_;
        }
        std::size_t digits = pos_ - digitsStart;
        if (digits == 0) {
            return std::nullopt;
        }
        if (digits > 1 && text_[digitsStart] == '0') {
            return std::nullopt;
        }
        // Fractions and exponents are not integers.
        if (pos_ < text_.size() &&
            (text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E')) {
            return std::nullopt;
        }
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text_.data() + start, text_.data() + pos_, value);
        if (ec != std::errc{} || ptr != text_.data() + pos_) {
            return std::nullopt;
        }
        return value;
    }

    [[nodiscard]] bool peekStringStart() { return peek('"'); }

private:
    std::optional<uint32_t> parseHex4() {
        if (pos_ + 4 > text_.size()) {
            return std::nullopt;
        }
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            char c = text_[pos_++];
            value <<= 4;
            if (c >= '0' && c <= '9') {
                value |= static_cast<uint32_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                value |= static_cast<uint32_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                value |= static_cast<uint32_t>(c - 'A' + 10);
            } else {
                return std::nullopt;
            }
        }
        return value;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

}  // namespace

std::string writeCanonicalJson(const FlatJsonObject& object) {
    std::string out;
    out.push_back('{');
    bool first = true;
    for (const auto& [key, value] : object) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        appendEscaped(out, key);
        out.push_back(':');
        if (const auto* s = std::get_if<std::string>(&value)) {
            appendEscaped(out, *s);
        } else {
            out += std::to_string(std::get<int64_t>(value));
        }
    }
    out.push_back('}');
    return out;
}

std::optional<FlatJsonObject> parseFlatJson(std::string_view text) {
    Cursor cursor(text);
    if (!cursor.consume('{')) {
        return std::nullopt;
    }

    FlatJsonObject object;
    if (cursor.consume('}')) {
        return cursor.atEnd() ? std::optional<FlatJsonObject>(std::move(object)) : std::nullopt;
    }

    while (true) {
        auto key = cursor.parseString();
        if (!key || !cursor.consume(':')) {
            return std::nullopt;
        }

        JsonScalar value;
        if (cursor.peekStringStart()) {
            auto s = cursor.parseString();
            if (!s) {
                return std::nullopt;
            }
            value = std::move(*s);
        } else {
            auto n = cursor.parseInteger();
            if (!n) {
                return std::nullopt;
            }
            value = *n;
        }

        if (!object.emplace(std::move(*key), std::move(value)).second) {
            return std::nullopt;  // duplicate key
        }

        if (cursor.consume(',')) {
            continue;
        }
        if (cursor.consume('}')) {
            break;
        }
        return std::nullopt;
    }

    if (!cursor.atEnd()) {
        return std::nullopt;
    }
    return object;
}

std::optional<std::string> stringField(const FlatJsonObject& object, std::string_view key) {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    if (const auto* s = std::get_if<std::string>(&it->second)) {
        return *s;
    }
    return std::nullopt;
}

std::optional<int64_t> integerField(const FlatJsonObject& object, std::string_view key) {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    if (const auto* n = std::get_if<int64_t>(&it->second)) {
        return *n;
    }
    return std::nullopt;
}

}  // namespace csa::auth::detail
