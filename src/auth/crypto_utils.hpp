#pragma once

/// @file crypto_utils.hpp
/// @brief Internal cryptographic helpers over OpenSSL: HMAC-SHA256, key
/// derivation, PBKDF2, scrypt, secure random, constant-time comparison,
/// plus hand-written base64url/hex codecs.
///
/// Every OpenSSL failure is reported through an empty optional; callers
/// translate it into an AuthError.

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace csa::auth::detail {

using Digest = std::array<uint8_t, 32>;

inline const unsigned char* bytesOf(std::string_view s) {
    return reinterpret_cast<const unsigned char*>(s.data());
}

// =============================================================================
// HMAC-SHA256 / key derivation
// =============================================================================

/// HMAC-SHA256(key, message).
[[nodiscard]] inline std::optional<Digest> hmacSha256(std::string_view key,
                                                      std::string_view message) {
    Digest out{};
    unsigned int outLen = 0;
    auto* res = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), bytesOf(message),
                     message.size(), out.data(), &outLen);
    if (res == nullptr || outLen != out.size()) {
        return std::nullopt;
    }
    return out;
}

/// Derive a 32-byte purpose-bound subkey: HMAC-SHA256(secret, label).
///
/// Token signing and CSRF MACs use different labels, so a value minted
/// for one purpose never validates as the other.
[[nodiscard]] inline std::optional<std::string> deriveKey(std::string_view secret,
                                                          std::string_view label) {
    auto mac = hmacSha256(secret, label);
    if (!mac) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(mac->data()), mac->size());
}

// =============================================================================
// Password derivation
// =============================================================================

/// PBKDF2-HMAC-SHA256 producing @p length bytes.
[[nodiscard]] inline std::optional<std::string> pbkdf2Sha256(std::string_view password,
                                                             std::string_view salt,
                                                             uint64_t iterations,
                                                             std::size_t length) {
    if (iterations == 0 || iterations > 0x7FFFFFFFu) {
        return std::nullopt;
    }
    std::string out(length, '\0');
    int ok = PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()), bytesOf(salt),
                               static_cast<int>(salt.size()), static_cast<int>(iterations),
                               EVP_sha256(), static_cast<int>(length),
                               reinterpret_cast<unsigned char*>(out.data()));
    if (ok != 1) {
        return std::nullopt;
    }
    return out;
}

/// scrypt producing @p length bytes. The memory ceiling is sized from the
/// parameters (128 * r * N plus headroom) so large N is not refused by
/// OpenSSL's 32 MiB default.
[[nodiscard]] inline std::optional<std::string> scrypt(std::string_view password,
                                                       std::string_view salt, uint64_t n,
                                                       uint64_t r, uint64_t p,
                                                       std::size_t length) {
    const uint64_t maxMem = 128 * r * (n + p + 2) + (uint64_t{1} << 20);
    std::string out(length, '\0');
    int ok = EVP_PBE_scrypt(password.data(), password.size(), bytesOf(salt), salt.size(), n, r, p,
                            maxMem, reinterpret_cast<unsigned char*>(out.data()), length);
    if (ok != 1) {
        return std::nullopt;
    }
    return out;
}

// =============================================================================
// Base64URL (RFC 4648 §5, unpadded)
// =============================================================================

[[nodiscard]] inline std::string base64urlEncode(const uint8_t* data, std::size_t length) {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string result;
    result.reserve((length * 4 + 2) / 3);

    for (std::size_t i = 0; i < length; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < length) {
            n |= static_cast<uint32_t>(data[i + 1]) << 8;
        }
        if (i + 2 < length) {
            n |= static_cast<uint32_t>(data[i + 2]);
        }

        result.push_back(table[(n >> 18) & 0x3F]);
        result.push_back(table[(n >> 12) & 0x3F]);
        if (i + 1 < length) {
            result.push_back(table[(n >> 6) & 0x3F]);
        }
        if (i + 2 < length) {
            result.push_back(table[n & 0x3F]);
        }
    }
    return result;
}

[[nodiscard]] inline std::string base64urlEncode(std::string_view input) {
    return base64urlEncode(bytesOf(input), input.size());
}

/// Strict decoder: rejects padding, characters outside the url-safe
/// alphabet, impossible lengths and non-zero trailing bits, so every byte
/// string has exactly one accepted encoding.
[[nodiscard]] inline std::optional<std::string> base64urlDecode(std::string_view input) {
    auto decodeChar = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') {
            return c - 'A';
        }
        if (c >= 'a' && c <= 'z') {
            return c - 'a' + 26;
        }
        if (c >= '0' && c <= '9') {
            return c - '0' + 52;
        }
        if (c == '-') {
            return 62;
        }
        if (c == '_') {
            return 63;
        }
        return -1;
    };

    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string result;
    result.reserve((input.size() * 3) / 4);

    uint32_t buf = 0;
    int bits = 0;
    for (char c : input) {
        int val = decodeChar(c);
        if (val < 0) {
            return std::nullopt;
        }
        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<char>((buf >> bits) & 0xFF));
        }
    }
    if (bits > 0 && (buf & ((1u << bits) - 1)) != 0) {
        return std::nullopt;
    }
    return result;
}

// =============================================================================
// Hex / random / comparison
// =============================================================================

[[nodiscard]] inline std::string toHex(std::string_view bytes) {
    static constexpr char hexChars[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (unsigned char b : bytes) {
        result.push_back(hexChars[(b >> 4) & 0x0F]);
        result.push_back(hexChars[b & 0x0F]);
    }
    return result;
}

/// Decode lowercase or uppercase hex. Empty optional on odd length or a
/// non-hex character.
[[nodiscard]] inline std::optional<std::string> fromHex(std::string_view hex) {
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    };
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::string out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
    }
    return out;
}

/// @p numBytes bytes from OpenSSL's CSPRNG.
[[nodiscard]] inline std::optional<std::string> secureRandomBytes(std::size_t numBytes) {
    std::string buf(numBytes, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(buf.data()), static_cast<int>(numBytes)) != 1) {
        return std::nullopt;
    }
    return buf;
}

[[nodiscard]] inline std::optional<std::string> secureRandomHex(std::size_t numBytes) {
    auto bytes = secureRandomBytes(numBytes);
    if (!bytes) {
        return std::nullopt;
    }
    return toHex(*bytes);
}

/// Equality whose running time depends only on the length of the inputs.
[[nodiscard]] inline bool constantTimeEqual(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}  // namespace csa::auth::detail
