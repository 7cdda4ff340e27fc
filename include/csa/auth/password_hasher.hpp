#pragma once

/// @file password_hasher.hpp
/// @brief Salted, work-factor-tunable password hashing and verification.
///
/// Encoded hash format (one self-describing string per credential):
/// @code
///   $<algorithm-tag>$<work-factor>$<salt base64url>$<digest base64url>
///   $pbkdf2-sha256$18$3q2-7wAAAAAAAAAAAAAAAA$Jm1...
/// @endcode
/// Because every hash carries its own algorithm and work factor, the
/// configured cost can be raised without invalidating stored hashes;
/// needsRehash() drives the upgrade on the next successful login.

#include "csa/auth/auth_types.hpp"
#include "csa/foundation/auth_result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace csa::auth {

/// Decoded form of an encoded hash.
struct EncodedHash {
    HashParams params;
    std::string salt;    ///< Raw salt bytes.
    std::string digest;  ///< Raw derived bytes.
};

/// One-way password hasher.
///
/// Example:
/// @code
///   PasswordHasher hasher({HashAlgorithm::Pbkdf2Sha256, 18}, 256);
///   auto encoded = hasher.hash("correct horse");
///   auto ok = hasher.verify("correct horse", encoded.value());
/// @endcode
class PasswordHasher {
public:
    static constexpr std::size_t kSaltBytes = 16;
    static constexpr std::size_t kDigestBytes = 32;

    /// @param defaults          Algorithm and work factor for new hashes.
    /// @param maxPasswordLength Longer inputs are rejected before derivation.
    explicit PasswordHasher(HashParams defaults = {}, uint32_t maxPasswordLength = 256);

    /// Hash with the default parameters and a fresh random salt.
    /// InvalidInput on empty/over-long passwords.
    [[nodiscard]] foundation::AuthResult<std::string> hash(std::string_view password) const;

    /// Hash with the default algorithm at an explicit work factor.
    [[nodiscard]] foundation::AuthResult<std::string> hash(std::string_view password,
                                                           uint32_t workFactor) const;

    [[nodiscard]] foundation::AuthResult<std::string> hash(std::string_view password,
                                                           const HashParams& params) const;

    /// Check @p password against @p encodedHash in constant time.
    ///
    /// Returns false on mismatch, and for empty or over-long candidates
    /// without deriving anything. MalformedHash if @p encodedHash does not
    /// parse.
    [[nodiscard]] foundation::AuthResult<bool> verify(std::string_view password,
                                                      std::string_view encodedHash) const;

    /// True when @p encodedHash was made with another algorithm or a lower
    /// work factor than the configured defaults.
    [[nodiscard]] foundation::AuthResult<bool> needsRehash(std::string_view encodedHash) const;

    /// Parse an encoded hash without verifying anything.
    [[nodiscard]] static foundation::AuthResult<EncodedHash> decode(std::string_view encodedHash);

    [[nodiscard]] static std::string encode(const EncodedHash& hash);

    /// Accepted work factor range [min, max] for an algorithm.
    [[nodiscard]] static std::pair<uint32_t, uint32_t> workFactorRange(HashAlgorithm algorithm);

    [[nodiscard]] const HashParams& defaults() const noexcept { return defaults_; }

    [[nodiscard]] uint32_t maxPasswordLength() const noexcept { return maxPasswordLength_; }

private:
    [[nodiscard]] foundation::AuthResult<std::string> derive(std::string_view password,
                                                             std::string_view salt,
                                                             const HashParams& params) const;

    HashParams defaults_;
    uint32_t maxPasswordLength_;
};

}  // namespace csa::auth
