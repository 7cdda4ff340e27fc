/// @file auth_types.cpp
/// @brief Name/tag conversions for the auth enums.

#include "csa/auth/auth_types.hpp"

namespace csa::auth {

std::string_view hashAlgorithmTag(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::Pbkdf2Sha256: return "pbkdf2-sha256";
        case HashAlgorithm::Scrypt:       return "scrypt";
    }
    return "unknown";
}

std::optional<HashAlgorithm> parseHashAlgorithm(std::string_view tag) {
    if (tag == "pbkdf2-sha256") {
        return HashAlgorithm::Pbkdf2Sha256;
    }
    if (tag == "scrypt") {
        return HashAlgorithm::Scrypt;
    }
    return std::nullopt;
}

std::string_view signingAlgorithmName(SigningAlgorithm algorithm) {
    switch (algorithm) {
        case SigningAlgorithm::HS256: return "HS256";
        case SigningAlgorithm::RS256: return "RS256";
    }
    return "unknown";
}

std::optional<SigningAlgorithm> parseSigningAlgorithm(std::string_view name) {
    if (name == "HS256") {
        return SigningAlgorithm::HS256;
    }
    if (name == "RS256") {
        return SigningAlgorithm::RS256;
    }
    return std::nullopt;
}

std::string_view sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Anonymous:     return "Anonymous";
        case SessionState::Authenticated: return "Authenticated";
        case SessionState::Expired:       return "Expired";
        case SessionState::Revoked:       return "Revoked";
        case SessionState::LoggedOut:     return "LoggedOut";
    }
    return "Unknown";
}

}  // namespace csa::auth
