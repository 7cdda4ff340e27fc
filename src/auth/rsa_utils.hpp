#pragma once

/// @file rsa_utils.hpp
/// @brief RSA-SHA256 signing and verification over the OpenSSL 3 EVP API.
///
/// Keys are loaded from PEM strings through memory BIOs, no file I/O.

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

namespace csa::auth::detail {

struct BioDeleter {
    void operator()(BIO* bio) const { BIO_free(bio); }
};
struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

/// Load a private key from PEM. Null on parse failure.
[[nodiscard]] inline PkeyPtr loadPrivateKey(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }
    PkeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        ERR_clear_error();
    }
    return key;
}

/// Load a public key (SubjectPublicKeyInfo PEM). Null on parse failure.
[[nodiscard]] inline PkeyPtr loadPublicKey(std::string_view pem) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
    if (!bio) {
        return nullptr;
    }
    PkeyPtr key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        ERR_clear_error();
    }
    return key;
}

/// Sign @p message with RSA-SHA256 (PKCS#1 v1.5). Raw signature bytes, or
/// nullopt on any OpenSSL failure.
[[nodiscard]] inline std::optional<std::string> rsaSha256Sign(EVP_PKEY* key,
                                                              std::string_view message) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || key == nullptr) {
        return std::nullopt;
    }
    if (EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1 ||
        EVP_DigestSignUpdate(ctx.get(), message.data(), message.size()) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }

    std::size_t sigLen = 0;
    if (EVP_DigestSignFinal(ctx.get(), nullptr, &sigLen) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }
    std::string signature(sigLen, '\0');
    if (EVP_DigestSignFinal(ctx.get(), reinterpret_cast<unsigned char*>(signature.data()),
                            &sigLen) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }
    signature.resize(sigLen);
    return signature;
}

/// Verify an RSA-SHA256 signature.
[[nodiscard]] inline bool rsaSha256Verify(EVP_PKEY* key,
                                          std::string_view message,
                                          std::string_view signature) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || key == nullptr) {
        return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) != 1 ||
        EVP_DigestVerifyUpdate(ctx.get(), message.data(), message.size()) != 1) {
        ERR_clear_error();
        return false;
    }
    int result = EVP_DigestVerifyFinal(
        ctx.get(), reinterpret_cast<const unsigned char*>(signature.data()), signature.size());
    if (result != 1) {
        ERR_clear_error();
    }
    return result == 1;
}

}  // namespace csa::auth::detail
