/// @file user_store.cpp
/// @brief InMemoryUserStore implementation.

#include "csa/auth/user_store.hpp"

namespace csa::auth {

using foundation::AuthError;
using foundation::AuthResult;
using foundation::ErrorCode;
using foundation::RequestContext;

AuthResult<std::optional<Credential>> InMemoryUserStore::findCredential(
    std::string_view subjectId, const RequestContext& ctx) {
    if (auto alive = ctx.check("findCredential"); !alive) {
        return AuthResult<std::optional<Credential>>::err(alive.error());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = credentials_.find(std::string(subjectId));
    if (it == credentials_.end()) {
        return AuthResult<std::optional<Credential>>::ok(std::nullopt);
    }
    return AuthResult<std::optional<Credential>>::ok(it->second);
}

AuthResult<void> InMemoryUserStore::saveCredential(const Credential& credential,
                                                   const RequestContext& ctx) {
    if (auto alive = ctx.check("saveCredential"); !alive) {
        return alive;
    }
    if (credential.subjectId.empty()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::InvalidInput, "credential subject must not be empty"));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    credentials_[credential.subjectId] = credential;
    return AuthResult<void>::ok();
}

AuthResult<void> InMemoryUserStore::deleteCredential(std::string_view subjectId,
                                                     const RequestContext& ctx) {
    if (auto alive = ctx.check("deleteCredential"); !alive) {
        return alive;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    credentials_.erase(std::string(subjectId));
    return AuthResult<void>::ok();
}

std::size_t InMemoryUserStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return credentials_.size();
}

}  // namespace csa::auth
