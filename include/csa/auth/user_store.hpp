#pragma once

/// @file user_store.hpp
/// @brief Credential persistence interface and in-memory implementation.
///
/// Abstracts credential storage so the coordinator can work with any
/// backend. The core never maps records itself; it only calls these three
/// operations.

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "csa/auth/auth_types.hpp"
#include "csa/foundation/auth_result.hpp"
#include "csa/foundation/request_context.hpp"

namespace csa::auth {

/// Abstract interface for credential persistence.
///
/// Implementations must be thread-safe and must honour the deadline and
/// cancellation of @p ctx. Backend faults are reported as
/// ErrorCode::StoreUnavailable, never as "not found".
class IUserStore {
public:
    virtual ~IUserStore() = default;

    /// Look up the credential of @p subjectId; nullopt if there is none.
    [[nodiscard]] virtual foundation::AuthResult<std::optional<Credential>> findCredential(
        std::string_view subjectId, const foundation::RequestContext& ctx) = 0;

    /// Insert or replace a credential.
    virtual foundation::AuthResult<void> saveCredential(
        const Credential& credential, const foundation::RequestContext& ctx) = 0;

    /// Remove a credential. Removing an absent subject is not an error.
    virtual foundation::AuthResult<void> deleteCredential(
        std::string_view subjectId, const foundation::RequestContext& ctx) = 0;
};

/// Thread-safe in-memory user store for testing and development.
class InMemoryUserStore : public IUserStore {
public:
    [[nodiscard]] foundation::AuthResult<std::optional<Credential>> findCredential(
        std::string_view subjectId, const foundation::RequestContext& ctx) override;

    foundation::AuthResult<void> saveCredential(
        const Credential& credential, const foundation::RequestContext& ctx) override;

    foundation::AuthResult<void> deleteCredential(
        std::string_view subjectId, const foundation::RequestContext& ctx) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Credential> credentials_;
};

}  // namespace csa::auth
