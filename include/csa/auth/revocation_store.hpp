#pragma once

/// @file revocation_store.hpp
/// @brief Durable backing for the revocation set.
///
/// Lets several instances share revocations and lets a restarted process
/// keep rejecting tokens that were revoked before it went down.

#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "csa/auth/revocation_set.hpp"
#include "csa/foundation/auth_result.hpp"
#include "csa/foundation/request_context.hpp"

namespace csa::auth {

/// Abstract interface for revocation persistence.
///
/// Implementations must be thread-safe and honour @p ctx.
class IRevocationStore {
public:
    virtual ~IRevocationStore() = default;

    /// Persist an entry. Writing an id that already exists is a no-op.
    virtual foundation::AuthResult<void> put(const RevocationEntry& entry,
                                             const foundation::RequestContext& ctx) = 0;

    /// Every persisted entry.
    [[nodiscard]] virtual foundation::AuthResult<std::vector<RevocationEntry>> loadAll(
        const foundation::RequestContext& ctx) = 0;

    /// Forget an entry once it is past retention.
    virtual foundation::AuthResult<void> remove(std::string_view tokenId,
                                                const foundation::RequestContext& ctx) = 0;
};

/// Thread-safe in-memory revocation store. One instance may be shared by
/// several coordinators to model a multi-instance deployment.
class InMemoryRevocationStore : public IRevocationStore {
public:
    foundation::AuthResult<void> put(const RevocationEntry& entry,
                                     const foundation::RequestContext& ctx) override;

    [[nodiscard]] foundation::AuthResult<std::vector<RevocationEntry>> loadAll(
        const foundation::RequestContext& ctx) override;

    foundation::AuthResult<void> remove(std::string_view tokenId,
                                        const foundation::RequestContext& ctx) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RevocationEntry> entries_;
};

}  // namespace csa::auth
