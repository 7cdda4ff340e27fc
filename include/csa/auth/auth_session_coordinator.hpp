#pragma once

/// @file auth_session_coordinator.hpp
/// @brief Login / authorize / logout protocol over the hasher, token
/// authority, CSRF guard and revocation set.
///
/// Session lifecycle:
///   Anonymous -> Authenticated -> { Expired | Revoked | LoggedOut }

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "csa/auth/auth_types.hpp"
#include "csa/auth/csrf_guard.hpp"
#include "csa/auth/password_hasher.hpp"
#include "csa/auth/rate_limiter.hpp"
#include "csa/auth/revocation_set.hpp"
#include "csa/auth/revocation_store.hpp"
#include "csa/auth/token_authority.hpp"
#include "csa/auth/user_store.hpp"
#include "csa/foundation/auth_result.hpp"
#include "csa/foundation/clock.hpp"
#include "csa/foundation/job_scheduler.hpp"
#include "csa/foundation/request_context.hpp"

namespace csa::auth {

/// Composes the authority's components into the session protocol.
///
/// Unknown users, wrong passwords and unreadable stored hashes all fail
/// with the same AuthenticationFailed error, after the same amount of
/// hashing work. Store faults surface as StoreUnavailable and never as an
/// authentication failure.
///
/// Example:
/// @code
///   auto users = std::make_shared<InMemoryUserStore>();
///   auto revocations = std::make_shared<RevocationSet>(config.clockSkewTolerance,
///                                                      config.maxTokenTtl);
///   auto coordinator = AuthSessionCoordinator::create(config, users, revocations);
///   auto& auth = *coordinator.value();
///
///   auth.registerCredential("alice", "Secr3t!");
///   auto session = auth.login("alice", "Secr3t!");
///   auto subject = auth.authorize(session.value().encodedToken,
///                                 session.value().csrf, true);  // "alice"
///   auth.logout(session.value().encodedToken);
/// @endcode
class AuthSessionCoordinator {
public:
    using LoginCallback = std::function<void(foundation::AuthResult<LoginResult>)>;

    /// Wire up a coordinator. @p revocations may be null, in which case a
    /// private set is created; @p revocationStore may be null for a
    /// single-instance deployment without persistence.
    /// @return The coordinator, or ConfigInvalid.
    [[nodiscard]] static foundation::AuthResult<std::unique_ptr<AuthSessionCoordinator>> create(
        AuthConfig config,
        std::shared_ptr<IUserStore> users,
        std::shared_ptr<RevocationSet> revocations = nullptr,
        std::shared_ptr<IRevocationStore> revocationStore = nullptr,
        std::shared_ptr<foundation::IClock> clock = foundation::SystemClock::shared());

    ~AuthSessionCoordinator();

    AuthSessionCoordinator(const AuthSessionCoordinator&) = delete;
    AuthSessionCoordinator& operator=(const AuthSessionCoordinator&) = delete;

    /// Check a password and open a session.
    ///
    /// @param clientKey  Throttling key supplied by the transport (client
    ///                   address); the username is used when empty.
    [[nodiscard]] foundation::AuthResult<LoginResult> login(
        std::string_view username,
        std::string_view password,
        const foundation::RequestContext& ctx = {},
        std::string_view clientKey = {});

    /// Run login() on @p scheduler and deliver the result to @p callback on
    /// a worker thread. If the coordinator is destroyed before the job
    /// runs, the callback receives JobCancelled.
    [[nodiscard]] foundation::AuthResult<void> loginAsync(
        foundation::AuthJobScheduler& scheduler,
        std::string username,
        std::string password,
        LoginCallback callback,
        foundation::RequestContext ctx = {},
        std::string clientKey = {});

    /// Verify a bearer token and, for state-changing requests, the CSRF
    /// pair bound to it. Returns the subject id.
    [[nodiscard]] foundation::AuthResult<std::string> authorize(std::string_view bearer,
                                                                const CsrfPair& csrf,
                                                                bool isStateChanging) const;

    [[nodiscard]] foundation::AuthResult<std::string> authorize(const SessionToken& token,
                                                                const CsrfPair& csrf,
                                                                bool isStateChanging) const;

    /// End the session of @p bearer. Idempotent: expired or already
    /// revoked tokens succeed without effect.
    foundation::AuthResult<void> logout(std::string_view bearer,
                                        const foundation::RequestContext& ctx = {});

    /// Server-side invalidation of a session (reason Revoked).
    foundation::AuthResult<void> revokeSession(std::string_view bearer,
                                               const foundation::RequestContext& ctx = {});

    /// Lifecycle state of the session named by @p bearer.
    [[nodiscard]] SessionState sessionState(std::string_view bearer) const;

    /// Hash and store a credential for a new subject.
    /// @return Success, InvalidInput, AlreadyExists or StoreUnavailable.
    foundation::AuthResult<void> registerCredential(std::string_view username,
                                                    std::string_view password,
                                                    const foundation::RequestContext& ctx = {});

    /// Replace the password of the session's subject. The presenting token
    /// is revoked and a fresh token and CSRF pair are returned.
    [[nodiscard]] foundation::AuthResult<LoginResult> changePassword(
        std::string_view bearer,
        std::string_view oldPassword,
        std::string_view newPassword,
        const foundation::RequestContext& ctx = {});

    // -- Revocation lifecycle ------------------------------------------------

    /// Load persisted revocations into the set. Returns number added.
    foundation::AuthResult<std::size_t> restoreRevocations(
        const foundation::RequestContext& ctx = {});

    /// Pull revocations made by other instances and drop stale entries from
    /// the store. Returns number of entries added locally.
    foundation::AuthResult<std::size_t> syncRevocations(
        const foundation::RequestContext& ctx = {});

    /// Drop revocations past retention and idle rate-limit keys.
    /// Returns number of revocations removed.
    std::size_t pruneRevocations();

    /// Register the periodic sync + prune tick on @p scheduler, every
    /// revocationPruneInterval of processTick() time.
    ///
    /// Call shutdown() while @p scheduler is still alive to unregister the
    /// tick. A coordinator destroyed without shutdown() leaves the tick
    /// registered as a no-op until the scheduler goes away; it never runs
    /// maintenance on a destroyed coordinator.
    foundation::AuthResult<foundation::AuthJobScheduler::JobId> attachMaintenance(
        foundation::AuthJobScheduler& scheduler);

    /// Stop maintenance and write every live revocation to the store.
    foundation::AuthResult<void> shutdown(const foundation::RequestContext& ctx = {});

    // -- Accessors -------------------------------------------------------------

    [[nodiscard]] const TokenAuthority& tokenAuthority() const noexcept { return tokens_; }
    [[nodiscard]] const CsrfGuard& csrfGuard() const noexcept { return csrf_; }
    [[nodiscard]] const PasswordHasher& passwordHasher() const noexcept { return hasher_; }
    [[nodiscard]] const std::shared_ptr<RevocationSet>& revocations() const noexcept {
        return revocations_;
    }
    [[nodiscard]] const AuthConfig& config() const noexcept { return config_; }

private:
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };
    struct LifetimeGate;

public:
    AuthSessionCoordinator(ConstructionKey,
                           AuthConfig config,
                           std::shared_ptr<IUserStore> users,
                           std::shared_ptr<RevocationSet> revocations,
                           std::shared_ptr<IRevocationStore> revocationStore,
                           std::shared_ptr<foundation::IClock> clock,
                           TokenAuthority tokens,
                           CsrfGuard csrf,
                           std::string dummyHash);

private:
    [[nodiscard]] foundation::AuthResult<LoginResult> openSession(const std::string& subjectId);
    foundation::AuthResult<void> endSession(std::string_view bearer, RevocationReason reason,
                                            const foundation::RequestContext& ctx);
    void persistRevocation(const RevocationEntry& entry, const foundation::RequestContext& ctx);
    void rehashIfNeeded(const Credential& credential, std::string_view password,
                        const foundation::RequestContext& ctx);
    void runMaintenance();

    AuthConfig config_;
    std::shared_ptr<IUserStore> users_;
    std::shared_ptr<RevocationSet> revocations_;
    std::shared_ptr<IRevocationStore> revocationStore_;
    std::shared_ptr<foundation::IClock> clock_;
    PasswordHasher hasher_;
    TokenAuthority tokens_;
    CsrfGuard csrf_;
    RateLimiter rateLimiter_;
    std::string dummyHash_;

    /// Closed by the destructor; pool jobs holding a copy check it first.
    std::shared_ptr<LifetimeGate> gate_;
    foundation::AuthJobScheduler* maintenanceScheduler_ = nullptr;
    std::optional<foundation::AuthJobScheduler::JobId> maintenanceJob_;
};

}  // namespace csa::auth
