/// @file auth_session_coordinator.cpp
/// @brief AuthSessionCoordinator implementation.

#include "csa/auth/auth_session_coordinator.hpp"

#include "csa/auth/auth_config_loader.hpp"
#include "csa/foundation/auth_logger.hpp"
#include "csa/foundation/error_code.hpp"

#include "crypto_utils.hpp"

#include <exception>
#include <shared_mutex>

namespace csa::auth {

using foundation::AuthError;
using foundation::AuthJobScheduler;
using foundation::AuthResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::RequestContext;

namespace {

constexpr std::string_view kBearerPrefix = "Bearer ";

/// Accept either the compact token or an "Authorization: Bearer" value.
std::string_view stripBearer(std::string_view bearer) {
    if (bearer.substr(0, kBearerPrefix.size()) == kBearerPrefix) {
        bearer.remove_prefix(kBearerPrefix.size());
    }
    return bearer;
}

AuthError authenticationFailed() {
    return AuthError(ErrorCode::AuthenticationFailed, "invalid username or password");
}

/// Store faults of any kind surface uniformly as StoreUnavailable.
AuthError storeUnavailable(const AuthError& cause, std::string_view what) {
    if (cause.code() == ErrorCode::StoreUnavailable) {
        return cause;
    }
    return AuthError(ErrorCode::StoreUnavailable,
                     std::string(what) + ": " + std::string(cause.message()));
}

}  // namespace

// -- Construction -------------------------------------------------------------

AuthResult<std::unique_ptr<AuthSessionCoordinator>> AuthSessionCoordinator::create(
    AuthConfig config,
    std::shared_ptr<IUserStore> users,
    std::shared_ptr<RevocationSet> revocations,
    std::shared_ptr<IRevocationStore> revocationStore,
    std::shared_ptr<foundation::IClock> clock) {
    using Out = AuthResult<std::unique_ptr<AuthSessionCoordinator>>;

    if (!users) {
        return Out::err(AuthError(ErrorCode::ConfigInvalid, "a user store is required"));
    }
    if (auto valid = validateAuthConfig(config); !valid) {
        return Out::err(valid.error());
    }
    if (!clock) {
        clock = foundation::SystemClock::shared();
    }
    if (!revocations) {
        revocations = std::make_shared<RevocationSet>(config.clockSkewTolerance,
                                                      config.maxTokenTtl, clock);
    }

    auto tokens = TokenAuthority::create(config, clock, revocations);
    if (!tokens) {
        return Out::err(tokens.error());
    }
    auto csrf = CsrfGuard::create(config, clock);
    if (!csrf) {
        return Out::err(csrf.error());
    }

    // Unknown users are checked against this hash so a miss costs the
    // same derivation as a hit.
    PasswordHasher hasher(config.hashParams(), config.maxPasswordLength);
    auto filler = detail::secureRandomHex(16);
    if (!filler) {
        return Out::err(AuthError(ErrorCode::Unknown, "random generation failed"));
    }
    auto dummyHash = hasher.hash(*filler);
    if (!dummyHash) {
        return Out::err(dummyHash.error());
    }

    CSA_LOG_INFO(LogCategory::Core,
                 "session coordinator ready: alg=" +
                     std::string(signingAlgorithmName(config.signingAlgorithm)) +
                     " revocation_store=" + (revocationStore ? "yes" : "no"));

    return Out::ok(std::make_unique<AuthSessionCoordinator>(
        ConstructionKey{}, std::move(config), std::move(users), std::move(revocations),
        std::move(revocationStore), std::move(clock), std::move(tokens).value(),
        std::move(csrf).value(), std::move(dummyHash).value()));
}

struct AuthSessionCoordinator::LifetimeGate {
    std::shared_mutex mutex;
    bool open = true;
};

AuthSessionCoordinator::AuthSessionCoordinator(ConstructionKey,
                                               AuthConfig config,
                                               std::shared_ptr<IUserStore> users,
                                               std::shared_ptr<RevocationSet> revocations,
                                               std::shared_ptr<IRevocationStore> revocationStore,
                                               std::shared_ptr<foundation::IClock> clock,
                                               TokenAuthority tokens,
                                               CsrfGuard csrf,
                                               std::string dummyHash)
    : config_(std::move(config)),
      users_(std::move(users)),
      revocations_(std::move(revocations)),
      revocationStore_(std::move(revocationStore)),
      clock_(std::move(clock)),
      hasher_(config_.hashParams(), config_.maxPasswordLength),
      tokens_(std::move(tokens)),
      csrf_(std::move(csrf)),
      rateLimiter_(config_.loginRateLimitMaxAttempts, config_.loginRateLimitWindow, clock_),
      dummyHash_(std::move(dummyHash)),
      gate_(std::make_shared<LifetimeGate>()) {}

AuthSessionCoordinator::~AuthSessionCoordinator() {
    // Waits for a tick or async login already running on the pool. The
    // scheduler may be gone by now, so it is not touched here.
    std::unique_lock lock(gate_->mutex);
    gate_->open = false;
    if (maintenanceJob_) {
        CSA_LOG_DEBUG(LogCategory::Core, "coordinator destroyed without shutdown()");
    }
}

// -- Login ----------------------------------------------------------------------

AuthResult<LoginResult> AuthSessionCoordinator::login(std::string_view username,
                                                      std::string_view password,
                                                      const RequestContext& ctx,
                                                      std::string_view clientKey) {
    LogContext logCtx;
    logCtx.subjectId = std::string(username);
    if (!clientKey.empty()) {
        logCtx.clientKey = std::string(clientKey);
    }

    std::string throttleKey =
        clientKey.empty() ? "user:" + std::string(username) : std::string(clientKey);
    if (!rateLimiter_.allow(throttleKey)) {
        CSA_LOG_CTX(LogLevel::Warning, LogCategory::Session, "login throttled", logCtx);
        return AuthResult<LoginResult>::err(
            AuthError(ErrorCode::RateLimitExceeded, "too many login attempts, try again later"));
    }

    if (auto alive = ctx.check("login"); !alive) {
        return AuthResult<LoginResult>::err(alive.error());
    }
    auto found = users_->findCredential(username, ctx);
    if (!found) {
        CSA_LOG_CTX(LogLevel::Error, LogCategory::Store, "credential lookup failed", logCtx);
        return AuthResult<LoginResult>::err(storeUnavailable(found.error(), "credential lookup"));
    }

    if (!found.value()) {
        auto burn = hasher_.verify(password, dummyHash_);
        if (!burn) {
            CSA_LOG_ERROR(LogCategory::Hasher, "dummy hash verification failed");
        }
        CSA_LOG_CTX(LogLevel::Info, LogCategory::Session, "login failed", logCtx);
        return AuthResult<LoginResult>::err(authenticationFailed());
    }

    const Credential& credential = *found.value();
    auto verified = hasher_.verify(password, credential.passwordHash);
    if (!verified) {
        CSA_LOG_CTX(LogLevel::Error, LogCategory::Session,
                    "stored password hash unreadable: " + std::string(verified.error().message()),
                    logCtx);
        return AuthResult<LoginResult>::err(authenticationFailed());
    }
    if (!verified.value()) {
        CSA_LOG_CTX(LogLevel::Info, LogCategory::Session, "login failed", logCtx);
        return AuthResult<LoginResult>::err(authenticationFailed());
    }

    rateLimiter_.reset(throttleKey);
    rehashIfNeeded(credential, password, ctx);

    auto session = openSession(credential.subjectId);
    if (session) {
        logCtx.tokenId = foundation::redactTokenId(session.value().token.tokenId);
        CSA_LOG_CTX(LogLevel::Info, LogCategory::Session, "login succeeded", logCtx);
    }
    return session;
}

AuthResult<void> AuthSessionCoordinator::loginAsync(
    AuthJobScheduler& scheduler,
    std::string username,
    std::string password,
    LoginCallback callback,
    RequestContext ctx,
    std::string clientKey) {
    if (!callback) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::InvalidInput, "login callback must be set"));
    }
    return scheduler.post(
        [this, gate = gate_, username = std::move(username), password = std::move(password),
         callback = std::move(callback), ctx = std::move(ctx),
         clientKey = std::move(clientKey)] {
            std::optional<AuthResult<LoginResult>> result;
            {
                std::shared_lock lock(gate->mutex);
                if (gate->open) {
                    result.emplace(login(username, password, ctx, clientKey));
                }
            }
            if (!result) {
                callback(AuthResult<LoginResult>::err(
                    AuthError(ErrorCode::JobCancelled, "session coordinator was destroyed")));
                return;
            }
            callback(std::move(*result));
        },
        foundation::JobPriority::High);
}

void AuthSessionCoordinator::rehashIfNeeded(const Credential& credential,
                                            std::string_view password,
                                            const RequestContext& ctx) {
    auto stale = hasher_.needsRehash(credential.passwordHash);
    if (!stale || !stale.value()) {
        return;
    }
    auto upgraded = hasher_.hash(password);
    if (!upgraded) {
        CSA_LOG_WARN(LogCategory::Hasher,
                     "rehash failed: " + std::string(upgraded.error().message()));
        return;
    }
    auto saved = users_->saveCredential(Credential{credential.subjectId, upgraded.value()}, ctx);
    LogContext logCtx;
    logCtx.subjectId = credential.subjectId;
    if (!saved) {
        logCtx.extra["error"] = std::string(saved.error().message());
        CSA_LOG_CTX(LogLevel::Warning, LogCategory::Store, "rehash not persisted", logCtx);
        return;
    }
    CSA_LOG_CTX(LogLevel::Info, LogCategory::Hasher, "password hash upgraded", logCtx);
}

AuthResult<LoginResult> AuthSessionCoordinator::openSession(const std::string& subjectId) {
    auto token = tokens_.issue(subjectId);
    if (!token) {
        return AuthResult<LoginResult>::err(token.error());
    }
    auto csrf = csrf_.issue(token.value().tokenId);
    if (!csrf) {
        return AuthResult<LoginResult>::err(csrf.error());
    }

    LoginResult result;
    result.encodedToken = tokens_.encode(token.value());
    result.token = std::move(token).value();
    result.csrf = std::move(csrf).value();
    return AuthResult<LoginResult>::ok(std::move(result));
}

// -- Authorize --------------------------------------------------------------------

AuthResult<std::string> AuthSessionCoordinator::authorize(std::string_view bearer,
                                                          const CsrfPair& csrf,
                                                          bool isStateChanging) const {
    auto claims = tokens_.verifyClaims(stripBearer(bearer));
    if (!claims) {
        CSA_LOG_DEBUG(LogCategory::Session,
                      "authorize rejected: " + std::string(claims.error().message()));
        return AuthResult<std::string>::err(claims.error());
    }

    const auto& token = claims.value();
    if (isStateChanging && !csrf_.verify(token.tokenId, csrf)) {
        LogContext logCtx;
        logCtx.subjectId = token.subjectId;
        logCtx.tokenId = foundation::redactTokenId(token.tokenId);
        CSA_LOG_CTX(LogLevel::Warning, LogCategory::Csrf, "CSRF validation failed", logCtx);
        return AuthResult<std::string>::err(
            AuthError(ErrorCode::CsrfValidationFailed, "CSRF validation failed"));
    }
    return AuthResult<std::string>::ok(token.subjectId);
}

AuthResult<std::string> AuthSessionCoordinator::authorize(const SessionToken& token,
                                                          const CsrfPair& csrf,
                                                          bool isStateChanging) const {
    return authorize(tokens_.encode(token), csrf, isStateChanging);
}

// -- Logout / revocation ------------------------------------------------------------

AuthResult<void> AuthSessionCoordinator::logout(std::string_view bearer,
                                                const RequestContext& ctx) {
    return endSession(bearer, RevocationReason::Logout, ctx);
}

AuthResult<void> AuthSessionCoordinator::revokeSession(std::string_view bearer,
                                                       const RequestContext& ctx) {
    return endSession(bearer, RevocationReason::Revoked, ctx);
}

AuthResult<void> AuthSessionCoordinator::endSession(std::string_view bearer,
                                                    RevocationReason reason,
                                                    const RequestContext& ctx) {
    auto claims = tokens_.verifyClaims(stripBearer(bearer));
    if (!claims) {
        auto code = claims.error().code();
        if (code == ErrorCode::TokenExpired || code == ErrorCode::TokenRevoked) {
            return AuthResult<void>::ok();
        }
        return AuthResult<void>::err(claims.error());
    }

    const auto& token = claims.value();
    auto added = tokens_.revoke(token, reason);
    if (!added) {
        return AuthResult<void>::err(added.error());
    }
    if (added.value()) {
        if (auto entry = revocations_->find(token.tokenId)) {
            persistRevocation(*entry, ctx);
        }
        LogContext logCtx;
        logCtx.subjectId = token.subjectId;
        logCtx.tokenId = foundation::redactTokenId(token.tokenId);
        CSA_LOG_CTX(LogLevel::Info, LogCategory::Session,
                    reason == RevocationReason::Logout ? "logout" : "session revoked", logCtx);
    }
    return AuthResult<void>::ok();
}

void AuthSessionCoordinator::persistRevocation(const RevocationEntry& entry,
                                               const RequestContext& ctx) {
    if (!revocationStore_) {
        return;
    }
    auto stored = revocationStore_->put(entry, ctx);
    if (!stored) {
        // The local set already rejects the token; peers learn of it on flush.
        LogContext logCtx;
        logCtx.tokenId = foundation::redactTokenId(entry.tokenId);
        logCtx.extra["error"] = std::string(stored.error().message());
        CSA_LOG_CTX(LogLevel::Error, LogCategory::Store, "revocation not persisted", logCtx);
    }
}

SessionState AuthSessionCoordinator::sessionState(std::string_view bearer) const {
    bearer = stripBearer(bearer);
    if (bearer.empty()) {
        return SessionState::Anonymous;
    }
    auto claims = tokens_.verifyClaims(bearer);
    if (claims) {
        return SessionState::Authenticated;
    }
    switch (claims.error().code()) {
        case ErrorCode::TokenExpired:
            return SessionState::Expired;
        case ErrorCode::TokenRevoked: {
            auto decoded = tokens_.decode(bearer);
            if (decoded) {
                auto entry = revocations_->find(decoded.value().tokenId);
                if (entry && entry->reason == RevocationReason::Logout) {
                    return SessionState::LoggedOut;
                }
            }
            return SessionState::Revoked;
        }
        default:
            return SessionState::Anonymous;
    }
}

// -- Credential management ----------------------------------------------------------

AuthResult<void> AuthSessionCoordinator::registerCredential(std::string_view username,
                                                            std::string_view password,
                                                            const RequestContext& ctx) {
    if (username.empty()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::InvalidInput, "username must not be empty"));
    }
    auto hashed = hasher_.hash(password);
    if (!hashed) {
        return AuthResult<void>::err(hashed.error());
    }

    auto existing = users_->findCredential(username, ctx);
    if (!existing) {
        return AuthResult<void>::err(storeUnavailable(existing.error(), "credential lookup"));
    }
    if (existing.value()) {
        return AuthResult<void>::err(
            AuthError(ErrorCode::AlreadyExists, "subject already registered"));
    }

    auto saved =
        users_->saveCredential(Credential{std::string(username), std::move(hashed).value()}, ctx);
    if (!saved) {
        return AuthResult<void>::err(storeUnavailable(saved.error(), "credential save"));
    }

    LogContext logCtx;
    logCtx.subjectId = std::string(username);
    CSA_LOG_CTX(LogLevel::Info, LogCategory::Session, "credential registered", logCtx);
    return AuthResult<void>::ok();
}

AuthResult<LoginResult> AuthSessionCoordinator::changePassword(std::string_view bearer,
                                                               std::string_view oldPassword,
                                                               std::string_view newPassword,
                                                               const RequestContext& ctx) {
    auto claims = tokens_.verifyClaims(stripBearer(bearer));
    if (!claims) {
        return AuthResult<LoginResult>::err(claims.error());
    }
    const auto& token = claims.value();

    auto found = users_->findCredential(token.subjectId, ctx);
    if (!found) {
        return AuthResult<LoginResult>::err(storeUnavailable(found.error(), "credential lookup"));
    }
    if (!found.value()) {
        return AuthResult<LoginResult>::err(authenticationFailed());
    }
    auto verified = hasher_.verify(oldPassword, found.value()->passwordHash);
    if (!verified || !verified.value()) {
        return AuthResult<LoginResult>::err(authenticationFailed());
    }

    auto hashed = hasher_.hash(newPassword);
    if (!hashed) {
        return AuthResult<LoginResult>::err(hashed.error());
    }
    auto saved = users_->saveCredential(Credential{token.subjectId, std::move(hashed).value()}, ctx);
    if (!saved) {
        return AuthResult<LoginResult>::err(storeUnavailable(saved.error(), "credential save"));
    }

    auto revoked = tokens_.revoke(token, RevocationReason::Revoked);
    if (!revoked) {
        return AuthResult<LoginResult>::err(revoked.error());
    }
    if (auto entry = revocations_->find(token.tokenId)) {
        persistRevocation(*entry, ctx);
    }

    LogContext logCtx;
    logCtx.subjectId = token.subjectId;
    logCtx.tokenId = foundation::redactTokenId(token.tokenId);
    CSA_LOG_CTX(LogLevel::Info, LogCategory::Session, "password changed", logCtx);

    return openSession(token.subjectId);
}

// -- Revocation lifecycle -----------------------------------------------------------

AuthResult<std::size_t> AuthSessionCoordinator::restoreRevocations(const RequestContext& ctx) {
    if (!revocationStore_) {
        return AuthResult<std::size_t>::ok(0);
    }
    auto loaded = revocationStore_->loadAll(ctx);
    if (!loaded) {
        CSA_LOG_ERROR(LogCategory::Store,
                      "revocation restore failed: " + std::string(loaded.error().message()));
        return AuthResult<std::size_t>::err(storeUnavailable(loaded.error(), "revocation load"));
    }
    auto added = revocations_->restore(loaded.value());
    CSA_LOG_INFO(LogCategory::Store, "restored " + std::to_string(added) + " revocations");
    return AuthResult<std::size_t>::ok(added);
}

AuthResult<std::size_t> AuthSessionCoordinator::syncRevocations(const RequestContext& ctx) {
    if (!revocationStore_) {
        return AuthResult<std::size_t>::ok(0);
    }
    auto loaded = revocationStore_->loadAll(ctx);
    if (!loaded) {
        return AuthResult<std::size_t>::err(storeUnavailable(loaded.error(), "revocation load"));
    }

    const auto now = clock_->now();
    std::size_t added = 0;
    for (const auto& entry : loaded.value()) {
        if (now > revocations_->retainUntil(entry)) {
            if (auto removed = revocationStore_->remove(entry.tokenId, ctx); !removed) {
                return AuthResult<std::size_t>::err(
                    storeUnavailable(removed.error(), "revocation remove"));
            }
            continue;
        }
        if (revocations_->insert(entry)) {
            ++added;
        }
    }
    if (added > 0) {
        CSA_LOG_DEBUG(LogCategory::Store, "synced " + std::to_string(added) + " revocations");
    }
    return AuthResult<std::size_t>::ok(added);
}

std::size_t AuthSessionCoordinator::pruneRevocations() {
    auto removed = revocations_->prune();
    rateLimiter_.purgeIdle();
    if (removed > 0) {
        CSA_LOG_DEBUG(LogCategory::Core, "pruned " + std::to_string(removed) + " revocations");
    }
    return removed;
}

void AuthSessionCoordinator::runMaintenance() {
    auto synced = syncRevocations(RequestContext::withTimeout(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.revocationPruneInterval)));
    if (!synced) {
        CSA_LOG_WARN(LogCategory::Store,
                     "revocation sync skipped: " + std::string(synced.error().message()));
    }
    pruneRevocations();
}

AuthResult<AuthJobScheduler::JobId> AuthSessionCoordinator::attachMaintenance(
    AuthJobScheduler& scheduler) {
    if (maintenanceJob_) {
        return AuthResult<AuthJobScheduler::JobId>::err(
            AuthError(ErrorCode::AlreadyExists, "maintenance already attached"));
    }
    auto id = scheduler.scheduleTick(
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.revocationPruneInterval),
        [this, gate = gate_] {
            std::shared_lock lock(gate->mutex);
            if (gate->open) {
                runMaintenance();
            }
        });
    if (!id) {
        return id;
    }
    maintenanceScheduler_ = &scheduler;
    maintenanceJob_ = id.value();
    return id;
}

AuthResult<void> AuthSessionCoordinator::shutdown(const RequestContext& ctx) {
    if (maintenanceScheduler_ && maintenanceJob_) {
        if (auto cancelled = maintenanceScheduler_->cancel(*maintenanceJob_); !cancelled) {
            CSA_LOG_WARN(LogCategory::Core, "maintenance tick was already gone");
        }
        maintenanceScheduler_ = nullptr;
        maintenanceJob_.reset();
    }

    if (revocationStore_) {
        revocations_->prune();
        for (const auto& entry : revocations_->snapshot()) {
            auto stored = revocationStore_->put(entry, ctx);
            if (!stored) {
                CSA_LOG_ERROR(LogCategory::Store, "revocation flush failed: " +
                                                      std::string(stored.error().message()));
                return AuthResult<void>::err(storeUnavailable(stored.error(), "revocation flush"));
            }
        }
    }

    if (auto flushed = foundation::AuthLogger::instance().flush(); !flushed) {
        CSA_LOG_WARN(LogCategory::Core, std::string(flushed.error().message()));
    }
    CSA_LOG_INFO(LogCategory::Core, "session coordinator shut down");
    return AuthResult<void>::ok();
}

}  // namespace csa::auth
