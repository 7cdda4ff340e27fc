#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "auth_test_config.hpp"
#include "faulty_stores.hpp"

#include "csa/auth/auth_session_coordinator.hpp"
#include "csa/foundation/error_code.hpp"
#include "csa/foundation/job_scheduler.hpp"

using namespace csa::auth;
using csa::foundation::AuthJobScheduler;
using csa::foundation::AuthResult;
using csa::foundation::ErrorCode;
using csa::foundation::ManualClock;
using csa::foundation::RequestContext;
using csa::test::FaultyRevocationStore;
using csa::test::FaultyUserStore;
using namespace std::chrono_literals;

class AuthSessionCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = csa::test::makeTestConfig();
        clock_ = csa::test::makeTestClock();
        users_ = std::make_shared<FaultyUserStore>();
        store_ = std::make_shared<FaultyRevocationStore>();
        rebuild();
        ASSERT_TRUE(coordinator_->registerCredential("alice", "Secr3t!").hasValue());
    }

    void rebuild() {
        auto created = AuthSessionCoordinator::create(config_, users_, nullptr, store_, clock_);
        ASSERT_TRUE(created.hasValue()) << created.error().message();
        coordinator_ = std::move(created).value();
    }

    LoginResult login(std::string_view user = "alice", std::string_view password = "Secr3t!") {
        auto result = coordinator_->login(user, password);
        EXPECT_TRUE(result.hasValue());
        return result.value();
    }

    std::string storedHash(const std::string& user) {
        return users_->inner.findCredential(user, {}).value()->passwordHash;
    }

    AuthConfig config_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<FaultyUserStore> users_;
    std::shared_ptr<FaultyRevocationStore> store_;
    std::unique_ptr<AuthSessionCoordinator> coordinator_;
};

// -- Construction ---------------------------------------------------------------

TEST_F(AuthSessionCoordinatorTest, CreateRequiresUserStore) {
    auto created = AuthSessionCoordinator::create(config_, nullptr);
    ASSERT_TRUE(created.hasError());
    EXPECT_EQ(created.error().code(), ErrorCode::ConfigInvalid);
}

TEST_F(AuthSessionCoordinatorTest, CreateRejectsInvalidConfig) {
    auto config = config_;
    config.secretKey = "short";
    auto created = AuthSessionCoordinator::create(config, users_);
    ASSERT_TRUE(created.hasError());
    EXPECT_EQ(created.error().code(), ErrorCode::ConfigInvalid);
}

// -- Registration ---------------------------------------------------------------

TEST_F(AuthSessionCoordinatorTest, StoresOnlyTheHash) {
    auto hash = storedHash("alice");
    EXPECT_EQ(hash.find("Secr3t!"), std::string::npos);
    EXPECT_EQ(hash.rfind("$pbkdf2-sha256$6$", 0), 0u);
}

TEST_F(AuthSessionCoordinatorTest, DuplicateRegistrationRejected) {
    auto result = coordinator_->registerCredential("alice", "other");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::AlreadyExists);
}

TEST_F(AuthSessionCoordinatorTest, RegistrationValidatesInput) {
    auto emptyUser = coordinator_->registerCredential("", "pw");
    ASSERT_TRUE(emptyUser.hasError());
    EXPECT_EQ(emptyUser.error().code(), ErrorCode::InvalidInput);

    auto emptyPassword = coordinator_->registerCredential("bob", "");
    ASSERT_TRUE(emptyPassword.hasError());
    EXPECT_EQ(emptyPassword.error().code(), ErrorCode::InvalidInput);
}

// -- Login ----------------------------------------------------------------------

TEST_F(AuthSessionCoordinatorTest, LoginIssuesTokenAndCsrf) {
    auto session = login();
    EXPECT_EQ(session.token.subjectId, "alice");
    EXPECT_EQ(session.encodedToken, coordinator_->tokenAuthority().encode(session.token));
    EXPECT_FALSE(session.csrf.cookieValue.empty());
    EXPECT_TRUE(coordinator_->csrfGuard().verify(session.token.tokenId, session.csrf));
}

TEST_F(AuthSessionCoordinatorTest, FailedLoginsAreIndistinguishable) {
    auto wrongPassword = coordinator_->login("alice", "wrong");
    auto unknownUser = coordinator_->login("nobody", "Secr3t!");
    ASSERT_TRUE(wrongPassword.hasError());
    ASSERT_TRUE(unknownUser.hasError());
    EXPECT_EQ(wrongPassword.error().code(), ErrorCode::AuthenticationFailed);
    EXPECT_EQ(unknownUser.error().code(), ErrorCode::AuthenticationFailed);
    EXPECT_EQ(wrongPassword.error().message(), unknownUser.error().message());
}

TEST_F(AuthSessionCoordinatorTest, MalformedStoredHashFailsAuthentication) {
    ASSERT_TRUE(users_->inner.saveCredential(Credential{"broken", "not-a-hash"}, {}).hasValue());
    auto result = coordinator_->login("broken", "anything");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::AuthenticationFailed);
}

TEST_F(AuthSessionCoordinatorTest, LoginThrottledPerClientKey) {
    for (uint32_t i = 0; i < config_.loginRateLimitMaxAttempts; ++i) {
        auto result = coordinator_->login("alice", "wrong", {}, "10.0.0.1");
        ASSERT_TRUE(result.hasError());
        EXPECT_EQ(result.error().code(), ErrorCode::AuthenticationFailed);
    }
    auto throttled = coordinator_->login("alice", "Secr3t!", {}, "10.0.0.1");
    ASSERT_TRUE(throttled.hasError());
    EXPECT_EQ(throttled.error().code(), ErrorCode::RateLimitExceeded);

    // Other clients are unaffected.
    EXPECT_TRUE(coordinator_->login("alice", "Secr3t!", {}, "10.0.0.2").hasValue());

    clock_->advance(config_.loginRateLimitWindow);
    EXPECT_TRUE(coordinator_->login("alice", "Secr3t!", {}, "10.0.0.1").hasValue());
}

TEST_F(AuthSessionCoordinatorTest, SuccessfulLoginResetsThrottle) {
    for (uint32_t i = 0; i + 1 < config_.loginRateLimitMaxAttempts; ++i) {
        ASSERT_TRUE(coordinator_->login("alice", "wrong").hasError());
    }
    ASSERT_TRUE(coordinator_->login("alice", "Secr3t!").hasValue());
    for (uint32_t i = 0; i < config_.loginRateLimitMaxAttempts; ++i) {
        auto result = coordinator_->login("alice", "wrong");
        ASSERT_TRUE(result.hasError());
        EXPECT_EQ(result.error().code(), ErrorCode::AuthenticationFailed);
    }
}

TEST_F(AuthSessionCoordinatorTest, StoreFailureSurfacesAsStoreUnavailable) {
    users_->failFind = true;
    auto result = coordinator_->login("alice", "Secr3t!");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::StoreUnavailable);
    EXPECT_EQ(csa::foundation::clientStatusFor(result.error().code()),
              csa::foundation::ClientStatus::ServiceUnavailable);
}

TEST_F(AuthSessionCoordinatorTest, CancelledRequestDoesNotReachStore) {
    RequestContext ctx;
    ctx.cancel();
    int before = users_->findCalls.load();
    auto result = coordinator_->login("alice", "Secr3t!", ctx);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::StoreUnavailable);
    EXPECT_EQ(users_->findCalls.load(), before);
}

TEST_F(AuthSessionCoordinatorTest, WeakHashUpgradedOnLogin) {
    PasswordHasher weak(HashParams{HashAlgorithm::Pbkdf2Sha256, 4}, 256);
    ASSERT_TRUE(users_->inner
                    .saveCredential(Credential{"legacy", weak.hash("0ldPass").value()}, {})
                    .hasValue());

    ASSERT_TRUE(coordinator_->login("legacy", "0ldPass").hasValue());
    auto upgraded = PasswordHasher::decode(storedHash("legacy"));
    ASSERT_TRUE(upgraded.hasValue());
    EXPECT_EQ(upgraded.value().params.workFactor, config_.workFactor);
    EXPECT_TRUE(coordinator_->login("legacy", "0ldPass").hasValue());
}

TEST_F(AuthSessionCoordinatorTest, RehashSaveFailureDoesNotFailLogin) {
    PasswordHasher weak(HashParams{HashAlgorithm::Pbkdf2Sha256, 4}, 256);
    auto weakHash = weak.hash("0ldPass").value();
    ASSERT_TRUE(users_->inner.saveCredential(Credential{"legacy", weakHash}, {}).hasValue());

    users_->failSave = true;
    EXPECT_TRUE(coordinator_->login("legacy", "0ldPass").hasValue());
    EXPECT_EQ(storedHash("legacy"), weakHash);
}

TEST_F(AuthSessionCoordinatorTest, LoginAsyncDeliversResult) {
    AuthJobScheduler scheduler(2);
    std::promise<AuthResult<LoginResult>> promise;
    auto future = promise.get_future();

    auto job = coordinator_->loginAsync(
        scheduler, "alice", "Secr3t!",
        [&](AuthResult<LoginResult> result) { promise.set_value(std::move(result)); });
    ASSERT_TRUE(job.hasValue());
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);

    auto result = future.get();
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().token.subjectId, "alice");
}

TEST_F(AuthSessionCoordinatorTest, LoginAsyncRequiresCallback) {
    AuthJobScheduler scheduler(1);
    auto job = coordinator_->loginAsync(scheduler, "alice", "Secr3t!", nullptr);
    ASSERT_TRUE(job.hasError());
    EXPECT_EQ(job.error().code(), ErrorCode::InvalidInput);
}

// -- Authorize ------------------------------------------------------------------

TEST_F(AuthSessionCoordinatorTest, AuthorizeAcceptsBearerPrefix) {
    auto session = login();
    auto plain = coordinator_->authorize(session.encodedToken, session.csrf, true);
    auto prefixed = coordinator_->authorize("Bearer " + session.encodedToken, session.csrf, true);
    ASSERT_TRUE(plain.hasValue());
    ASSERT_TRUE(prefixed.hasValue());
    EXPECT_EQ(plain.value(), "alice");
    EXPECT_EQ(prefixed.value(), "alice");

    auto byToken = coordinator_->authorize(session.token, session.csrf, true);
    ASSERT_TRUE(byToken.hasValue());
    EXPECT_EQ(byToken.value(), "alice");
}

TEST_F(AuthSessionCoordinatorTest, CsrfOnlyCheckedForStateChangingRequests) {
    auto session = login();
    CsrfPair bogus{"x", "y"};
    EXPECT_TRUE(coordinator_->authorize(session.encodedToken, bogus, false).hasValue());

    auto result = coordinator_->authorize(session.encodedToken, bogus, true);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::CsrfValidationFailed);
}

TEST_F(AuthSessionCoordinatorTest, CsrfPairOfAnotherSessionRejected) {
    auto first = login();
    auto second = login();
    auto result = coordinator_->authorize(first.encodedToken, second.csrf, true);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::CsrfValidationFailed);
}

TEST_F(AuthSessionCoordinatorTest, TokenCheckedBeforeCsrf) {
    auto session = login();
    clock_->advance(config_.tokenTtl + config_.clockSkewTolerance + 1s);
    auto result = coordinator_->authorize(session.encodedToken, CsrfPair{}, true);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TokenExpired);
}

// -- Logout / session state -------------------------------------------------------

TEST_F(AuthSessionCoordinatorTest, LogoutRevokesToken) {
    auto session = login();
    ASSERT_TRUE(coordinator_->logout(session.encodedToken).hasValue());

    auto result = coordinator_->authorize(session.encodedToken, session.csrf, false);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::TokenRevoked);
    EXPECT_EQ(coordinator_->sessionState(session.encodedToken), SessionState::LoggedOut);

    // Idempotent.
    EXPECT_TRUE(coordinator_->logout(session.encodedToken).hasValue());
}

TEST_F(AuthSessionCoordinatorTest, LogoutOfExpiredTokenIsNoop) {
    auto session = login();
    clock_->advance(config_.tokenTtl + config_.clockSkewTolerance + 1s);
    EXPECT_TRUE(coordinator_->logout(session.encodedToken).hasValue());
    EXPECT_EQ(coordinator_->revocations()->size(), 0u);
}

TEST_F(AuthSessionCoordinatorTest, LogoutOfForgedTokenFails) {
    auto result = coordinator_->logout("not.a.token");
    ASSERT_TRUE(result.hasError());
    EXPECT_NE(result.error().code(), ErrorCode::Success);
}

TEST_F(AuthSessionCoordinatorTest, SessionStates) {
    EXPECT_EQ(coordinator_->sessionState(""), SessionState::Anonymous);
    EXPECT_EQ(coordinator_->sessionState("garbage"), SessionState::Anonymous);

    auto active = login();
    EXPECT_EQ(coordinator_->sessionState(active.encodedToken), SessionState::Authenticated);

    auto revoked = login();
    ASSERT_TRUE(coordinator_->revokeSession(revoked.encodedToken).hasValue());
    EXPECT_EQ(coordinator_->sessionState(revoked.encodedToken), SessionState::Revoked);

    clock_->advance(config_.tokenTtl + config_.clockSkewTolerance + 1s);
    EXPECT_EQ(coordinator_->sessionState(active.encodedToken), SessionState::Expired);
}

// -- Password change -------------------------------------------------------------------

TEST_F(AuthSessionCoordinatorTest, ChangePasswordRotatesSession) {
    auto session = login();
    auto changed = coordinator_->changePassword(session.encodedToken, "Secr3t!", "N3wPass!");
    ASSERT_TRUE(changed.hasValue()) << changed.error().message();

    EXPECT_EQ(coordinator_->sessionState(session.encodedToken), SessionState::Revoked);
    EXPECT_TRUE(
        coordinator_->authorize(changed.value().encodedToken, changed.value().csrf, true)
            .hasValue());

    EXPECT_TRUE(coordinator_->login("alice", "Secr3t!").hasError());
    EXPECT_TRUE(coordinator_->login("alice", "N3wPass!").hasValue());
}

TEST_F(AuthSessionCoordinatorTest, ChangePasswordRequiresOldPassword) {
    auto session = login();
    auto result = coordinator_->changePassword(session.encodedToken, "wrong", "N3wPass!");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::AuthenticationFailed);
    EXPECT_EQ(coordinator_->sessionState(session.encodedToken), SessionState::Authenticated);
}

// -- Revocation persistence --------------------------------------------------------------

TEST_F(AuthSessionCoordinatorTest, RevocationsWrittenThrough) {
    auto session = login();
    ASSERT_TRUE(coordinator_->logout(session.encodedToken).hasValue());
    EXPECT_EQ(store_->inner.size(), 1u);
    auto stored = store_->inner.loadAll({}).value();
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored[0].tokenId, session.token.tokenId);
    EXPECT_EQ(stored[0].reason, RevocationReason::Logout);
}

TEST_F(AuthSessionCoordinatorTest, WriteThroughFailureStillRevokesLocally) {
    store_->failPut = true;
    auto session = login();
    EXPECT_TRUE(coordinator_->logout(session.encodedToken).hasValue());
    EXPECT_EQ(coordinator_->sessionState(session.encodedToken), SessionState::LoggedOut);
    EXPECT_EQ(store_->inner.size(), 0u);

    // Shutdown retries the flush.
    store_->failPut = false;
    ASSERT_TRUE(coordinator_->shutdown().hasValue());
    EXPECT_EQ(store_->inner.size(), 1u);
}

TEST_F(AuthSessionCoordinatorTest, RestoreAfterRestart) {
    auto session = login();
    ASSERT_TRUE(coordinator_->logout(session.encodedToken).hasValue());
    ASSERT_TRUE(coordinator_->shutdown().hasValue());

    rebuild();
    EXPECT_EQ(coordinator_->sessionState(session.encodedToken), SessionState::Authenticated);
    auto restored = coordinator_->restoreRevocations();
    ASSERT_TRUE(restored.hasValue());
    EXPECT_EQ(restored.value(), 1u);
    EXPECT_EQ(coordinator_->sessionState(session.encodedToken), SessionState::LoggedOut);
}

TEST_F(AuthSessionCoordinatorTest, RestoreFailureReported) {
    store_->failLoad = true;
    auto result = coordinator_->restoreRevocations();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::StoreUnavailable);
}

TEST_F(AuthSessionCoordinatorTest, SyncDropsStaleStoreEntries) {
    RevocationEntry stale{"stale", clock_->now() - 10h, clock_->now() - 5h,
                          RevocationReason::Revoked};
    RevocationEntry fresh{"fresh", clock_->now(), clock_->now() + 10min,
                          RevocationReason::Logout};
    ASSERT_TRUE(store_->inner.put(stale, {}).hasValue());
    ASSERT_TRUE(store_->inner.put(fresh, {}).hasValue());

    auto synced = coordinator_->syncRevocations();
    ASSERT_TRUE(synced.hasValue());
    EXPECT_EQ(synced.value(), 1u);
    EXPECT_TRUE(coordinator_->revocations()->isRevoked("fresh"));
    EXPECT_FALSE(coordinator_->revocations()->isRevoked("stale"));
    EXPECT_EQ(store_->inner.size(), 1u);
}

TEST_F(AuthSessionCoordinatorTest, PruneRemovesExpiredRevocations) {
    auto session = login();
    ASSERT_TRUE(coordinator_->logout(session.encodedToken).hasValue());
    EXPECT_EQ(coordinator_->pruneRevocations(), 0u);

    clock_->advance(config_.tokenTtl + config_.clockSkewTolerance + 1s);
    EXPECT_EQ(coordinator_->pruneRevocations(), 1u);
    EXPECT_EQ(coordinator_->revocations()->size(), 0u);
}

TEST_F(AuthSessionCoordinatorTest, ShutdownFlushFailureReported) {
    auto session = login();
    ASSERT_TRUE(coordinator_->logout(session.encodedToken).hasValue());
    store_->failPut = true;
    auto result = coordinator_->shutdown();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::StoreUnavailable);
}

// -- Maintenance ------------------------------------------------------------------------

TEST_F(AuthSessionCoordinatorTest, MaintenanceTickSyncsAndPrunes) {
    AuthJobScheduler scheduler(2);
    auto job = coordinator_->attachMaintenance(scheduler);
    ASSERT_TRUE(job.hasValue());

    auto again = coordinator_->attachMaintenance(scheduler);
    EXPECT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::AlreadyExists);

    ASSERT_TRUE(store_->inner
                    .put(RevocationEntry{"peer", clock_->now(), clock_->now() + 10min,
                                         RevocationReason::Revoked},
                         {})
                    .hasValue());

    scheduler.processTick(std::chrono::duration_cast<std::chrono::milliseconds>(
        config_.revocationPruneInterval));
    for (int i = 0; i < 200 && !coordinator_->revocations()->isRevoked("peer"); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(coordinator_->revocations()->isRevoked("peer"));

    ASSERT_TRUE(coordinator_->shutdown().hasValue());
}

TEST_F(AuthSessionCoordinatorTest, ShutdownUnregistersMaintenanceTick) {
    AuthJobScheduler scheduler(1);
    ASSERT_TRUE(coordinator_->attachMaintenance(scheduler).hasValue());
    EXPECT_EQ(scheduler.tickJobCount(), 1u);

    ASSERT_TRUE(coordinator_->shutdown().hasValue());
    EXPECT_EQ(scheduler.tickJobCount(), 0u);
}

TEST_F(AuthSessionCoordinatorTest, DestroyedCoordinatorSkipsPendingTicks) {
    AuthJobScheduler scheduler(2);
    ASSERT_TRUE(coordinator_->attachMaintenance(scheduler).hasValue());
    const auto interval =
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.revocationPruneInterval);

    scheduler.processTick(interval);
    coordinator_.reset();
    const int loadsAtDestruction = store_->loadCalls.load();

    for (int i = 0; i < 5; ++i) {
        scheduler.processTick(interval);
    }
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(store_->loadCalls.load(), loadsAtDestruction);
}

TEST_F(AuthSessionCoordinatorTest, CoordinatorMayOutliveItsScheduler) {
    {
        AuthJobScheduler scheduler(1);
        ASSERT_TRUE(coordinator_->attachMaintenance(scheduler).hasValue());
        scheduler.processTick(std::chrono::duration_cast<std::chrono::milliseconds>(
            config_.revocationPruneInterval));
    }
    auto session = login();
    EXPECT_TRUE(coordinator_->authorize(session.encodedToken, session.csrf, true).hasValue());
    coordinator_.reset();
}

TEST_F(AuthSessionCoordinatorTest, LoginAsyncAfterDestructionReportsCancelled) {
    AuthJobScheduler scheduler(1);
    std::promise<void> release;
    auto released = release.get_future().share();
    auto blocker = scheduler.schedule([released] { released.wait(); });
    ASSERT_TRUE(blocker.hasValue());

    std::promise<AuthResult<LoginResult>> promise;
    auto future = promise.get_future();
    ASSERT_TRUE(coordinator_
                    ->loginAsync(scheduler, "alice", "Secr3t!",
                                 [&](AuthResult<LoginResult> result) {
                                     promise.set_value(std::move(result));
                                 })
                    .hasValue());

    coordinator_.reset();
    release.set_value();
    ASSERT_TRUE(scheduler.wait(blocker.value()).hasValue());
    ASSERT_EQ(future.wait_for(5s), std::future_status::ready);

    auto result = future.get();
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::JobCancelled);
}
