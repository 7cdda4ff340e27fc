#pragma once

/// @file revocation_set.hpp
/// @brief Sharded, process-scoped set of revoked token ids.
///
/// Entries stay until the token they name could no longer verify anyway,
/// then prune() drops them, keeping memory bounded by the number of live
/// sessions.

#include <array>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "csa/auth/auth_types.hpp"
#include "csa/foundation/clock.hpp"

namespace csa::auth {

/// One revoked token.
struct RevocationEntry {
    std::string tokenId;
    std::chrono::system_clock::time_point revokedAt{};
    /// Expiry of the revoked token; nullopt when the caller did not know it.
    std::optional<std::chrono::system_clock::time_point> expiresAt;
    RevocationReason reason = RevocationReason::Revoked;
};

/// Thread-safe revocation set keyed by token id.
///
/// Split into kShardCount shards, each a hash map behind its own
/// std::shared_mutex: lookups take one shared lock, revocations one
/// exclusive lock, so readers of different tokens never contend with a
/// writer on another shard.
///
/// Example:
/// @code
///   RevocationSet revocations(std::chrono::seconds{30}, std::chrono::hours{24});
///   revocations.revoke(token.tokenId, token.expiresAt, RevocationReason::Logout);
///   revocations.isRevoked(token.tokenId);  // true
/// @endcode
class RevocationSet {
public:
    static constexpr std::size_t kShardCount = 16;

    /// @param grace        Added to expiry before an entry may be pruned
    ///                     (the verifier's clock-skew tolerance).
    /// @param maxLifetime  Longest token lifetime; bounds entries whose
    ///                     expiry is unknown.
    RevocationSet(std::chrono::seconds grace,
                  std::chrono::seconds maxLifetime,
                  std::shared_ptr<foundation::IClock> clock = foundation::SystemClock::shared());

    RevocationSet(const RevocationSet&) = delete;
    RevocationSet& operator=(const RevocationSet&) = delete;

    /// Record a revocation. Returns true if @p tokenId was not yet present;
    /// revoking twice keeps the first entry.
    bool revoke(std::string_view tokenId,
                std::optional<std::chrono::system_clock::time_point> expiresAt,
                RevocationReason reason = RevocationReason::Revoked);

    /// Insert a complete entry (used when restoring from a store).
    bool insert(RevocationEntry entry);

    [[nodiscard]] bool isRevoked(std::string_view tokenId) const;

    [[nodiscard]] std::optional<RevocationEntry> find(std::string_view tokenId) const;

    /// Remove entries past their retention horizon. Returns number removed.
    std::size_t prune();

    /// Bulk insert; existing ids are left untouched. Returns number added.
    std::size_t restore(const std::vector<RevocationEntry>& entries);

    /// Copy of every entry, in no particular order.
    [[nodiscard]] std::vector<RevocationEntry> snapshot() const;

    [[nodiscard]] std::size_t size() const;

    /// Instant after which @p entry is safe to forget.
    [[nodiscard]] std::chrono::system_clock::time_point retainUntil(
        const RevocationEntry& entry) const;

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, RevocationEntry> entries;
    };

    [[nodiscard]] Shard& shardFor(std::string_view tokenId);
    [[nodiscard]] const Shard& shardFor(std::string_view tokenId) const;

    std::chrono::seconds grace_;
    std::chrono::seconds maxLifetime_;
    std::shared_ptr<foundation::IClock> clock_;
    std::array<Shard, kShardCount> shards_;
};

}  // namespace csa::auth
