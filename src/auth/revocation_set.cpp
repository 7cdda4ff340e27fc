/// @file revocation_set.cpp
/// @brief RevocationSet implementation with per-shard reader/writer locks.

#include "csa/auth/revocation_set.hpp"

#include <functional>
#include <mutex>

namespace csa::auth {

RevocationSet::RevocationSet(std::chrono::seconds grace,
                             std::chrono::seconds maxLifetime,
                             std::shared_ptr<foundation::IClock> clock)
    : grace_(grace), maxLifetime_(maxLifetime), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = foundation::SystemClock::shared();
    }
}

RevocationSet::Shard& RevocationSet::shardFor(std::string_view tokenId) {
    return shards_[std::hash<std::string_view>{}(tokenId) % kShardCount];
}

const RevocationSet::Shard& RevocationSet::shardFor(std::string_view tokenId) const {
    return shards_[std::hash<std::string_view>{}(tokenId) % kShardCount];
}

bool RevocationSet::revoke(std::string_view tokenId,
                           std::optional<std::chrono::system_clock::time_point> expiresAt,
                           RevocationReason reason) {
    return insert(RevocationEntry{std::string(tokenId), clock_->now(), expiresAt, reason});
}

bool RevocationSet::insert(RevocationEntry entry) {
    auto& shard = shardFor(entry.tokenId);
    std::unique_lock lock(shard.mutex);
    auto key = entry.tokenId;
    return shard.entries.emplace(std::move(key), std::move(entry)).second;
}

bool RevocationSet::isRevoked(std::string_view tokenId) const {
    const auto& shard = shardFor(tokenId);
    std::shared_lock lock(shard.mutex);
    return shard.entries.find(std::string(tokenId)) != shard.entries.end();
}

std::optional<RevocationEntry> RevocationSet::find(std::string_view tokenId) const {
    const auto& shard = shardFor(tokenId);
    std::shared_lock lock(shard.mutex);
    auto it = shard.entries.find(std::string(tokenId));
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::chrono::system_clock::time_point RevocationSet::retainUntil(
    const RevocationEntry& entry) const {
    if (entry.expiresAt) {
        return *entry.expiresAt + grace_;
    }
    return entry.revokedAt + maxLifetime_ + grace_;
}

std::size_t RevocationSet::prune() {
    const auto now = clock_->now();
    std::size_t removed = 0;
    for (auto& shard : shards_) {
        std::unique_lock lock(shard.mutex);
        for (auto it = shard.entries.begin(); it != shard.entries.end();) {
            if (now > retainUntil(it->second)) {
                it = shard.entries.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    return removed;
}

std::size_t RevocationSet::restore(const std::vector<RevocationEntry>& entries) {
    std::size_t added = 0;
    for (const auto& entry : entries) {
        if (insert(entry)) {
            ++added;
        }
    }
    return added;
}

std::vector<RevocationEntry> RevocationSet::snapshot() const {
    std::vector<RevocationEntry> out;
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard.mutex);
        for (const auto& [id, entry] : shard.entries) {
            out.push_back(entry);
        }
    }
    return out;
}

std::size_t RevocationSet::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock lock(shard.mutex);
        total += shard.entries.size();
    }
    return total;
}

}  // namespace csa::auth
