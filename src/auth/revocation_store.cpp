/// @file revocation_store.cpp
/// @brief InMemoryRevocationStore implementation.

#include "csa/auth/revocation_store.hpp"

namespace csa::auth {

using foundation::AuthResult;
using foundation::RequestContext;

AuthResult<void> InMemoryRevocationStore::put(const RevocationEntry& entry,
                                              const RequestContext& ctx) {
    if (auto alive = ctx.check("revocation put"); !alive) {
        return alive;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.emplace(entry.tokenId, entry);
    return AuthResult<void>::ok();
}

AuthResult<std::vector<RevocationEntry>> InMemoryRevocationStore::loadAll(
    const RequestContext& ctx) {
    if (auto alive = ctx.check("revocation loadAll"); !alive) {
        return AuthResult<std::vector<RevocationEntry>>::err(alive.error());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RevocationEntry> out;
    out.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        out.push_back(entry);
    }
    return AuthResult<std::vector<RevocationEntry>>::ok(std::move(out));
}

AuthResult<void> InMemoryRevocationStore::remove(std::string_view tokenId,
                                                 const RequestContext& ctx) {
    if (auto alive = ctx.check("revocation remove"); !alive) {
        return alive;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(std::string(tokenId));
    return AuthResult<void>::ok();
}

std::size_t InMemoryRevocationStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace csa::auth
