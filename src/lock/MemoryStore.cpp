#include "lock/MemoryStore.hpp"

using namespace lw::lock;

AcquireAttempt MemoryStore::tryAcquire(const model::Lock& candidate, const model::Timestamp now) {
    std::lock_guard lk(mtx_);

    const auto it = rows_.find(candidate.resource_id);
    if (it == rows_.end()) {
        rows_.emplace(candidate.resource_id, candidate);
        return {true, candidate};
    }

    auto& row = it->second;
    if (row.expires_at < now) {
        row = candidate;
        return {true, row};
    }

    if (row.isHeldBy(candidate.holder_user_id, candidate.holder_session_id)
        && row.resource_kind == candidate.resource_kind) {
        row.expires_at = candidate.expires_at;
        row.last_activity_at = candidate.last_activity_at;
        return {true, row};
    }

    return {false, row};
}

std::optional<lw::lock::model::Lock> MemoryStore::renew(const std::string& resourceId, const std::string& sessionId,
                                                        const model::Timestamp now, const model::Timestamp expiresAt) {
    std::lock_guard lk(mtx_);

    const auto it = rows_.find(resourceId);
    if (it == rows_.end()) return std::nullopt;

    auto& row = it->second;
    if (row.holder_session_id != sessionId || row.expires_at < now) return std::nullopt;

    row.expires_at = expiresAt;
    row.last_activity_at = now;
    return row;
}

ReleaseAttempt MemoryStore::release(const std::string& resourceId, const std::string& sessionId) {
    std::lock_guard lk(mtx_);

    const auto it = rows_.find(resourceId);
    if (it == rows_.end()) return {};

    if (it->second.holder_session_id != sessionId) return {false, it->second};

    rows_.erase(it);
    return {true, std::nullopt};
}

std::optional<lw::lock::model::Lock> MemoryStore::find(const std::string& resourceId) {
    std::lock_guard lk(mtx_);
    if (const auto it = rows_.find(resourceId); it != rows_.end()) return it->second;
    return std::nullopt;
}

std::size_t MemoryStore::purgeExpired(const model::Timestamp cutoff) {
    std::lock_guard lk(mtx_);
    return std::erase_if(rows_, [cutoff](const auto& entry) { return entry.second.expires_at < cutoff; });
}

std::size_t MemoryStore::size() const {
    std::lock_guard lk(mtx_);
    return rows_.size();
}
