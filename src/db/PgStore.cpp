#include "db/PgStore.hpp"
#include "db/DBPool.hpp"
#include "db/query/lock/OrderLock.hpp"
#include "db/query/identities/Directory.hpp"
#include "lock/errors.hpp"
#include "log/Registry.hpp"

#include <pqxx/except>

using namespace lw::db;
using namespace lw::lock;
using OrderLockQuery = lw::db::query::lock::OrderLock;
using DirectoryQuery = lw::db::query::identities::Directory;

namespace {

// Any failure to get an answer out of PostgreSQL becomes Unavailable.
template <typename Func>
auto guarded(const char* ctx, Func&& func) -> decltype(func()) {
    try {
        return func();
    } catch (const PoolTimeout& e) {
        lw::log::Registry::db()->error("[PgStore] {}: {}", ctx, e.what());
        throw Unavailable(std::string(ctx) + ": " + e.what());
    } catch (const pqxx::failure& e) {
        lw::log::Registry::db()->error("[PgStore] {}: {}", ctx, e.what());
        throw Unavailable(std::string(ctx) + ": " + e.what());
    }
}

}

AcquireAttempt PgStore::tryAcquire(const model::Lock& candidate, const model::Timestamp now) {
    return guarded("tryAcquire", [&] { return OrderLockQuery::tryAcquire(candidate, now); });
}

std::optional<model::Lock> PgStore::renew(const std::string& resourceId, const std::string& sessionId,
                                          const model::Timestamp now, const model::Timestamp expiresAt) {
    return guarded("renew", [&] { return OrderLockQuery::renew(resourceId, sessionId, now, expiresAt); });
}

ReleaseAttempt PgStore::release(const std::string& resourceId, const std::string& sessionId) {
    return guarded("release", [&] { return OrderLockQuery::release(resourceId, sessionId); });
}

std::optional<model::Lock> PgStore::find(const std::string& resourceId) {
    return guarded("find", [&] { return OrderLockQuery::get(resourceId); });
}

std::size_t PgStore::purgeExpired(const model::Timestamp cutoff) {
    return guarded("purgeExpired", [&] { return OrderLockQuery::purgeExpired(cutoff); });
}

bool PgOrderDirectory::exists(const model::ResourceKind kind, const std::string& resourceId) const {
    return guarded("orderExists", [&] { return DirectoryQuery::orderExists(kind, resourceId); });
}

std::optional<std::string> PgUserDirectory::displayName(const std::string& userId) const {
    return guarded("displayName", [&] { return DirectoryQuery::getUserDisplayName(userId); });
}
