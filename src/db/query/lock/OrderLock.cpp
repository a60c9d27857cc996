#include "db/query/lock/OrderLock.hpp"
#include "db/Transactions.hpp"
#include "lock/errors.hpp"
#include "util/timestamp.hpp"

using namespace lw::db::query::lock;
using namespace lw::db;

namespace {

std::optional<lw::lock::model::Lock> firstLock(const pqxx::result& res) {
    if (res.empty()) return std::nullopt;
    return lw::lock::model::Lock(res[0]);
}

}

lw::lock::AcquireAttempt OrderLock::tryAcquire(const L& candidate, const Timestamp now) {
    return Transactions::exec("OrderLock::tryAcquire", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(candidate.id);
        p.append(lw::lock::model::to_string(candidate.resource_kind));
        p.append(candidate.resource_id);
        p.append(candidate.holder_user_id);
        p.append(candidate.holder_session_id);
        p.append(util::toEpochMicros(now));
        p.append(util::toEpochMicros(candidate.expires_at));

        // A holder that releases between the conditional write and the read
        // leaves nothing to report, so the write gets one more chance.
        for (int attempt = 0; attempt < 2; ++attempt) {
            if (auto granted = firstLock(txn.exec(pqxx::prepped{"lock_try_acquire"}, p)))
                return lw::lock::AcquireAttempt{true, std::move(*granted)};

            if (auto holder = firstLock(txn.exec(pqxx::prepped{"lock_get"}, pqxx::params{candidate.resource_id})))
                return lw::lock::AcquireAttempt{false, std::move(*holder)};
        }

        throw lw::lock::Unavailable("Lock row for " + candidate.resource_id + " kept changing during acquire");
    });
}

std::optional<lw::lock::model::Lock> OrderLock::renew(const std::string& resourceId, const std::string& sessionId,
                                                      const Timestamp now, const Timestamp expiresAt) {
    return Transactions::exec("OrderLock::renew", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(resourceId);
        p.append(sessionId);
        p.append(util::toEpochMicros(now));
        p.append(util::toEpochMicros(expiresAt));
        return firstLock(txn.exec(pqxx::prepped{"lock_renew"}, p));
    });
}

lw::lock::ReleaseAttempt OrderLock::release(const std::string& resourceId, const std::string& sessionId) {
    return Transactions::exec("OrderLock::release", [&](pqxx::work& txn) {
        pqxx::params p;
        p.append(resourceId);
        p.append(sessionId);

        if (firstLock(txn.exec(pqxx::prepped{"lock_release"}, p))) return lw::lock::ReleaseAttempt{true, std::nullopt};

        return lw::lock::ReleaseAttempt{false, firstLock(txn.exec(pqxx::prepped{"lock_get"}, pqxx::params{resourceId}))};
    });
}

std::optional<lw::lock::model::Lock> OrderLock::get(const std::string& resourceId) {
    return Transactions::exec("OrderLock::get", [&](pqxx::work& txn) {
        return firstLock(txn.exec(pqxx::prepped{"lock_get"}, pqxx::params{resourceId}));
    });
}

std::size_t OrderLock::purgeExpired(const Timestamp cutoff) {
    return Transactions::exec("OrderLock::purgeExpired", [&](pqxx::work& txn) {
        const auto res = txn.exec(pqxx::prepped{"lock_purge_expired"}, pqxx::params{util::toEpochMicros(cutoff)});
        return static_cast<std::size_t>(res.affected_rows());
    });
}
