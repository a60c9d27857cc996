#include "db/DBConnection.hpp"

// Timestamps cross the wire as epoch microseconds so that no timezone or
// rounding conversion happens on either side.
#define LW_TS(n) "(TIMESTAMPTZ 'epoch' + $" #n "::bigint * INTERVAL '1 microsecond')"

static constexpr auto LOCK_COLUMNS =
    "id::text AS id, order_type::text AS order_type, resource_id, holder_user_id, holder_session_id, "
    "(EXTRACT(EPOCH FROM acquired_at) * 1000000)::bigint AS acquired_at_us, "
    "(EXTRACT(EPOCH FROM expires_at) * 1000000)::bigint AS expires_at_us, "
    "(EXTRACT(EPOCH FROM last_activity_at) * 1000000)::bigint AS last_activity_at_us";

void lw::db::DBConnection::initPreparedLocks() const {
    const std::string cols = LOCK_COLUMNS;

    // One statement decides the winner: insert, take over an expired row, or
    // extend the caller's own live row. Anything else leaves the row alone and
    // returns nothing.
    conn_->prepare("lock_try_acquire",
                   "INSERT INTO order_locks AS l (id, order_type, resource_id, holder_user_id, holder_session_id, "
                   "acquired_at, expires_at, last_activity_at) "
                   "VALUES ($1::uuid, $2::order_lock_type, $3, $4, $5, " LW_TS(6) ", " LW_TS(7) ", " LW_TS(6) ") "
                   "ON CONFLICT (resource_id) DO UPDATE SET "
                   "id = CASE WHEN l.expires_at < EXCLUDED.acquired_at THEN EXCLUDED.id ELSE l.id END, "
                   "order_type = EXCLUDED.order_type, "
                   "holder_user_id = EXCLUDED.holder_user_id, "
                   "holder_session_id = EXCLUDED.holder_session_id, "
                   "acquired_at = CASE WHEN l.expires_at < EXCLUDED.acquired_at "
                   "THEN EXCLUDED.acquired_at ELSE l.acquired_at END, "
                   "expires_at = EXCLUDED.expires_at, "
                   "last_activity_at = EXCLUDED.last_activity_at "
                   "WHERE l.expires_at < EXCLUDED.acquired_at "
                   "OR (l.holder_user_id = EXCLUDED.holder_user_id "
                   "AND l.holder_session_id = EXCLUDED.holder_session_id "
                   "AND l.order_type = EXCLUDED.order_type) "
                   "RETURNING " + cols);

    conn_->prepare("lock_renew",
                   "UPDATE order_locks SET expires_at = " LW_TS(4) ", last_activity_at = " LW_TS(3) " "
                   "WHERE resource_id = $1 AND holder_session_id = $2 AND expires_at >= " LW_TS(3) " "
                   "RETURNING " + cols);

    conn_->prepare("lock_release",
                   "DELETE FROM order_locks WHERE resource_id = $1 AND holder_session_id = $2 "
                   "RETURNING " + cols);

    conn_->prepare("lock_get", "SELECT " + cols + " FROM order_locks WHERE resource_id = $1");

    conn_->prepare("lock_purge_expired", "DELETE FROM order_locks WHERE expires_at < " LW_TS(1));
}

#undef LW_TS
