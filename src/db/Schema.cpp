#include "db/Schema.hpp"
#include "db/Transactions.hpp"

void lw::db::Schema::initTablesIfNotExists() {
    Transactions::exec("Schema::initTablesIfNotExists", [&](pqxx::work& txn) {
        txn.exec(R"(
DO $$
BEGIN
    IF NOT EXISTS (SELECT 1 FROM pg_type WHERE typname = 'order_lock_type') THEN
        CREATE TYPE order_lock_type AS ENUM ('customer', 'internal');
    END IF;
END
$$;
        )");

        txn.exec(R"(
CREATE TABLE IF NOT EXISTS order_locks
(
    id                 UUID               PRIMARY KEY,
    order_type         order_lock_type    NOT NULL,
    resource_id        VARCHAR(255)       NOT NULL UNIQUE,
    holder_user_id     VARCHAR(255)       NOT NULL,
    holder_session_id  VARCHAR(255)       NOT NULL,
    acquired_at        TIMESTAMPTZ        NOT NULL,
    expires_at         TIMESTAMPTZ        NOT NULL,
    last_activity_at   TIMESTAMPTZ        NOT NULL,
    CONSTRAINT order_locks_expiry_after_acquire CHECK (expires_at > acquired_at)
);
        )");

        txn.exec("CREATE INDEX IF NOT EXISTS order_locks_expires_at_idx ON order_locks (expires_at);");
    });
}
