#include "db/DBConnection.hpp"

void lw::db::DBConnection::initPreparedDirectories() const {
    // ids are compared as text so a non-uuid id is "not found", not a SQL error
    conn_->prepare("customer_order_exists", "SELECT 1 FROM orders WHERE id::text = $1 LIMIT 1");
    conn_->prepare("internal_order_exists", "SELECT 1 FROM internal_orders WHERE id::text = $1 LIMIT 1");
    conn_->prepare("get_user_display_name", "SELECT name FROM users WHERE id::text = $1 LIMIT 1");
}
