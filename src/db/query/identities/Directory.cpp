#include "db/query/identities/Directory.hpp"
#include "db/Transactions.hpp"

using namespace lw::db::query::identities;
using namespace lw::db;
using lw::lock::model::ResourceKind;

bool Directory::orderExists(const ResourceKind kind, const std::string& orderId) {
    const auto* stmt = kind == ResourceKind::InternalOrder ? "internal_order_exists" : "customer_order_exists";
    return Transactions::exec("Directory::orderExists", [&](pqxx::work& txn) {
        return !txn.exec(pqxx::prepped{stmt}, pqxx::params{orderId}).empty();
    });
}

std::optional<std::string> Directory::getUserDisplayName(const std::string& userId) {
    return Transactions::exec("Directory::getUserDisplayName", [&](pqxx::work& txn) -> std::optional<std::string> {
        const auto res = txn.exec(pqxx::prepped{"get_user_display_name"}, pqxx::params{userId});
        if (res.empty() || res[0]["name"].is_null()) return std::nullopt;
        return res[0]["name"].as<std::string>();
    });
}
