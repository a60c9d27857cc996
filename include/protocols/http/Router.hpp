#pragma once

#include <boost/beast/http.hpp>
#include <nlohmann/json_fwd.hpp>
#include <memory>
#include <string>

namespace lw::lock {
class Coordinator;
class UserDirectory;
}

namespace lw::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;
using string_body = boost::beast::http::string_body;
using string_response = boost::beast::http::response<string_body>;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

inline constexpr auto USER_HEADER = "X-User-Id";
inline constexpr auto SESSION_HEADER = "X-Session-Id";

/**
 * Maps the /locks surface onto the coordinator.
 *
 *   POST   /locks/{id}/acquire   {"resource_kind": "customer"|"internal", "ttl_seconds"?}
 *   POST   /locks/{id}/renew     {"ttl_seconds"?}
 *   DELETE /locks/{id}
 *   GET    /locks/{id}
 *
 * Caller identity arrives in X-User-Id / X-Session-Id, set by the auth layer
 * in front of this service.
 */
class Router {
public:
    explicit Router(std::shared_ptr<lock::Coordinator> coordinator,
                    std::shared_ptr<lock::UserDirectory> users = nullptr);

    [[nodiscard]] string_response route(const request& req) const;

    // {"statusCode", "error", "message"} body with the given status.
    static string_response makeErrorResponse(const request& req, const std::string& error,
                                             const std::string& msg, status status);

private:
    std::shared_ptr<lock::Coordinator> coordinator_;
    std::shared_ptr<lock::UserDirectory> users_;

    [[nodiscard]] string_response dispatch(const request& req) const;

    [[nodiscard]] string_response handleAcquire(const request& req, const std::string& resourceId) const;
    [[nodiscard]] string_response handleRenew(const request& req, const std::string& resourceId) const;
    [[nodiscard]] string_response handleRelease(const request& req, const std::string& resourceId) const;
    [[nodiscard]] string_response handleInspect(const request& req, const std::string& resourceId) const;

    [[nodiscard]] std::string holderName(const std::string& userId) const;

    static string_response makeJsonResponse(const request& req, const nlohmann::json& j,
                                            status status = status::ok);

    static string_response makeEmptyResponse(const request& req, status status);
};

}
