#include "protocols/http/Router.hpp"
#include "lock/Coordinator.hpp"
#include "lock/Directory.hpp"
#include "lock/errors.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>

using namespace lw::protocols::http;
using namespace lw::lock;
using namespace lw::log;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };

std::string url_decode(const std::string& value) {
    std::ostringstream result;
    for (size_t i = 0; i < value.length(); ++i) {
        if (value[i] == '%' && i + 2 < value.length()) {
            if (int hex = 0; std::istringstream(value.substr(i + 1, 2)) >> std::hex >> hex) {
                result << static_cast<char>(hex);
                i += 2;
            } else throw std::invalid_argument("Invalid percent-encoding in URL");
        }
        else result << value[i];
    }
    return result.str();
}

// "/locks/abc/renew?x=1" -> {"locks", "abc", "renew"}; empty segments are kept
std::vector<std::string> split_path(std::string target) {
    if (const auto q = target.find('?'); q != std::string::npos) target.resize(q);
    if (!target.empty() && target.front() == '/') target.erase(0, 1);

    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const auto slash = target.find('/', start);
        parts.push_back(url_decode(target.substr(start, slash == std::string::npos ? std::string::npos : slash - start)));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    return parts;
}

std::string header(const request& req, const char* name) {
    const auto it = req.find(name);
    if (it == req.end()) return {};
    return std::string(it->value());
}

nlohmann::json parse_body(const request& req) {
    if (req.body().empty()) return nlohmann::json::object();
    auto j = nlohmann::json::parse(req.body());
    if (!j.is_object()) throw std::invalid_argument("Request body must be a JSON object");
    return j;
}

std::optional<std::chrono::seconds> ttl_from(const nlohmann::json& body) {
    if (!body.contains("ttl_seconds") || body["ttl_seconds"].is_null()) return std::nullopt;
    if (!body["ttl_seconds"].is_number_integer()) throw std::invalid_argument("ttl_seconds must be an integer");
    return std::chrono::seconds(body["ttl_seconds"].get<long long>());
}

}

Router::Router(std::shared_ptr<Coordinator> coordinator, std::shared_ptr<UserDirectory> users)
    : coordinator_(std::move(coordinator)), users_(std::move(users)) {
    if (!coordinator_) throw std::invalid_argument("Router requires a coordinator");
}

string_response Router::route(const request& req) const {
    try {
        return dispatch(req);
    } catch (const Unavailable& e) {
        Registry::http()->error("[Router] Lock store unavailable for {} {}: {}",
                                std::string(req.method_string()), std::string(req.target()), e.what());
        return makeErrorResponse(req, "unavailable", "Lock store unavailable, retry shortly", status::service_unavailable);
    } catch (const ResourceNotFound& e) {
        return makeErrorResponse(req, "not_found", e.what(), status::not_found);
    } catch (const std::invalid_argument& e) {
        return makeErrorResponse(req, "invalid_argument", e.what(), status::bad_request);
    } catch (const nlohmann::json::exception& e) {
        return makeErrorResponse(req, "invalid_argument", std::string("Malformed JSON: ") + e.what(), status::bad_request);
    } catch (const std::exception& e) {
        Registry::http()->error("[Router] Unhandled error for {} {}: {}",
                                std::string(req.method_string()), std::string(req.target()), e.what());
        return makeErrorResponse(req, "internal", "Internal server error", status::internal_server_error);
    }
}

string_response Router::dispatch(const request& req) const {
    const auto parts = split_path(std::string(req.target()));
    if (parts[0] != "locks" || parts.size() < 2 || parts.size() > 3
        || std::ranges::any_of(parts, [](const std::string& p) { return p.empty(); }))
        return makeErrorResponse(req, "not_found", "Not found", status::not_found);

    const auto& resourceId = parts[1];

    if (parts.size() == 3) {
        if (parts[2] != "acquire" && parts[2] != "renew")
            return makeErrorResponse(req, "not_found", "Not found", status::not_found);
        if (req.method() != verb::post)
            return makeErrorResponse(req, "method_not_allowed", "Use POST", status::method_not_allowed);
        return parts[2] == "acquire" ? handleAcquire(req, resourceId) : handleRenew(req, resourceId);
    }

    switch (req.method()) {
        case verb::get: return handleInspect(req, resourceId);
        case verb::delete_: return handleRelease(req, resourceId);
        default: return makeErrorResponse(req, "method_not_allowed", "Use GET or DELETE", status::method_not_allowed);
    }
}

string_response Router::handleAcquire(const request& req, const std::string& resourceId) const {
    const auto userId = header(req, USER_HEADER);
    const auto sessionId = header(req, SESSION_HEADER);
    if (userId.empty() || sessionId.empty())
        return makeErrorResponse(req, "unauthorized", "Missing caller identity", status::unauthorized);

    const auto body = parse_body(req);
    if (!body.contains("resource_kind") || !body["resource_kind"].is_string())
        throw std::invalid_argument("resource_kind is required");

    const AcquireRequest acquireReq{
        .resource_kind = model::resourceKindFromString(body["resource_kind"].get<std::string>()),
        .resource_id = resourceId,
        .holder_user_id = userId,
        .holder_session_id = sessionId,
        .ttl = ttl_from(body)
    };

    return std::visit(overloaded{
        [&](const LockGrant& grant) {
            nlohmann::json j = grant;
            j["locked_by_user_name"] = holderName(grant.lock.holder_user_id);
            return makeJsonResponse(req, j);
        },
        [&](const Conflict& conflict) {
            nlohmann::json j = conflict;
            j["locked_by_user_name"] = holderName(conflict.holder_user_id);
            return makeJsonResponse(req, {
                {"error", "conflict"},
                {"message", "Order is currently locked by " + j["locked_by_user_name"].get<std::string>()},
                {"locked_by", j}
            }, status::conflict);
        }
    }, coordinator_->acquire(acquireReq));
}

string_response Router::handleRenew(const request& req, const std::string& resourceId) const {
    const auto sessionId = header(req, SESSION_HEADER);
    if (sessionId.empty()) return makeErrorResponse(req, "unauthorized", "Missing caller identity", status::unauthorized);

    const auto body = parse_body(req);

    return std::visit(overloaded{
        [&](const LockGrant& grant) {
            nlohmann::json j = grant;
            j["locked_by_user_name"] = holderName(grant.lock.holder_user_id);
            return makeJsonResponse(req, j);
        },
        [&](const NotHeld&) {
            return makeErrorResponse(req, "not_held", "Lock not found or expired", status::not_found);
        }
    }, coordinator_->renew(resourceId, sessionId, ttl_from(body)));
}

string_response Router::handleRelease(const request& req, const std::string& resourceId) const {
    const auto sessionId = header(req, SESSION_HEADER);
    if (sessionId.empty()) return makeErrorResponse(req, "unauthorized", "Missing caller identity", status::unauthorized);

    return std::visit(overloaded{
        [&](const Released&) { return makeEmptyResponse(req, status::no_content); },
        [&](const NotHeld& notHeld) {
            if (notHeld.held_by_other)
                return makeErrorResponse(req, "held_by_other", "Lock is held by another session", status::conflict);
            return makeErrorResponse(req, "not_held", "No lock held by this session", status::not_found);
        }
    }, coordinator_->release(resourceId, sessionId));
}

string_response Router::handleInspect(const request& req, const std::string& resourceId) const {
    return std::visit(overloaded{
        [&](const Unlocked& unlocked) { return makeJsonResponse(req, unlocked); },
        [&](const LockedBy& locked) {
            nlohmann::json j = locked;
            j["locked_by_user_name"] = holderName(locked.holder_user_id);
            return makeJsonResponse(req, j);
        }
    }, coordinator_->inspect(resourceId));
}

std::string Router::holderName(const std::string& userId) const {
    if (!users_) return userId;
    try {
        if (const auto name = users_->displayName(userId)) return *name;
    } catch (const std::exception& e) {
        Registry::http()->warn("[Router] Could not resolve user name for {}: {}", userId, e.what());
    }
    return "Unknown User";
}

string_response Router::makeJsonResponse(const request& req, const nlohmann::json& j, const status status) {
    string_response res{status, req.version()};
    res.set(field::content_type, "application/json");
    res.body() = j.dump();
    res.prepare_payload();
    res.keep_alive(req.keep_alive());
    return res;
}

string_response Router::makeErrorResponse(const request& req, const std::string& error,
                                          const std::string& msg, const status status) {
    return makeJsonResponse(req, {
        {"statusCode", static_cast<unsigned>(status)},
        {"error", error},
        {"message", msg}
    }, status);
}

string_response Router::makeEmptyResponse(const request& req, const status status) {
    string_response res{status, req.version()};
    res.prepare_payload();
    res.keep_alive(req.keep_alive());
    return res;
}
