#include "protocols/http/Session.hpp"
#include "protocols/http/Router.hpp"
#include "log/Registry.hpp"

#include <chrono>

using namespace lw::log;

namespace lw::protocols::http {

Session::Session(tcp::socket socket, std::shared_ptr<const Router> router, const std::size_t maxBodyBytes)
    : stream_(std::move(socket)), router_(std::move(router)), maxBodyBytes_(maxBodyBytes) {
    buffer_.max_size(maxBodyBytes_ + 8192);
}

void Session::run() {
    do_read();
}

void Session::do_read() {
    parser_.emplace();
    parser_->body_limit(maxBodyBytes_);
    stream_.expires_after(std::chrono::seconds(30));

    bhttp::async_read(stream_, buffer_, *parser_,
                      [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
                          self->on_read(ec, bytes);
                      });
}

void Session::on_read(beast::error_code ec, std::size_t bytes) {
    if (ec == bhttp::error::end_of_stream || ec == beast::error::timeout) return do_close();

    if (ec == bhttp::error::body_limit) {
        Registry::http()->warn("[Session] Request body over {} bytes rejected", maxBodyBytes_);
        auto res = std::make_shared<string_response>(Router::makeErrorResponse(
            parser_->get(), "payload_too_large",
            "Request body exceeds " + std::to_string(maxBodyBytes_) + " bytes", status::payload_too_large));
        res->keep_alive(false);

        bhttp::async_write(stream_, *res,
                           [self = shared_from_this(), res](beast::error_code ec, std::size_t bytes) {
                               self->on_write(true, ec, bytes);
                           });
        return;
    }

    if (ec) {
        Registry::http()->warn("[Session] Read error: {}", ec.message());
        return do_close();
    }

    const auto req = parser_->release();
    Registry::http()->debug("[Session] Read {} bytes: {} {}", bytes,
                            std::string(req.method_string()), std::string(req.target()));

    auto res = std::make_shared<string_response>(router_->route(req));
    const bool close = res->need_eof();

    bhttp::async_write(stream_, *res,
                       [self = shared_from_this(), res, close](beast::error_code ec, std::size_t bytes) {
                           self->on_write(close, ec, bytes);
                       });
}

void Session::on_write(const bool close, beast::error_code ec, const std::size_t bytes) {
    (void)bytes; // unused

    if (ec) {
        Registry::http()->warn("[Session] Write error: {}", ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void Session::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    // ignore errors on shutdown
}

}
