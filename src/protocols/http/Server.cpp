#include "protocols/http/Server.hpp"
#include "protocols/http/Session.hpp"
#include "log/Registry.hpp"

using namespace lw::log;

namespace lw::protocols::http {

Server::Server(net::io_context& ioc, const tcp::endpoint& endpoint,
               std::shared_ptr<const Router> router, const std::size_t maxBodyBytes)
    : ioc_(ioc), acceptor_(net::make_strand(ioc)), router_(std::move(router)), maxBodyBytes_(maxBodyBytes) {
    beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.bind(endpoint, ec);
    if (ec) throw beast::system_error(ec);
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) throw beast::system_error(ec);
}

void Server::run() {
    Registry::http()->info("[Server] Listening on {}:{}",
                           acceptor_.local_endpoint().address().to_string(), acceptor_.local_endpoint().port());
    do_accept();
}

void Server::stop() {
    net::post(acceptor_.get_executor(), [self = shared_from_this()] {
        beast::error_code ec;
        self->acceptor_.close(ec);
    });
}

void Server::do_accept() {
    acceptor_.async_accept(net::make_strand(ioc_),
                           beast::bind_front_handler(&Server::on_accept, shared_from_this()));
}

void Server::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) return;

    if (ec) Registry::http()->warn("[Server] Accept error: {}", ec.message());
    else std::make_shared<Session>(std::move(socket), router_, maxBodyBytes_)->run();

    do_accept();
}

}
