#pragma once

#include <boost/beast/core.hpp>
#include <boost/asio.hpp>
#include <memory>

namespace lw::protocols::http {

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class Router;

class Server : public std::enable_shared_from_this<Server> {
public:
    Server(net::io_context& ioc, const tcp::endpoint& endpoint,
           std::shared_ptr<const Router> router, std::size_t maxBodyBytes);

    void run();

    void stop();

    [[nodiscard]] tcp::endpoint localEndpoint() const { return acceptor_.local_endpoint(); }

private:
    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<const Router> router_;
    std::size_t maxBodyBytes_;
};

}
