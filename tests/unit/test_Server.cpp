#include <gtest/gtest.h>
#include "protocols/http/Server.hpp"
#include "protocols/http/Router.hpp"
#include "lock/Coordinator.hpp"
#include "lock/MemoryStore.hpp"
#include "ManualClock.hpp"

#include <thread>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace bhttp = beast::http;
using tcp = net::ip::tcp;
using lw::protocols::http::Router;
using lw::protocols::http::Server;
using lw::protocols::http::USER_HEADER;
using lw::protocols::http::SESSION_HEADER;
using namespace lw::lock;

class ServerTest : public ::testing::Test {
protected:
    static constexpr std::size_t MAX_BODY = 1024;

    net::io_context ioc;
    net::io_context clientIoc;
    std::shared_ptr<Server> server;
    tcp::endpoint endpoint;
    std::thread runner;

    void SetUp() override {
        const auto coordinator = std::make_shared<Coordinator>(std::make_shared<MemoryStore>(),
                                                               std::make_shared<lw::test::ManualClock>());
        server = std::make_shared<Server>(ioc, tcp::endpoint{net::ip::make_address("127.0.0.1"), 0},
                                          std::make_shared<const Router>(coordinator), MAX_BODY);
        endpoint = server->localEndpoint();
        server->run();
        runner = std::thread([this] { ioc.run(); });
    }

    void TearDown() override {
        server->stop();
        ioc.stop();
        runner.join();
    }

    tcp::socket connect() {
        tcp::socket sock(clientIoc);
        sock.connect(endpoint);
        return sock;
    }

    static bhttp::response<bhttp::string_body> read(tcp::socket& sock, beast::flat_buffer& buf) {
        bhttp::response<bhttp::string_body> res;
        bhttp::read(sock, buf, res);
        return res;
    }
};

TEST_F(ServerTest, ServesRequestsOnKeepAliveConnection) {
    auto sock = connect();
    beast::flat_buffer buf;

    bhttp::request<bhttp::string_body> acquire{bhttp::verb::post, "/locks/ORD-1/acquire", 11};
    acquire.set(bhttp::field::host, "localhost");
    acquire.set(USER_HEADER, "alice");
    acquire.set(SESSION_HEADER, "s1");
    acquire.body() = R"({"resource_kind":"customer"})";
    acquire.prepare_payload();
    bhttp::write(sock, acquire);

    const auto granted = read(sock, buf);
    EXPECT_EQ(granted.result(), bhttp::status::ok);
    EXPECT_EQ(nlohmann::json::parse(granted.body())["locked_by_user_id"], "alice");

    bhttp::request<bhttp::string_body> inspect{bhttp::verb::get, "/locks/ORD-1", 11};
    inspect.set(bhttp::field::host, "localhost");
    inspect.prepare_payload();
    bhttp::write(sock, inspect);

    const auto status = read(sock, buf);
    EXPECT_EQ(status.result(), bhttp::status::ok);
    EXPECT_EQ(nlohmann::json::parse(status.body())["locked"], true);
}

TEST_F(ServerTest, OversizedBodyGets413AndClose) {
    auto sock = connect();
    beast::flat_buffer buf;

    const std::string head =
        "POST /locks/ORD-1/acquire HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "X-User-Id: alice\r\n"
        "X-Session-Id: s1\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: " + std::to_string(MAX_BODY * 4) + "\r\n\r\n";
    net::write(sock, net::buffer(head));

    const auto res = read(sock, buf);
    EXPECT_EQ(res.result(), bhttp::status::payload_too_large);
    EXPECT_EQ(nlohmann::json::parse(res.body())["error"], "payload_too_large");
    EXPECT_FALSE(res.keep_alive());

    bhttp::response<bhttp::string_body> next;
    beast::error_code ec;
    bhttp::read(sock, buf, next, ec);
    EXPECT_EQ(ec, bhttp::error::end_of_stream);
}
