// Locks
#include "lock/Coordinator.hpp"
#include "lock/Clock.hpp"
#include "lock/Listener.hpp"
#include "lock/MemoryStore.hpp"

// Database
#include "db/DBConnection.hpp"
#include "db/DBPool.hpp"
#include "db/Transactions.hpp"
#include "db/Schema.hpp"
#include "db/PgStore.hpp"
#include "db/Janitor.hpp"

// HTTP
#include "protocols/http/Router.hpp"
#include "protocols/http/Server.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

// Libraries
#include <atomic>
#include <csignal>
#include <thread>
#include <vector>
#include <boost/asio.hpp>

using namespace lw;
using namespace lw::config;
using namespace lw::log;

namespace {
std::atomic shouldExit = false;
std::atomic reopenLogs = false;

void signalHandler(const int signum) {
    if (signum == SIGHUP) reopenLogs = true;
    else shouldExit = true;
}

std::shared_ptr<lock::Store> makeStore(const Config& cfg) {
    if (cfg.store.backend == StoreBackend::Memory) {
        Registry::lockwright()->warn("[*] Using in-process lock store, locks are not shared between instances");
        return std::make_shared<lock::MemoryStore>();
    }

    Registry::lockwright()->info("[*] Connecting to PostgreSQL at {}:{}/{}",
                                 cfg.database.host, cfg.database.port, cfg.database.name);
    db::Transactions::init(std::make_shared<db::DBPool>(
        cfg.database.pool_size, cfg.database.acquire_timeout,
        db::DBConnection::connectionStringFromConfig(cfg.database)));
    db::Schema::initTablesIfNotExists();
    db::Transactions::dbPool_->initPreparedStatements();
    return std::make_shared<db::PgStore>();
}
}

int main() {
    try {
        ConfigRegistry::init();
        const auto& cfg = ConfigRegistry::get();
        Registry::init(cfg.logging.log_dir);

        Registry::lockwright()->info("[*] Initializing lockwright (store: {})...", to_string(cfg.store.backend));

        const bool pg = cfg.store.backend == StoreBackend::Postgres;
        auto coordinator = std::make_shared<lock::Coordinator>(
            makeStore(cfg), std::make_shared<lock::SystemClock>(), lock::CoordinatorOptions::fromConfig(cfg));
        coordinator->addListener(std::make_shared<lock::AuditListener>());
        if (pg && cfg.locks.verify_resources) coordinator->setOrderDirectory(std::make_shared<db::PgOrderDirectory>());

        std::shared_ptr<lock::UserDirectory> users;
        if (pg && cfg.locks.resolve_user_names) users = std::make_shared<db::PgUserDirectory>();

        std::unique_ptr<db::Janitor> janitor;
        if (cfg.janitor.enabled) {
            janitor = std::make_unique<db::Janitor>(coordinator, cfg.janitor.sweep_interval);
            janitor->start();
        }

        boost::asio::io_context ioc{static_cast<int>(cfg.http.threads)};
        std::shared_ptr<protocols::http::Server> server;
        std::vector<std::thread> workers;

        if (cfg.http.enabled) {
            const auto router = std::make_shared<const protocols::http::Router>(coordinator, users);
            const boost::asio::ip::tcp::endpoint endpoint{
                boost::asio::ip::make_address(cfg.http.host), cfg.http.port};
            server = std::make_shared<protocols::http::Server>(ioc, endpoint, router, cfg.http.max_body_bytes);
            server->run();

            workers.reserve(cfg.http.threads);
            for (unsigned int i = 0; i < cfg.http.threads; ++i) workers.emplace_back([&ioc] { ioc.run(); });
        }

        Registry::lockwright()->info("[✓] lockwright started");

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGHUP, signalHandler);

        while (!shouldExit) {
            if (reopenLogs.exchange(false)) {
                Registry::reopenMainLog();
                Registry::lockwright()->info("[*] Reopened log files");
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(250));
        }

        Registry::lockwright()->info("[*] Shutting down lockwright...");

        if (server) server->stop();
        ioc.stop();
        for (auto& t : workers) t.join();
        if (janitor) janitor->stop();

        Registry::lockwright()->info("[✓] lockwright shut down cleanly.");

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::lockwright()->error("[-] Failed to start lockwright: {}", e.what());
        else spdlog::error("[-] Failed to start lockwright: {}", e.what());
        return EXIT_FAILURE;
    }
}
