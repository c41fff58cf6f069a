// Database
#include "db/PgStore.hpp"
#include "db/Transactions.hpp"

// Seed
#include "seed/include/init_db_tables.hpp"

// Sync
#include "auth/TokenValidator.hpp"
#include "protocols/http/Router.hpp"
#include "protocols/http/Server.hpp"
#include "sync/Processor.hpp"
#include "util/Clock.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

// Libraries
#include <boost/asio/signal_set.hpp>
#include <algorithm>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <thread>
#include <vector>

using namespace tally;
using namespace tally::config;
using namespace tally::log;

namespace net = boost::asio;

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "/etc/tally/config.yaml";

    try {
        ConfigRegistry::init(configPath);
        Registry::init();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "tallyd: failed to load %s: %s\n", configPath.c_str(), e.what());
        return EXIT_FAILURE;
    }

    try {
        const auto& cfg = ConfigRegistry::get();

        Registry::tally()->info("[*] Connecting to PostgreSQL at {}:{}...", cfg.database.host, cfg.database.port);
        db::Transactions::init(cfg.database);
        db::seed::init_tables();

        util::SystemClock clock;
        db::PgStore store;
        sync::Processor processor(store, clock, cfg.sync);
        const auth::TokenValidator tokens(cfg.auth);
        const protocols::http::Router router(processor, tokens);

        net::io_context ioc;
        const auto endpoint = net::ip::tcp::endpoint{net::ip::make_address(cfg.server.host), cfg.server.port};
        const auto server = std::make_shared<protocols::http::Server>(ioc, endpoint, router, cfg.server.max_body_bytes);
        server->run();

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, const int signum) {
            Registry::tally()->info("[!] Signal {} received. Shutting down gracefully...", signum);
            server->stop();
            ioc.stop();
        });

        const auto threads = std::max(1u, cfg.server.threads);
        std::vector<std::thread> pool;
        pool.reserve(threads - 1);
        for (unsigned int i = 1; i < threads; ++i) pool.emplace_back([&ioc] { ioc.run(); });

        Registry::tally()->info("[✓] tallyd serving on {} threads", threads);
        ioc.run();

        for (auto& t : pool) t.join();

        Registry::tally()->info("[✓] tallyd shut down cleanly.");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        Registry::tally()->error("[-] tallyd failed: {}", e.what());
        return EXIT_FAILURE;
    }
}
