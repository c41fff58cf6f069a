#include "auth/CredentialProvider.hpp"
#include "config/ConfigRegistry.hpp"
#include "ledger/Mutations.hpp"
#include "ledger/sqlite/SqliteLedger.hpp"
#include "ledger/sqlite/SqliteStore.hpp"
#include "log/Registry.hpp"
#include "sync/Agent.hpp"
#include "sync/HttpTransport.hpp"
#include "sync/Scheduler.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <thread>

using namespace tally;
using namespace tally::config;
using namespace tally::log;

namespace {
std::atomic shouldExit = false;

void signalHandler(const int) {
    shouldExit = true;
}

void usage() {
    std::fprintf(stderr, "usage: tally-sync [config.yaml] [--once]\n");
}
}

int main(int argc, char** argv) {
    std::string configPath = "tally.yaml";
    bool once = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--once") == 0) once = true;
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            usage();
            return EXIT_SUCCESS;
        } else if (argv[i][0] == '-') {
            usage();
            return EXIT_FAILURE;
        } else configPath = argv[i];
    }

    try {
        ConfigRegistry::init(configPath);
        Registry::init();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "tally-sync: failed to load %s: %s\n", configPath.c_str(), e.what());
        return EXIT_FAILURE;
    }

    try {
        const auto& cfg = ConfigRegistry::get();

        const auto db = ledger::sqlite::SqliteLedger::open(cfg.client.database_path.string());
        ledger::sqlite::SqliteLedger store(db);
        ledger::sqlite::SyncState syncState(db);

        util::SystemClock clock;
        if (cfg.sync.seed_defaults && ledger::seedDefaults(store, clock))
            Registry::tally()->info("[*] Seeded default categories in {}", cfg.client.database_path.string());

        sync::HttpTransport transport(cfg.client.server_url, cfg.client.request_timeout);
        const auth::StaticCredentialProvider credentials(cfg.client.access_token);
        sync::Agent agent(store, syncState, transport, credentials, clock, cfg.sync);
        sync::Scheduler scheduler(agent);

        if (once) {
            const auto result = scheduler.trigger();
            Registry::tally()->info("[*] Sync {}", sync::to_string(result));
            return result == sync::SyncResult::Completed ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        Registry::tally()->info("[*] Sync {}", sync::to_string(scheduler.trigger()));
        scheduler.startPeriodic(std::chrono::duration_cast<std::chrono::milliseconds>(cfg.client.sync_interval));

        while (!shouldExit) std::this_thread::sleep_for(std::chrono::milliseconds(200));

        Registry::tally()->info("[*] Stopping sync scheduler...");
        scheduler.stopPeriodic();
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        Registry::tally()->error("[-] tally-sync failed: {}", e.what());
        return EXIT_FAILURE;
    }
}
