#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace tally::concurrency;

AsyncService::AsyncService(std::string serviceName)
    : serviceName_(std::move(serviceName)) {}

AsyncService::~AsyncService() {
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::tally()->error("[{}] Service error: {}", serviceName_, e.what());
        } catch (...) {
            log::Registry::tally()->error("[{}] Service error: unknown exception.", serviceName_);
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::tally()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    interruptFlag_.store(true, std::memory_order_release);

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
        log::Registry::tally()->debug("[{}] Service stopped.", serviceName_);
    }

    running_.store(false, std::memory_order_release);
}
