#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace vcs::concurrency;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    stop();
}

void AsyncService::start() {
    if (isRunning()) return;

    // a previous run that exited on its own still owns a joinable thread
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::vcstatus()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::vcstatus()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    log::Registry::vcstatus()->info("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true, std::memory_order_release);
    wake();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else worker_.detach();

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    log::Registry::vcstatus()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    log::Registry::vcstatus()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}

void AsyncService::lazySleep(const std::chrono::milliseconds d) {
    std::unique_lock lock(sleepMutex_);
    sleepCv_.wait_for(lock, d, [this] { return woken_ || shouldStop(); });
    woken_ = false;
}

void AsyncService::wake() {
    {
        std::scoped_lock lock(sleepMutex_);
        woken_ = true;
    }
    sleepCv_.notify_all();
}
