#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace pw::concurrency;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    if (worker_.joinable()) {
        {
            std::scoped_lock lk(sleepMutex_);
            interruptFlag_.store(true, std::memory_order_release);
        }
        sleepCv_.notify_all();
        if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
        else worker_.detach();
    }
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
            log::Registry::proxywatch()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::proxywatch()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    log::Registry::proxywatch()->info("[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock lk(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    log::Registry::proxywatch()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    log::Registry::proxywatch()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}
