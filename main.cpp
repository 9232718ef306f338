#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "runtime/Manager.hpp"
#include "util/curlWrappers.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

using namespace pw;

namespace {
std::atomic<bool> shouldExit = false;
std::atomic<int> exitSignal = 0;

void signalHandler(const int signum) {
    exitSignal = signum;
    shouldExit = true;
}

constexpr auto DEFAULT_CONFIG_PATH = "/etc/proxywatch/config.yaml";
}

int main(const int argc, char** argv) {
    const std::filesystem::path configPath = argc > 1 ? argv[1] : DEFAULT_CONFIG_PATH;

    config::Config cfg;
    try {
        cfg = config::loadConfig(configPath);
    } catch (const std::exception& e) {
        std::cerr << "[-] Failed to load configuration " << configPath << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    try {
        log::Registry::init(cfg.logging);
        const util::CurlGlobal curl;

        log::Registry::proxywatch()->info("[*] Initializing proxywatch for {}", cfg.proxy.log_path.string());
        runtime::Manager manager(cfg);
        manager.startAll();
        log::Registry::proxywatch()->info("[*] proxywatch services started successfully.");

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        while (!shouldExit) std::this_thread::sleep_for(std::chrono::seconds(1));

        log::Registry::proxywatch()->info("[!] Signal {} received. Shutting down gracefully...", exitSignal.load());
        manager.stopAll();

        log::Registry::proxywatch()->info("[✓] proxywatch shut down cleanly.");
        log::Registry::shutdown();
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (log::Registry::isInitialized()) log::Registry::proxywatch()->error("[-] Failed to run proxywatch: {}", e.what());
        else std::cerr << "[-] Failed to run proxywatch: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
