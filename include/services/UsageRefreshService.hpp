#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>

namespace pw::usage { class Reconciler; }

namespace pw::services {

// Re-seeds the proxy from the saved snapshot once, then keeps the snapshot fresh.
class UsageRefreshService final : public concurrency::AsyncService {
public:
    UsageRefreshService(usage::Reconciler& reconciler, std::chrono::seconds interval);
    ~UsageRefreshService() override;

    void runLoop() override;

private:
    usage::Reconciler& reconciler_;
    std::chrono::seconds interval_;
    bool imported_ = false;
};

}
