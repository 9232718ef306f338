#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>

namespace pw::stats { class CountersStore; }

namespace pw::services {

class CounterFlushService final : public concurrency::AsyncService {
public:
    // Intervals shorter than the store's save window are raised to it.
    CounterFlushService(stats::CountersStore& counters, std::chrono::seconds interval);
    ~CounterFlushService() override;

    void runLoop() override;

    [[nodiscard]] std::chrono::seconds interval() const { return interval_; }

private:
    stats::CountersStore& counters_;
    std::chrono::seconds interval_;
};

}
