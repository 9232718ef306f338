#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>

namespace pw::status { class Queries; }
namespace pw::health { class Monitor; }

namespace pw::services {

// Keeps the request-count and health cache entries warm between route calls.
class LogPollService final : public concurrency::AsyncService {
public:
    LogPollService(status::Queries& queries, health::Monitor& health, std::chrono::seconds interval);
    ~LogPollService() override;

    void runLoop() override;

private:
    status::Queries& queries_;
    health::Monitor& health_;
    std::chrono::seconds interval_;
};

}
