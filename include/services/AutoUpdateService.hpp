#pragma once

#include "concurrency/AsyncService.hpp"

namespace pw::update { class AutoUpdater; }
namespace pw::config { class Settings; }

namespace pw::services {

class AutoUpdateService final : public concurrency::AsyncService {
public:
    AutoUpdateService(update::AutoUpdater& updater, const config::Settings& settings);
    ~AutoUpdateService() override;

    void runLoop() override;

private:
    update::AutoUpdater& updater_;
    const config::Settings& settings_;
};

}
