#pragma once

#include "config/Config.hpp"

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace pw::update {

struct UpdateOutcome {
    bool success = false;
    std::string message;
    std::vector<std::string> details;
    std::string finishedAt;
};

void to_json(nlohmann::json& j, const UpdateOutcome& o);

class UpdateProcedure {
public:
    virtual ~UpdateProcedure() = default;

    virtual UpdateOutcome run() = 0;
};

// Delegates stop, fetch, rebuild and restart of the proxy to an operator-provided command.
class CommandUpdateProcedure final : public UpdateProcedure {
public:
    explicit CommandUpdateProcedure(config::AutoUpdateConfig cfg);

    UpdateOutcome run() override;

private:
    config::AutoUpdateConfig cfg_;
};

}
