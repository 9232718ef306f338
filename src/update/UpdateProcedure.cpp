#include "update/UpdateProcedure.hpp"
#include "util/command.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <sstream>
#include <nlohmann/json.hpp>

using namespace pw::update;

CommandUpdateProcedure::CommandUpdateProcedure(config::AutoUpdateConfig cfg) : cfg_(std::move(cfg)) {}

UpdateOutcome CommandUpdateProcedure::run() {
    UpdateOutcome out;

    if (cfg_.command.empty()) {
        out.message = "No update command configured";
        out.finishedAt = util::nowIso8601();
        return out;
    }

    log::Registry::update()->info("[UpdateProcedure] Running {}", cfg_.command.front());
    const auto res = util::runCommand(cfg_.command, std::chrono::seconds(cfg_.command_timeout_seconds));

    std::istringstream lines(res.output);
    for (std::string line; std::getline(lines, line);)
        if (!line.empty()) out.details.push_back(line);

    out.success = res.ok();
    if (res.timed_out) out.message = "Update command timed out";
    else if (!res.ok()) out.message = "Update command exited with status " + std::to_string(res.exit_code);
    else out.message = "Update successful";

    out.finishedAt = util::nowIso8601();
    return out;
}

namespace pw::update {

void to_json(nlohmann::json& j, const UpdateOutcome& o) {
    j = {
        {"success", o.success},
        {"message", o.message},
        {"details", o.details},
        {"time", o.finishedAt}
    };
}

}
