#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace pw::util {

struct ExecResult {
    int exit_code = -1;          // 0 on success, 124 on timeout, 127 when exec failed
    std::string output;          // merged stdout + stderr, trailing whitespace trimmed
    bool timed_out = false;

    [[nodiscard]] bool ok() const { return exit_code == 0 && !timed_out; }
};

// Runs argv[0] from PATH with the given arguments, no shell involved.
ExecResult runCommand(const std::vector<std::string>& argv,
                      std::chrono::seconds timeout = std::chrono::seconds(60));

}
