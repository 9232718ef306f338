#pragma once

#include "tail/Cursor.hpp"
#include "tail/LogLine.hpp"
#include "util/Clock.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

namespace pw::tail {

// Incremental request counter over the proxy's access log.
//
// Each poll() reads only the bytes appended since the previous call. Truncation, replacement
// and external clears all show up as a size or mtime regression and are handled as one
// rotation: the current window folds into the base totals exactly once and reading restarts
// at offset 0. The cursor is checkpointed to disk so counts survive restarts.
class StatsTracker {
public:
    static constexpr auto PERSIST_INTERVAL = std::chrono::seconds(5);

    StatsTracker(std::filesystem::path logPath,
                 std::filesystem::path statePath,
                 LineClassifier classifier,
                 std::shared_ptr<const util::Clock> clock = std::make_shared<util::SystemClock>());

    PollResult poll();

    // Forget everything counted so far and checkpoint the empty cursor.
    void reset();

    // Restore the cursor from disk. Missing or unreadable state leaves the empty cursor.
    bool load();

    bool persist(bool force = false);

    [[nodiscard]] LogCursor cursor() const;
    [[nodiscard]] std::optional<std::string> lastSeenRequestAt() const;
    [[nodiscard]] const std::filesystem::path& logPath() const { return logPath_; }

private:
    std::filesystem::path logPath_;
    std::filesystem::path statePath_;
    LineClassifier classifier_;
    std::shared_ptr<const util::Clock> clock_;

    mutable std::mutex mutex_;
    LogCursor cursor_;
    std::optional<util::Clock::time_point> lastPersistedAt_;

    bool persistLocked(bool force);
    void countLine(const std::string& line);
    [[nodiscard]] PollResult totalsLocked() const;
};

}
