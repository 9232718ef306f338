#include "tail/StatsTracker.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <nlohmann/json.hpp>

using namespace pw::tail;
namespace fs = std::filesystem;

StatsTracker::StatsTracker(fs::path logPath, fs::path statePath, LineClassifier classifier,
                           std::shared_ptr<const util::Clock> clock)
    : logPath_(std::move(logPath)),
      statePath_(std::move(statePath)),
      classifier_(std::move(classifier)),
      clock_(std::move(clock)) {}

PollResult StatsTracker::poll() {
    std::scoped_lock lk(mutex_);

    struct stat st{};
    if (::stat(logPath_.c_str(), &st) != 0) {
        if (errno != ENOENT)
            log::Registry::tail()->warn("[StatsTracker] stat({}) failed: {}", logPath_.string(), std::strerror(errno));
        PollResult r;
        r.count = cursor_.base.total;
        r.success = cursor_.base.success;
        r.failed = cursor_.base.failed;
        r.lastTime = cursor_.lastSeenRequestAt;
        return r;
    }

    const auto size = static_cast<uint64_t>(st.st_size);
    const int64_t mtimeNs = static_cast<int64_t>(st.st_mtim.tv_sec) * 1'000'000'000LL + st.st_mtim.tv_nsec;

    const bool rotated = !cursor_.initialized
                         || size < cursor_.lastSize
                         || (cursor_.lastModifiedNs && mtimeNs < *cursor_.lastModifiedNs)
                         || cursor_.offset > size;

    if (rotated) {
        if (cursor_.initialized) {
            log::Registry::tail()->info("[StatsTracker] Rotation detected on {} (size {} -> {}), folding {} requests",
                                        logPath_.string(), cursor_.lastSize, size, cursor_.window.total);
            cursor_.base += cursor_.window;
        }
        cursor_.offset = 0;
        cursor_.window = {};
        cursor_.carry.clear();
        cursor_.lastSeenRequestAt.reset();
    }

    // Record what was observed now so a failed read below cannot trigger a second fold.
    cursor_.initialized = true;
    cursor_.lastSize = size;
    cursor_.lastModifiedNs = mtimeNs;

    std::string fresh;
    {
        std::ifstream in(logPath_, std::ios::binary);
        if (!in) {
            log::Registry::tail()->warn("[StatsTracker] Cannot open {}", logPath_.string());
            if (rotated) persistLocked(true);
            return totalsLocked();
        }
        in.seekg(static_cast<std::streamoff>(cursor_.offset));
        fresh.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    cursor_.offset += fresh.size();

    const auto before = cursor_.window;

    std::string pending = std::move(cursor_.carry);
    pending += fresh;
    cursor_.carry.clear();

    std::size_t start = 0;
    while (start < pending.size()) {
        const auto nl = pending.find('\n', start);
        if (nl == std::string::npos) {
            cursor_.carry = pending.substr(start);
            break;
        }
        auto line = pending.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        countLine(line);
        start = nl + 1;
    }

    const bool changed = rotated || !(cursor_.window == before);

    std::error_code ec;
    if (rotated || !fs::exists(statePath_, ec)) persistLocked(true);
    else if (changed) persistLocked(false);

    return totalsLocked();
}

void StatsTracker::countLine(const std::string& line) {
    if (!LineClassifier::isRequestLine(line)) return;
    if (classifier_.isExcluded(line)) return;

    ++cursor_.window.total;

    if (auto ts = LineClassifier::extractTimestamp(line)) cursor_.lastSeenRequestAt = std::move(*ts);

    if (const auto status = LineClassifier::extractStatus(line)) {
        if (*status >= 200 && *status < 300) ++cursor_.window.success;
        else if (*status >= 400) ++cursor_.window.failed;
    }
}

PollResult StatsTracker::totalsLocked() const {
    PollResult r;
    r.count = cursor_.base.total + cursor_.window.total;
    r.success = cursor_.base.success + cursor_.window.success;
    r.failed = cursor_.base.failed + cursor_.window.failed;
    r.lastTime = cursor_.lastSeenRequestAt;
    return r;
}

void StatsTracker::reset() {
    std::scoped_lock lk(mutex_);
    cursor_ = LogCursor{};
    persistLocked(true);
    log::Registry::tail()->info("[StatsTracker] Cursor reset");
}

bool StatsTracker::load() {
    std::scoped_lock lk(mutex_);

    std::error_code ec;
    if (!fs::exists(statePath_, ec)) return false;

    try {
        const auto j = nlohmann::json::parse(util::readFileToString(statePath_), nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            log::Registry::tail()->warn("[StatsTracker] Ignoring malformed cursor file {}", statePath_.string());
            return false;
        }
        cursor_ = j.get<LogCursor>();
    } catch (const std::exception& e) {
        log::Registry::tail()->warn("[StatsTracker] Failed to load cursor: {}", e.what());
        return false;
    }

    log::Registry::tail()->info("[StatsTracker] Restored cursor at offset {} ({} requests)",
                                cursor_.offset, cursor_.base.total + cursor_.window.total);
    return true;
}

bool StatsTracker::persist(const bool force) {
    std::scoped_lock lk(mutex_);
    return persistLocked(force);
}

bool StatsTracker::persistLocked(const bool force) {
    const auto now = clock_->now();
    if (!force && lastPersistedAt_ && now - *lastPersistedAt_ < PERSIST_INTERVAL) return false;

    try {
        const nlohmann::json j = cursor_;
        util::writeFileAtomic(statePath_, j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
    } catch (const std::exception& e) {
        log::Registry::tail()->warn("[StatsTracker] Failed to save cursor: {}", e.what());
        return false;
    }

    lastPersistedAt_ = now;
    return true;
}

LogCursor StatsTracker::cursor() const {
    std::scoped_lock lk(mutex_);
    return cursor_;
}

std::optional<std::string> StatsTracker::lastSeenRequestAt() const {
    std::scoped_lock lk(mutex_);
    return cursor_.lastSeenRequestAt;
}
