#include "health/Monitor.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <memory>
#include <netdb.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <sys/statvfs.h>
#include <unistd.h>
#include <fmt/format.h>

using namespace pw::health;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

double roundTenth(const double v) { return static_cast<double>(static_cast<long long>(v * 10.0 + 0.5)) / 10.0; }

class FdGuard {
public:
    explicit FdGuard(const int fd) : fd_(fd) {}
    ~FdGuard() { if (fd_ >= 0) ::close(fd_); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    [[nodiscard]] int get() const { return fd_; }

private:
    int fd_;
};

bool connectWithin(const addrinfo* ai, const std::chrono::milliseconds timeout) {
    const FdGuard fd(::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol));
    if (fd.get() < 0) return false;

    if (::connect(fd.get(), ai->ai_addr, ai->ai_addrlen) == 0) return true;
    if (errno != EINPROGRESS) return false;

    pollfd p{fd.get(), POLLOUT, 0};
    if (::poll(&p, 1, static_cast<int>(timeout.count())) <= 0) return false;

    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd.get(), SOL_SOCKET, SO_ERROR, &err, &len) != 0) return false;
    return err == 0;
}

}

namespace pw::health {

std::string to_string(const CheckStatus s) {
    switch (s) {
        case CheckStatus::Pass: return "pass";
        case CheckStatus::Warn: return "warn";
        case CheckStatus::Fail: return "fail";
        default: return "unknown";
    }
}

void to_json(json& j, const CheckResult& r) {
    j = {
        {"name", r.name},
        {"status", to_string(r.status)},
        {"message", r.message}
    };
    if (!r.details.is_null()) j["details"] = r.details;
}

std::string overall(const std::vector<CheckResult>& checks) {
    bool warned = false;
    for (const auto& c : checks) {
        if (c.status == CheckStatus::Fail) return "unhealthy";
        if (c.status == CheckStatus::Warn) warned = true;
    }
    return warned ? "degraded" : "healthy";
}

CheckResult checkLogFile(const fs::path& logPath) {
    CheckResult r{"log_file", "Proxy log"};
    std::error_code ec;
    if (fs::is_regular_file(logPath, ec)) {
        r.status = CheckStatus::Pass;
        r.message = "Log file present";
        r.details = {{"path", logPath.string()}, {"size", fs::file_size(logPath, ec)}};
    } else {
        r.status = CheckStatus::Warn;
        r.message = "Log file missing: " + logPath.string();
    }
    return r;
}

CheckResult checkUsageEndpoint(const usage::Reconciler& reconciler) {
    CheckResult r{"usage", "Usage endpoint"};
    if (!reconciler.attempted()) {
        r.message = "Not queried yet";
        return r;
    }
    r.status = reconciler.lastFetchOk() ? CheckStatus::Pass : CheckStatus::Warn;
    r.message = reconciler.lastFetchOk() ? "Reachable" : "Unreachable, serving saved snapshot";
    return r;
}

CheckResult checkDisk(const fs::path& path, const double warnPercent) {
    CheckResult r{"disk", "Disk space"};

    struct statvfs vfs{};
    if (::statvfs(path.c_str(), &vfs) != 0 || vfs.f_blocks == 0) {
        r.message = "Cannot read disk usage";
        return r;
    }

    const auto total = static_cast<double>(vfs.f_blocks) * vfs.f_frsize;
    const auto avail = static_cast<double>(vfs.f_bavail) * vfs.f_frsize;
    const auto free = static_cast<double>(vfs.f_bfree) * vfs.f_frsize;
    const auto used = total - free;
    // Same denominator df uses: space visible to unprivileged users
    const auto denom = used + avail;
    const auto percent = denom > 0 ? roundTenth(used / denom * 100.0) : 0.0;

    r.status = percent < warnPercent ? CheckStatus::Pass : CheckStatus::Warn;
    r.message = fmt::format("{}% used", percent);
    r.details = {{"percent", percent}};
    return r;
}

CheckResult checkMemory(const fs::path& meminfo, const double warnPercent) {
    CheckResult r{"memory", "Memory"};

    std::ifstream in(meminfo);
    if (!in) {
        r.message = "Cannot read memory usage";
        return r;
    }

    uint64_t totalKb = 0, availKb = 0;
    bool haveAvail = false;
    for (std::string line; std::getline(in, line);) {
        std::istringstream ss(line);
        std::string key;
        uint64_t value = 0;
        if (!(ss >> key >> value)) continue;
        if (key == "MemTotal:") totalKb = value;
        else if (key == "MemAvailable:") { availKb = value; haveAvail = true; }
    }

    if (totalKb == 0 || !haveAvail) {
        r.message = "Cannot read memory usage";
        return r;
    }

    const auto percent = roundTenth(static_cast<double>(totalKb - std::min(availKb, totalKb)) / totalKb * 100.0);
    r.status = percent < warnPercent ? CheckStatus::Pass : CheckStatus::Warn;
    r.message = fmt::format("{}% used", percent);
    r.details = {{"percent", percent}};
    return r;
}

CheckResult checkAuthDir(const fs::path& dir) {
    CheckResult r{"auth", "Credential files"};

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        r.status = CheckStatus::Fail;
        r.message = "Credential directory missing: " + dir.string();
        return r;
    }

    std::size_t count = 0;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
        if (it->is_regular_file(ec)) ++count;

    r.status = count > 0 ? CheckStatus::Pass : CheckStatus::Warn;
    r.message = fmt::format("{} credential file(s)", count);
    r.details = {{"count", count}};
    return r;
}

CheckResult checkPort(const std::string& host, const uint16_t port, const std::chrono::milliseconds timeout) {
    CheckResult r{"api_port", "API port"};

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const auto service = std::to_string(port);
    if (const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res); rc != 0) {
        r.message = fmt::format("Cannot resolve {}: {}", host, ::gai_strerror(rc));
        return r;
    }
    const std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);

    bool open = false;
    for (auto* ai = res; ai && !open; ai = ai->ai_next) open = connectWithin(ai, timeout);

    r.status = open ? CheckStatus::Pass : CheckStatus::Fail;
    r.message = fmt::format("Port {} {}", port, open ? "open" : "closed");
    return r;
}

std::string hostFromUrl(const std::string& url) {
    auto start = url.find("://");
    start = start == std::string::npos ? 0 : start + 3;

    auto end = url.find_first_of("/?#", start);
    auto authority = url.substr(start, end == std::string::npos ? std::string::npos : end - start);

    if (const auto at = authority.rfind('@'); at != std::string::npos) authority.erase(0, at + 1);

    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        return close == std::string::npos ? authority.substr(1) : authority.substr(1, close - 1);
    }

    if (const auto colon = authority.find(':'); colon != std::string::npos) authority.erase(colon);
    return authority.empty() ? "127.0.0.1" : authority;
}

}

Monitor::Monitor(const config::Config& cfg, const usage::Reconciler& reconciler, cache::JsonCache& cache)
    : proxy_(cfg.proxy),
      management_(cfg.management),
      health_(cfg.health),
      reconciler_(reconciler),
      cache_(cache) {}

json Monitor::check(const bool useCache) {
    if (useCache)
        if (auto hit = cache_.get(cache::keys::HEALTH_CHECK, CACHE_MAX_AGE)) return *hit;

    std::vector<CheckResult> checks;
    checks.push_back(checkLogFile(proxy_.log_path));
    checks.push_back(checkUsageEndpoint(reconciler_));
    checks.push_back(checkDisk(health_.disk_path, health_.disk_warn_percent));
    checks.push_back(checkMemory(MEMINFO_PATH, health_.memory_warn_percent));
    checks.push_back(checkAuthDir(proxy_.auth_dir));
    checks.push_back(checkPort(hostFromUrl(management_.base_url), management_.port, PORT_TIMEOUT));

    const auto verdict = overall(checks);

    json j;
    j["timestamp"] = util::nowIso8601();
    j["overall"] = verdict;
    j["checks"] = checks;
    j["checks_map"] = json::object();
    for (const auto& c : checks) j["checks_map"][c.key] = c;

    for (const auto& c : checks)
        if (c.status == CheckStatus::Fail || c.status == CheckStatus::Warn)
            log::Registry::health()->warn("[HealthMonitor] {} {}: {}", c.name, to_string(c.status), c.message);

    {
        std::scoped_lock lk(mutex_);
        lastVerdict_ = verdict;
    }

    cache_.set(cache::keys::HEALTH_CHECK, j);
    return j;
}

std::optional<std::string> Monitor::lastVerdict() const {
    std::scoped_lock lk(mutex_);
    return lastVerdict_;
}
