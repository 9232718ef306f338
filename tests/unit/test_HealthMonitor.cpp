#include <gtest/gtest.h>
#include "health/Monitor.hpp"
#include "FakeTransport.hpp"
#include "TestSupport.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace pw::health;
using namespace std::chrono_literals;

class HealthChecksTest : public ::testing::Test {
protected:
    pw::test::TempDir dir;
};

TEST_F(HealthChecksTest, OverallVerdict) {
    std::vector<CheckResult> checks(3);
    checks[0].status = CheckStatus::Pass;
    checks[1].status = CheckStatus::Unknown;
    checks[2].status = CheckStatus::Pass;
    EXPECT_EQ(overall(checks), "healthy");

    checks[1].status = CheckStatus::Warn;
    EXPECT_EQ(overall(checks), "degraded");

    checks[2].status = CheckStatus::Fail;
    EXPECT_EQ(overall(checks), "unhealthy");
}

TEST_F(HealthChecksTest, AuthDirStates) {
    EXPECT_EQ(checkAuthDir(dir / "missing").status, CheckStatus::Fail);

    std::filesystem::create_directories(dir / "auth");
    EXPECT_EQ(checkAuthDir(dir / "auth").status, CheckStatus::Warn);

    pw::test::writeFile(dir / "auth" / "token.json", "{}");
    const auto r = checkAuthDir(dir / "auth");
    EXPECT_EQ(r.status, CheckStatus::Pass);
    EXPECT_EQ(r.details["count"], 1);
}

TEST_F(HealthChecksTest, LogFilePresence) {
    EXPECT_EQ(checkLogFile(dir / "main.log").status, CheckStatus::Warn);
    pw::test::writeFile(dir / "main.log", "x\n");
    EXPECT_EQ(checkLogFile(dir / "main.log").status, CheckStatus::Pass);
}

TEST_F(HealthChecksTest, MemoryFromMeminfo) {
    const auto meminfo = dir / "meminfo";
    pw::test::writeFile(meminfo, "MemTotal:       1000 kB\nMemFree:         100 kB\nMemAvailable:    250 kB\n");

    auto r = checkMemory(meminfo, 90.0);
    EXPECT_EQ(r.status, CheckStatus::Pass);
    EXPECT_DOUBLE_EQ(r.details["percent"].get<double>(), 75.0);

    r = checkMemory(meminfo, 70.0);
    EXPECT_EQ(r.status, CheckStatus::Warn);

    EXPECT_EQ(checkMemory(dir / "nope", 90.0).status, CheckStatus::Unknown);
}

TEST_F(HealthChecksTest, DiskReportsPercent) {
    const auto r = checkDisk(dir.path(), 100.1);
    EXPECT_EQ(r.status, CheckStatus::Pass);
    ASSERT_TRUE(r.details.contains("percent"));

    EXPECT_EQ(checkDisk(dir / "no" / "such" / "dir", 90.0).status, CheckStatus::Unknown);
}

TEST_F(HealthChecksTest, PortOpenAndClosed) {
    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(fd, 1), 0);

    socklen_t len = sizeof(addr);
    ASSERT_EQ(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);
    const auto port = ntohs(addr.sin_port);

    EXPECT_EQ(checkPort("127.0.0.1", port, 2000ms).status, CheckStatus::Pass);

    ::close(fd);
    EXPECT_EQ(checkPort("127.0.0.1", port, 500ms).status, CheckStatus::Fail);
}

TEST(HostFromUrlTest, StripsSchemePortAndPath) {
    EXPECT_EQ(hostFromUrl("http://127.0.0.1"), "127.0.0.1");
    EXPECT_EQ(hostFromUrl("https://proxy.local:8443/base"), "proxy.local");
    EXPECT_EQ(hostFromUrl("http://user:pw@host"), "host");
    EXPECT_EQ(hostFromUrl("http://[::1]:8317"), "::1");
    EXPECT_EQ(hostFromUrl("localhost"), "localhost");
    EXPECT_EQ(hostFromUrl(""), "127.0.0.1");
}

class HealthMonitorTest : public ::testing::Test {
protected:
    pw::test::TempDir dir;
    std::shared_ptr<pw::test::ManualClock> clock = std::make_shared<pw::test::ManualClock>();
    pw::cache::JsonCache cache{clock};
    pw::test::FakeTransport transport;
    pw::config::Config cfg = [this] {
        pw::config::Config c;
        c.proxy.log_path = dir / "main.log";
        c.proxy.auth_dir = dir / "auth";
        c.health.disk_path = dir.path();
        c.management.port = 1;
        return c;
    }();
    pw::usage::Reconciler reconciler{cfg.management, dir / "usage_snapshot.json", cache, transport};
    Monitor monitor{cfg, reconciler, cache};
};

TEST_F(HealthMonitorTest, ReportsAllChecksAndCachesResult) {
    EXPECT_FALSE(monitor.lastVerdict().has_value());

    const auto j = monitor.check(false);
    EXPECT_EQ(j["checks"].size(), 6u);
    EXPECT_EQ(j["checks_map"]["auth"]["status"], "fail");
    EXPECT_EQ(j["overall"], "unhealthy");
    EXPECT_EQ(monitor.lastVerdict(), "unhealthy");

    std::filesystem::create_directories(dir / "auth");
    const auto cached = monitor.check(true);
    EXPECT_EQ(cached["checks_map"]["auth"]["status"], "fail");

    clock->advance(Monitor::CACHE_MAX_AGE);
    const auto fresh = monitor.check(true);
    EXPECT_EQ(fresh["checks_map"]["auth"]["status"], "warn");
}
