// tests/test_env.cpp
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

// ENV guard
struct EnvGuard
{
    std::string key, old_val;
    bool        had = false;
    explicit EnvGuard(const char *k) : key(k)
    {
        const char *v = std::getenv(k);
        if (v)
        {
            had     = true;
            old_val = v;
        }
    }
    void set(const std::string &v) const { ::setenv(key.c_str(), v.c_str(), 1); }
    void unset() const { ::unsetenv(key.c_str()); }
    ~EnvGuard()
    {
        if (had)
            ::setenv(key.c_str(), old_val.c_str(), 1);
        else
            ::unsetenv(key.c_str());
    }
};

TEST(Env_CtlSockPath, FromEnv)
{
    EnvGuard          g("APDULINK_CTL_SOCK");
    const std::string want = "/tmp/apdulink-test.sock";
    g.set(want);

    // should NOT log the default path when env is set
    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(got, want);
    EXPECT_TRUE(err.find("defaults to") == std::string::npos);
}

TEST(Env_CtlSockPath, DefaultFromHomeAndLogs)
{
    EnvGuard g_sock("APDULINK_CTL_SOCK");
    g_sock.unset();

    EnvGuard              g_home("HOME");
    std::filesystem::path tmp = std::filesystem::temp_directory_path() / "apdulink-home";
    std::filesystem::create_directories(tmp);
    g_home.set(tmp.string());

    testing::internal::CaptureStderr();
    std::string got = constants::ctl_sock_path();
    std::string err = testing::internal::GetCapturedStderr();

    std::string want = (tmp / ".cache/apdulink/ctl.sock").string();
    EXPECT_EQ(got, want);
    EXPECT_NE(err.find("defaults to " + want), std::string::npos);
}

TEST(LogLevel, FiltersByThreshold)
{
    using namespace apdulink;

    // ERROR-only: WARN should be suppressed, ERROR should appear
    set_log_level_by_name("ERROR");
    testing::internal::CaptureStderr();
    LOG_WARN("should_not_print_warn");
    std::string out1 = testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out1.find("should_not_print_warn") == std::string::npos);

    testing::internal::CaptureStderr();
    LOG_ERROR("should_print_error");
    std::string out2 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out2.find("should_print_error"), std::string::npos);

    // DEBUG: DEBUG should appear
    set_log_level_by_name("DEBUG");
    testing::internal::CaptureStderr();
    LOG_DEBUG("debug_visible");
    std::string out3 = testing::internal::GetCapturedStderr();
    EXPECT_NE(out3.find("debug_visible"), std::string::npos);

    set_log_level(Level::Info);
}

TEST(Config, ParseU32Bounds)
{
    std::uint32_t v = 7;
    EXPECT_TRUE(config::parse_u32("250", 100, 60000, v));
    EXPECT_EQ(v, 250u);
    EXPECT_FALSE(config::parse_u32("99", 100, 60000, v));
    EXPECT_FALSE(config::parse_u32("12ms", 0, 60000, v));
    EXPECT_FALSE(config::parse_u32("-1", 0, 60000, v));
    EXPECT_FALSE(config::parse_u32("", 0, 60000, v));
    EXPECT_EQ(v, 250u);
}

TEST(Config, LoadFromEnv)
{
    EnvGuard g_tr("APDULINK_TRANSPORT");
    EnvGuard g_ad("APDULINK_ADAPTER");
    EnvGuard g_to("APDULINK_NEGOTIATE_TIMEOUT_MS");
    EnvGuard g_mtu("APDULINK_SIM_MTU");
    EnvGuard g_sock("APDULINK_CTL_SOCK");

    g_tr.unset();
    g_ad.unset();
    g_to.unset();
    g_mtu.unset();
    g_sock.set("/tmp/apdulink-cfg.sock");
    config::DaemonConfig d = config::load_from_env();
    EXPECT_EQ(d.link, config::LinkKind::Sim);
    EXPECT_EQ(d.adapter, "hci0");
    EXPECT_EQ(d.negotiate_timeout_ms, 5000u);
    EXPECT_EQ(d.sim_mtu, 158u);
    EXPECT_EQ(d.ctl_sock, "/tmp/apdulink-cfg.sock");

    g_tr.set("BlueZ");
    g_ad.set("hci1");
    g_to.set("750");
    g_mtu.set("10");  // below range, ignored
    config::DaemonConfig e = config::load_from_env();
    EXPECT_EQ(e.link, config::LinkKind::Bluez);
    EXPECT_EQ(e.adapter, "hci1");
    EXPECT_EQ(e.negotiate_timeout_ms, 750u);
    EXPECT_EQ(e.sim_mtu, 158u);
}
