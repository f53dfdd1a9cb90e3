#include <fstream>

#include <gtest/gtest.h>

#include "config.hpp"
#include "test_support.hpp"

TEST(Config, DefaultsApplyToMissingKeys) {
    Config cfg;
    std::string error;
    ASSERT_TRUE(parse_config("role=companion\nlisten=0.0.0.0:6001\npeer=127.0.0.1:6000\n", cfg, error));
    EXPECT_EQ(cfg.role, "companion");
    EXPECT_EQ(cfg.listen, "0.0.0.0:6001");
    EXPECT_EQ(cfg.peer, "127.0.0.1:6000");
    EXPECT_EQ(cfg.send_deadline, std::chrono::milliseconds(200));
    EXPECT_EQ(cfg.ping_interval, std::chrono::milliseconds(1000));
    EXPECT_EQ(cfg.tick_interval, std::chrono::milliseconds(500));
    EXPECT_EQ(cfg.haptic_interval, std::chrono::milliseconds(1500));
    EXPECT_EQ(cfg.grant_limit, std::chrono::seconds(3600));
    EXPECT_EQ(cfg.theme, "dark");
    EXPECT_FALSE(cfg.verbose);
}

TEST(Config, CommentsBlankLinesAndWhitespace) {
    Config cfg;
    std::string error;
    const std::string text =
        "# handheld\n"
        "\n"
        "  role = handheld  \n"
        "send_deadline_ms=350\r\n"
        "grant_limit_seconds = 0\n"
        "verbose=true\n"
        "theme=ocean\n";
    ASSERT_TRUE(parse_config(text, cfg, error)) << error;
    EXPECT_EQ(cfg.role, "handheld");
    EXPECT_EQ(cfg.send_deadline, std::chrono::milliseconds(350));
    EXPECT_EQ(cfg.grant_limit, std::chrono::seconds(0));
    EXPECT_TRUE(cfg.verbose);
    EXPECT_EQ(cfg.theme, "ocean");
}

TEST(Config, RejectsUnknownKey) {
    Config cfg;
    std::string error;
    EXPECT_FALSE(parse_config("colour=red\n", cfg, error));
    EXPECT_NE(error.find("colour"), std::string::npos);
}

TEST(Config, RejectsBadNumbers) {
    Config cfg;
    std::string error;
    EXPECT_FALSE(parse_config("tick_interval_ms=fast\n", cfg, error));
    EXPECT_FALSE(parse_config("tick_interval_ms=10ms\n", cfg, error));
    EXPECT_FALSE(parse_config("ping_interval_ms=0\n", cfg, error));
    EXPECT_FALSE(parse_config("grant_limit_seconds=-1\n", cfg, error));
    EXPECT_FALSE(parse_config("send_deadline_ms=99999999999999\n", cfg, error));
}

TEST(Config, RejectsBadRoleAndFlag) {
    Config cfg;
    std::string error;
    EXPECT_FALSE(parse_config("role=tablet\n", cfg, error));
    EXPECT_FALSE(parse_config("verbose=yes\n", cfg, error));
    EXPECT_FALSE(parse_config("just a line\n", cfg, error));
}

TEST(Config, LoadsFromFile) {
    TempDir dir;
    const std::string path = dir.file("wsync.conf");
    {
        std::ofstream out(path);
        out << "role=companion\nshared_dir=/tmp/shared\n";
    }
    Config cfg;
    std::string error;
    ASSERT_TRUE(load_config(path, cfg, error)) << error;
    EXPECT_EQ(cfg.shared_dir, "/tmp/shared");

    EXPECT_FALSE(load_config(dir.file("missing.conf"), cfg, error));
    EXPECT_NE(error.find("cannot open"), std::string::npos);
}
