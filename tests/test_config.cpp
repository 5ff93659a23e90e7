#include "testing.hpp"
#include "util/config_parser.hpp"

#include <gtest/gtest.h>

namespace {

using imgjoin::config::JoinerConfigFromFile;

TEST(ConfigTest, LoadsAllKeys) {
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.Join("imgjoin.json");
    ASSERT_TRUE(testutil::WriteFile(p, R"({
        "DefaultOutput": "/var/tmp/out.img",
        "BufferSize": 65536,
        "FsyncOutput": true,
        "LogLevel": "debug",
        "Unrelated": [1, 2, 3]
    })"));

    JoinerConfigFromFile cfg;
    const auto res = cfg.LoadFile(p);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(cfg.default_output, "/var/tmp/out.img");
    EXPECT_EQ(cfg.buffer_size, 65536u);
    EXPECT_EQ(cfg.fsync_output, true);
    EXPECT_EQ(cfg.log_level, imgjoin::LogLevel::Debug);
}

TEST(ConfigTest, BufferSizeUpperLimitIsAccepted) {
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.Join("imgjoin.json");
    ASSERT_TRUE(testutil::WriteFile(p, R"({"BufferSize": 67108864})"));

    JoinerConfigFromFile cfg;
    const auto res = cfg.LoadFile(p);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(cfg.buffer_size, 64u * 1024 * 1024);
}

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.Join("imgjoin.json");
    ASSERT_TRUE(testutil::WriteFile(p, "{}"));

    JoinerConfigFromFile cfg;
    ASSERT_TRUE(cfg.LoadFile(p).ok);
    EXPECT_FALSE(cfg.default_output.has_value());
    EXPECT_FALSE(cfg.buffer_size.has_value());
    EXPECT_FALSE(cfg.fsync_output.has_value());
    EXPECT_FALSE(cfg.log_level.has_value());
}

TEST(ConfigTest, RejectsInvalidInput) {
    struct FailCase {
        std::string json;
        std::string expected_error_substr;
    };
    const std::vector<FailCase> cases = {
        {"not json", "invalid JSON"},
        {"[1, 2]", "root must be JSON object"},
        {R"({"DefaultOutput": 5})", "DefaultOutput must be a string"},
        {R"({"DefaultOutput": ""})", "DefaultOutput must not be empty"},
        {R"({"BufferSize": 0})", "BufferSize must be a positive integer"},
        {R"({"BufferSize": -4})", "BufferSize must be a positive integer"},
        {R"({"BufferSize": 67108865})", "BufferSize must be a positive integer <= 67108864"},
        {R"({"BufferSize": 18000000000000000000})", "BufferSize must be a positive integer"},
        {R"({"FsyncOutput": "yes"})", "FsyncOutput must be a boolean"},
        {R"({"LogLevel": "loud"})", "unknown LogLevel: loud"},
    };

    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.Join("imgjoin.json");
    for (const auto& c : cases) {
        ASSERT_TRUE(testutil::WriteFile(p, c.json));
        JoinerConfigFromFile cfg;
        const auto res = cfg.LoadFile(p);
        ASSERT_FALSE(res.ok) << c.json;
        EXPECT_EQ(res.kind(), imgjoin::ErrorKind::Config);
        EXPECT_NE(res.msg.find(c.expected_error_substr), std::string::npos) << res.msg;
    }
}

TEST(ConfigTest, MissingFileFails) {
    testutil::TemporaryDirectory tmp;
    JoinerConfigFromFile cfg;
    const auto res = cfg.LoadFile(tmp.Join("absent.json"));
    ASSERT_FALSE(res.ok);
    EXPECT_NE(res.msg.find("cannot open"), std::string::npos);
}

TEST(ConfigTest, LogLevelNames) {
    EXPECT_EQ(imgjoin::ParseLogLevel("info"), imgjoin::LogLevel::Info);
    EXPECT_EQ(imgjoin::ParseLogLevel("none"), imgjoin::LogLevel::None);
    EXPECT_FALSE(imgjoin::ParseLogLevel("INFO").has_value());
}

} // namespace
