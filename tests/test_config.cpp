/*
 * Configuration tests - GChat
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <gchat/config/config.hpp>
#include <sstream>

using namespace gchat;

TEST(Config, Defaults) {
    AppConfig cfg;
    EXPECT_EQ(cfg.level, 3);
    EXPECT_DOUBLE_EQ(cfg.temperature, 1.0);
    EXPECT_TRUE(cfg.auto_tokens);
    EXPECT_TRUE(cfg.auto_files);
    EXPECT_EQ(cfg.api_timeout, 600);
}

TEST(Config, StreamParsing) {
    AppConfig cfg;
    std::istringstream in("# comment\n\nchat_file = notes/chat.md\nlevel=2\ntemperature = 0.7\nauto_files=off\n"
                          "bogus=1\nno equals sign\nlevel=9\nprovider=stub\n");
    std::vector<std::string> warnings;
    load_config_stream(cfg, in, &warnings);
    EXPECT_EQ(cfg.chat_file, "notes/chat.md");
    EXPECT_EQ(cfg.level, 2);
    EXPECT_DOUBLE_EQ(cfg.temperature, 0.7);
    EXPECT_FALSE(cfg.auto_files);
    EXPECT_EQ(cfg.llm.provider, "stub");
    ASSERT_EQ(warnings.size(), 3u);
    EXPECT_EQ(warnings[0], "line 7: unknown setting: bogus");
    EXPECT_EQ(warnings[1], "line 8: expected key=value");
    EXPECT_EQ(warnings[2].rfind("line 9: invalid value for level", 0), 0u);
}

TEST(Config, MaxTokensMapsToLevel) {
    AppConfig cfg;
    EXPECT_TRUE(apply_config_value(cfg, "max_tokens", "8192"));
    EXPECT_EQ(cfg.level, 4);
    EXPECT_TRUE(apply_config_value(cfg, "max_tokens", "3000"));
    EXPECT_EQ(cfg.level, 2);
    EXPECT_FALSE(apply_config_value(cfg, "max_tokens", "lots"));
    EXPECT_FALSE(apply_config_value(cfg, "temperature", "2.5"));
    EXPECT_FALSE(apply_config_value(cfg, "provider", "acme"));
}

TEST(Config, Args) {
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(apply_args(cfg, {"-f", "x.md", "-t", "16384", "-p", "0.2", "--no-auto-tokens", "--once", "--stub", "reply.txt"}, &err)) << err;
    EXPECT_EQ(cfg.chat_file, "x.md");
    EXPECT_EQ(cfg.level, 5);
    EXPECT_DOUBLE_EQ(cfg.temperature, 0.2);
    EXPECT_FALSE(cfg.auto_tokens);
    EXPECT_TRUE(cfg.once);
    EXPECT_EQ(cfg.llm.provider, "stub");
    EXPECT_EQ(cfg.llm.stub_file, "reply.txt");

    EXPECT_FALSE(apply_args(cfg, {"--wat"}, &err));
    EXPECT_EQ(err, "unknown option: --wat");
    EXPECT_FALSE(apply_args(cfg, {"-l"}, &err));
    EXPECT_EQ(err, "missing value for -l");
}

TEST(Config, ExchangeOptionsCarrySettings) {
    AppConfig cfg;
    cfg.level = 1; cfg.temperature = 0.3; cfg.auto_files = false; cfg.api_timeout = 30;
    auto o = exchange_options(cfg, "/tmp/proj");
    EXPECT_EQ(o.root, std::filesystem::path("/tmp/proj"));
    EXPECT_EQ(o.defaults.level, 1);
    EXPECT_DOUBLE_EQ(o.defaults.temperature, 0.3);
    EXPECT_TRUE(o.auto_increase_tokens);
    EXPECT_FALSE(o.auto_file_request);
    EXPECT_EQ(o.timeout_seconds, 30);
}
