/*
 * Session cycle tests - GChat
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <gchat/app/session.hpp>
#include <gchat/util/log.hpp>
#include "test_support.hpp"
#include <fstream>
#include <sstream>

using namespace gchat;
using gchat::testing::ScriptedClient;
using gchat::testing::TempDir;

namespace {

class RecordingNotifier : public Notifier {
public:
    std::vector<Notification> seen;
    void notify(const Notification& n) override { seen.push_back(n); }
};

ExchangeOptions plain_options(const TempDir& dir) {
    ExchangeOptions o;
    o.root = dir.path();
    o.auto_file_request = false;
    return o;
}

std::string slurp(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    std::ostringstream oss; oss << in.rdbuf();
    return oss.str();
}

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override { log::set_quiet(true); }
    void TearDown() override { log::set_quiet(false); }
    TempDir dir;
    ScriptedClient client;
    RecordingNotifier notifier;
};

} // namespace

TEST_F(SessionTest, CommitsResponseAndNewPrompt) {
    client.reply("Hi.");
    ChatSession s(dir.path() / "chat.md", client, plain_options(dir), notifier);
    auto r = s.process_text("USER PROMPT:\nHello\n");
    EXPECT_EQ(r.status, CycleStatus::Committed);
    EXPECT_EQ(r.document, "USER PROMPT:\nHello\n\nGROK RESPONSE:\nHi.\n\nUSER PROMPT:\n");
    ASSERT_EQ(notifier.seen.size(), 1u);
    EXPECT_TRUE(notifier.seen[0].success);
    EXPECT_EQ(notifier.seen[0].message, "Grok has thought.");
}

TEST_F(SessionTest, SingleCommitAfterRetries) {
    client.reply("first", true);
    client.reply("second", true);
    client.reply("final answer");
    ChatSession s(dir.path() / "chat.md", client, plain_options(dir), notifier);
    std::string before = "USER PROMPT:\nEarlier\n\nGROK RESPONSE:\nOld\n\nUSER PROMPT:\nNext\n";
    auto r = s.process_text(before);
    ASSERT_EQ(r.status, CycleStatus::Committed);
    EXPECT_EQ(r.outcome.attempts, 3);
    EXPECT_EQ(r.document, "USER PROMPT:\nEarlier\n\nGROK RESPONSE:\nOld\n\nUSER PROMPT:\nNext\n\nGROK RESPONSE:\nfinal answer\n\nUSER PROMPT:\n");
    EXPECT_EQ(r.document.find("first"), std::string::npos);
    EXPECT_EQ(notifier.seen.size(), 1u);
}

TEST_F(SessionTest, TruncatedNotificationMentionsLimit) {
    client.reply("cut", true);
    auto opts = plain_options(dir);
    opts.auto_increase_tokens = false;
    ChatSession s(dir.path() / "chat.md", client, opts, notifier);
    auto r = s.process_text("USER PROMPT:\nq @t:L0\n");
    ASSERT_EQ(r.status, CycleStatus::Committed);
    EXPECT_NE(r.document.find("GROK RESPONSE:\n[Warning: response truncated at max_tokens=512]\n\ncut\n"), std::string::npos);
    ASSERT_EQ(notifier.seen.size(), 1u);
    EXPECT_NE(notifier.seen[0].message.find("truncated"), std::string::npos);
}

TEST_F(SessionTest, FailureLeavesDocumentUnchanged) {
    client.fail("(env-missing:XAI_API_KEY)");
    ChatSession s(dir.path() / "chat.md", client, plain_options(dir), notifier);
    std::string text = "USER PROMPT:\nHello\n";
    auto r = s.process_text(text);
    EXPECT_EQ(r.status, CycleStatus::Failed);
    EXPECT_EQ(r.document, text);
    ASSERT_EQ(notifier.seen.size(), 1u);
    EXPECT_FALSE(notifier.seen[0].success);
    EXPECT_EQ(notifier.seen[0].message, "Grok failed to respond. (env-missing:XAI_API_KEY)");
}

TEST_F(SessionTest, BlankDocumentInitialized) {
    ChatSession s(dir.path() / "chat.md", client, plain_options(dir), notifier);
    auto r = s.process_text("  \n");
    EXPECT_EQ(r.status, CycleStatus::Initialized);
    EXPECT_EQ(r.document, "USER PROMPT:\n\n");
    EXPECT_TRUE(client.requests.empty());
}

TEST_F(SessionTest, NothingPendingIsIdle) {
    ChatSession s(dir.path() / "chat.md", client, plain_options(dir), notifier);
    auto r = s.process_text("USER PROMPT:\nq\n\nGROK RESPONSE:\na\n\nUSER PROMPT:\n\n");
    EXPECT_EQ(r.status, CycleStatus::Idle);
    EXPECT_TRUE(client.requests.empty());
    EXPECT_TRUE(notifier.seen.empty());
}

TEST_F(SessionTest, ProcessFileWritesOnce) {
    auto path = dir.write("chat.md", "USER PROMPT:\nHello\n");
    client.reply("Hi.");
    ChatSession s(path, client, plain_options(dir), notifier);
    auto r = s.process_file();
    ASSERT_EQ(r.status, CycleStatus::Committed);
    EXPECT_EQ(slurp(path), r.document);
    ASSERT_TRUE(s.last_write_time().has_value());
    EXPECT_EQ(*s.last_write_time(), std::filesystem::last_write_time(path));

    // Now nothing is pending.
    auto again = s.process_file();
    EXPECT_EQ(again.status, CycleStatus::Idle);
    EXPECT_EQ(client.requests.size(), 1u);
}

TEST_F(SessionTest, UnreadableChatFileIsNotReinitialized) {
    // A directory where the chat file should be cannot be read as text.
    auto path = dir.path() / "chat.md";
    std::filesystem::create_directories(path / "sub");
    ChatSession s(path, client, plain_options(dir), notifier);
    auto r = s.process_file();
    EXPECT_EQ(r.status, CycleStatus::Failed);
    EXPECT_TRUE(std::filesystem::is_directory(path / "sub"));
    EXPECT_FALSE(s.last_write_time().has_value());
    ASSERT_EQ(notifier.seen.size(), 1u);
    EXPECT_FALSE(notifier.seen[0].success);
    EXPECT_TRUE(client.requests.empty());
}

TEST_F(SessionTest, MissingChatFileIsInitialized) {
    auto path = dir.path() / "fresh.md";
    ChatSession s(path, client, plain_options(dir), notifier);
    auto r = s.process_file();
    EXPECT_EQ(r.status, CycleStatus::Initialized);
    EXPECT_EQ(slurp(path), "USER PROMPT:\n\n");
}

TEST_F(SessionTest, EnsureChatFileCreatesOnlyOnce) {
    auto path = dir.path() / "new.md";
    ChatSession s(path, client, plain_options(dir), notifier);
    EXPECT_TRUE(s.ensure_chat_file());
    EXPECT_EQ(slurp(path), "USER PROMPT:\n\n");
    EXPECT_FALSE(s.ensure_chat_file());
}

TEST(StubClient, EchoesLastUserMessageOrReturnsFile) {
    TempDir dir;
    ai::LLMConfig cfg; cfg.provider = "stub";
    auto client = ai::make_chat_client(cfg);
    ASSERT_TRUE(client);
    ai::ChatRequest req;
    req.messages = {{"system", "hint"}, {"user", "ping"}};
    auto c = client->complete(req);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->text, "ping");
    EXPECT_EQ(c->source, "stub_echo");

    cfg.stub_file = dir.write("reply.txt", "canned").string();
    c = ai::make_chat_client(cfg)->complete(req);
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->text, "canned");

    cfg.provider = "acme";
    EXPECT_FALSE(ai::make_chat_client(cfg));
}

TEST(ProviderDefaults, XaiAndOpenAi) {
    ai::LLMConfig cfg;
    auto x = ai::with_provider_defaults(cfg);
    EXPECT_EQ(x.endpoint, "https://api.x.ai/v1/chat/completions");
    EXPECT_EQ(x.model, "grok-4-0709");
    EXPECT_EQ(x.api_key_env, "XAI_API_KEY");
    cfg.provider = "openai"; cfg.model = "custom";
    auto o = ai::with_provider_defaults(cfg);
    EXPECT_EQ(o.model, "custom");
    EXPECT_EQ(o.api_key_env, "OPENAI_API_KEY");
}
