#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gchat::ai {

struct ChatMessage {
    std::string role;     // system | user | assistant
    std::string content;
};

struct LLMConfig {
    std::string provider = "xai";    // xai, openai, stub
    std::string model;               // model id (provider default when empty)
    std::string endpoint;            // HTTP endpoint (provider default when empty)
    std::string api_key_env;         // env var containing key
    std::string api_key;             // direct key (less secure; prefer env)
    std::string stub_file;           // local file with a canned response (for offline)
};

struct ChatRequest {
    std::vector<ChatMessage> messages;
    int max_tokens = 4096;
    double temperature = 1.0;
    int timeout_seconds = 600;       // network timeout
};

// Response from a chat completion. Transport failures carry source == "error"
// and a parenthesized reason in text, e.g. "(xai error code=401 msg=...)".
struct LLMCompletion {
    std::string text;                // raw model text
    std::string source;              // xai|openai|stub_file|stub_echo|error
    bool truncated = false;          // finish_reason == "length"
    std::string finish_reason;
    int prompt_tokens = -1;          // number of tokens in prompt (if reported)
    int completion_tokens = -1;      // number of tokens in completion
    int total_tokens = -1;           // total usage (prompt+completion)

    bool failed() const { return source == "error"; }
};

class ChatClient {
public:
    virtual ~ChatClient() = default;
    virtual std::optional<LLMCompletion> complete(const ChatRequest& request) = 0;
};

// Stub implementation: if stub_file set, returns its contents; otherwise echoes the last user message.
class StubChatClient : public ChatClient {
public:
    explicit StubChatClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const ChatRequest& request) override;
private:
    LLMConfig m_cfg;
};

// OpenAI-compatible Chat Completions client (xAI, OpenAI). Requires libcurl.
class ChatCompletionsClient : public ChatClient {
public:
    explicit ChatCompletionsClient(const LLMConfig& cfg) : m_cfg(cfg) {}
    std::optional<LLMCompletion> complete(const ChatRequest& request) override;
    const LLMConfig& config() const { return m_cfg; }
private:
    LLMConfig m_cfg;
};

// Fills endpoint/model/api_key_env with the provider's defaults where empty.
LLMConfig with_provider_defaults(LLMConfig cfg);

// nullptr for an unknown provider.
std::unique_ptr<ChatClient> make_chat_client(const LLMConfig& cfg);

} // namespace gchat::ai
