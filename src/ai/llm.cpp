#include <gchat/ai/llm.hpp>
#include <fstream>
#include <sstream>

namespace gchat::ai {

std::optional<LLMCompletion> StubChatClient::complete(const ChatRequest& request) {
    // 1. If stub_file configured and readable: return its contents
    if (!m_cfg.stub_file.empty()) {
        std::ifstream in(m_cfg.stub_file);
        if (in) {
            std::ostringstream oss; oss << in.rdbuf();
            std::string data = oss.str();
            if (!data.empty()) {
                LLMCompletion c; c.text = data; c.source = "stub_file"; c.finish_reason = "stop";
                return c;
            }
        }
    }
    // 2. Fallback: echo the last user message
    LLMCompletion c; c.source = "stub_echo"; c.finish_reason = "stop";
    for (auto it = request.messages.rbegin(); it != request.messages.rend(); ++it) {
        if (it->role == "user") { c.text = it->content; break; }
    }
    return c;
}

LLMConfig with_provider_defaults(LLMConfig cfg) {
    if (cfg.provider == "xai") {
        if (cfg.endpoint.empty()) cfg.endpoint = "https://api.x.ai/v1/chat/completions";
        if (cfg.model.empty()) cfg.model = "grok-4-0709";
        if (cfg.api_key_env.empty()) cfg.api_key_env = "XAI_API_KEY";
    } else if (cfg.provider == "openai") {
        if (cfg.endpoint.empty()) cfg.endpoint = "https://api.openai.com/v1/chat/completions";
        if (cfg.model.empty()) cfg.model = "gpt-4o-mini";
        if (cfg.api_key_env.empty()) cfg.api_key_env = "OPENAI_API_KEY";
    }
    return cfg;
}

std::unique_ptr<ChatClient> make_chat_client(const LLMConfig& cfg) {
    if (cfg.provider == "xai" || cfg.provider == "openai") {
        return std::make_unique<ChatCompletionsClient>(with_provider_defaults(cfg));
    }
    if (cfg.provider == "stub") return std::make_unique<StubChatClient>(cfg);
    return nullptr;
}

} // namespace gchat::ai
