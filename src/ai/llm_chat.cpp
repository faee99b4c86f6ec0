#include <gchat/ai/llm.hpp>
#include <gchat/ai/chat_json.hpp>
#include <gchat/util/log.hpp>
#include <curl/curl.h>
#include <algorithm>
#include <cstdlib>
#include <string>
#include <utility>

namespace gchat::ai {

static size_t curl_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

static LLMCompletion error_completion(std::string reason) {
    LLMCompletion c; c.text = std::move(reason); c.source = "error";
    return c;
}

std::optional<LLMCompletion> ChatCompletionsClient::complete(const ChatRequest& request) {
    const char* env_key = nullptr;
    if (!m_cfg.api_key_env.empty()) env_key = std::getenv(m_cfg.api_key_env.c_str());
    std::string key = (env_key && *env_key) ? env_key : m_cfg.api_key;
    if (key.empty()) {
        if (m_cfg.api_key_env.empty()) return error_completion("(no-key-direct)");
        const char* raw = std::getenv(m_cfg.api_key_env.c_str());
        return error_completion(raw == nullptr ? "(env-missing:" + m_cfg.api_key_env + ")"
                                               : "(env-empty:" + m_cfg.api_key_env + ")");
    }

    CURL* curl = curl_easy_init();
    if (!curl) return error_completion("(curl-init-fail)");
    std::string response;
    std::string body_str = build_chat_body(m_cfg.model, request);
    curl_easy_setopt(curl, CURLOPT_URL, m_cfg.endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(request.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    std::string auth = std::string("Authorization: Bearer ") + key;
    headers = curl_slist_append(headers, auth.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body_str.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body_str.size()));
    log::debug("POST " + m_cfg.endpoint + " model=" + m_cfg.model + " max_tokens=" + std::to_string(request.max_tokens)
               + " messages=" + std::to_string(request.messages.size()));

    auto res = curl_easy_perform(curl);
    long code = 0; curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        return error_completion("(timeout after " + std::to_string(request.timeout_seconds) + "s)");
    }
    if (res != CURLE_OK) return error_completion(std::string("(curl error: ") + curl_easy_strerror(res) + ")");

    auto parsed = parse_chat_response(response);
    if (code / 100 != 2) {
        return error_completion("(" + m_cfg.provider + " error code=" + std::to_string(code)
                                + (parsed.error_message.empty() ? "" : " msg=" + parsed.error_message) + ")");
    }
    if (!parsed.valid) {
        // No content extracted: return truncated raw body for debug
        return error_completion("(parse-empty) RAW:" + response.substr(0, std::min<size_t>(response.size(), 2048)));
    }
    LLMCompletion comp;
    comp.text = parsed.content;
    comp.source = m_cfg.provider;
    comp.finish_reason = parsed.finish_reason;
    comp.truncated = parsed.finish_reason == "length";
    comp.prompt_tokens = parsed.prompt_tokens;
    comp.completion_tokens = parsed.completion_tokens;
    comp.total_tokens = parsed.total_tokens;
    return comp;
}

} // namespace gchat::ai
