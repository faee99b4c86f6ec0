#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include "gchat/ai/llm.hpp"

namespace gchat::ai {

// Request/response JSON for the Chat Completions API (hand-written, no external lib).
std::string json_escape(const std::string& in);

std::string build_chat_body(const std::string& model, const ChatRequest& request);

struct ParsedChatResponse {
    bool valid = false;            // syntactically parsed and content found
    std::string content;           // choices[0].message.content
    std::string finish_reason;     // choices[0].finish_reason
    std::string error_message;     // error.message, if any
    int prompt_tokens = -1;
    int completion_tokens = -1;
    int total_tokens = -1;
};

ParsedChatResponse parse_chat_response(const std::string& body);

} // namespace gchat::ai
