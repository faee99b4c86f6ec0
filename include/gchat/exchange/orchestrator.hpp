/*
 * GChat Exchange Orchestrator
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Drives one processing cycle as an explicit state machine:
 *
 *     BUILD -> CALL -> INSPECT -> DONE
 *                        |-> RETRY_TOKENS  -> CALL   (truncated, level < 5)
 *                        `-> REQUEST_FILES -> CALL   (model asked for new files)
 *
 *   The two loops have independent bounds: the token level only grows up to
 *   L5, and a file request is honored only if it names at least one file not
 *   yet appended in this cycle. Nothing is written here; the caller commits
 *   the outcome to the document exactly once.
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <gchat/ai/llm.hpp>
#include <gchat/convo/builder.hpp>
#include <gchat/doc/document.hpp>

namespace gchat {

inline constexpr const char* kFileRequestPrefix = "GROK REQUESTS FILES: ";

struct ExchangeOptions {
    std::filesystem::path root;
    GenerationDefaults defaults;
    bool auto_increase_tokens = true;
    bool auto_file_request = true;
    int timeout_seconds = 600;
    std::size_t max_file_bytes = 1024 * 1024;
};

enum class ResponseKind { Normal, Truncated, FileRequest };

struct ExchangeOutcome {
    bool success = false;
    std::string response;                    // final text (warning line prepended if truncated)
    std::string user_body;                   // trailing user body with appended @f lines
    std::string error;                       // transport failure reason
    bool truncated = false;
    int attempts = 0;
    int final_level = 0;
    std::vector<std::string> appended_files; // root-relative, in append order
    std::vector<std::string> warnings;
};

// Paths listed by an exact "GROK REQUESTS FILES: a, b" body; nullopt for anything else.
std::optional<std::vector<std::string>> parse_file_request(const std::string& response);

ResponseKind classify_response(const ai::LLMCompletion& reply);

std::string truncation_warning(int max_tokens);

class ExchangeOrchestrator {
public:
    ExchangeOrchestrator(ai::ChatClient& client, ExchangeOptions opts);

    // Requires a pending User turn (doc::has_pending_user_turn).
    ExchangeOutcome run(const std::vector<doc::Turn>& turns);

    // Invoked before every API call with the 1-based attempt number and max_tokens.
    std::function<void(int attempt, int max_tokens)> on_call;

private:
    enum class State { Build, Call, Inspect, RetryTokens, RequestFiles, Done };

    struct ExchangeState {
        std::vector<ai::ChatMessage> messages;
        std::size_t user_index = 0;
        std::string user_text;               // expanded trailing prompt before any appended files
        std::string appended_text;           // expansion of the appended @f lines
        std::vector<std::string> appended_lines;
        std::set<std::string> appended;      // novelty set for file requests
        int start_level = 0;
        int level = 0;
        double temperature = 1.0;
        std::vector<std::string> requested;
    };

    // Appends the new files of a request; false if none qualify.
    bool append_requested_files(ExchangeState& st, ExchangeOutcome& out);
    // True if "@f:<rel>" resolves back to exactly p.
    bool reproducible_include(const std::string& rel, const std::filesystem::path& p) const;

    ai::ChatClient& m_client;
    ExchangeOptions m_opts;
};

} // namespace gchat
