/*
 * GChat Exchange Orchestrator Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gchat/exchange/orchestrator.hpp>
#include <gchat/expand/placeholder.hpp>
#include <gchat/fs/path_resolver.hpp>
#include <gchat/util/log.hpp>
#include <cctype>
#include <utility>

namespace gchat {

namespace {

const char* kFileRequestHint =
    "You are assisting with a software project stored on the user's machine. "
    "If answering requires project files that were not provided, reply with exactly one line of the form\n"
    "GROK REQUESTS FILES: path/one, path/two\n"
    "using paths relative to the project root and nothing else. The files will then be supplied.";

bool has_space(const std::string& s) {
    for (char c : s) if (std::isspace(static_cast<unsigned char>(c))) return true;
    return false;
}

} // namespace

std::optional<std::vector<std::string>> parse_file_request(const std::string& response) {
    std::string body = trim(response);
    const std::string prefix = kFileRequestPrefix;
    if (body.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    std::string list = body.substr(prefix.size());
    if (list.empty() || list.find('\n') != std::string::npos) return std::nullopt;
    std::vector<std::string> paths;
    std::size_t start = 0;
    while (true) {
        std::size_t comma = list.find(',', start);
        std::string entry = trim(list.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (entry.empty()) return std::nullopt;
        paths.push_back(entry);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return paths;
}

ResponseKind classify_response(const ai::LLMCompletion& reply) {
    if (reply.truncated) return ResponseKind::Truncated;
    if (parse_file_request(reply.text)) return ResponseKind::FileRequest;
    return ResponseKind::Normal;
}

std::string truncation_warning(int max_tokens) {
    return "[Warning: response truncated at max_tokens=" + std::to_string(max_tokens) + "]";
}

ExchangeOrchestrator::ExchangeOrchestrator(ai::ChatClient& client, ExchangeOptions opts)
    : m_client(client), m_opts(std::move(opts)) {}

bool ExchangeOrchestrator::append_requested_files(ExchangeState& st, ExchangeOutcome& out) {
    std::vector<std::filesystem::path> fresh;
    for (const auto& entry : st.requested) {
        if (has_space(entry)) { log::debug("file request dropped: " + entry); continue; }
        auto res = resolve(entry, m_opts.root, Containment::DropOffending);
        for (const auto& d : res.dropped) log::debug("file request dropped (outside root): " + d);
        if (!res.ok()) { log::debug("file request dropped: " + entry + " (" + res.message + ")"); continue; }
        for (const auto& p : res.paths) {
            if (st.appended.insert(relative_display(p, m_opts.root)).second) fresh.push_back(p);
        }
    }

    // Contents come from the resolved path itself; the @f line is only a record.
    std::string blocks;
    for (const auto& p : fresh) {
        std::string rel = relative_display(p, m_opts.root);
        std::string why;
        auto content = read_text_file(p, m_opts.max_file_bytes, &why);
        if (!content) { out.warnings.push_back("requested file " + rel + ": " + why); continue; }
        if (!blocks.empty()) blocks += "\n";
        blocks += format_file_block(rel, *content);
        out.appended_files.push_back(rel);
        if (reproducible_include(rel, p)) st.appended_lines.push_back("@f:" + rel);
        else log::debug("requested file " + rel + " cannot be written back as @f:, not recorded in the prompt");
    }
    if (blocks.empty()) return false;

    if (!st.appended_text.empty()) st.appended_text += "\n";
    st.appended_text += trim(blocks);
    st.messages[st.user_index].content = trim(st.user_text + "\n\n" + st.appended_text);
    return true;
}

bool ExchangeOrchestrator::reproducible_include(const std::string& rel, const std::filesystem::path& p) const {
    if (has_space(rel)) return false;
    auto res = resolve(rel, m_opts.root, Containment::Strict);
    return res.ok() && res.paths.size() == 1 && res.paths.front().lexically_normal() == p.lexically_normal();
}

ExchangeOutcome ExchangeOrchestrator::run(const std::vector<doc::Turn>& turns) {
    ExchangeOutcome out;
    if (!doc::has_pending_user_turn(turns)) {
        out.error = "no pending user prompt";
        return out;
    }
    const std::string raw_user = turns.back().raw_body;
    ExchangeState st;
    ai::LLMCompletion reply;
    State state = State::Build;

    auto finish = [&](bool truncated) {
        out.success = true;
        out.truncated = truncated;
        out.final_level = st.level;
        out.response = truncated ? truncation_warning(level_to_tokens(st.level)) + "\n\n" + reply.text : reply.text;
        if (truncated) out.warnings.push_back(truncation_warning(level_to_tokens(st.level)));
        std::string body = trim(raw_user);
        if (!st.appended_lines.empty()) {
            body += "\n";
            for (const auto& l : st.appended_lines) body += "\n" + l;
        }
        out.user_body = body;
        state = State::Done;
    };

    while (state != State::Done) {
        switch (state) {
        case State::Build: {
            auto conv = build_conversation(turns, ExpandOptions{m_opts.root, m_opts.max_file_bytes}, m_opts.defaults);
            out.warnings = conv.warnings;
            st.messages = std::move(conv.messages);
            st.user_index = conv.trailing_user.value_or(st.messages.size() - 1);
            if (m_opts.auto_file_request) {
                st.messages.insert(st.messages.begin(), ai::ChatMessage{"system", kFileRequestHint});
                ++st.user_index;
            }
            st.user_text = st.messages[st.user_index].content;
            st.start_level = st.level = conv.level;
            st.temperature = conv.temperature;
            state = State::Call;
            break;
        }
        case State::Call: {
            ++out.attempts;
            int max_tokens = level_to_tokens(st.level);
            if (on_call) on_call(out.attempts, max_tokens);
            ai::ChatRequest req{st.messages, max_tokens, st.temperature, m_opts.timeout_seconds};
            auto r = m_client.complete(req);
            if (!r || r->failed()) {
                out.error = r ? r->text : "(no response)";
                out.final_level = st.level;
                return out;
            }
            reply = *r;
            state = State::Inspect;
            break;
        }
        case State::Inspect:
            switch (classify_response(reply)) {
            case ResponseKind::Truncated:
                if (m_opts.auto_increase_tokens && st.level < kMaxTokenLevel) state = State::RetryTokens;
                else finish(true);
                break;
            case ResponseKind::FileRequest:
                if (!m_opts.auto_file_request) { finish(false); break; }
                st.requested = *parse_file_request(reply.text);
                state = State::RequestFiles;
                break;
            case ResponseKind::Normal:
                finish(false);
                break;
            }
            break;
        case State::RetryTokens:
            ++st.level;
            log::info("Response truncated, retrying with max_tokens=" + std::to_string(level_to_tokens(st.level)));
            state = State::Call;
            break;
        case State::RequestFiles:
            if (append_requested_files(st, out)) {
                log::info("Model requested files: " + std::to_string(out.appended_files.size()) + " appended so far");
                st.level = st.start_level;
                state = State::Call;
            } else {
                log::debug("file request names no new files; treating response as final");
                finish(false);
            }
            break;
        case State::Done:
            break;
        }
    }
    return out;
}

} // namespace gchat
