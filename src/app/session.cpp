/*
 * GChat Session Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gchat/app/session.hpp>
#include <gchat/doc/document.hpp>
#include <gchat/util/log.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

namespace gchat {

namespace fs = std::filesystem;

void ConsoleNotifier::notify(const Notification& n) {
    if (n.success) std::cout << n.message << "\n";
    else std::cerr << n.message << "\n";
    if (m_bell) {
        std::cout << (n.success ? "\a" : "\a\a");
        std::cout.flush();
    }
}

ChatSession::ChatSession(fs::path chat_file, ai::ChatClient& client, ExchangeOptions opts, Notifier& notifier)
    : m_chat_file(std::move(chat_file)), m_client(client), m_opts(std::move(opts)), m_notifier(notifier) {}

bool ChatSession::write_document(const std::string& text, std::string* err) {
    std::ofstream out(m_chat_file, std::ios::binary | std::ios::trunc);
    if (!out) { if (err) *err = "cannot open " + m_chat_file.string() + " for writing"; return false; }
    out << text;
    out.close();
    if (!out) { if (err) *err = "write failed: " + m_chat_file.string(); return false; }
    std::error_code ec;
    auto t = fs::last_write_time(m_chat_file, ec);
    if (!ec) m_last_write = t;
    return true;
}

bool ChatSession::ensure_chat_file(std::string* err) {
    std::error_code ec;
    if (fs::exists(m_chat_file, ec)) return false;
    return write_document(doc::initial_document(), err);
}

CycleResult ChatSession::process_text(const std::string& text) {
    CycleResult result;
    result.document = text;
    if (doc::is_blank(text)) {
        result.document = doc::initial_document();
        result.status = CycleStatus::Initialized;
        return result;
    }
    auto turns = doc::parse(text);
    if (!doc::has_pending_user_turn(turns)) {
        log::debug("No user prompt to process in chat file.");
        return result;
    }
    log::debug("Parsed " + std::to_string(turns.size()) + " turns");

    ExchangeOrchestrator orchestrator(m_client, m_opts);
    orchestrator.on_call = [](int attempt, int max_tokens) {
        if (attempt == 1) log::info("Grok is thinking...");
        log::debug("API call #" + std::to_string(attempt) + " max_tokens=" + std::to_string(max_tokens));
    };
    result.outcome = orchestrator.run(turns);
    for (const auto& w : result.outcome.warnings) log::warn(w);

    if (!result.outcome.success) {
        result.status = CycleStatus::Failed;
        m_notifier.notify({false, "Grok failed to respond. " + result.outcome.error});
        return result;
    }
    result.document = doc::commit(text, doc::TrailingRegion{result.outcome.user_body, result.outcome.response});
    result.status = CycleStatus::Committed;
    std::string msg = "Grok has thought.";
    if (result.outcome.truncated) msg += " Warning: response truncated due to max_tokens limit!";
    m_notifier.notify({true, msg});
    return result;
}

CycleResult ChatSession::process_file() {
    std::string text;
    std::error_code exists_ec;
    if (fs::exists(m_chat_file, exists_ec)) {
        // An unreadable file must never be mistaken for an empty one.
        std::error_code type_ec;
        const bool regular = fs::is_regular_file(m_chat_file, type_ec);
        std::ifstream in;
        std::ostringstream oss;
        if (regular) in.open(m_chat_file, std::ios::binary);
        if (regular && in) oss << in.rdbuf();
        if (!regular || !in || in.bad()) {
            std::string err = regular ? "cannot read " + m_chat_file.string()
                                      : m_chat_file.string() + " is not a regular file";
            log::error(err);
            m_notifier.notify({false, "Could not read chat file: " + err});
            CycleResult failed;
            failed.status = CycleStatus::Failed;
            return failed;
        }
        text = oss.str();
    }
    std::error_code read_ec;
    auto read_time = fs::last_write_time(m_chat_file, read_ec);

    CycleResult result = process_text(text);
    if (result.status != CycleStatus::Committed && result.status != CycleStatus::Initialized) return result;

    std::error_code now_ec;
    auto now = fs::last_write_time(m_chat_file, now_ec);
    if (!read_ec && !now_ec && now != read_time) log::warn("chat file changed during the request; edits made meanwhile are replaced");
    std::string err;
    if (!write_document(result.document, &err)) {
        log::error(err);
        result.status = CycleStatus::Failed;
        m_notifier.notify({false, "Could not update chat file: " + err});
    }
    return result;
}

} // namespace gchat
