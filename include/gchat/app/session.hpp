/*
 * GChat Session
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   One processing cycle over the chat file: read the document once, run the
 *   exchange orchestrator if a User prompt is pending, write the reconciled
 *   document once and report the result through a Notifier.
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <gchat/ai/llm.hpp>
#include <gchat/exchange/orchestrator.hpp>

namespace gchat {

struct Notification {
    bool success = false;
    std::string message;
};

class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const Notification& n) = 0;
};

// Prints to the console; optional terminal bell (one ring on success, two on failure).
class ConsoleNotifier : public Notifier {
public:
    explicit ConsoleNotifier(bool bell) : m_bell(bell) {}
    void notify(const Notification& n) override;
private:
    bool m_bell;
};

enum class CycleStatus { Idle, Initialized, Committed, Failed };

struct CycleResult {
    CycleStatus status = CycleStatus::Idle;
    std::string document;        // document text after the cycle
    ExchangeOutcome outcome;
};

class ChatSession {
public:
    ChatSession(std::filesystem::path chat_file, ai::ChatClient& client, ExchangeOptions opts, Notifier& notifier);

    // Creates the chat file with an empty USER PROMPT: section. Returns true if it was created.
    bool ensure_chat_file(std::string* err = nullptr);

    // Pure cycle over document text; never touches the filesystem besides placeholder reads.
    CycleResult process_text(const std::string& text);

    // Reads the chat file, runs process_text and writes the result once.
    CycleResult process_file();

    // Modification time after our last write; the watcher ignores it.
    std::optional<std::filesystem::file_time_type> last_write_time() const { return m_last_write; }

    const std::filesystem::path& chat_file() const { return m_chat_file; }

private:
    bool write_document(const std::string& text, std::string* err);

    std::filesystem::path m_chat_file;
    ai::ChatClient& m_client;
    ExchangeOptions m_opts;
    Notifier& m_notifier;
    std::optional<std::filesystem::file_time_type> m_last_write;
};

} // namespace gchat
