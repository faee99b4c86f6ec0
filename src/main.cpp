// GChat main: watches the chat document and answers pending prompts.
#include <gchat/ai/llm.hpp>
#include <gchat/app/session.hpp>
#include <gchat/config/config.hpp>
#include <gchat/doc/document.hpp>
#include <gchat/expand/placeholder.hpp>
#include <gchat/util/log.hpp>

#include <curl/curl.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
namespace fs = std::filesystem;

static volatile sig_atomic_t g_interrupted = 0;
static void sigint_handler(int) { g_interrupted = 1; }

static std::string getenv_or(const char* k, const std::string& def = "") { const char* v = std::getenv(k); return v ? std::string(v) : def; }

static void load_rc_files(gchat::AppConfig& cfg) {
    std::vector<std::string> warnings;
    std::string home = getenv_or("HOME");
    if (!home.empty() && gchat::load_config_file(cfg, fs::path(home) / ".gchatrc", &warnings)) {
        for (auto& w : warnings) std::cerr << "~/.gchatrc: " << w << "\n";
    }
    warnings.clear();
    if (gchat::load_config_file(cfg, ".gchatrc", &warnings)) {
        for (auto& w : warnings) std::cerr << ".gchatrc: " << w << "\n";
    }
}

static void print_settings(const gchat::AppConfig& cfg, const gchat::ai::LLMConfig& llm, const fs::path& root) {
    std::cout << "Running with settings:\n";
    std::cout << "  Chat file: " << cfg.chat_file << "\n";
    std::cout << "  Project root: " << root.string() << "\n";
    std::cout << "  Provider: " << llm.provider;
    if (!llm.model.empty()) std::cout << " | model=" << llm.model;
    std::cout << "\n";
    std::cout << "  Max tokens: " << gchat::level_to_tokens(cfg.level) << " (L" << cfg.level << ")"
              << (cfg.auto_tokens ? ", auto-increase on truncation" : "") << "\n";
    std::cout << "  Temperature: " << std::fixed << std::setprecision(2) << cfg.temperature << "\n";
    std::cout << "  File requests: " << (cfg.auto_files ? "enabled" : "disabled") << "\n";
    std::cout << "  API timeout: " << cfg.api_timeout << " seconds\n";
}

static std::optional<fs::file_time_type> mtime(const fs::path& p) {
    std::error_code ec;
    auto t = fs::last_write_time(p, ec);
    if (ec) return std::nullopt;
    return t;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, sigint_handler);
    gchat::AppConfig cfg;
    load_rc_files(cfg);
    std::string err;
    if (!gchat::apply_args(cfg, std::vector<std::string>(argv + 1, argv + argc), &err)) {
        std::cerr << "gchat: " << err << "\n" << gchat::usage();
        return 2;
    }
    if (cfg.show_help) { std::cout << gchat::usage(); return 0; }
    gchat::log::set_debug(cfg.debug);

    std::error_code ec;
    fs::path root = cfg.root.empty() ? fs::current_path(ec) : fs::path(cfg.root);
    root = fs::weakly_canonical(fs::absolute(root, ec), ec);
    if (ec || !fs::is_directory(root)) {
        std::cerr << "gchat: project root is not a directory: " << (cfg.root.empty() ? "." : cfg.root) << "\n";
        return 2;
    }

    gchat::ai::LLMConfig llm = gchat::ai::with_provider_defaults(cfg.llm);
    auto client = gchat::ai::make_chat_client(llm);
    if (!client) { std::cerr << "gchat: unknown provider '" << llm.provider << "'\n"; return 2; }
    curl_global_init(CURL_GLOBAL_DEFAULT);

    gchat::ConsoleNotifier notifier(cfg.bell);
    gchat::ChatSession session(cfg.chat_file, *client, gchat::exchange_options(cfg, root), notifier);
    if (session.ensure_chat_file(&err)) {
        std::cout << "Created chat file at " << cfg.chat_file << ". Start your conversation by adding:\n"
                  << gchat::doc::kUserMarker << "\nYour prompt here\n\n";
    } else if (!err.empty()) {
        std::cerr << "gchat: " << err << "\n";
        curl_global_cleanup();
        return 1;
    }
    print_settings(cfg, llm, root);

    auto first = session.process_file();
    if (cfg.once) {
        curl_global_cleanup();
        return first.status == gchat::CycleStatus::Failed ? 1 : 0;
    }

    std::cout << "Watching " << cfg.chat_file << " for changes. Press Ctrl-C to quit.\n";
    auto seen = mtime(session.chat_file());
    const auto interval = std::chrono::milliseconds(cfg.poll_ms);
    while (!g_interrupted) {
        std::this_thread::sleep_for(interval);
        auto now = mtime(session.chat_file());
        if (!now || now == seen) continue;
        // Debounce: wait for the editor to finish writing.
        std::this_thread::sleep_for(interval);
        if (g_interrupted) break;
        now = mtime(session.chat_file());
        if (now && now == session.last_write_time()) { seen = now; continue; }
        gchat::log::debug("chat file changed");
        session.process_file();
        seen = mtime(session.chat_file());
    }
    std::cout << "\nStopped.\n";
    curl_global_cleanup();
    return 0;
}
