/*
 * GChat Configuration
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   key=value settings read from ~/.gchatrc, then ./.gchatrc, then command
 *   line flags. Lines starting with '#' are comments. Booleans accept
 *   1|true|on and 0|false|off.
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <vector>
#include <gchat/ai/llm.hpp>
#include <gchat/exchange/orchestrator.hpp>

namespace gchat {

struct AppConfig {
    std::string chat_file = "./gchat.md";
    std::string root;                 // project root; empty = current directory
    int level = 3;                    // default max-tokens level (4096 tokens)
    double temperature = 1.0;         // default temperature
    bool auto_tokens = true;          // raise the level on truncation
    bool auto_files = true;           // honor GROK REQUESTS FILES responses
    int api_timeout = 600;            // seconds
    ai::LLMConfig llm;
    bool bell = true;                 // terminal bell on completion
    bool debug = false;
    int poll_ms = 500;                // watch interval and debounce
    std::size_t max_file_bytes = 1024 * 1024;
    bool once = false;                // process a single cycle and exit
    bool show_help = false;
};

// Applies one setting; false (and err) for an unknown key or invalid value.
bool apply_config_value(AppConfig& cfg, const std::string& key, const std::string& val, std::string* err = nullptr);

// Invalid lines are reported in warnings and skipped.
void load_config_stream(AppConfig& cfg, std::istream& in, std::vector<std::string>* warnings = nullptr);

// False if the file does not exist.
bool load_config_file(AppConfig& cfg, const std::filesystem::path& path, std::vector<std::string>* warnings = nullptr);

// Command line flags (argv without the program name).
bool apply_args(AppConfig& cfg, const std::vector<std::string>& args, std::string* err = nullptr);

std::string usage();

ExchangeOptions exchange_options(const AppConfig& cfg, const std::filesystem::path& root);

} // namespace gchat
