/*
 * GChat Placeholder Expansion Interface
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Recognizes the placeholders a user can embed in a prompt:
 *     @f:<path-expr>   inline file contents (literal, glob or directory)
 *     @d:<path-expr>   inline a directory tree
 *     @t:L<n>          max-tokens level override (512 * 2^n tokens)
 *     @p:<float>       temperature override
 *   A single optional space is allowed between the tag and the colon. The
 *   argument is the run of non-whitespace characters after the colon.
 *   Failed placeholders stay in the text verbatim and produce a warning.
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gchat {

inline constexpr int kMaxTokenLevel = 5;

// 512 * 2^level, level clamped to 0..5.
int level_to_tokens(int level);
// Largest level whose budget does not exceed tokens (0 for anything smaller).
int tokens_to_level(int tokens);

struct FileInclude { std::string path_expr; };
struct DirTree { std::string path_expr; };
struct TokenLevel { int level = 0; bool clamped = false; };
struct Temperature { double value = 0.0; };
struct Malformed { std::string reason; };

using PlaceholderKind = std::variant<FileInclude, DirTree, TokenLevel, Temperature, Malformed>;

struct Placeholder {
    std::size_t begin = 0;
    std::size_t end = 0;   // one past the last character
    std::string text;      // verbatim source text
    PlaceholderKind kind;
};

struct Overrides {
    std::optional<int> level;
    std::optional<double> temperature;
};

struct ExpansionResult {
    std::string text;
    Overrides overrides;
    std::vector<std::string> warnings;
};

struct ExpandOptions {
    std::filesystem::path root;
    std::size_t max_file_bytes = 1024 * 1024;
};

// One deterministic pass, placeholders in reading order.
std::vector<Placeholder> scan_placeholders(const std::string& text);

ExpansionResult expand_placeholders(const std::string& text, const ExpandOptions& opts);

// "Contents of <label>:\n```\n<content>\n```\n"
std::string format_file_block(const std::string& label, const std::string& content);

} // namespace gchat
