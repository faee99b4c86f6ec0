/*
 * GChat Placeholder Expansion Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gchat/expand/placeholder.hpp>
#include <gchat/fs/path_resolver.hpp>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <type_traits>

namespace gchat {

namespace {

bool is_tag(char c) { return c == 'f' || c == 'd' || c == 't' || c == 'p'; }

PlaceholderKind parse_level(const std::string& arg) {
    if (arg.size() < 2 || arg[0] != 'L') return Malformed{"malformed token level (expected L0-L5)"};
    int value = 0;
    for (std::size_t i = 1; i < arg.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(arg[i]))) return Malformed{"malformed token level (expected L0-L5)"};
        if (value <= kMaxTokenLevel) value = value * 10 + (arg[i] - '0');
    }
    if (value > kMaxTokenLevel) return TokenLevel{kMaxTokenLevel, true};
    return TokenLevel{value, false};
}

PlaceholderKind parse_temperature(const std::string& arg) {
    const char* begin = arg.c_str();
    char* end = nullptr;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || !std::isfinite(v)) return Malformed{"malformed temperature (expected a number)"};
    if (v < 0.0 || v > 2.0) return Malformed{"temperature out of range (expected 0-2)"};
    return Temperature{v};
}

PlaceholderKind classify(char tag, const std::string& arg) {
    if (arg.empty()) return Malformed{"missing argument"};
    switch (tag) {
        case 'f': return FileInclude{arg};
        case 'd': return DirTree{arg};
        case 't': return parse_level(arg);
        default: return parse_temperature(arg);
    }
}

// Returns the expansion for @f or nullopt with a warning.
std::optional<std::string> expand_files(const std::string& expr, const ExpandOptions& opts, std::string& why) {
    auto res = resolve(expr, opts.root, Containment::Strict);
    if (!res.ok()) { why = res.message; return std::nullopt; }
    std::string out;
    for (const auto& p : res.paths) {
        std::string read_err;
        auto content = read_text_file(p, opts.max_file_bytes, &read_err);
        std::string label = relative_display(p, opts.root);
        if (!content) { why = label + ": " + read_err; return std::nullopt; }
        if (!out.empty()) out += "\n";
        out += format_file_block(label, *content);
    }
    return out;
}

// An override is removed together with one adjacent space so no double
// space is left behind. Returns where copying of the source resumes.
std::size_t drop_separator(const std::string& text, std::size_t end, std::string& out) {
    const bool at_break = end >= text.size() || std::isspace(static_cast<unsigned char>(text[end]));
    if (!at_break) return end;
    if (!out.empty() && out.back() == ' ') { out.pop_back(); return end; }
    if ((out.empty() || out.back() == '\n') && end < text.size() && text[end] == ' ') return end + 1;
    return end;
}

} // namespace

int level_to_tokens(int level) {
    if (level < 0) level = 0;
    if (level > kMaxTokenLevel) level = kMaxTokenLevel;
    return 512 << level;
}

int tokens_to_level(int tokens) {
    int level = 0;
    while (level < kMaxTokenLevel && level_to_tokens(level + 1) <= tokens) ++level;
    return level;
}

std::string format_file_block(const std::string& label, const std::string& content) {
    std::string out = "Contents of " + label + ":\n```\n" + content;
    if (content.empty() || content.back() != '\n') out += '\n';
    out += "```\n";
    return out;
}

std::vector<Placeholder> scan_placeholders(const std::string& text) {
    std::vector<Placeholder> out;
    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        if (text[i] != '@' || i + 1 >= n || !is_tag(text[i + 1])) { ++i; continue; }
        std::size_t j = i + 2;
        if (j < n && text[j] == ' ') ++j;
        if (j >= n || text[j] != ':') { ++i; continue; }
        std::size_t arg_begin = j + 1;
        std::size_t arg_end = arg_begin;
        while (arg_end < n && !std::isspace(static_cast<unsigned char>(text[arg_end]))) ++arg_end;
        std::string arg = text.substr(arg_begin, arg_end - arg_begin);
        out.push_back(Placeholder{i, arg_end, text.substr(i, arg_end - i), classify(text[i + 1], arg)});
        i = arg_end;
    }
    return out;
}

ExpansionResult expand_placeholders(const std::string& text, const ExpandOptions& opts) {
    ExpansionResult r;
    auto placeholders = scan_placeholders(text);
    if (placeholders.empty()) { r.text = text; return r; }

    std::size_t last = 0;
    for (const auto& ph : placeholders) {
        r.text.append(text, last, ph.begin - last);
        last = ph.end;
        std::visit([&](const auto& k) {
            using K = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<K, FileInclude>) {
                std::string why;
                if (auto expanded = expand_files(k.path_expr, opts, why)) r.text += *expanded;
                else { r.warnings.push_back(ph.text + ": " + why); r.text += ph.text; }
            } else if constexpr (std::is_same_v<K, DirTree>) {
                auto tree = render_tree(k.path_expr, opts.root);
                if (tree.ok()) r.text += tree.text;
                else { r.warnings.push_back(ph.text + ": " + tree.message); r.text += ph.text; }
            } else if constexpr (std::is_same_v<K, TokenLevel>) {
                if (k.clamped) r.warnings.push_back(ph.text + ": token level clamped to L" + std::to_string(kMaxTokenLevel));
                r.overrides.level = k.level;
                last = drop_separator(text, ph.end, r.text);
            } else if constexpr (std::is_same_v<K, Temperature>) {
                r.overrides.temperature = k.value;
                last = drop_separator(text, ph.end, r.text);
            } else {
                r.warnings.push_back(ph.text + ": " + k.reason);
                r.text += ph.text;
            }
        }, ph.kind);
    }
    r.text.append(text, last, std::string::npos);
    return r;
}

} // namespace gchat
