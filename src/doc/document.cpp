/*
 * GChat Document Model Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gchat/doc/document.hpp>
#include <cctype>
#include <string_view>

namespace gchat::doc {

namespace {

struct Marker {
    std::size_t line_begin;
    std::size_t body_begin;
    Role role;
};

std::string_view rstrip(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

constexpr std::string_view kBom = "\xEF\xBB\xBF";

// Length of a leading UTF-8 byte order mark; the document body starts after it.
std::size_t bom_length(const std::string& text) {
    return std::string_view(text).substr(0, kBom.size()) == kBom ? kBom.size() : 0;
}

std::vector<Marker> find_markers(const std::string& text) {
    std::vector<Marker> markers;
    std::size_t pos = bom_length(text);
    while (pos < text.size()) {
        std::size_t nl = text.find('\n', pos);
        std::size_t end = (nl == std::string::npos) ? text.size() : nl;
        std::size_t next = (nl == std::string::npos) ? text.size() : nl + 1;
        std::string_view line = rstrip(std::string_view(text).substr(pos, end - pos));
        if (line == kUserMarker) markers.push_back({pos, next, Role::User});
        else if (line == kResponseMarker) markers.push_back({pos, next, Role::Assistant});
        pos = next;
    }
    return markers;
}

std::string strip_for_commit(const std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && (s[a] == '\n' || s[a] == '\r')) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

} // namespace

bool is_blank(const std::string& s) {
    for (char c : s) if (!std::isspace(static_cast<unsigned char>(c))) return false;
    return true;
}

std::vector<Turn> parse(const std::string& text) {
    std::vector<Turn> turns;
    auto markers = find_markers(text);
    const std::size_t start = bom_length(text);
    std::size_t first = markers.empty() ? text.size() : markers.front().line_begin;
    if (first > start) {
        std::string preamble = text.substr(start, first - start);
        if (!is_blank(preamble)) turns.push_back(Turn{Role::User, preamble, 0, start, false});
    }
    for (std::size_t i = 0; i < markers.size(); ++i) {
        const auto& m = markers[i];
        std::size_t stop = (i + 1 < markers.size()) ? markers[i + 1].line_begin : text.size();
        turns.push_back(Turn{m.role, text.substr(m.body_begin, stop - m.body_begin), turns.size(), m.line_begin, true});
    }
    return turns;
}

bool has_pending_user_turn(const std::vector<Turn>& turns) {
    if (turns.empty()) return false;
    const Turn& last = turns.back();
    return last.role == Role::User && !is_blank(last.raw_body);
}

std::string commit(const std::string& text, const TrailingRegion& region) {
    auto turns = parse(text);
    std::size_t cut = text.size();
    for (auto it = turns.rbegin(); it != turns.rend(); ++it) {
        if (it->role == Role::User) { cut = it->offset; break; }
    }
    std::string out = text.substr(0, cut);
    if (out.size() > bom_length(text) && out.back() != '\n') out += '\n';
    out += kUserMarker;
    out += '\n';
    out += strip_for_commit(region.user_body);
    out += "\n\n";
    out += kResponseMarker;
    out += '\n';
    out += strip_for_commit(region.response);
    out += "\n\n";
    out += kUserMarker;
    out += '\n';
    return out;
}

std::string initial_document() {
    return std::string(kUserMarker) + "\n\n";
}

const char* role_name(Role role) {
    return role == Role::User ? "user" : "assistant";
}

} // namespace gchat::doc
