/*
 * GChat Path Resolver Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gchat/fs/path_resolver.hpp>
#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>

namespace gchat {

namespace fs = std::filesystem;

namespace {

fs::path canonical_root(const fs::path& root) {
    std::error_code ec;
    fs::path c = fs::weakly_canonical(fs::absolute(root, ec), ec);
    return ec ? root.lexically_normal() : c;
}

// Rejects absolute paths and anything that normalizes to a parent traversal.
std::optional<std::string> lexical_violation(const std::string& expr) {
    fs::path p(expr);
    if (p.is_absolute() || p.has_root_name() || p.has_root_directory()) return "absolute path not allowed";
    if (!p.empty() && *p.begin() == "..") return "parent traversal not allowed";
    fs::path norm = p.lexically_normal();
    if (!norm.empty() && *norm.begin() == "..") return "path escapes project root";
    return std::nullopt;
}

bool physically_inside(const fs::path& p, const fs::path& canon_root) {
    std::error_code ec;
    fs::path c = fs::weakly_canonical(p, ec);
    if (ec) return false;
    fs::path rel = c.lexically_relative(canon_root);
    if (rel.empty()) return false;
    return *rel.begin() != "..";
}

bool is_regular(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

bool is_dir(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

std::vector<fs::path> sorted_children(const fs::path& dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    for (auto it = fs::directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::directory_iterator(); it.increment(ec)) {
        out.push_back(it->path());
    }
    std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().generic_string() < b.filename().generic_string();
    });
    return out;
}

void walk_files(const fs::path& dir, std::vector<fs::path>& out) {
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (is_regular(it->path())) out.push_back(it->path());
    }
}

std::vector<std::string> split_segments(const fs::path& norm) {
    std::vector<std::string> segs;
    for (const auto& part : norm) {
        std::string s = part.generic_string();
        if (s.empty() || s == ".") continue;
        segs.push_back(s);
    }
    return segs;
}

// Recursive segment matcher. "**" matches zero or more directories.
void glob_walk(const fs::path& cur, const std::vector<std::string>& segs,
               const std::vector<std::optional<std::regex>>& rx, std::size_t idx,
               std::vector<fs::path>& out) {
    if (idx == segs.size()) {
        if (is_regular(cur)) out.push_back(cur);
        return;
    }
    if (!is_dir(cur)) return;
    const std::string& seg = segs[idx];
    if (seg == "**") {
        glob_walk(cur, segs, rx, idx + 1, out);
        for (const auto& child : sorted_children(cur)) {
            std::error_code ec;
            if (fs::is_symlink(child, ec)) {
                if (is_regular(child)) glob_walk(child, segs, rx, idx, out);
                continue;
            }
            glob_walk(child, segs, rx, idx, out);
        }
        return;
    }
    if (!rx[idx]) {
        glob_walk(cur / seg, segs, rx, idx + 1, out);
        return;
    }
    for (const auto& child : sorted_children(cur)) {
        if (std::regex_match(child.filename().string(), *rx[idx])) glob_walk(child, segs, rx, idx + 1, out);
    }
}

PathResolution fail(PathError e, std::string msg) {
    PathResolution r;
    r.error = e;
    r.message = std::move(msg);
    return r;
}

void render_dir(const fs::path& dir, const fs::path& canon_root, int depth, std::ostringstream& os) {
    for (const auto& child : sorted_children(dir)) {
        if (!physically_inside(child, canon_root)) continue;
        std::error_code ec;
        bool link = fs::is_symlink(child, ec);
        bool sub = is_dir(child);
        os << std::string(static_cast<std::size_t>(depth) * 2, ' ') << child.filename().string() << (sub ? "/" : "") << "\n";
        if (sub && !link) render_dir(child, canon_root, depth + 1, os);
    }
}

} // namespace

bool has_glob_chars(const std::string& s) {
    return s.find_first_of("*?[") != std::string::npos; // '[' start of char class
}

std::string glob_to_regex(const std::string& pat) {
    std::string rx; rx.reserve(pat.size() * 2);
    rx += '^';
    bool in_class = false;
    for (std::size_t i = 0; i < pat.size(); ++i) {
        char c = pat[i];
        if (in_class) {
            if (c == ']') in_class = false;
            if (c == '\\') rx.push_back('\\');
            rx.push_back(c);
            continue;
        }
        switch (c) {
            case '*': rx += ".*"; break;
            case '?': rx += '.'; break;
            case '[':
                in_class = true; rx.push_back('[');
                if (i + 1 < pat.size() && pat[i + 1] == '!') { rx.push_back('^'); ++i; }
                break;
            case '.': case '(': case ')': case '+': case '{': case '}': case '^': case '$': case '|': case '\\': case ']':
                rx.push_back('\\'); rx.push_back(c); break;
            default: rx.push_back(c); break;
        }
    }
    rx += '$';
    return rx;
}

std::string relative_display(const fs::path& p, const fs::path& root) {
    fs::path rel = p.lexically_normal().lexically_relative(root.lexically_normal());
    if (rel.empty()) rel = p;
    std::string s = rel.generic_string();
    return s.empty() ? "." : s;
}

PathResolution resolve(const std::string& expr, const fs::path& root, Containment policy) {
    if (expr.empty()) return fail(PathError::BadPattern, "empty path expression");
    if (auto why = lexical_violation(expr)) return fail(PathError::OutsideRoot, *why + ": " + expr);

    const fs::path base = root.lexically_normal();
    const fs::path canon = canonical_root(root);
    const fs::path norm = fs::path(expr).lexically_normal();
    std::vector<fs::path> candidates;

    if (has_glob_chars(expr)) {
        auto segs = split_segments(norm);
        std::vector<std::optional<std::regex>> rx;
        try {
            for (const auto& s : segs) {
                if (s != "**" && has_glob_chars(s)) rx.emplace_back(std::regex(glob_to_regex(s)));
                else rx.emplace_back(std::nullopt);
            }
        } catch (const std::regex_error&) {
            return fail(PathError::BadPattern, "invalid glob pattern: " + expr);
        }
        glob_walk(base, segs, rx, 0, candidates);
        if (candidates.empty()) return fail(PathError::NotFound, "no files matched the glob pattern: " + expr);
    } else {
        fs::path p = (base / norm).lexically_normal();
        std::error_code ec;
        if (!fs::exists(p, ec)) return fail(PathError::NotFound, "file not found: " + expr);
        if (is_dir(p)) {
            if (!physically_inside(p, canon)) {
                return fail(PathError::OutsideRoot, "path escapes project root: " + expr);
            }
            walk_files(p, candidates);
            if (candidates.empty()) return fail(PathError::NotFound, "no files found in directory: " + expr);
        } else if (is_regular(p)) {
            candidates.push_back(p);
        } else {
            return fail(PathError::NotFound, "not a regular file: " + expr);
        }
    }

    PathResolution out;
    for (auto& c : candidates) {
        if (physically_inside(c, canon)) { out.paths.push_back(c.lexically_normal()); continue; }
        std::string shown = relative_display(c, base);
        if (policy == Containment::Strict) return fail(PathError::OutsideRoot, "path escapes project root: " + shown);
        out.dropped.push_back(shown);
    }
    if (out.paths.empty()) {
        out.error = out.dropped.empty() ? PathError::NotFound : PathError::OutsideRoot;
        out.message = "no usable files for: " + expr;
        return out;
    }
    std::sort(out.paths.begin(), out.paths.end(), [&](const fs::path& a, const fs::path& b) {
        return relative_display(a, base) < relative_display(b, base);
    });
    out.paths.erase(std::unique(out.paths.begin(), out.paths.end()), out.paths.end());
    return out;
}

TreeListing render_tree(const std::string& expr, const fs::path& root) {
    TreeListing t;
    auto fail_tree = [&](PathError e, std::string msg) { t.error = e; t.message = std::move(msg); return t; };
    if (expr.empty()) return fail_tree(PathError::BadPattern, "empty path expression");
    if (has_glob_chars(expr)) return fail_tree(PathError::BadPattern, "glob patterns are not supported for directory trees: " + expr);
    if (auto why = lexical_violation(expr)) return fail_tree(PathError::OutsideRoot, *why + ": " + expr);

    const fs::path base = root.lexically_normal();
    const fs::path canon = canonical_root(root);
    fs::path dir = (base / fs::path(expr).lexically_normal()).lexically_normal();
    std::error_code ec;
    if (!fs::exists(dir, ec)) return fail_tree(PathError::NotFound, "directory not found: " + expr);
    if (!is_dir(dir)) return fail_tree(PathError::NotADirectory, "path is not a directory: " + expr);
    if (!physically_inside(dir, canon)) return fail_tree(PathError::OutsideRoot, "path escapes project root: " + expr);

    std::ostringstream body;
    render_dir(dir, canon, 0, body);
    std::string listing = body.str();
    t.text = "Contents of directory " + relative_display(dir, base) + ":\n```\n"
           + (listing.empty() ? std::string("(empty directory)\n") : listing) + "```\n";
    return t;
}

// Well-formed UTF-8: no overlongs, surrogates or code points past U+10FFFF.
static bool is_utf8(const std::string& s) {
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) { ++i; continue; }
        int extra = 0;
        unsigned long cp = 0;
        if (c >= 0xC2 && c <= 0xDF) { extra = 1; cp = c & 0x1F; }
        else if (c >= 0xE0 && c <= 0xEF) { extra = 2; cp = c & 0x0F; }
        else if (c >= 0xF0 && c <= 0xF4) { extra = 3; cp = c & 0x07; }
        else return false;
        if (i + extra >= n) return false;
        for (int k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((extra == 2 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) ||
            (extra == 3 && (cp < 0x10000 || cp > 0x10FFFF))) return false;
        i += extra + 1;
    }
    return true;
}

std::optional<std::string> read_text_file(const fs::path& p, std::size_t max_bytes, std::string* why) {
    std::error_code ec;
    auto size = fs::file_size(p, ec);
    if (ec) { if (why) *why = "cannot stat file: " + ec.message(); return std::nullopt; }
    if (max_bytes > 0 && size > max_bytes) {
        if (why) *why = "file too large (" + std::to_string(size) + " bytes, limit " + std::to_string(max_bytes) + ")";
        return std::nullopt;
    }
    std::ifstream in(p, std::ios::binary);
    if (!in) { if (why) *why = "cannot open file"; return std::nullopt; }
    std::ostringstream oss; oss << in.rdbuf();
    if (in.bad()) { if (why) *why = "read error"; return std::nullopt; }
    std::string data = oss.str();
    if (!is_utf8(data)) { if (why) *why = "not a UTF-8 text file"; return std::nullopt; }
    return data;
}

const char* path_error_name(PathError e) {
    switch (e) {
        case PathError::None: return "none";
        case PathError::NotFound: return "not-found";
        case PathError::OutsideRoot: return "outside-root";
        case PathError::BadPattern: return "bad-pattern";
        case PathError::NotADirectory: return "not-a-directory";
        case PathError::Unreadable: return "unreadable";
    }
    return "unknown";
}

} // namespace gchat
