/*
 * GChat Configuration Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gchat/config/config.hpp>
#include <gchat/expand/placeholder.hpp>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace gchat {

namespace {

std::string trim_ws(const std::string& s) {
    size_t a = 0; while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b = s.size(); while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

bool parse_bool(const std::string& v, bool& out) {
    if (v == "1" || v == "true" || v == "on" || v == "yes") { out = true; return true; }
    if (v == "0" || v == "false" || v == "off" || v == "no") { out = false; return true; }
    return false;
}

bool parse_long(const std::string& v, long lo, long hi, long& out) {
    if (v.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long n = std::strtol(v.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || n < lo || n > hi) return false;
    out = n;
    return true;
}

bool parse_double(const std::string& v, double lo, double hi, double& out) {
    if (v.empty()) return false;
    char* end = nullptr;
    double d = std::strtod(v.c_str(), &end);
    if (*end != '\0' || !std::isfinite(d) || d < lo || d > hi) return false;
    out = d;
    return true;
}

bool invalid(std::string* err, const std::string& key, const std::string& val) {
    if (err) *err = "invalid value for " + key + ": '" + val + "'";
    return false;
}

} // namespace

bool apply_config_value(AppConfig& cfg, const std::string& key, const std::string& val, std::string* err) {
    long n = 0;
    double d = 0.0;
    if (key == "chat_file") cfg.chat_file = val;
    else if (key == "root") cfg.root = val;
    else if (key == "level") { if (!parse_long(val, 0, kMaxTokenLevel, n)) return invalid(err, key, val); cfg.level = static_cast<int>(n); }
    else if (key == "max_tokens") { if (!parse_long(val, 1, 1L << 30, n)) return invalid(err, key, val); cfg.level = tokens_to_level(static_cast<int>(n)); }
    else if (key == "temperature") { if (!parse_double(val, 0.0, 2.0, d)) return invalid(err, key, val); cfg.temperature = d; }
    else if (key == "auto_tokens") { if (!parse_bool(val, cfg.auto_tokens)) return invalid(err, key, val); }
    else if (key == "auto_files") { if (!parse_bool(val, cfg.auto_files)) return invalid(err, key, val); }
    else if (key == "api_timeout") { if (!parse_long(val, 1, 86400, n)) return invalid(err, key, val); cfg.api_timeout = static_cast<int>(n); }
    else if (key == "provider") {
        if (val != "xai" && val != "openai" && val != "stub") return invalid(err, key, val);
        cfg.llm.provider = val;
    }
    else if (key == "model") cfg.llm.model = val;
    else if (key == "endpoint") cfg.llm.endpoint = val;
    else if (key == "api_key_env") cfg.llm.api_key_env = val;
    else if (key == "api_key") cfg.llm.api_key = val;
    else if (key == "stub_file") cfg.llm.stub_file = val;
    else if (key == "bell") { if (!parse_bool(val, cfg.bell)) return invalid(err, key, val); }
    else if (key == "debug") { if (!parse_bool(val, cfg.debug)) return invalid(err, key, val); }
    else if (key == "poll_ms") { if (!parse_long(val, 50, 60000, n)) return invalid(err, key, val); cfg.poll_ms = static_cast<int>(n); }
    else if (key == "max_file_bytes") { if (!parse_long(val, 1, 1L << 30, n)) return invalid(err, key, val); cfg.max_file_bytes = static_cast<std::size_t>(n); }
    else {
        if (err) *err = "unknown setting: " + key;
        return false;
    }
    return true;
}

void load_config_stream(AppConfig& cfg, std::istream& in, std::vector<std::string>* warnings) {
    std::string line; size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim_ws(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            if (warnings) warnings->push_back("line " + std::to_string(lineno) + ": expected key=value");
            continue;
        }
        std::string err;
        if (!apply_config_value(cfg, trim_ws(line.substr(0, eq)), trim_ws(line.substr(eq + 1)), &err) && warnings) {
            warnings->push_back("line " + std::to_string(lineno) + ": " + err);
        }
    }
}

bool load_config_file(AppConfig& cfg, const std::filesystem::path& path, std::vector<std::string>* warnings) {
    std::ifstream in(path);
    if (!in) return false;
    load_config_stream(cfg, in, warnings);
    return true;
}

bool apply_args(AppConfig& cfg, const std::vector<std::string>& args, std::string* err) {
    auto value_flag = [&](const std::string& a) -> const char* {
        if (a == "-f" || a == "--chat-file") return "chat_file";
        if (a == "-t" || a == "--max-tokens") return "max_tokens";
        if (a == "-l" || a == "--level") return "level";
        if (a == "-p" || a == "--temperature") return "temperature";
        if (a == "-T" || a == "--api-timeout") return "api_timeout";
        if (a == "-r" || a == "--root") return "root";
        if (a == "--provider") return "provider";
        if (a == "--model") return "model";
        if (a == "--stub") return "stub_file";
        return nullptr;
    };
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "-h" || a == "--help") cfg.show_help = true;
        else if (a == "-d" || a == "--debug") cfg.debug = true;
        else if (a == "--once") cfg.once = true;
        else if (a == "--no-auto-tokens") cfg.auto_tokens = false;
        else if (a == "--no-auto-files") cfg.auto_files = false;
        else if (a == "--no-bell") cfg.bell = false;
        else if (const char* key = value_flag(a)) {
            if (i + 1 >= args.size()) { if (err) *err = "missing value for " + a; return false; }
            if (!apply_config_value(cfg, key, args[++i], err)) return false;
            if (a == "--stub") cfg.llm.provider = "stub";
        } else {
            if (err) *err = "unknown option: " + a;
            return false;
        }
    }
    return true;
}

std::string usage() {
    return
        "Usage: gchat [options]\n"
        "  -f, --chat-file <path>    chat document (default ./gchat.md)\n"
        "  -t, --max-tokens <n>      default max tokens (mapped to a level, default 4096)\n"
        "  -l, --level <0-5>         default max-tokens level (512 * 2^level)\n"
        "  -p, --temperature <t>     default temperature (0-2, default 1.0)\n"
        "  -T, --api-timeout <s>     API timeout in seconds (default 600)\n"
        "  -r, --root <dir>          project root for @f/@d and file requests (default cwd)\n"
        "      --provider <name>     xai | openai | stub (default xai)\n"
        "      --model <id>          model id\n"
        "      --stub <file>         use the stub provider with a canned response\n"
        "      --no-auto-tokens      do not retry truncated responses with more tokens\n"
        "      --no-auto-files       do not honor GROK REQUESTS FILES responses\n"
        "      --no-bell             disable the terminal bell\n"
        "      --once                process the chat file once and exit\n"
        "  -d, --debug               debug output\n"
        "  -h, --help                show this help\n"
        "Settings can also be placed in ~/.gchatrc or ./.gchatrc as key=value lines.\n";
}

ExchangeOptions exchange_options(const AppConfig& cfg, const std::filesystem::path& root) {
    ExchangeOptions o;
    o.root = root;
    o.defaults.level = cfg.level;
    o.defaults.temperature = cfg.temperature;
    o.auto_increase_tokens = cfg.auto_tokens;
    o.auto_file_request = cfg.auto_files;
    o.timeout_seconds = cfg.api_timeout;
    o.max_file_bytes = cfg.max_file_bytes;
    return o;
}

} // namespace gchat
