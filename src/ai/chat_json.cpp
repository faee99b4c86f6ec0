#include <gchat/ai/chat_json.hpp>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <locale>
#include <sstream>

namespace gchat::ai {

namespace {

constexpr std::size_t npos = std::string::npos;

std::size_t skip_ws(const std::string& s, std::size_t pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
    return pos;
}

void append_utf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) out.push_back(static_cast<char>(cp));
    else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool read_hex4(const std::string& s, std::size_t pos, unsigned long& out) {
    if (pos + 4 > s.size()) return false;
    out = 0;
    for (std::size_t i = pos; i < pos + 4; ++i) {
        char c = s[i];
        out <<= 4;
        if (c >= '0' && c <= '9') out |= static_cast<unsigned long>(c - '0');
        else if (c >= 'a' && c <= 'f') out |= static_cast<unsigned long>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F') out |= static_cast<unsigned long>(c - 'A' + 10);
        else return false;
    }
    return true;
}

// Decodes the string literal starting at pos ('"'); end receives one past the closing quote.
std::optional<std::string> read_string(const std::string& s, std::size_t pos, std::size_t* end = nullptr) {
    if (pos >= s.size() || s[pos] != '"') return std::nullopt;
    std::string out;
    for (std::size_t i = pos + 1; i < s.size(); ++i) {
        char c = s[i];
        if (c == '"') { if (end) *end = i + 1; return out; }
        if (c != '\\') { out.push_back(c); continue; }
        if (++i >= s.size()) return std::nullopt;
        switch (s[i]) {
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'u': {
                unsigned long cp = 0;
                if (!read_hex4(s, i + 1, cp)) return std::nullopt;
                i += 4;
                // surrogate pair
                if (cp >= 0xD800 && cp <= 0xDBFF && i + 6 < s.size() && s[i + 1] == '\\' && s[i + 2] == 'u') {
                    unsigned long lo = 0;
                    if (read_hex4(s, i + 3, lo) && lo >= 0xDC00 && lo <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        i += 6;
                    }
                }
                append_utf8(out, cp);
                break;
            }
            default: out.push_back(s[i]); break; // \" \\ \/
        }
    }
    return std::nullopt;
}

// Returns one past the end of the value at pos, or npos if malformed.
std::size_t skip_value(const std::string& s, std::size_t pos) {
    pos = skip_ws(s, pos);
    if (pos >= s.size()) return npos;
    char c = s[pos];
    if (c == '"') {
        std::size_t end = npos;
        return read_string(s, pos, &end) ? end : npos;
    }
    if (c == '{' || c == '[') {
        char close = (c == '{') ? '}' : ']';
        pos = skip_ws(s, pos + 1);
        if (pos < s.size() && s[pos] == close) return pos + 1;
        while (pos < s.size()) {
            if (c == '{') {
                std::size_t key_end = npos;
                if (!read_string(s, skip_ws(s, pos), &key_end)) return npos;
                pos = skip_ws(s, key_end);
                if (pos >= s.size() || s[pos] != ':') return npos;
                ++pos;
            }
            pos = skip_value(s, pos);
            if (pos == npos) return npos;
            pos = skip_ws(s, pos);
            if (pos >= s.size()) return npos;
            if (s[pos] == close) return pos + 1;
            if (s[pos] != ',') return npos;
            ++pos;
        }
        return npos;
    }
    std::size_t end = pos;
    while (end < s.size() && s[end] != ',' && s[end] != '}' && s[end] != ']' &&
           !std::isspace(static_cast<unsigned char>(s[end]))) ++end;
    return end == pos ? npos : end;
}

// Position of the value of member key in the object at obj, or npos.
std::size_t find_member(const std::string& s, std::size_t obj, const std::string& key) {
    if (obj == npos) return npos;
    obj = skip_ws(s, obj);
    if (obj >= s.size() || s[obj] != '{') return npos;
    std::size_t pos = skip_ws(s, obj + 1);
    if (pos < s.size() && s[pos] == '}') return npos;
    while (pos < s.size()) {
        std::size_t key_end = npos;
        auto name = read_string(s, skip_ws(s, pos), &key_end);
        if (!name) return npos;
        pos = skip_ws(s, key_end);
        if (pos >= s.size() || s[pos] != ':') return npos;
        std::size_t value = skip_ws(s, pos + 1);
        if (*name == key) return value;
        pos = skip_value(s, value);
        if (pos == npos) return npos;
        pos = skip_ws(s, pos);
        if (pos >= s.size() || s[pos] != ',') return npos;
        ++pos;
    }
    return npos;
}

std::size_t first_element(const std::string& s, std::size_t arr) {
    if (arr == npos || arr >= s.size() || s[arr] != '[') return npos;
    std::size_t pos = skip_ws(s, arr + 1);
    return (pos < s.size() && s[pos] != ']') ? pos : npos;
}

std::optional<std::string> string_at(const std::string& s, std::size_t pos) {
    if (pos == npos) return std::nullopt;
    return read_string(s, pos);
}

int int_at(const std::string& s, std::size_t pos) {
    if (pos == npos || pos >= s.size()) return -1;
    char* end = nullptr;
    long v = std::strtol(s.c_str() + pos, &end, 10);
    if (end == s.c_str() + pos) return -1;
    return static_cast<int>(v);
}

} // namespace

std::string json_escape(const std::string& in) {
    std::string out; out.reserve(in.size() + 32);
    for (char c : in) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c)); out += buf;
                } else out.push_back(c);
        }
    }
    return out;
}

std::string build_chat_body(const std::string& model, const ChatRequest& request) {
    std::ostringstream body;
    body.imbue(std::locale::classic());
    body << "{\"model\":\"" << json_escape(model) << "\",\"messages\":[";
    for (std::size_t i = 0; i < request.messages.size(); ++i) {
        const auto& m = request.messages[i];
        if (i) body << ",";
        body << "{\"role\":\"" << json_escape(m.role) << "\",\"content\":\"" << json_escape(m.content) << "\"}";
    }
    body << "],\"temperature\":" << request.temperature << ",\"max_tokens\":" << request.max_tokens
         << ",\"stream\":false}";
    return body.str();
}

ParsedChatResponse parse_chat_response(const std::string& body) {
    ParsedChatResponse out;
    std::size_t root = skip_ws(body, 0);
    if (root >= body.size() || body[root] != '{') return out;

    if (auto msg = string_at(body, find_member(body, find_member(body, root, "error"), "message"))) {
        out.error_message = *msg;
    }
    std::size_t usage = find_member(body, root, "usage");
    out.prompt_tokens = int_at(body, find_member(body, usage, "prompt_tokens"));
    out.completion_tokens = int_at(body, find_member(body, usage, "completion_tokens"));
    out.total_tokens = int_at(body, find_member(body, usage, "total_tokens"));

    std::size_t choice = first_element(body, find_member(body, root, "choices"));
    if (choice == npos) return out;
    if (auto reason = string_at(body, find_member(body, choice, "finish_reason"))) out.finish_reason = *reason;
    auto content = string_at(body, find_member(body, find_member(body, choice, "message"), "content"));
    if (!content) return out;
    out.content = *content;
    out.valid = true;
    return out;
}

} // namespace gchat::ai
