/*
 * GChat Document Model
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Splits the chat document into User / Assistant turns. A turn starts at an
 *   exact marker line ("USER PROMPT:" or "GROK RESPONSE:") and its body runs up
 *   to the next marker line or end of file. commit() is the only write path:
 *   it rewrites the region from the last User turn to EOF.
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace gchat::doc {

inline constexpr const char* kUserMarker = "USER PROMPT:";
inline constexpr const char* kResponseMarker = "GROK RESPONSE:";

enum class Role { User, Assistant };

struct Turn {
    Role role = Role::User;
    std::string raw_body;     // text between the marker line and the next marker
    std::size_t ordinal = 0;  // position in document
    std::size_t offset = 0;   // byte offset where the region starts
    bool has_marker = true;   // false only for an unmarked leading block
};

// New region written in place of the trailing User turn.
struct TrailingRegion {
    std::string user_body;
    std::string response;
};

// Never fails: text that does not fit the marker structure becomes body text
// of the nearest preceding turn (or of an unmarked leading User turn).
std::vector<Turn> parse(const std::string& text);

// True iff the last turn is a User turn with a non-blank body.
bool has_pending_user_turn(const std::vector<Turn>& turns);

std::string commit(const std::string& text, const TrailingRegion& region);

// Content of a freshly created chat file.
std::string initial_document();

// "user" / "assistant" as used by the Chat Completions API.
const char* role_name(Role role);

bool is_blank(const std::string& s);

} // namespace gchat::doc
