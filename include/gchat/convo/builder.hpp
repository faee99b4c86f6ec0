/*
 * GChat Conversation Builder
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Turns the parsed document into the message list sent to the API. Only User
 *   turns are expanded. Overrides resolve globally: the last @t / @p found in any
 *   User turn wins, otherwise the configured defaults apply.
 */
#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <gchat/ai/llm.hpp>
#include <gchat/doc/document.hpp>
#include <gchat/expand/placeholder.hpp>

namespace gchat {

struct GenerationDefaults {
    int level = 3;
    double temperature = 1.0;
};

struct Conversation {
    std::vector<ai::ChatMessage> messages;
    int level = 0;
    double temperature = 1.0;
    std::vector<std::string> warnings;
    std::optional<std::size_t> trailing_user; // index in messages of the last turn, if it is a User turn
};

Conversation build_conversation(const std::vector<doc::Turn>& turns, const ExpandOptions& opts,
                                const GenerationDefaults& defaults);

std::string trim(const std::string& s);

} // namespace gchat
