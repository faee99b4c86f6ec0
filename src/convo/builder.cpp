#include <gchat/convo/builder.hpp>
#include <cctype>

namespace gchat {

std::string trim(const std::string& s) {
    size_t a = 0; while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b = s.size(); while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

Conversation build_conversation(const std::vector<doc::Turn>& turns, const ExpandOptions& opts,
                                const GenerationDefaults& defaults) {
    Conversation conv;
    Overrides effective;
    for (std::size_t i = 0; i < turns.size(); ++i) {
        const auto& turn = turns[i];
        const bool trailing = (i + 1 == turns.size());
        std::string text;
        if (turn.role == doc::Role::User) {
            auto r = expand_placeholders(turn.raw_body, opts);
            if (r.overrides.level) effective.level = r.overrides.level;
            if (r.overrides.temperature) effective.temperature = r.overrides.temperature;
            for (auto& w : r.warnings) conv.warnings.push_back("turn " + std::to_string(turn.ordinal + 1) + ": " + w);
            text = trim(r.text);
        } else {
            text = trim(turn.raw_body);
        }
        // Blank turns are not sent; the pending prompt always is.
        bool pending = trailing && turn.role == doc::Role::User;
        if (text.empty() && !pending) continue;
        if (pending) conv.trailing_user = conv.messages.size();
        conv.messages.push_back(ai::ChatMessage{doc::role_name(turn.role), text});
    }
    conv.level = effective.level.value_or(defaults.level);
    conv.temperature = effective.temperature.value_or(defaults.temperature);
    return conv;
}

} // namespace gchat
