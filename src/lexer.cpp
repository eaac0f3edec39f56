#include "rulex/lexer.hpp"

#include <algorithm>
#include <utility>

#include "rulex/RulexError.hpp"

namespace rulex {

namespace {

// Byte length of the UTF-8 sequence starting at pos, clamped to the text.
// A malformed sequence counts as a single byte.
size_t utf8_sequence_length(const std::string& text, size_t pos) {
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t expected = 1;
    if (lead >= 0xF0 && lead <= 0xF7) {
        expected = 4;
    } else if (lead >= 0xE0) {
        expected = lead <= 0xEF ? 3 : 1;
    } else if (lead >= 0xC0) {
        expected = 2;
    }

    size_t len = 1;
    while (len < expected && pos + len < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[pos + len]);
        if ((c & 0xC0) != 0x80) break;
        ++len;
    }
    return len == expected ? len : 1;
}

std::string describe_rule(const std::string& state, size_t index, const std::string& pattern) {
    return "rule " + std::to_string(index) + " /" + pattern + "/ of state \"" + state + "\"";
}

}  // anonymous namespace

RegexLexer::RegexLexer(Config config, const Rules& rules) : config_(std::move(config)) {
    if (rules.find("root") == rules.end()) {
        throw CompileError("no \"root\" state" + (config_.name.empty() ? std::string() : " in lexer " + config_.name));
    }

    const PatternFlags flags = config_.pattern_flags();
    for (const auto& [state, state_rules] : rules) {
        std::vector<CompiledRule>& compiled = rules_[state];
        compiled.reserve(state_rules.size());

        for (size_t i = 0; i < state_rules.size(); ++i) {
            const Rule& rule = state_rules[i];
            try {
                compiled.emplace_back(rule, CompiledPattern(rule.pattern, flags));
            } catch (const CompileError& e) {
                throw CompileError("invalid regex \"" + rule.pattern + "\" for state \"" + state + "\": " + e.message());
            }

            const std::string where = describe_rule(state, i, rule.pattern);
            rule.type.validate(compiled.back().regex.group_count(), where);

            std::vector<std::string> targets;
            rule.mutator.collect_targets(targets);
            for (const std::string& target : targets) {
                if (rules.find(target) == rules.end()) {
                    throw CompileError(where + " moves to unknown state \"" + target + "\"");
                }
            }
            targets.clear();
            rule.type.collect_self_states(targets);
            for (const std::string& target : targets) {
                if (rules.find(target) == rules.end()) {
                    throw CompileError(where + " delegates to unknown state \"" + target + "\"");
                }
            }
        }
    }
}

void RegexLexer::tokenize(const TokenizeOptions& options, const std::string& text, const TokenSink& out) const {
    // A start state without rules matches nothing, so all input comes out
    // as ERROR tokens.
    const std::string start = options.state.empty() ? std::string("root") : options.state;

    LexerState state(text, rules_);
    state.stack.push_back(start);

    size_t empty_transitions = 0;
    while (state.pos < text.size() && !state.stack.empty()) {
        state.state = state.stack.back();

        Match match;
        size_t index = 0;
        const CompiledRule* rule = nullptr;
        auto it = rules_.find(state.state);
        if (it != rules_.end()) {
            rule = match_rules(it->second, text, state.pos, empty_transitions < kMaxEmptyTransitions, match, index);
        }

        // No match.
        if (rule == nullptr) {
            size_t len = utf8_sequence_length(text, state.pos);
            out(Token(TokenType::ERROR, text.substr(state.pos, len)));
            state.pos += len;
            empty_transitions = 0;
            continue;
        }

        if (match.length == 0) {
            ++empty_transitions;
        } else {
            empty_transitions = 0;
        }

        state.rule = index;
        state.groups.clear();
        state.groups.reserve(match.groups.size());
        for (Group& group : match.groups) {
            state.groups.push_back(std::move(group.value));
        }
        state.pos += match.length;

        if (rule->mutator) {
            rule->mutator.mutate(state);
        }
        if (rule->type) {
            rule->type.emit(state.groups, *this, state, out);
        }
    }
}

const CompiledRule* RegexLexer::match_rules(const std::vector<CompiledRule>& state_rules, const std::string& text,
    size_t pos, bool allow_empty, Match& match, size_t& index) const {
    for (size_t i = 0; i < state_rules.size(); ++i) {
        const CompiledRule& rule = state_rules[i];
        std::optional<Match> m = rule.regex.match_at(text, pos);
        if (!m) continue;
        if (m->length == 0 && (!allow_empty || !rule.mutator)) continue;
        match = std::move(*m);
        index = i;
        return &rule;
    }
    return nullptr;
}

RegexLexer& RegexLexer::set_analyser(AnalyserFunction fn) {
    analyser_ = std::move(fn);
    return *this;
}

float RegexLexer::analyse_text(const std::string& text) const {
    if (!analyser_) return 0.0f;
    return std::clamp(analyser_(text), 0.0f, 1.0f);
}

std::shared_ptr<RegexLexer> make_lexer(Config config, const Rules& rules) {
    return std::make_shared<RegexLexer>(std::move(config), rules);
}

std::vector<Token> tokenize(const Lexer& lexer, const std::string& text, const TokenizeOptions& options) {
    std::vector<Token> out;
    lexer.tokenize(options, text, [&out](const Token& token) { out.push_back(token); });
    return out;
}

LexerPtr pick(const std::vector<LexerPtr>& lexers, const std::string& text) {
    LexerPtr picked;
    float highest = -1.0f;
    for (const LexerPtr& lexer : lexers) {
        const auto* analyser = dynamic_cast<const Analyser*>(lexer.get());
        if (analyser == nullptr) continue;
        float score = analyser->analyse_text(text);
        if (score > highest) {
            highest = score;
            picked = lexer;
        }
    }
    return picked;
}

}  // namespace rulex
