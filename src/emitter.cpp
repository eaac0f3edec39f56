#include "rulex/emitter.hpp"

#include <utility>

#include "rulex/RulexError.hpp"
#include "rulex/lexer.hpp"

namespace rulex {

Emitter Emitter::token(TokenType type) {
    return Emitter(type);
}

Emitter Emitter::by_groups(std::vector<Emitter> emitters) {
    Emitter e(Kind::BY_GROUPS);
    e.emitters_ = std::move(emitters);
    return e;
}

Emitter Emitter::using_lexer(std::shared_ptr<const Lexer> lexer, const std::string& state) {
    Emitter e(Kind::USING);
    e.lexer_ = std::move(lexer);
    e.state_ = state;
    return e;
}

Emitter Emitter::using_self(const std::string& state) {
    Emitter e(Kind::USING_SELF);
    e.state_ = state;
    return e;
}

Emitter Emitter::custom(Function fn) {
    Emitter e(Kind::CUSTOM);
    e.fn_ = std::move(fn);
    return e;
}

void Emitter::emit(const Groups& groups, const Lexer& lexer, LexerState& state, const TokenSink& out) const {
    switch (kind_) {
        case Kind::NONE:
            break;

        case Kind::TOKEN:
            // groups that did not participate produce nothing
            if (!groups.empty() && !groups[0].empty()) {
                out(Token(type_, groups[0]));
            }
            break;

        case Kind::BY_GROUPS:
            for (size_t i = 0; i < emitters_.size() && i + 1 < groups.size(); ++i) {
                emitters_[i].emit(Groups{groups[i + 1]}, lexer, state, out);
            }
            break;

        case Kind::USING: {
            if (!lexer_ || groups.empty()) break;
            TokenizeOptions options;
            options.state = state_;
            lexer_->tokenize(options, groups[0], out);
            break;
        }

        case Kind::USING_SELF: {
            if (groups.empty()) break;
            TokenizeOptions options;
            options.state = state_;
            lexer.tokenize(options, groups[0], out);
            break;
        }

        case Kind::CUSTOM:
            if (fn_) fn_(groups, lexer, state, out);
            break;
    }
}

void Emitter::validate(size_t group_count, const std::string& where) const {
    switch (kind_) {
        case Kind::BY_GROUPS:
            if (emitters_.size() != group_count) {
                throw CompileError(where + ": by-groups has " + std::to_string(emitters_.size()) +
                    " emitter(s) for " + std::to_string(group_count) + " capture group(s)");
            }
            // each sub-emitter sees a single group with no captures of its own
            for (const Emitter& sub : emitters_) {
                sub.validate(0, where);
            }
            break;
        case Kind::USING:
            if (!lexer_) {
                throw CompileError(where + ": using() without a lexer");
            }
            break;
        default:
            break;
    }
}

void Emitter::collect_self_states(std::vector<std::string>& out) const {
    if (kind_ == Kind::USING_SELF) {
        out.push_back(state_);
    } else if (kind_ == Kind::BY_GROUPS) {
        for (const Emitter& sub : emitters_) {
            sub.collect_self_states(out);
        }
    }
}

}  // namespace rulex
