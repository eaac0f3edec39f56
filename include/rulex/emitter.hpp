#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "rulex/token.hpp"

namespace rulex {

class Lexer;
struct LexerState;

using TokenSink = std::function<void(const Token&)>;

// Text of each capture group of a match; groups[0] is the whole match.
using Groups = std::vector<std::string>;

// Turns the groups of a match into tokens.
class Emitter {
   public:
    enum class Kind {
        NONE,
        TOKEN,
        BY_GROUPS,
        USING,
        USING_SELF,
        CUSTOM
    };

    using Function = std::function<void(const Groups&, const Lexer&, LexerState&, const TokenSink&)>;

    Emitter() = default;

    // Implicit so that rule tables can name a token type directly.
    Emitter(TokenType type) : kind_(Kind::TOKEN), type_(type) {}

    static Emitter token(TokenType type);

    // Sub-emitter i handles capture group i + 1. There must be exactly one
    // sub-emitter per capture group of the rule's pattern.
    static Emitter by_groups(std::vector<Emitter> emitters);

    // Tokenizes the whole match with another lexer starting at state.
    static Emitter using_lexer(std::shared_ptr<const Lexer> lexer, const std::string& state = "root");

    // Tokenizes the whole match with the owning lexer starting at state.
    static Emitter using_self(const std::string& state);

    static Emitter custom(Function fn);

    Kind kind() const { return kind_; }
    explicit operator bool() const { return kind_ != Kind::NONE; }

    TokenType type() const { return type_; }
    const std::string& state() const { return state_; }
    const std::vector<Emitter>& emitters() const { return emitters_; }

    void emit(const Groups& groups, const Lexer& lexer, LexerState& state, const TokenSink& out) const;

    // Throws CompileError if a by-groups emitter does not have one
    // sub-emitter per capture group. where names the rule for the message.
    void validate(size_t group_count, const std::string& where) const;

    // Appends the owning-lexer states that using_self() emitters start in.
    void collect_self_states(std::vector<std::string>& out) const;

   private:
    explicit Emitter(Kind kind) : kind_(kind) {}

    Kind kind_ = Kind::NONE;
    TokenType type_ = TokenType::ERROR;
    std::string state_;
    std::vector<Emitter> emitters_;
    std::shared_ptr<const Lexer> lexer_;
    Function fn_;
};

}  // namespace rulex
