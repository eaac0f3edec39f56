#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "rulex/emitter.hpp"
#include "rulex/mutator.hpp"
#include "rulex/pattern.hpp"
#include "rulex/token.hpp"

namespace rulex {

// Per-lexer settings. Identity fields are only read by the registry and the CLI.
struct Config {
    std::string name;
    std::vector<std::string> aliases;
    std::vector<std::string> filenames;        // file name globs
    std::vector<std::string> alias_filenames;  // secondary file name globs
    std::vector<std::string> mime_types;

    bool case_insensitive = false;
    bool dot_all = false;
    // '^' and '$' match only at the start and end of the text instead of at
    // every line boundary.
    bool not_multiline = false;

    PatternFlags pattern_flags() const {
        PatternFlags flags;
        flags.case_insensitive = case_insensitive;
        flags.dot_all = dot_all;
        flags.not_multiline = not_multiline;
        return flags;
    }
};

struct Rule {
    std::string pattern;
    Emitter type;
    Mutator mutator;
};

// State name -> rules tried in order. Must contain "root".
using Rules = std::map<std::string, std::vector<Rule>>;

struct CompiledRule : public Rule {
    CompiledRule(const Rule& rule, CompiledPattern re) : Rule(rule), regex(std::move(re)) {}

    CompiledPattern regex;
};

using CompiledRules = std::map<std::string, std::vector<CompiledRule>>;

// Mutable state of one tokenize call.
struct LexerState {
    LexerState(const std::string& text, const CompiledRules& rules) : text(text), rules(rules) {}

    const std::string& text;
    size_t pos = 0;
    const CompiledRules& rules;
    std::vector<std::string> stack;  // back() is the active state
    std::string state;               // active state of the current iteration
    size_t rule = 0;                 // index of the matched rule within state
    Groups groups;                   // groups of the most recent match
};

struct TokenizeOptions {
    // State to start tokenizing in.
    std::string state = "root";
};

class Lexer {
   public:
    virtual ~Lexer() = default;

    virtual const Config& config() const = 0;

    // Streams tokens to out. Throws on fatal run errors; tokens already
    // emitted stay emitted.
    virtual void tokenize(const TokenizeOptions& options, const std::string& text, const TokenSink& out) const = 0;

    void tokenize(const std::string& text, const TokenSink& out) const {
        tokenize(TokenizeOptions(), text, out);
    }
};

// Lexers that can rate how well they suit a text sample.
class Analyser {
   public:
    virtual ~Analyser() = default;

    // 0.0 (not at all) to 1.0 (certainly).
    virtual float analyse_text(const std::string& text) const = 0;
};

using LexerPtr = std::shared_ptr<Lexer>;

// Consecutive zero-length transitions honoured at one position.
constexpr size_t kMaxEmptyTransitions = 64;

class RegexLexer : public Lexer, public Analyser {
   public:
    using AnalyserFunction = std::function<float(const std::string&)>;

    // Compiles every rule. Throws CompileError on a missing "root" state, an
    // invalid pattern, a by-groups arity mismatch or a mutator naming an
    // unknown state.
    RegexLexer(Config config, const Rules& rules);

    const Config& config() const override { return config_; }

    using Lexer::tokenize;
    void tokenize(const TokenizeOptions& options, const std::string& text, const TokenSink& out) const override;

    RegexLexer& set_analyser(AnalyserFunction fn);
    float analyse_text(const std::string& text) const override;

    const CompiledRules& rules() const { return rules_; }

   private:
    Config config_;
    CompiledRules rules_;
    AnalyserFunction analyser_;

    // First rule of state_rules matching at pos. Zero-length matches only
    // count for rules carrying a mutator, and only when allow_empty is set.
    const CompiledRule* match_rules(const std::vector<CompiledRule>& state_rules, const std::string& text,
        size_t pos, bool allow_empty, Match& match, size_t& index) const;
};

std::shared_ptr<RegexLexer> make_lexer(Config config, const Rules& rules);

// Tokenizes text into a vector.
std::vector<Token> tokenize(const Lexer& lexer, const std::string& text, const TokenizeOptions& options = TokenizeOptions());

// Picks the lexer whose analyser scores text highest; ties go to the earlier
// lexer. Lexers that are not Analysers are ignored. Returns nullptr if no
// lexer could be rated.
LexerPtr pick(const std::vector<LexerPtr>& lexers, const std::string& text);

}  // namespace rulex
