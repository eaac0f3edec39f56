#pragma once

#include <map>
#include <string>
#include <vector>

#include "rulex/lexer.hpp"

namespace rulex {

// Collection of lexers addressable by name, alias and file name.
class LexerRegistry {
   public:
    // Registers a lexer under its name and aliases (case-insensitive). A later
    // lexer with the same name or alias takes over that key.
    void add(LexerPtr lexer);

    // Lexer by name or alias, or nullptr.
    LexerPtr get(const std::string& name) const;

    // First lexer whose file name globs match the base name of filename.
    // Primary globs of all lexers are tried before alias globs.
    LexerPtr match(const std::string& filename) const;

    // Lexer best suited to text according to the analysers (see pick()).
    LexerPtr analyse(const std::string& text) const;

    const std::vector<LexerPtr>& lexers() const { return lexers_; }

    // Registered lexer names in registration order.
    std::vector<std::string> names() const;

    bool empty() const { return lexers_.empty(); }

   private:
    std::vector<LexerPtr> lexers_;
    std::map<std::string, LexerPtr> by_name_;
};

}  // namespace rulex
