#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "rulex/lexer.hpp"
#include "rulex/registry.hpp"

namespace rulex {

// Builds a lexer from a JSON grammar document:
//
//   {
//     "name": "Example", "aliases": ["ex"], "filenames": ["*.ex"],
//     "case_insensitive": false, "dot_all": false, "not_multiline": false,
//     "keywords": {"kw": ["if", "else"]},
//     "analyse": [{"pattern": "^#!.*example", "score": 1.0}],
//     "rules": {
//       "root": [
//         {"words": "kw", "token": "KEYWORD"},
//         {"pattern": "(\\w+)(=)", "groups": ["NAME_VARIABLE", "OPERATOR"]},
//         {"pattern": "\\(", "token": "PUNCTUATION", "push": "paren"}
//       ],
//       "paren": [{"pattern": "\\)", "token": "PUNCTUATION", "pop": 1}]
//     }
//   }
//
// Lexers named by "using" are looked up in registry. Throws GrammarError for
// malformed documents and CompileError for rules that do not compile.
std::shared_ptr<RegexLexer> load_grammar(const nlohmann::json& doc, const LexerRegistry* registry = nullptr);

std::shared_ptr<RegexLexer> load_grammar_string(const std::string& text, const LexerRegistry* registry = nullptr);

std::shared_ptr<RegexLexer> load_grammar_file(const std::string& path, const LexerRegistry* registry = nullptr);

}  // namespace rulex
