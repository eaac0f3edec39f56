#pragma once

#include <optional>
#include <string>

namespace rulex {

// Token types.
// Values are grouped: the thousands digit names the category and the hundreds
// digit the sub-category, so LITERAL_NUMBER_HEX (3203) belongs to the
// LITERAL_NUMBER sub-category (3200) of the LITERAL category (3000).
enum class TokenType : int {
    // -----------------------
    // Meta types (not produced by grammars)
    // -----------------------
    NONE = -3,
    OTHER = -2,  // text a delegating lexer hands on to another lexer
    ERROR = -1,  // input that no rule matched

    // -----------------------
    // Keywords
    // -----------------------
    KEYWORD = 1000,
    KEYWORD_CONSTANT,
    KEYWORD_DECLARATION,
    KEYWORD_NAMESPACE,
    KEYWORD_PSEUDO,
    KEYWORD_RESERVED,
    KEYWORD_TYPE,

    // -----------------------
    // Names
    // -----------------------
    NAME = 2000,
    NAME_ATTRIBUTE,
    NAME_BUILTIN,
    NAME_BUILTIN_PSEUDO,
    NAME_CLASS,
    NAME_CONSTANT,
    NAME_DECORATOR,
    NAME_ENTITY,
    NAME_EXCEPTION,
    NAME_FUNCTION,
    NAME_FUNCTION_MAGIC,
    NAME_KEYWORD,
    NAME_LABEL,
    NAME_NAMESPACE,
    NAME_OPERATOR,
    NAME_OTHER,
    NAME_PSEUDO,
    NAME_PROPERTY,
    NAME_TAG,
    NAME_VARIABLE,
    NAME_VARIABLE_ANONYMOUS,
    NAME_VARIABLE_CLASS,
    NAME_VARIABLE_GLOBAL,
    NAME_VARIABLE_INSTANCE,
    NAME_VARIABLE_MAGIC,

    // -----------------------
    // Literals
    // -----------------------
    LITERAL = 3000,
    LITERAL_DATE,
    LITERAL_OTHER,

    LITERAL_STRING = 3100,
    LITERAL_STRING_AFFIX,
    LITERAL_STRING_ATOM,
    LITERAL_STRING_BACKTICK,
    LITERAL_STRING_BOOLEAN,
    LITERAL_STRING_CHAR,
    LITERAL_STRING_DELIMITER,
    LITERAL_STRING_DOC,
    LITERAL_STRING_DOUBLE,
    LITERAL_STRING_ESCAPE,
    LITERAL_STRING_HEREDOC,
    LITERAL_STRING_INTERPOL,
    LITERAL_STRING_NAME,
    LITERAL_STRING_OTHER,
    LITERAL_STRING_REGEX,
    LITERAL_STRING_SINGLE,
    LITERAL_STRING_SYMBOL,

    LITERAL_NUMBER = 3200,
    LITERAL_NUMBER_BIN,
    LITERAL_NUMBER_FLOAT,
    LITERAL_NUMBER_HEX,
    LITERAL_NUMBER_INTEGER,
    LITERAL_NUMBER_INTEGER_LONG,
    LITERAL_NUMBER_OCT,

    // -----------------------
    // Operators & punctuation
    // -----------------------
    OPERATOR = 4000,
    OPERATOR_WORD,

    PUNCTUATION = 5000,

    // -----------------------
    // Comments
    // -----------------------
    COMMENT = 6000,
    COMMENT_HASHBANG,
    COMMENT_MULTILINE,
    COMMENT_SINGLE,
    COMMENT_SPECIAL,

    COMMENT_PREPROC = 6100,
    COMMENT_PREPROC_FILE,

    // -----------------------
    // Generic (diffs, console sessions, markup)
    // -----------------------
    GENERIC = 7000,
    GENERIC_DELETED,
    GENERIC_EMPH,
    GENERIC_ERROR,
    GENERIC_HEADING,
    GENERIC_INSERTED,
    GENERIC_OUTPUT,
    GENERIC_PROMPT,
    GENERIC_STRONG,
    GENERIC_SUBHEADING,
    GENERIC_TRACEBACK,
    GENERIC_UNDERLINE,

    // -----------------------
    // Text
    // -----------------------
    TEXT = 8000,
    TEXT_WHITESPACE,
    TEXT_SYMBOL,
    TEXT_PUNCTUATION,
};

// Category of a type, e.g. LITERAL for LITERAL_NUMBER_HEX.
TokenType category(TokenType type);

// Sub-category of a type, e.g. LITERAL_NUMBER for LITERAL_NUMBER_HEX.
TokenType sub_category(TokenType type);

bool in_category(TokenType type, TokenType other);
bool in_sub_category(TokenType type, TokenType other);

// Name of a type as written in grammar files ("KEYWORD_CONSTANT").
std::string token_type_name(TokenType type);
std::optional<TokenType> token_type_from_name(const std::string& name);

// Represents a single emitted token
struct Token {
    TokenType type = TokenType::ERROR;
    std::string value;

    Token() = default;
    Token(TokenType t, const std::string& v) : type(t), value(v) {}

    bool operator==(const Token& other) const {
        return type == other.type && value == other.value;
    }
    bool operator!=(const Token& other) const { return !(*this == other); }

    // Token{KEYWORD, "if"}
    std::string debug_string() const;
};

// Escapes control characters, quotes and backslashes for single-line output.
std::string escape_value(const std::string& value);

}  // namespace rulex
