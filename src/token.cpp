#include "rulex/token.hpp"

#include <cctype>
#include <cstdio>
#include <unordered_map>
#include <utility>
#include <vector>

namespace rulex {

namespace {

const std::vector<std::pair<TokenType, std::string>>& type_names() {
    static const std::vector<std::pair<TokenType, std::string>> names = {
        {TokenType::NONE, "NONE"}, {TokenType::OTHER, "OTHER"}, {TokenType::ERROR, "ERROR"},

        {TokenType::KEYWORD, "KEYWORD"}, {TokenType::KEYWORD_CONSTANT, "KEYWORD_CONSTANT"},
        {TokenType::KEYWORD_DECLARATION, "KEYWORD_DECLARATION"}, {TokenType::KEYWORD_NAMESPACE, "KEYWORD_NAMESPACE"},
        {TokenType::KEYWORD_PSEUDO, "KEYWORD_PSEUDO"}, {TokenType::KEYWORD_RESERVED, "KEYWORD_RESERVED"},
        {TokenType::KEYWORD_TYPE, "KEYWORD_TYPE"},

        {TokenType::NAME, "NAME"}, {TokenType::NAME_ATTRIBUTE, "NAME_ATTRIBUTE"},
        {TokenType::NAME_BUILTIN, "NAME_BUILTIN"}, {TokenType::NAME_BUILTIN_PSEUDO, "NAME_BUILTIN_PSEUDO"},
        {TokenType::NAME_CLASS, "NAME_CLASS"}, {TokenType::NAME_CONSTANT, "NAME_CONSTANT"},
        {TokenType::NAME_DECORATOR, "NAME_DECORATOR"}, {TokenType::NAME_ENTITY, "NAME_ENTITY"},
        {TokenType::NAME_EXCEPTION, "NAME_EXCEPTION"}, {TokenType::NAME_FUNCTION, "NAME_FUNCTION"},
        {TokenType::NAME_FUNCTION_MAGIC, "NAME_FUNCTION_MAGIC"}, {TokenType::NAME_KEYWORD, "NAME_KEYWORD"},
        {TokenType::NAME_LABEL, "NAME_LABEL"}, {TokenType::NAME_NAMESPACE, "NAME_NAMESPACE"},
        {TokenType::NAME_OPERATOR, "NAME_OPERATOR"}, {TokenType::NAME_OTHER, "NAME_OTHER"},
        {TokenType::NAME_PSEUDO, "NAME_PSEUDO"}, {TokenType::NAME_PROPERTY, "NAME_PROPERTY"},
        {TokenType::NAME_TAG, "NAME_TAG"}, {TokenType::NAME_VARIABLE, "NAME_VARIABLE"},
        {TokenType::NAME_VARIABLE_ANONYMOUS, "NAME_VARIABLE_ANONYMOUS"},
        {TokenType::NAME_VARIABLE_CLASS, "NAME_VARIABLE_CLASS"},
        {TokenType::NAME_VARIABLE_GLOBAL, "NAME_VARIABLE_GLOBAL"},
        {TokenType::NAME_VARIABLE_INSTANCE, "NAME_VARIABLE_INSTANCE"},
        {TokenType::NAME_VARIABLE_MAGIC, "NAME_VARIABLE_MAGIC"},

        {TokenType::LITERAL, "LITERAL"}, {TokenType::LITERAL_DATE, "LITERAL_DATE"},
        {TokenType::LITERAL_OTHER, "LITERAL_OTHER"},
        {TokenType::LITERAL_STRING, "LITERAL_STRING"}, {TokenType::LITERAL_STRING_AFFIX, "LITERAL_STRING_AFFIX"},
        {TokenType::LITERAL_STRING_ATOM, "LITERAL_STRING_ATOM"},
        {TokenType::LITERAL_STRING_BACKTICK, "LITERAL_STRING_BACKTICK"},
        {TokenType::LITERAL_STRING_BOOLEAN, "LITERAL_STRING_BOOLEAN"},
        {TokenType::LITERAL_STRING_CHAR, "LITERAL_STRING_CHAR"},
        {TokenType::LITERAL_STRING_DELIMITER, "LITERAL_STRING_DELIMITER"},
        {TokenType::LITERAL_STRING_DOC, "LITERAL_STRING_DOC"},
        {TokenType::LITERAL_STRING_DOUBLE, "LITERAL_STRING_DOUBLE"},
        {TokenType::LITERAL_STRING_ESCAPE, "LITERAL_STRING_ESCAPE"},
        {TokenType::LITERAL_STRING_HEREDOC, "LITERAL_STRING_HEREDOC"},
        {TokenType::LITERAL_STRING_INTERPOL, "LITERAL_STRING_INTERPOL"},
        {TokenType::LITERAL_STRING_NAME, "LITERAL_STRING_NAME"},
        {TokenType::LITERAL_STRING_OTHER, "LITERAL_STRING_OTHER"},
        {TokenType::LITERAL_STRING_REGEX, "LITERAL_STRING_REGEX"},
        {TokenType::LITERAL_STRING_SINGLE, "LITERAL_STRING_SINGLE"},
        {TokenType::LITERAL_STRING_SYMBOL, "LITERAL_STRING_SYMBOL"},
        {TokenType::LITERAL_NUMBER, "LITERAL_NUMBER"}, {TokenType::LITERAL_NUMBER_BIN, "LITERAL_NUMBER_BIN"},
        {TokenType::LITERAL_NUMBER_FLOAT, "LITERAL_NUMBER_FLOAT"},
        {TokenType::LITERAL_NUMBER_HEX, "LITERAL_NUMBER_HEX"},
        {TokenType::LITERAL_NUMBER_INTEGER, "LITERAL_NUMBER_INTEGER"},
        {TokenType::LITERAL_NUMBER_INTEGER_LONG, "LITERAL_NUMBER_INTEGER_LONG"},
        {TokenType::LITERAL_NUMBER_OCT, "LITERAL_NUMBER_OCT"},

        {TokenType::OPERATOR, "OPERATOR"}, {TokenType::OPERATOR_WORD, "OPERATOR_WORD"},
        {TokenType::PUNCTUATION, "PUNCTUATION"},

        {TokenType::COMMENT, "COMMENT"}, {TokenType::COMMENT_HASHBANG, "COMMENT_HASHBANG"},
        {TokenType::COMMENT_MULTILINE, "COMMENT_MULTILINE"}, {TokenType::COMMENT_SINGLE, "COMMENT_SINGLE"},
        {TokenType::COMMENT_SPECIAL, "COMMENT_SPECIAL"}, {TokenType::COMMENT_PREPROC, "COMMENT_PREPROC"},
        {TokenType::COMMENT_PREPROC_FILE, "COMMENT_PREPROC_FILE"},

        {TokenType::GENERIC, "GENERIC"}, {TokenType::GENERIC_DELETED, "GENERIC_DELETED"},
        {TokenType::GENERIC_EMPH, "GENERIC_EMPH"}, {TokenType::GENERIC_ERROR, "GENERIC_ERROR"},
        {TokenType::GENERIC_HEADING, "GENERIC_HEADING"}, {TokenType::GENERIC_INSERTED, "GENERIC_INSERTED"},
        {TokenType::GENERIC_OUTPUT, "GENERIC_OUTPUT"}, {TokenType::GENERIC_PROMPT, "GENERIC_PROMPT"},
        {TokenType::GENERIC_STRONG, "GENERIC_STRONG"}, {TokenType::GENERIC_SUBHEADING, "GENERIC_SUBHEADING"},
        {TokenType::GENERIC_TRACEBACK, "GENERIC_TRACEBACK"}, {TokenType::GENERIC_UNDERLINE, "GENERIC_UNDERLINE"},

        {TokenType::TEXT, "TEXT"}, {TokenType::TEXT_WHITESPACE, "TEXT_WHITESPACE"},
        {TokenType::TEXT_SYMBOL, "TEXT_SYMBOL"}, {TokenType::TEXT_PUNCTUATION, "TEXT_PUNCTUATION"},
    };
    return names;
}

}  // namespace

TokenType category(TokenType type) {
    int value = static_cast<int>(type);
    if (value < 0) return type;
    return static_cast<TokenType>(value / 1000 * 1000);
}

TokenType sub_category(TokenType type) {
    int value = static_cast<int>(type);
    if (value < 0) return type;
    return static_cast<TokenType>(value / 100 * 100);
}

bool in_category(TokenType type, TokenType other) {
    return category(type) == category(other);
}

bool in_sub_category(TokenType type, TokenType other) {
    return sub_category(type) == sub_category(other);
}

std::string token_type_name(TokenType type) {
    static const std::unordered_map<int, std::string> by_type = [] {
        std::unordered_map<int, std::string> m;
        for (const auto& entry : type_names()) m.emplace(static_cast<int>(entry.first), entry.second);
        return m;
    }();
    auto it = by_type.find(static_cast<int>(type));
    if (it != by_type.end()) return it->second;
    return "TOKEN(" + std::to_string(static_cast<int>(type)) + ")";
}

std::optional<TokenType> token_type_from_name(const std::string& name) {
    static const std::unordered_map<std::string, TokenType> by_name = [] {
        std::unordered_map<std::string, TokenType> m;
        for (const auto& entry : type_names()) m.emplace(entry.second, entry.first);
        return m;
    }();
    auto it = by_name.find(name);
    if (it != by_name.end()) return it->second;

    // CamelCase spelling: "NameVariable", "LiteralStringDouble", and the
    // short "String..." / "Number..." / "Whitespace" forms.
    if (name.empty() || !std::isupper(static_cast<unsigned char>(name[0]))) return std::nullopt;
    std::string camel = name;
    if (camel.rfind("String", 0) == 0 || camel.rfind("Number", 0) == 0) {
        camel = "Literal" + camel;
    } else if (camel == "Whitespace") {
        camel = "TextWhitespace";
    }

    std::string snake;
    for (size_t i = 0; i < camel.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(camel[i]);
        if (!std::isalpha(c)) return std::nullopt;
        if (std::isupper(c) && i > 0) snake.push_back('_');
        snake.push_back(static_cast<char>(std::toupper(c)));
    }
    it = by_name.find(snake);
    if (it == by_name.end()) return std::nullopt;
    return it->second;
}

std::string Token::debug_string() const {
    return "Token{" + token_type_name(type) + ", \"" + escape_value(value) + "\"}";
}

std::string escape_value(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        switch (c) {
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\'': out += "\\'"; break;
            default:
                if (c < 0x20 || c == 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

}  // namespace rulex
