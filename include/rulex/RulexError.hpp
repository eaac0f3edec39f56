#pragma once
#include <stdexcept>
#include <string>

namespace rulex {

class RulexError : public std::runtime_error {
   public:
    RulexError(const std::string& type, const std::string& message)
        : std::runtime_error(format_message(type, message)), type_(type), message_(message) {}

    const std::string& type() const { return type_; }
    // Message without the type prefix.
    const std::string& message() const { return message_; }

   private:
    std::string type_;
    std::string message_;

    static std::string format_message(const std::string& type, const std::string& message) {
        return type + ": " + message;
    }
};

// Grammar could not be turned into a lexer (missing "root", bad pattern,
// by-groups arity, mutator naming an unknown state).
class CompileError : public RulexError {
   public:
    explicit CompileError(const std::string& message) : RulexError("CompileError", message) {}
};

// State stack misuse during a tokenize call. The lexer itself stays usable.
class StateError : public RulexError {
   public:
    explicit StateError(const std::string& message) : RulexError("StateError", message) {}
};

// Malformed grammar file.
class GrammarError : public RulexError {
   public:
    explicit GrammarError(const std::string& message) : RulexError("GrammarError", message) {}
};

}  // namespace rulex
