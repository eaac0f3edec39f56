#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace rulex {

struct LexerState;

// Changes the state stack after a rule matched. Applied before the rule's
// emitter runs.
class Mutator {
   public:
    enum class Kind {
        NONE,
        PUSH,
        POP,
        REPLACE_TOP,
        SET_STACK,
        COMBINED,
        CUSTOM
    };

    // Custom mutators throw to abort the tokenize call.
    using Function = std::function<void(LexerState&)>;

    Mutator() = default;

    // Pushes states in order; with no states, pushes the active state again.
    static Mutator push(std::vector<std::string> states = {});
    // Pops depth entries. Throws StateError if the stack holds fewer.
    static Mutator pop(size_t depth = 1);
    static Mutator replace_top(const std::string& state);
    static Mutator set_stack(std::vector<std::string> states);
    static Mutator combined(std::vector<Mutator> steps);
    static Mutator custom(Function fn);

    Kind kind() const { return kind_; }
    explicit operator bool() const { return kind_ != Kind::NONE; }

    void mutate(LexerState& state) const;

    // Appends every state name this mutator may move to (custom mutators name none).
    void collect_targets(std::vector<std::string>& out) const;

    const std::vector<std::string>& states() const { return states_; }
    size_t depth() const { return depth_; }
    const std::vector<Mutator>& steps() const { return steps_; }

   private:
    explicit Mutator(Kind kind) : kind_(kind) {}

    Kind kind_ = Kind::NONE;
    std::vector<std::string> states_;
    size_t depth_ = 0;
    std::vector<Mutator> steps_;
    Function fn_;
};

}  // namespace rulex
