#include "rulex/mutator.hpp"

#include <utility>

#include "rulex/RulexError.hpp"
#include "rulex/lexer.hpp"

namespace rulex {

Mutator Mutator::push(std::vector<std::string> states) {
    Mutator m(Kind::PUSH);
    m.states_ = std::move(states);
    return m;
}

Mutator Mutator::pop(size_t depth) {
    Mutator m(Kind::POP);
    m.depth_ = depth;
    return m;
}

Mutator Mutator::replace_top(const std::string& state) {
    Mutator m(Kind::REPLACE_TOP);
    m.states_.push_back(state);
    return m;
}

Mutator Mutator::set_stack(std::vector<std::string> states) {
    Mutator m(Kind::SET_STACK);
    m.states_ = std::move(states);
    return m;
}

Mutator Mutator::combined(std::vector<Mutator> steps) {
    Mutator m(Kind::COMBINED);
    m.steps_ = std::move(steps);
    return m;
}

Mutator Mutator::custom(Function fn) {
    Mutator m(Kind::CUSTOM);
    m.fn_ = std::move(fn);
    return m;
}

void Mutator::mutate(LexerState& state) const {
    switch (kind_) {
        case Kind::NONE:
            break;

        case Kind::PUSH:
            if (states_.empty()) {
                state.stack.push_back(state.state);
            } else {
                state.stack.insert(state.stack.end(), states_.begin(), states_.end());
            }
            break;

        case Kind::POP:
            if (state.stack.size() < depth_) {
                throw StateError("cannot pop " + std::to_string(depth_) + " state(s) from a stack of " +
                    std::to_string(state.stack.size()) + " in state \"" + state.state + "\"");
            }
            state.stack.resize(state.stack.size() - depth_);
            break;

        case Kind::REPLACE_TOP:
            if (state.stack.empty()) {
                throw StateError("no state to replace in state \"" + state.state + "\"");
            }
            state.stack.back() = states_.front();
            break;

        case Kind::SET_STACK:
            state.stack = states_;
            break;

        case Kind::COMBINED:
            for (const Mutator& step : steps_) {
                step.mutate(state);
            }
            break;

        case Kind::CUSTOM:
            if (fn_) fn_(state);
            break;
    }
}

void Mutator::collect_targets(std::vector<std::string>& out) const {
    switch (kind_) {
        case Kind::PUSH:
        case Kind::REPLACE_TOP:
        case Kind::SET_STACK:
            out.insert(out.end(), states_.begin(), states_.end());
            break;
        case Kind::COMBINED:
            for (const Mutator& step : steps_) {
                step.collect_targets(out);
            }
            break;
        default:
            break;
    }
}

}  // namespace rulex
