#include "rulex/grammar.hpp"

#include <fstream>
#include <map>
#include <sstream>
#include <utility>
#include <vector>

#include "rulex/RulexError.hpp"

namespace rulex {

using json = nlohmann::json;

namespace {

using Keywords = std::map<std::string, std::vector<std::string>>;

std::string require_string(const json& j, const std::string& where) {
    if (!j.is_string()) {
        throw GrammarError(where + ": expected a string");
    }
    return j.get<std::string>();
}

// Accepts a single string or an array of strings.
std::vector<std::string> string_list(const json& j, const std::string& where) {
    std::vector<std::string> out;
    if (j.is_string()) {
        out.push_back(j.get<std::string>());
        return out;
    }
    if (!j.is_array()) {
        throw GrammarError(where + ": expected a string or an array of strings");
    }
    for (const auto& item : j) {
        out.push_back(require_string(item, where));
    }
    return out;
}

bool optional_bool(const json& doc, const char* key) {
    if (!doc.contains(key)) return false;
    if (!doc[key].is_boolean()) {
        throw GrammarError(std::string("\"") + key + "\" must be true or false");
    }
    return doc[key].get<bool>();
}

TokenType parse_token_type(const json& j, const std::string& where) {
    std::string name = require_string(j, where);
    auto type = token_type_from_name(name);
    if (!type) {
        throw GrammarError(where + ": unknown token type \"" + name + "\"");
    }
    return *type;
}

const char* const kEmitterKeys[] = {"token", "groups", "using_self", "using"};
const char* const kMutatorKeys[] = {"push", "pop", "replace", "set_stack", "combined"};

Emitter parse_emitter(const json& j, const std::string& where, const LexerRegistry* registry);

// Emitter described by the emitter keys of obj (a rule or a nested emitter object).
Emitter parse_emitter_fields(const json& obj, const std::string& where, const LexerRegistry* registry) {
    int count = 0;
    for (const char* key : kEmitterKeys) {
        if (obj.contains(key)) ++count;
    }
    if (count > 1) {
        throw GrammarError(where + ": more than one of token/groups/using_self/using");
    }

    if (obj.contains("token")) {
        return Emitter::token(parse_token_type(obj["token"], where));
    }
    if (obj.contains("groups")) {
        const json& groups = obj["groups"];
        if (!groups.is_array()) {
            throw GrammarError(where + ": \"groups\" must be an array");
        }
        std::vector<Emitter> emitters;
        for (size_t i = 0; i < groups.size(); ++i) {
            emitters.push_back(parse_emitter(groups[i], where + " group " + std::to_string(i + 1), registry));
        }
        return Emitter::by_groups(std::move(emitters));
    }
    if (obj.contains("using_self")) {
        return Emitter::using_self(require_string(obj["using_self"], where));
    }
    if (obj.contains("using")) {
        std::string name = require_string(obj["using"], where);
        LexerPtr target = registry ? registry->get(name) : nullptr;
        if (!target) {
            throw GrammarError(where + ": unknown lexer \"" + name + "\" in \"using\"");
        }
        std::string state = obj.contains("state") ? require_string(obj["state"], where) : "root";
        return Emitter::using_lexer(target, state);
    }
    return Emitter();
}

// A token type name, null (emit nothing) or an emitter object.
Emitter parse_emitter(const json& j, const std::string& where, const LexerRegistry* registry) {
    if (j.is_null()) return Emitter();
    if (j.is_string()) return Emitter::token(parse_token_type(j, where));
    if (j.is_object()) return parse_emitter_fields(j, where, registry);
    throw GrammarError(where + ": expected a token type, null or an emitter object");
}

Mutator parse_mutator(const json& obj, const std::string& where) {
    const char* found = nullptr;
    for (const char* key : kMutatorKeys) {
        if (!obj.contains(key)) continue;
        if (found) {
            throw GrammarError(where + ": both \"" + found + "\" and \"" + key + "\"; use \"combined\"");
        }
        found = key;
    }
    if (!found) return Mutator();

    const json& value = obj[found];
    const std::string key = found;
    if (key == "push") {
        return Mutator::push(string_list(value, where));
    }
    if (key == "pop") {
        if (!value.is_number_unsigned() || value.get<size_t>() == 0) {
            throw GrammarError(where + ": \"pop\" must be a positive integer");
        }
        return Mutator::pop(value.get<size_t>());
    }
    if (key == "replace") {
        return Mutator::replace_top(require_string(value, where));
    }
    if (key == "set_stack") {
        return Mutator::set_stack(string_list(value, where));
    }

    if (!value.is_array()) {
        throw GrammarError(where + ": \"combined\" must be an array of mutators");
    }
    std::vector<Mutator> steps;
    for (const auto& step : value) {
        if (!step.is_object()) {
            throw GrammarError(where + ": \"combined\" entries must be objects");
        }
        steps.push_back(parse_mutator(step, where));
    }
    return Mutator::combined(std::move(steps));
}

Rule parse_rule(const json& j, const std::string& where, const Keywords& keywords, const LexerRegistry* registry) {
    if (!j.is_object()) {
        throw GrammarError(where + ": a rule must be an object");
    }

    Rule rule;
    if (j.contains("pattern") && j.contains("words")) {
        throw GrammarError(where + ": both \"pattern\" and \"words\"");
    }
    if (j.contains("pattern")) {
        rule.pattern = require_string(j["pattern"], where);
    } else if (j.contains("words")) {
        const json& w = j["words"];
        if (w.is_string()) {
            auto it = keywords.find(w.get<std::string>());
            if (it == keywords.end()) {
                throw GrammarError(where + ": unknown keyword list \"" + w.get<std::string>() + "\"");
            }
            rule.pattern = words(it->second);
        } else {
            rule.pattern = words(string_list(w, where));
        }
    } else {
        throw GrammarError(where + ": missing \"pattern\"");
    }

    rule.type = parse_emitter_fields(j, where, registry);
    rule.mutator = parse_mutator(j, where);
    return rule;
}

Config parse_config(const json& doc) {
    Config config;
    if (doc.contains("name")) config.name = require_string(doc["name"], "\"name\"");
    if (doc.contains("aliases")) config.aliases = string_list(doc["aliases"], "\"aliases\"");
    if (doc.contains("filenames")) config.filenames = string_list(doc["filenames"], "\"filenames\"");
    if (doc.contains("alias_filenames")) {
        config.alias_filenames = string_list(doc["alias_filenames"], "\"alias_filenames\"");
    }
    if (doc.contains("mime_types")) config.mime_types = string_list(doc["mime_types"], "\"mime_types\"");
    config.case_insensitive = optional_bool(doc, "case_insensitive");
    config.dot_all = optional_bool(doc, "dot_all");
    config.not_multiline = optional_bool(doc, "not_multiline");
    return config;
}

RegexLexer::AnalyserFunction parse_analyser(const json& j, const Config& config) {
    if (!j.is_array()) {
        throw GrammarError("\"analyse\" must be an array");
    }

    const PatternFlags flags = config.pattern_flags();

    std::vector<std::pair<CompiledPattern, float>> checks;
    for (size_t i = 0; i < j.size(); ++i) {
        const json& item = j[i];
        const std::string where = "analyse entry " + std::to_string(i);
        if (!item.is_object() || !item.contains("pattern")) {
            throw GrammarError(where + ": expected {\"pattern\": ..., \"score\": ...}");
        }
        std::string pattern = require_string(item["pattern"], where);
        float score = 1.0f;
        if (item.contains("score")) {
            if (!item["score"].is_number()) {
                throw GrammarError(where + ": \"score\" must be a number");
            }
            score = item["score"].get<float>();
        }
        try {
            checks.emplace_back(CompiledPattern(pattern, flags), score);
        } catch (const CompileError& e) {
            throw CompileError("invalid analyse regex \"" + pattern + "\": " + e.message());
        }
    }

    // scores of all matching patterns add up; the lexer clamps the total
    return [checks](const std::string& text) {
        float total = 0.0f;
        for (const auto& check : checks) {
            if (check.first.search(text)) total += check.second;
        }
        return total;
    };
}

}  // anonymous namespace

std::shared_ptr<RegexLexer> load_grammar(const json& doc, const LexerRegistry* registry) {
    if (!doc.is_object()) {
        throw GrammarError("grammar must be a JSON object");
    }

    try {
        Config config = parse_config(doc);

        Keywords keywords;
        if (doc.contains("keywords")) {
            const json& kw = doc["keywords"];
            if (!kw.is_object()) {
                throw GrammarError("\"keywords\" must be an object of word lists");
            }
            for (const auto& item : kw.items()) {
                keywords[item.key()] = string_list(item.value(), "keyword list \"" + item.key() + "\"");
            }
        }

        if (!doc.contains("rules") || !doc["rules"].is_object()) {
            throw GrammarError("missing \"rules\" object");
        }
        Rules rules;
        for (const auto& item : doc["rules"].items()) {
            const std::string& state = item.key();
            const json& list = item.value();
            if (!list.is_array()) {
                throw GrammarError("state \"" + state + "\" must be an array of rules");
            }
            std::vector<Rule>& state_rules = rules[state];
            for (size_t i = 0; i < list.size(); ++i) {
                const std::string where = "rule " + std::to_string(i) + " of state \"" + state + "\"";
                state_rules.push_back(parse_rule(list[i], where, keywords, registry));
            }
        }

        auto lexer = make_lexer(config, rules);
        if (doc.contains("analyse")) {
            lexer->set_analyser(parse_analyser(doc["analyse"], config));
        }
        return lexer;
    } catch (const json::exception& e) {
        throw GrammarError(std::string("malformed grammar: ") + e.what());
    }
}

std::shared_ptr<RegexLexer> load_grammar_string(const std::string& text, const LexerRegistry* registry) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw GrammarError(std::string("JSON parse error: ") + e.what());
    }
    return load_grammar(doc, registry);
}

std::shared_ptr<RegexLexer> load_grammar_file(const std::string& path, const LexerRegistry* registry) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw GrammarError("could not open grammar file " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return load_grammar_string(buffer.str(), registry);
    } catch (const GrammarError& e) {
        throw GrammarError(path + ": " + e.message());
    }
}

}  // namespace rulex
