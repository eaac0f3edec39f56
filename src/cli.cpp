#include "rulex/cli.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include "rulex/colors.hpp"
#include "rulex/grammar.hpp"
#include "rulex/lexer.hpp"
#include "rulex/registry.hpp"

#ifndef RULEX_VERSION
#define RULEX_VERSION "0.0.0"
#endif

namespace rulex {
namespace cli {

namespace {

// Colors only when writing to a terminal stderr.
bool use_color(const std::ostream& err) {
    return &err == &std::cerr && Color::supports_color();
}

void print_error(std::ostream& err, const std::string& message) {
    if (use_color(err)) {
        err << Color::red << "error: " << Color::reset << message << std::endl;
    } else {
        err << "error: " << message << std::endl;
    }
}

void print_warning(std::ostream& err, const std::string& message) {
    if (use_color(err)) {
        err << Color::yellow << "warning: " << Color::reset << message << std::endl;
    } else {
        err << "warning: " << message << std::endl;
    }
}

void print_trace(std::ostream& err, const Token& tok) {
    const bool color = use_color(err);
    if (color) err << Color::bright_black;
    err << "[trace] " << token_type_name(tok.type) << " '" << escape_value(tok.value) << "'";
    if (color) err << Color::reset;
    err << "\n";
}

void print_usage(std::ostream& out) {
    out << "Usage: rulex [options] <grammar.json> [file]\n"
        << "       rulex [options] --auto -g <grammar.json>... [file]\n"
        << "Options:\n"
        << "  -g, --grammar FILE  Load an extra grammar (usable by \"using\" rules); repeatable\n"
        << "  -s, --state NAME    State to start tokenizing in (default: root)\n"
        << "  -a, --auto          Pick the lexer among -g grammars by file name, then by content\n"
        << "      --trace         Print each token to stderr as it is emitted\n"
        << "  -v, --version       Print version and exit\n"
        << "  -h, --help          Show this help message\n"
        << "\n"
        << "Reads standard input when no file (or '-') is given.\n";
}

bool read_input(const std::string& path, std::istream& in, std::string& text) {
    std::stringstream buffer;
    if (path == "-") {
        buffer << in.rdbuf();
    } else {
        std::ifstream file(path);
        if (!file.is_open()) return false;
        buffer << file.rdbuf();
    }
    text = buffer.str();
    return true;
}

void dump_tokens(std::ostream& out, const std::vector<Token>& tokens) {
    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& tok = tokens[i];
        out << i << ": " << token_type_name(tok.type) << " '" << escape_value(tok.value) << "'\n";
    }
}

int run(const Options& opts, std::istream& in, std::ostream& out, std::ostream& err) {
    LexerRegistry registry;
    for (const auto& path : opts.extra_grammars) {
        registry.add(load_grammar_file(path, &registry));
    }

    std::string source;
    if (!read_input(opts.input, in, source)) {
        print_error(err, "could not open file " + opts.input);
        return 1;
    }

    LexerPtr lexer;
    if (opts.auto_select) {
        if (opts.input != "-") lexer = registry.match(opts.input);
        if (!lexer) lexer = registry.analyse(source);
        if (!lexer) {
            print_error(err, "no grammar matches " + (opts.input == "-" ? std::string("<stdin>") : opts.input));
            return 1;
        }
        if (opts.trace) {
            err << "[trace] using lexer " << lexer->config().name << "\n";
        }
    } else {
        lexer = load_grammar_file(opts.grammar, &registry);
    }

    const auto* regex_lexer = dynamic_cast<const RegexLexer*>(lexer.get());
    if (regex_lexer != nullptr && regex_lexer->rules().count(opts.state) == 0) {
        print_warning(err, "state \"" + opts.state + "\" is not defined; all input will be reported as ERROR");
    }

    TokenizeOptions tokenize_options;
    tokenize_options.state = opts.state;

    std::vector<Token> tokens;
    try {
        lexer->tokenize(tokenize_options, source, [&](const Token& tok) {
            if (opts.trace) print_trace(err, tok);
            tokens.push_back(tok);
        });
    } catch (const std::exception&) {
        // tokens emitted before the failure are still shown
        dump_tokens(out, tokens);
        throw;
    }
    dump_tokens(out, tokens);
    return 0;
}

}  // anonymous namespace

int execute(const std::vector<std::string>& args, std::istream& in, std::ostream& out, std::ostream& err) {
    Options opts;
    std::vector<std::string> positional;
    bool seen_double_dash = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (seen_double_dash || arg == "-" || arg.empty() || arg[0] != '-') {
            positional.push_back(arg);
            continue;
        }
        if (arg == "--") {
            seen_double_dash = true;
            continue;
        }

        if (arg == "-v" || arg == "--version") {
            out << "rulex v" << RULEX_VERSION << std::endl;
            return 0;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(out);
            return 0;
        } else if (arg == "-g" || arg == "--grammar" || arg == "-s" || arg == "--state") {
            if (i + 1 >= args.size()) {
                err << "rulex: option '" << arg << "' requires an argument\n";
                return 1;
            }
            if (arg == "-g" || arg == "--grammar") {
                opts.extra_grammars.push_back(args[++i]);
            } else {
                opts.state = args[++i];
            }
        } else if (arg == "-a" || arg == "--auto") {
            opts.auto_select = true;
        } else if (arg == "--trace") {
            opts.trace = true;
        } else {
            err << "rulex: unknown option '" << arg << "'\n";
            err << "Try 'rulex --help' for more information.\n";
            return 1;
        }
    }

    size_t expected = opts.auto_select ? 1 : 2;
    if ((!opts.auto_select && positional.empty()) || positional.size() > expected) {
        print_usage(err);
        return 1;
    }
    if (opts.auto_select && opts.extra_grammars.empty()) {
        print_error(err, "--auto needs at least one -g grammar");
        return 1;
    }

    if (!opts.auto_select) {
        opts.grammar = positional[0];
        if (positional.size() == 2) opts.input = positional[1];
    } else if (!positional.empty()) {
        opts.input = positional[0];
    }

    try {
        return run(opts, in, out, err);
    } catch (const std::exception& e) {
        print_error(err, e.what());
        return 1;
    }
}

}  // namespace cli
}  // namespace rulex
