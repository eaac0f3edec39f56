#include "rulex/pattern.hpp"

#include <re2/re2.h>

#include "rulex/RulexError.hpp"

namespace rulex {

namespace {

// Inline flag group in front of the pattern, e.g. "(?mi)(?:pattern)".
std::string with_flags(const std::string& pattern, const PatternFlags& flags) {
    std::string prefix;
    if (!flags.not_multiline) prefix += 'm';
    if (flags.case_insensitive) prefix += 'i';
    if (flags.dot_all) prefix += 's';

    std::string out;
    if (!prefix.empty()) out = "(?" + prefix + ")";
    out += "(?:" + pattern + ")";
    return out;
}

}  // anonymous namespace

CompiledPattern::CompiledPattern(const std::string& pattern, const PatternFlags& flags) : pattern(pattern) {
    re2::RE2::Options options;
    options.set_log_errors(false);

    auto compiled = std::make_shared<re2::RE2>(with_flags(pattern, flags), options);
    if (!compiled->ok()) {
        throw CompileError(compiled->error());
    }
    re = std::move(compiled);
}

std::optional<Match> CompiledPattern::match_at(const std::string& text, size_t offset) const {
    if (offset > text.size()) return std::nullopt;

    const int n = 1 + re->NumberOfCapturingGroups();
    std::vector<re2::StringPiece> sub(static_cast<size_t>(n));
    if (!re->Match(text, offset, text.size(), re2::RE2::ANCHOR_START, sub.data(), n)) {
        return std::nullopt;
    }

    Match out;
    out.length = sub[0].size();
    out.groups.reserve(sub.size());
    for (const re2::StringPiece& piece : sub) {
        Group g;
        // an unset piece marks a group that did not participate
        if (piece.data() != nullptr) {
            g.matched = true;
            g.offset = static_cast<size_t>(piece.data() - text.data());
            g.value.assign(piece.data(), piece.size());
        }
        out.groups.push_back(std::move(g));
    }
    return out;
}

bool CompiledPattern::search(const std::string& text) const {
    return re2::RE2::PartialMatch(text, *re);
}

size_t CompiledPattern::group_count() const {
    return static_cast<size_t>(re->NumberOfCapturingGroups());
}

std::string quote_meta(const std::string& s) {
    return re2::RE2::QuoteMeta(s);
}

std::string words(const std::vector<std::string>& list) {
    std::string out = "\\b(?:";
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) out.push_back('|');
        out += quote_meta(list[i]);
    }
    out += ")\\b";
    return out;
}

}  // namespace rulex
