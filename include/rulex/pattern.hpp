#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace re2 {
class RE2;
}

namespace rulex {

struct PatternFlags {
    bool case_insensitive = false;
    bool dot_all = false;        // '.' also matches '\n'
    bool not_multiline = false;  // '^' and '$' only match at the real text start/end
};

// One capture group of a match. Groups that did not take part in the match
// (e.g. the untaken branch of an alternation) have matched == false and an
// empty value.
struct Group {
    bool matched = false;
    size_t offset = 0;
    std::string value;
};

struct Match {
    size_t length = 0;
    std::vector<Group> groups;  // groups[0] is the whole match
};

// A pattern compiled once with RE2 and matched only at an exact offset of
// the text. Matching runs in time linear in the input and never recurses
// per character, so long matches are safe. Copies share the compiled
// program, which is safe to use from several threads.
class CompiledPattern {
   public:
    // Throws CompileError if the pattern is not valid RE2 syntax.
    CompiledPattern(const std::string& pattern, const PatternFlags& flags);

    // Attempts a match starting exactly at offset. Anchors and word
    // boundaries see the text before offset.
    std::optional<Match> match_at(const std::string& text, size_t offset) const;

    // True if the pattern matches anywhere in text.
    bool search(const std::string& text) const;

    // Number of user capture groups (group 0 excluded).
    size_t group_count() const;

    const std::string& source() const { return pattern; }

   private:
    std::string pattern;
    std::shared_ptr<const re2::RE2> re;
};

// Escapes all regex metacharacters in s.
std::string quote_meta(const std::string& s);

// Pattern matching any of the given literal words on word boundaries.
std::string words(const std::vector<std::string>& list);

}  // namespace rulex
