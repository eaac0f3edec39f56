#include "rulex/registry.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <utility>

namespace rulex {

namespace fs = std::filesystem;

namespace {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool glob_matches(const std::vector<std::string>& globs, const std::string& basename) {
    for (const auto& glob : globs) {
        if (fnmatch(glob.c_str(), basename.c_str(), 0) == 0) return true;
    }
    return false;
}

}  // anonymous namespace

void LexerRegistry::add(LexerPtr lexer) {
    if (!lexer) return;
    const Config& config = lexer->config();
    if (!config.name.empty()) {
        by_name_[to_lower(config.name)] = lexer;
    }
    for (const auto& alias : config.aliases) {
        by_name_[to_lower(alias)] = lexer;
    }
    lexers_.push_back(std::move(lexer));
}

LexerPtr LexerRegistry::get(const std::string& name) const {
    auto it = by_name_.find(to_lower(name));
    if (it != by_name_.end()) return it->second;
    return nullptr;
}

LexerPtr LexerRegistry::match(const std::string& filename) const {
    std::string basename = fs::path(filename).filename().string();
    for (const auto& lexer : lexers_) {
        if (glob_matches(lexer->config().filenames, basename)) return lexer;
    }
    for (const auto& lexer : lexers_) {
        if (glob_matches(lexer->config().alias_filenames, basename)) return lexer;
    }
    return nullptr;
}

LexerPtr LexerRegistry::analyse(const std::string& text) const {
    return pick(lexers_, text);
}

std::vector<std::string> LexerRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(lexers_.size());
    for (const auto& lexer : lexers_) {
        out.push_back(lexer->config().name);
    }
    return out;
}

}  // namespace rulex
