#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "rulex/registry.hpp"

using namespace rulex;

namespace {

std::shared_ptr<RegexLexer> named_lexer(const std::string& name, std::vector<std::string> aliases,
    std::vector<std::string> filenames, std::vector<std::string> alias_filenames = {}) {
    Config config;
    config.name = name;
    config.aliases = std::move(aliases);
    config.filenames = std::move(filenames);
    config.alias_filenames = std::move(alias_filenames);
    return make_lexer(config, Rules{{"root", {}}});
}

}  // namespace

TEST(RegistryTest, LookupByNameAndAliasIgnoresCase) {
    LexerRegistry registry;
    registry.add(named_lexer("Python", {"py", "python3"}, {"*.py"}));

    ASSERT_NE(registry.get("python"), nullptr);
    EXPECT_EQ(registry.get("PY")->config().name, "Python");
    EXPECT_EQ(registry.get("Python3")->config().name, "Python");
    EXPECT_EQ(registry.get("ruby"), nullptr);
}

TEST(RegistryTest, MatchesFileNameGlobs) {
    LexerRegistry registry;
    registry.add(named_lexer("C", {}, {"*.c", "*.h"}));
    registry.add(named_lexer("Make", {}, {"Makefile", "*.mk"}));

    EXPECT_EQ(registry.match("src/main.c")->config().name, "C");
    EXPECT_EQ(registry.match("/tmp/include/x.h")->config().name, "C");
    EXPECT_EQ(registry.match("Makefile")->config().name, "Make");
    EXPECT_EQ(registry.match("notes.txt"), nullptr);
}

TEST(RegistryTest, PrimaryGlobsBeatAliasGlobs) {
    LexerRegistry registry;
    registry.add(named_lexer("C", {}, {"*.c"}, {"*.h"}));
    registry.add(named_lexer("C++", {}, {"*.cpp", "*.h"}));

    EXPECT_EQ(registry.match("x.h")->config().name, "C++");
    EXPECT_EQ(registry.match("x.c")->config().name, "C");
}

TEST(RegistryTest, LaterRegistrationTakesOverName) {
    LexerRegistry registry;
    registry.add(named_lexer("Shell", {"sh"}, {}));
    auto replacement = named_lexer("Bash", {"sh"}, {});
    registry.add(replacement);

    EXPECT_EQ(registry.get("sh"), replacement);
    EXPECT_EQ(registry.get("shell")->config().name, "Shell");
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"Shell", "Bash"}));
}

TEST(RegistryTest, AnalysePicksBestLexer) {
    LexerRegistry registry;
    EXPECT_TRUE(registry.empty());
    EXPECT_EQ(registry.analyse("x"), nullptr);

    auto ini = named_lexer("INI", {}, {});
    ini->set_analyser([](const std::string& text) { return text.find('[') == 0 ? 0.8f : 0.0f; });
    auto plain = named_lexer("Plain", {}, {});
    plain->set_analyser([](const std::string&) { return 0.1f; });
    registry.add(plain);
    registry.add(ini);

    EXPECT_EQ(registry.analyse("[section]\nkey=value\n")->config().name, "INI");
    EXPECT_EQ(registry.analyse("hello")->config().name, "Plain");
}

TEST(RegistryTest, IgnoresNullLexer) {
    LexerRegistry registry;
    registry.add(nullptr);
    EXPECT_TRUE(registry.empty());
}
