#include <gtest/gtest.h>
#include "protocols/shell/commands/mirror.hpp"
#include "protocols/shell/Parser.hpp"
#include "protocols/shell/Token.hpp"

using namespace ms::shell;

namespace {

const MirrorArgs& expectMirror(const Invocation& inv) {
    if (const auto* r = std::get_if<CommandResult>(&inv))
        ADD_FAILURE() << "expected a mirror run, got exit " << r->exit_code << ": " << r->stderr_text;
    return std::get<MirrorArgs>(inv);
}

int exitOf(const Invocation& inv) {
    const auto* r = std::get_if<CommandResult>(&inv);
    return r ? r->exit_code : -1;
}

}

TEST(TokenizeTest, SplitsLongFlagValuesAndBundles) {
    const auto toks = tokenize({"mirror", "--workers=4", "-wq", "--", "-odd"});
    EXPECT_EQ(to_string(toks), "Word(mirror) Flag(workers) Word(4) Flag(w) Flag(q) Word(--) Word(-odd)");
}

TEST(TokenizeTest, NegativeNumbersAreWords) {
    const auto toks = tokenize({"mirror", "-5"});
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[1].type, TokenType::Word);
}

TEST(ParseTokensTest, OnlyValueFlagsConsumeTheNextWord) {
    const auto call = parseTokens(tokenize({"mirror", "--force", "src", "--workers", "3", "dst"}), {"workers"});
    EXPECT_EQ(call.name, "mirror");
    EXPECT_EQ(call.positionals, (std::vector<std::string>{"src", "dst"}));
    ASSERT_EQ(call.options.size(), 2u);
    EXPECT_EQ(call.options[1].value, "3");
}

TEST(MirrorArgsTest, ParsesPolicyAndDisplay) {
    const auto inv = parseCommandLine({"mirror", "--force", "--remove", "-w", "--json", "--workers", "8",
                                       "src", "dst1", "dst2"});
    const auto& args = expectMirror(inv);
    EXPECT_TRUE(args.request.policy.force);
    EXPECT_TRUE(args.request.policy.remove);
    EXPECT_TRUE(args.request.policy.watch);
    EXPECT_FALSE(args.request.policy.fake);
    EXPECT_TRUE(args.display.json);
    EXPECT_FALSE(args.display.color);
    EXPECT_EQ(args.request.workers, 8u);
    EXPECT_EQ(args.request.source, "src");
    EXPECT_EQ(args.request.targets, (std::vector<std::string>{"dst1", "dst2"}));
}

TEST(MirrorArgsTest, DryRunIsFake) {
    const auto& args = expectMirror(parseCommandLine({"mirror", "--dry-run", "a", "b"}));
    EXPECT_TRUE(args.request.policy.fake);
}

TEST(MirrorArgsTest, ConfigPathIsCaptured) {
    const auto& args = expectMirror(parseCommandLine({"mirror", "--config", "/etc/ms.yaml", "a", "b"}));
    ASSERT_TRUE(args.configPath.has_value());
    EXPECT_EQ(*args.configPath, "/etc/ms.yaml");
}

TEST(MirrorArgsTest, UsageErrorsExitWithTwo) {
    EXPECT_EQ(exitOf(parseCommandLine({})), 2);
    EXPECT_EQ(exitOf(parseCommandLine({"mirror", "only-source"})), 2);
    EXPECT_EQ(exitOf(parseCommandLine({"mirror", "--remove", "a", "b"})), 2);
    EXPECT_EQ(exitOf(parseCommandLine({"mirror", "--workers", "zero", "a", "b"})), 2);
    EXPECT_EQ(exitOf(parseCommandLine({"mirror", "--bogus", "a", "b"})), 2);
    EXPECT_EQ(exitOf(parseCommandLine({"copy", "a", "b"})), 2);
}

TEST(MirrorArgsTest, HelpAndVersion) {
    EXPECT_EQ(exitOf(parseCommandLine({"--help"})), 0);
    EXPECT_EQ(exitOf(parseCommandLine({"-h"})), 0);
    EXPECT_EQ(exitOf(parseCommandLine({"mirror", "--help"})), 0);

    const auto inv = parseCommandLine({"version"});
    const auto* r = std::get_if<CommandResult>(&inv);
    ASSERT_NE(r, nullptr);
    EXPECT_NE(r->stdout_text.find("mirrorsync"), std::string::npos);
}
