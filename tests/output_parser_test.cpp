#include <gtest/gtest.h>

#include "sandbox/output_parser.hpp"

namespace remex::sandbox {
namespace {

TEST(OutputParserTest, SplitsLinesAndDropsCarriageReturns) {
    const auto lines = ParseOutput("one\r\ntwo\nthree\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0].text, "one");
    EXPECT_EQ(lines[1].text, "two");
    EXPECT_EQ(lines[2].text, "three");
    EXPECT_FALSE(lines[0].tag.has_value());
}

TEST(OutputParserTest, EmptyTextHasNoLines) {
    EXPECT_TRUE(ParseOutput("").empty());
}

TEST(OutputParserTest, TagsSourceLocations) {
    const auto lines = ParseOutput("<source>:12:5: runtime error: overflow\n");
    ASSERT_EQ(lines.size(), 1u);
    ASSERT_TRUE(lines[0].tag.has_value());
    EXPECT_EQ(lines[0].tag->line, 12);
    EXPECT_EQ(lines[0].tag->column, 5);
    EXPECT_EQ(lines[0].text, "<source>:12:5: runtime error: overflow");
}

TEST(OutputParserTest, TagsThroughColourCodes) {
    const auto lines = ParseOutput("\x1b[1m<source>:3:1: warning\x1b[0m\n");
    ASSERT_EQ(lines.size(), 1u);
    ASSERT_TRUE(lines[0].tag.has_value());
    EXPECT_EQ(lines[0].tag->line, 3);
}

TEST(OutputParserTest, AtFileLineOnlyWhenRequested) {
    const std::string report = "  in main at /app/example.cpp:42\n";
    EXPECT_FALSE(ParseOutput(report)[0].tag.has_value());

    const auto tagged = ParseOutput(report, {LineParseOption::kAtFileLine});
    ASSERT_TRUE(tagged[0].tag.has_value());
    EXPECT_EQ(tagged[0].tag->file, "/app/example.cpp");
    EXPECT_EQ(tagged[0].tag->line, 42);
}

TEST(OutputParserTest, TagsParenthesisedLocations) {
    const auto lines = ParseOutput("<source>(7,2): error C2065\n");
    ASSERT_TRUE(lines[0].tag.has_value());
    EXPECT_EQ(lines[0].tag->line, 7);
    EXPECT_EQ(lines[0].tag->column, 2);
}

TEST(OutputParserTest, HandlesLinesAsLongAsTheOutputCap) {
    const std::string tail(64 * 1024, 'x');
    const auto source = ParseOutput("<source>:1:1 " + tail);
    ASSERT_EQ(source.size(), 1u);
    ASSERT_TRUE(source[0].tag.has_value());
    EXPECT_EQ(source[0].tag->line, 1);
    EXPECT_EQ(source[0].text.size(), tail.size() + 13);

    const std::string path(64 * 1024, 'a');
    const auto at = ParseOutput("at " + path, {LineParseOption::kAtFileLine});
    ASSERT_EQ(at.size(), 1u);
    EXPECT_FALSE(at[0].tag.has_value());

    const auto at_with_line = ParseOutput("at " + path + ":9", {LineParseOption::kAtFileLine});
    ASSERT_TRUE(at_with_line[0].tag.has_value());
    EXPECT_EQ(at_with_line[0].tag->line, 9);
    EXPECT_EQ(at_with_line[0].tag->file.size(), path.size());

    const std::string colours(64 * 1024, ';');
    EXPECT_FALSE(ParseOutput("\x1b[" + colours)[0].tag.has_value());
}

TEST(SplitArgumentsTest, HonoursQuotesAndEscapes) {
    EXPECT_EQ(SplitArguments("  -a  b "), (std::vector<std::string>{"-a", "b"}));
    EXPECT_EQ(SplitArguments(R"(--name "hello world" 'single $quoted')"),
              (std::vector<std::string>{"--name", "hello world", "single $quoted"}));
    EXPECT_EQ(SplitArguments(R"(a\ b "c\"d" '')"), (std::vector<std::string>{"a b", "c\"d", ""}));
    EXPECT_TRUE(SplitArguments("").empty());
}

TEST(SplitArgumentsTest, ResolvesEitherArgumentForm) {
    queue::ExecutionParams params{};
    params.args = std::string("x 'y z'");
    EXPECT_EQ(ResolveArgs(params), (std::vector<std::string>{"x", "y z"}));
    params.args = std::vector<std::string>{"x y"};
    EXPECT_EQ(ResolveArgs(params), (std::vector<std::string>{"x y"}));
}

}  // namespace
}  // namespace remex::sandbox
