#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "strata/error/exception.hpp"
#include "strata/yaml/exception.hpp"
#include "strata/yaml/scanner.hpp"

namespace strata::yaml::test {

namespace {
struct ScannedToken {
    TokenId id;
    std::string value;
};

auto scanAll(const std::string& input) -> std::vector<ScannedToken> {
    Scanner scanner(input);
    std::vector<ScannedToken> tokens;
    while (!scanner.empty()) {
        const Token& token = scanner.front();
        tokens.push_back({token.id, std::string(scanner.value(token))});
        scanner.popFront();
    }
    return tokens;
}

auto ids(const std::vector<ScannedToken>& tokens) -> std::vector<TokenId> {
    std::vector<TokenId> result;
    for (const auto& token : tokens) {
        result.push_back(token.id);
    }
    return result;
}

auto scalarValues(const std::vector<ScannedToken>& tokens)
    -> std::vector<std::string> {
    std::vector<std::string> result;
    for (const auto& token : tokens) {
        if (token.id == TokenId::Scalar) {
            result.push_back(token.value);
        }
    }
    return result;
}
}  // namespace

class ScannerTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    static void expectError(const std::string& input,
                            const std::string& context,
                            const std::string& mark,
                            const std::optional<std::string>& problem = {},
                            const std::string& problemMark = {}) {
        SCOPED_TRACE(input);
        try {
            (void)scanAll(input);
            FAIL() << "expected a ScannerError";
        } catch (const ScannerError& e) {
            EXPECT_EQ(e.getContext(), context);
            EXPECT_EQ(e.getMark().toString(), "<unknown>:" + mark);
            EXPECT_EQ(e.getProblem(), problem);
            if (problem) {
                ASSERT_TRUE(e.getProblemMark().has_value());
                EXPECT_EQ(e.getProblemMark()->toString(),
                          "<unknown>:" + problemMark);
            } else {
                EXPECT_FALSE(e.getProblemMark().has_value());
            }
        }
    }
};

TEST_F(ScannerTest, BlockMapping) {
    const auto tokens = scanAll("key: value\nother: 2\n");
    const std::vector<TokenId> expected = {
        TokenId::StreamStart, TokenId::BlockMappingStart, TokenId::Key,
        TokenId::Scalar,      TokenId::Value,             TokenId::Scalar,
        TokenId::Key,         TokenId::Scalar,            TokenId::Value,
        TokenId::Scalar,      TokenId::BlockEnd,          TokenId::StreamEnd};
    EXPECT_EQ(ids(tokens), expected);
    EXPECT_EQ(scalarValues(tokens),
              (std::vector<std::string>{"key", "value", "other", "2"}));
}

TEST_F(ScannerTest, BlockSequenceInsideMapping) {
    const auto tokens = scanAll("items:\n  - a\n  - b\n");
    const std::vector<TokenId> expected = {
        TokenId::StreamStart,        TokenId::BlockMappingStart,
        TokenId::Key,                TokenId::Scalar,
        TokenId::Value,              TokenId::BlockSequenceStart,
        TokenId::BlockEntry,         TokenId::Scalar,
        TokenId::BlockEntry,         TokenId::Scalar,
        TokenId::BlockEnd,           TokenId::BlockEnd,
        TokenId::StreamEnd};
    EXPECT_EQ(ids(tokens), expected);
}

TEST_F(ScannerTest, IndentlessSequence) {
    const auto tokens = scanAll("items:\n- a\n- b\n");
    const std::vector<TokenId> expected = {
        TokenId::StreamStart, TokenId::BlockMappingStart, TokenId::Key,
        TokenId::Scalar,      TokenId::Value,             TokenId::BlockEntry,
        TokenId::Scalar,      TokenId::BlockEntry,        TokenId::Scalar,
        TokenId::BlockEnd,    TokenId::StreamEnd};
    EXPECT_EQ(ids(tokens), expected);
}

TEST_F(ScannerTest, FlowCollections) {
    const auto tokens = scanAll("{a: 1, b: [x, y]}");
    const std::vector<TokenId> expected = {
        TokenId::StreamStart,       TokenId::FlowMappingStart,
        TokenId::Key,               TokenId::Scalar,
        TokenId::Value,             TokenId::Scalar,
        TokenId::FlowEntry,         TokenId::Key,
        TokenId::Scalar,            TokenId::Value,
        TokenId::FlowSequenceStart, TokenId::Scalar,
        TokenId::FlowEntry,         TokenId::Scalar,
        TokenId::FlowSequenceEnd,   TokenId::FlowMappingEnd,
        TokenId::StreamEnd};
    EXPECT_EQ(ids(tokens), expected);
    EXPECT_EQ(scalarValues(tokens),
              (std::vector<std::string>{"a", "1", "b", "x", "y"}));
}

TEST_F(ScannerTest, ExplicitKey) {
    const auto tokens = scanAll("? complex\n: value\n");
    const std::vector<TokenId> expected = {
        TokenId::StreamStart, TokenId::BlockMappingStart, TokenId::Key,
        TokenId::Scalar,      TokenId::Value,             TokenId::Scalar,
        TokenId::BlockEnd,    TokenId::StreamEnd};
    EXPECT_EQ(ids(tokens), expected);
}

TEST_F(ScannerTest, DirectivesAndDocumentMarkers) {
    Scanner scanner("%YAML 1.1\n%TAG !e! tag:example.com,2000:\n--- !e!foo bar\n...\n");
    ASSERT_EQ(scanner.front().id, TokenId::StreamStart);
    scanner.popFront();

    const Token yaml = scanner.front();
    EXPECT_EQ(yaml.id, TokenId::Directive);
    EXPECT_EQ(yaml.directive, DirectiveType::Yaml);
    EXPECT_EQ(scanner.value(yaml), "1.1");
    scanner.popFront();

    const Token tag = scanner.front();
    EXPECT_EQ(tag.directive, DirectiveType::Tag);
    EXPECT_EQ(scanner.value(tag), "!e!tag:example.com,2000:");
    EXPECT_EQ(tag.valueDivider, 3U);
    scanner.popFront();

    EXPECT_EQ(scanner.front().id, TokenId::DocumentStart);
    scanner.popFront();

    const Token nodeTag = scanner.front();
    EXPECT_EQ(nodeTag.id, TokenId::Tag);
    EXPECT_EQ(scanner.value(nodeTag), "!e!foo");
    EXPECT_EQ(nodeTag.valueDivider, 3U);
    EXPECT_EQ(nodeTag.startMark.toString(), "<unknown>:3,5");
    scanner.popFront();

    EXPECT_EQ(scanner.front().id, TokenId::Scalar);
    EXPECT_EQ(scanner.value(scanner.front()), "bar");
    scanner.popFront();
    EXPECT_EQ(scanner.front().id, TokenId::DocumentEnd);
    scanner.popFront();
    EXPECT_EQ(scanner.front().id, TokenId::StreamEnd);
    scanner.popFront();
    EXPECT_TRUE(scanner.empty());
    EXPECT_THROW((void)scanner.front(), error::LogicError);
}

TEST_F(ScannerTest, ReservedDirectiveIsSkipped) {
    Scanner scanner("%FOO bar baz\n--- x\n");
    scanner.popFront();
    EXPECT_EQ(scanner.front().id, TokenId::Directive);
    EXPECT_EQ(scanner.front().directive, DirectiveType::Reserved);
    EXPECT_TRUE(scanner.value(scanner.front()).empty());
}

TEST_F(ScannerTest, AnchorsAliasesAndTags) {
    const auto tokens = scanAll("- &anchor !!str x\n- *anchor\n- !<tag:a> y\n");
    std::vector<std::string> anchors;
    std::vector<std::string> tags;
    for (const auto& token : tokens) {
        if (token.id == TokenId::Anchor || token.id == TokenId::Alias) {
            anchors.push_back(token.value);
        } else if (token.id == TokenId::Tag) {
            tags.push_back(token.value);
        }
    }
    EXPECT_EQ(anchors, (std::vector<std::string>{"anchor", "anchor"}));
    EXPECT_EQ(tags, (std::vector<std::string>{"!!str", "tag:a"}));
}

TEST_F(ScannerTest, PlainScalarFolding) {
    const auto tokens = scanAll("a\n  b\n\n  c # comment\n");
    EXPECT_EQ(scalarValues(tokens), (std::vector<std::string>{"a b\nc"}));
}

TEST_F(ScannerTest, QuotedScalars) {
    const auto tokens = scanAll("- 'it''s'\n- \"two\n  lines\"\n");
    EXPECT_EQ(scalarValues(tokens),
              (std::vector<std::string>{"it's", "two lines"}));
}

TEST_F(ScannerTest, BlockScalars) {
    const auto tokens =
        scanAll("literal: |\n  a\n  b\nfolded: >\n  c\n  d\nstrip: |-\n  e\n\nkeep: |+\n  f\n\n");
    EXPECT_EQ(scalarValues(tokens),
              (std::vector<std::string>{"literal", "a\nb\n", "folded", "c d\n",
                                        "strip", "e", "keep", "f\n\n"}));
}

TEST_F(ScannerTest, BlockScalarWithoutTrailingBreak) {
    const auto tokens = scanAll("exp: |\n  foobar");
    EXPECT_EQ(scalarValues(tokens),
              (std::vector<std::string>{"exp", "foobar"}));
}

TEST_F(ScannerTest, BlockScalarIndentationIndicator) {
    const auto tokens = scanAll("- |2\n   indented\n");
    EXPECT_EQ(scalarValues(tokens), (std::vector<std::string>{" indented\n"}));
}

TEST_F(ScannerTest, LongSimpleKey) {
    const std::string shortKey(1000, 'k');
    const auto tokens = scanAll(shortKey + ": v");
    EXPECT_EQ(tokens[1].id, TokenId::BlockMappingStart);
    EXPECT_EQ(scalarValues(tokens), (std::vector<std::string>{shortKey, "v"}));

    const std::string longKey(1100, 'k');
    EXPECT_THROW((void)scanAll(longKey + ": v"), ScannerError);
}

TEST_F(ScannerTest, TabsSeparateTokensOnlyInFlowContext) {
    EXPECT_EQ(scalarValues(scanAll("[\ta,\tb]")),
              (std::vector<std::string>{"a", "b"}));
    EXPECT_THROW((void)scanAll("-\tb"), ScannerError);
    EXPECT_THROW((void)scanAll("key:\tvalue"), ScannerError);
}

TEST_F(ScannerTest, StreamStartCarriesEncoding) {
    Scanner utf8("a");
    EXPECT_EQ(utf8.front().encoding, Encoding::Utf8);

    Scanner utf16(std::string("\xFF\xFE" "a\0", 4));
    EXPECT_EQ(utf16.front().id, TokenId::StreamStart);
    EXPECT_EQ(utf16.front().encoding, Encoding::Utf16);
}

TEST_F(ScannerTest, NullReaderIsRejected) {
    EXPECT_THROW(Scanner scanner{std::unique_ptr<Reader>{}},
                 error::InvalidArgument);
}

TEST_F(ScannerTest, NameAppearsInMarks) {
    Scanner scanner("x", "config.yaml");
    EXPECT_EQ(scanner.name(), "config.yaml");
    scanner.popFront();
    EXPECT_EQ(scanner.front().startMark.toString(), "config.yaml:1,1");
}

TEST_F(ScannerTest, MappingAndKeyErrors) {
    expectError("test: key: value", "Mapping values are not allowed here",
                "1,10");
    expectError("test: ? foo\n      : bar", "Mapping keys are not allowed here",
                "1,7");
    expectError("@",
                "While scanning for the next token, found character '@', "
                "index 64 that cannot start any token",
                "1,1");
    expectError("foo: bar\nmeh",
                "While scanning a simple key, could not find expected ':'",
                "2,4", "key started here", "2,1");
    expectError("foo: &[",
                "While scanning an anchor or alias, expected a printable "
                "character besides '[', ']', '{', '}' and ',', but found [",
                "1,7", "started here", "1,6");
}

TEST_F(ScannerTest, DirectiveErrors) {
    expectError("%?",
                "While scanning a directive, expected alphanumeric, '-' or "
                "'_', but found ?",
                "1,2", "directive started here", "1,1");
    expectError("%YAML 1?",
                "While scanning a directive, expected digit or '.', but found ?",
                "1,8", "directive started here", "1,1");
    expectError("%YAML ?",
                "While scanning a directive, expected a digit, but found ?",
                "1,7", "directive started here", "1,1");
    expectError("%TAG !a!<",
                "While scanning a directive handle, expected ' ', but found <",
                "1,9", "directive started here", "1,1");
    expectError("%TAG !a! !>",
                "While scanning a directive prefix, expected ' ', but found >",
                "1,11", "directive started here", "1,1");
    expectError("%YAML 1.0 ?",
                "While scanning a directive, expected a comment or a line "
                "break, but found ?",
                "1,11", "directive started here", "1,1");
}

TEST_F(ScannerTest, TagErrors) {
    expectError("foo: !<a#", "While scanning a tag, expected a '>', but found #",
                "1,9", "tag started here", "1,6");
    expectError("foo: !<a>#", "While scanning a tag, expected a ' ', but found #",
                "1,10", "tag started here", "1,6");
    expectError("Error: !a:!", "While scanning a tag, expected a !, but found :",
                "1,10", "tag started here", "1,8");
}

TEST_F(ScannerTest, ScalarErrors) {
    expectError("foo: |b",
                "While scanning a block scalar, expected a chomping or "
                "indentation indicator, but found b",
                "1,7", "scalar started here", "1,6");
    expectError("foo: |0",
                "While scanning a block scalar, expected an indentation "
                "indicator in range 1-9, but found 0",
                "1,7", "scalar started here", "1,6");
    expectError("\"\\x\"",
                "While scanning a double quoted scalar, expected an escape "
                "sequence of hexadecimal numbers, but found \"",
                "1,4", "scalar started here", "1,1");
    expectError("\"\\:\"",
                "While scanning a double quoted scalar, found unsupported "
                "escape character :",
                "1,3", "scalar started here", "1,1");
    expectError("\"an unfinished scal",
                "While scanning a quoted scalar, found unexpected end of buffer",
                "1,20", "scalar started here", "1,1");
    expectError("\"an unfinished scal\n---",
                "While scanning a quoted scalar, found unexpected document "
                "separator",
                "2,1", "scalar started here", "1,1");
}

TEST_F(ScannerTest, ErrorDescription) {
    try {
        (void)scanAll("foo: bar\nmeh");
        FAIL() << "expected a ScannerError";
    } catch (const ScannerError& e) {
        EXPECT_EQ(e.describe(),
                  "While scanning a simple key, could not find expected ':': "
                  "<unknown>:2,4\nkey started here: <unknown>:2,1");
        EXPECT_EQ(e.getMessage(), e.describe());
    }
}

}  // namespace strata::yaml::test

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
