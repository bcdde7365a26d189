#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "strata/yaml/emitter.hpp"
#include "strata/yaml/exception.hpp"
#include "strata/yaml/parser.hpp"
#include "strata/yaml/scalar_writer.hpp"

namespace strata::yaml::test {

namespace {
const Mark NO_MARK;

auto scalar(std::string value, bool implicit = true,
            ScalarStyle style = ScalarStyle::Invalid, std::string tag = "",
            std::string anchor = "") -> Event {
    return scalarEvent(NO_MARK, NO_MARK, std::move(anchor), std::move(tag),
                       implicit, std::move(value), style);
}

auto mapStart(CollectionStyle style = CollectionStyle::Block,
              std::string tag = "", bool implicit = true) -> Event {
    return mappingStartEvent(NO_MARK, NO_MARK, "", std::move(tag), implicit,
                             style);
}

auto seqStart(CollectionStyle style = CollectionStyle::Block,
              std::string anchor = "") -> Event {
    return sequenceStartEvent(NO_MARK, NO_MARK, std::move(anchor), "", true,
                              style);
}

auto mapEnd() -> Event { return mappingEndEvent(NO_MARK, NO_MARK); }
auto seqEnd() -> Event { return sequenceEndEvent(NO_MARK, NO_MARK); }

/// A stream holding one document with the given content.
auto document(std::vector<Event> body, bool explicitStart = false,
              std::string version = "",
              std::vector<TagDirective> directives = {})
    -> std::vector<Event> {
    std::vector<Event> events;
    events.push_back(streamStartEvent(NO_MARK, NO_MARK));
    events.push_back(documentStartEvent(NO_MARK, NO_MARK, explicitStart,
                                        std::move(version),
                                        std::move(directives)));
    for (auto& event : body) {
        events.push_back(std::move(event));
    }
    events.push_back(documentEndEvent(NO_MARK, NO_MARK, false));
    events.push_back(streamEndEvent(NO_MARK, NO_MARK));
    return events;
}
}  // namespace

class EmitterTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }
};

TEST_F(EmitterTest, EmptyMappingValueKeepsSpace) {
    const auto events =
        document({mapStart(), scalar("key"), scalar(""), mapEnd()}, true);
    EXPECT_EQ(emitEvents(events), "---\nkey: \n");
}

TEST_F(EmitterTest, BlockMapping) {
    const auto events = document(
        {mapStart(), scalar("key"), scalar("value"), scalar("n"), scalar("1"),
         mapEnd()});
    EXPECT_EQ(emitEvents(events), "key: value\nn: 1\n");
}

TEST_F(EmitterTest, BlockSequence) {
    const auto events = document({seqStart(), scalar("1"), scalar("2"), seqEnd()});
    EXPECT_EQ(emitEvents(events), "- 1\n- 2\n");
}

TEST_F(EmitterTest, SequenceInsideMappingIsIndentless) {
    const auto events = document({mapStart(), scalar("a"), seqStart(),
                                  scalar("x"), scalar("y"), seqEnd(), mapEnd()});
    EXPECT_EQ(emitEvents(events), "a:\n- x\n- y\n");
}

TEST_F(EmitterTest, MappingInsideSequence) {
    const auto events =
        document({seqStart(), mapStart(), scalar("a"), scalar("1"), scalar("b"),
                  scalar("2"), mapEnd(), seqEnd()});
    EXPECT_EQ(emitEvents(events), "- a: 1\n  b: 2\n");
}

TEST_F(EmitterTest, FlowCollections) {
    const auto events = document(
        {seqStart(CollectionStyle::Flow), scalar("a"), scalar("b"), seqEnd()});
    EXPECT_EQ(emitEvents(events), "[a, b]\n");

    const auto mapping =
        document({mapStart(CollectionStyle::Flow), scalar("k"), scalar("v"),
                  mapEnd()});
    EXPECT_EQ(emitEvents(mapping), "{k: v}\n");
}

TEST_F(EmitterTest, EmptyCollectionsAreFlow) {
    const auto events =
        document({mapStart(), scalar("a"), seqStart(), seqEnd(), scalar("b"),
                  mapStart(), mapEnd(), mapEnd()});
    EXPECT_EQ(emitEvents(events), "a: []\nb: {}\n");
}

TEST_F(EmitterTest, RootPlainScalarIsOpenEnded) {
    EXPECT_EQ(emitEvents(document({scalar("x")})), "x\n...\n");
}

TEST_F(EmitterTest, SecondDocumentGetsMarker) {
    std::vector<Event> events;
    events.push_back(streamStartEvent(NO_MARK, NO_MARK));
    for (const char* value : {"x", "y"}) {
        events.push_back(documentStartEvent(NO_MARK, NO_MARK, false, "", {}));
        events.push_back(scalar(value));
        events.push_back(documentEndEvent(NO_MARK, NO_MARK, false));
    }
    events.push_back(streamEndEvent(NO_MARK, NO_MARK));
    EXPECT_EQ(emitEvents(events), "x\n--- y\n...\n");
}

TEST_F(EmitterTest, ExplicitDocumentEnd) {
    auto events = document({mapStart(), scalar("a"), scalar("b"), mapEnd()});
    events[events.size() - 2] = documentEndEvent(NO_MARK, NO_MARK, true);
    EXPECT_EQ(emitEvents(events), "a: b\n...\n");
}

TEST_F(EmitterTest, QuotedStyles) {
    const auto events = document(
        {seqStart(), scalar(" lead", false), scalar("it's", false,
                                                    ScalarStyle::SingleQuoted),
         scalar("plain", false, ScalarStyle::DoubleQuoted),
         scalar("tab\there\x01", false), seqEnd()});
    EXPECT_EQ(emitEvents(events),
              "- ' lead'\n- 'it''s'\n- \"plain\"\n- \"tab\\there\\x01\"\n");
}

TEST_F(EmitterTest, ImplicitScalarThatCannotBePlain) {
    const auto events = document({seqStart(), scalar("a: b"), seqEnd()});
    EXPECT_EQ(emitEvents(events), "- ! 'a: b'\n");
}

TEST_F(EmitterTest, BlockScalars) {
    const auto events = document(
        {mapStart(), scalar("lit"), scalar("a\nb\n", false, ScalarStyle::Literal),
         scalar("strip"), scalar("a", false, ScalarStyle::Literal), mapEnd()});
    EXPECT_EQ(emitEvents(events), "lit: |\n  a\n  b\nstrip: |-\n  a\n");
}

TEST_F(EmitterTest, MultilineScalarDefaultsToQuoted) {
    const auto events = document({seqStart(), scalar("a\nb", false), seqEnd()});
    const std::string text = emitEvents(events);
    const auto reparsed = parseEvents(text);
    EXPECT_EQ(reparsed[3].value, "a\nb");
    EXPECT_EQ(reparsed[3].scalarStyle, ScalarStyle::SingleQuoted);
}

TEST_F(EmitterTest, AnchorsAndAliases) {
    const auto events = document(
        {seqStart(), scalar("x", true, ScalarStyle::Invalid, "", "a"),
         aliasEvent(NO_MARK, NO_MARK, "a"), seqEnd()});
    EXPECT_EQ(emitEvents(events), "- &a x\n- *a\n");
}

TEST_F(EmitterTest, LongKeyIsWrittenExplicitly) {
    const std::string key(130, 'k');
    const auto events =
        document({mapStart(), scalar(key), scalar("v"), mapEnd()});
    EXPECT_EQ(emitEvents(events), "? " + key + "\n: v\n");
}

TEST_F(EmitterTest, Canonical) {
    const auto events = document(
        {mapStart(CollectionStyle::Block, "tag:yaml.org,2002:map", false),
         scalar("key", false, ScalarStyle::Invalid, "tag:yaml.org,2002:str"),
         scalar("value", false, ScalarStyle::Invalid, "tag:yaml.org,2002:str"),
         mapEnd()});
    EmitterSettings settings;
    settings.canonical = true;
    EXPECT_EQ(emitEvents(events, settings),
              "---\n!!map {\n  ? !!str \"key\"\n  : !!str \"value\",\n}\n");
}

TEST_F(EmitterTest, VersionAndTagDirectives) {
    const auto events = document(
        {scalar("x", false, ScalarStyle::Invalid, "tag:example.com,2000:foo")},
        false, "1.1", {{"!e!", "tag:example.com,2000:"}});
    const std::string text = emitEvents(events);
    EXPECT_EQ(text,
              "%YAML 1.1\n%TAG !e! tag:example.com,2000:\n--- !e!foo 'x'\n");

    const auto reparsed = parseEvents(text);
    EXPECT_EQ(reparsed[1].value, "1.1");
    EXPECT_EQ(reparsed[2].tag(), "tag:example.com,2000:foo");
}

TEST_F(EmitterTest, UnknownTagIsVerbatim) {
    const auto events = document({seqStart(),
                                  scalar("x", false, ScalarStyle::Invalid,
                                         "urn:a b"),
                                  seqEnd()});
    EXPECT_EQ(emitEvents(events), "- !<urn:a%20b> 'x'\n");
}

TEST_F(EmitterTest, IndentSetting) {
    const auto events =
        document({mapStart(), scalar("a"), mapStart(), scalar("b"),
                  scalar("c"), mapEnd(), mapEnd()});
    EmitterSettings settings;
    settings.indent = 4;
    EXPECT_EQ(emitEvents(events, settings), "a:\n    b: c\n");
}

TEST_F(EmitterTest, WindowsLineBreaks) {
    const auto events = document(
        {mapStart(), scalar("a"), scalar("1"), scalar("b"), scalar("2"),
         mapEnd()});
    EmitterSettings settings;
    settings.lineBreak = LineBreak::Windows;
    EXPECT_EQ(emitEvents(events, settings), "a: 1\r\nb: 2\r\n");
}

TEST_F(EmitterTest, Utf16OutputStartsWithByteOrderMark) {
    const auto events =
        document({mapStart(), scalar("a"), scalar("b"), mapEnd()});
    EmitterSettings settings;
    settings.encoding = Encoding::Utf16;
    const std::string text = emitEvents(events, settings);
    ASSERT_EQ(text.size(), 12U);

    const auto reparsed = parseEvents(text);
    ASSERT_EQ(reparsed.size(), 8U);
    EXPECT_EQ(reparsed[3].value, "a");
    EXPECT_EQ(reparsed[4].value, "b");
}

TEST_F(EmitterTest, SettingsAreNormalized) {
    EmitterSettings settings;
    settings.indent = 1;
    settings.width = 3;
    const EmitterSettings normalized = settings.normalized();
    EXPECT_EQ(normalized.indent, 2);
    EXPECT_EQ(normalized.width, 80);

    settings.indent = 4;
    settings.width = 9;
    EXPECT_EQ(settings.normalized().width, 9);

    std::ostringstream out;
    Emitter emitter(out, EmitterSettings{false, 12, 80});
    EXPECT_EQ(emitter.settings().indent, 2);
}

TEST_F(EmitterTest, EventOrderErrors) {
    std::ostringstream out;
    Emitter emitter(out);
    try {
        emitter.emit(scalar("x"));
        FAIL() << "expected an EmitterError";
    } catch (const EmitterError& e) {
        EXPECT_EQ(e.getMessage(), "Expected streamStart, but got scalar");
    }

    std::vector<Event> events = document({scalar("x")});
    events.push_back(scalar("y"));
    try {
        (void)emitEvents(events);
        FAIL() << "expected an EmitterError";
    } catch (const EmitterError& e) {
        EXPECT_EQ(e.getMessage(), "Expected nothing, but got scalar");
    }
}

TEST_F(EmitterTest, AliasWithoutAnchor) {
    Event alias;
    alias.id = EventId::Alias;
    EXPECT_THROW((void)emitEvents(document({alias})), EmitterError);
}

TEST_F(EmitterTest, CollectionWithoutTag) {
    const auto events = document(
        {mapStart(CollectionStyle::Block, "", false), mapEnd()});
    try {
        (void)emitEvents(events);
        FAIL() << "expected an EmitterError";
    } catch (const EmitterError& e) {
        EXPECT_EQ(e.getMessage(), "Tag is not specified");
    }
}

TEST_F(EmitterTest, InvalidDirectivesAndAnchors) {
    EXPECT_THROW((void)emitEvents(document({scalar("x")}, false, "2.0")),
                 EmitterError);
    EXPECT_THROW(
        (void)emitEvents(document({scalar("x")}, false, "", {{"e!", "tag:e"}})),
        EmitterError);
    EXPECT_THROW((void)emitEvents(document(
                     {scalar("x", true, ScalarStyle::Invalid, "", "a b")})),
                 EmitterError);
}

class ScalarAnalysisTest : public ::testing::Test {
protected:
    static auto flags(std::string_view text) -> std::uint8_t {
        return analyzeScalar(text).flags;
    }

    static constexpr std::uint8_t QUOTED =
        ScalarAnalysis::AllowSingleQuoted | ScalarAnalysis::AllowDoubleQuoted;
};

TEST_F(ScalarAnalysisTest, EmptyScalar) {
    EXPECT_EQ(flags(""), ScalarAnalysis::Empty |
                             ScalarAnalysis::AllowBlockPlain | QUOTED);
}

TEST_F(ScalarAnalysisTest, SimpleScalarAllowsEverything) {
    EXPECT_EQ(flags("a"), ScalarAnalysis::AllowFlowPlain |
                              ScalarAnalysis::AllowBlockPlain | QUOTED |
                              ScalarAnalysis::AllowBlock);
}

TEST_F(ScalarAnalysisTest, SurroundingSpaces) {
    EXPECT_EQ(flags(" "), QUOTED);
    EXPECT_EQ(flags(" a"), QUOTED | ScalarAnalysis::AllowBlock);
    EXPECT_EQ(flags("a "), QUOTED);
}

TEST_F(ScalarAnalysisTest, LineBreaks) {
    EXPECT_EQ(flags("\n"), ScalarAnalysis::Multiline | QUOTED |
                               ScalarAnalysis::AllowBlock);
    EXPECT_EQ(flags("\na"), ScalarAnalysis::Multiline | QUOTED |
                                ScalarAnalysis::AllowBlock);
    EXPECT_EQ(flags(" \n"),
              ScalarAnalysis::Multiline | ScalarAnalysis::AllowDoubleQuoted);
    EXPECT_EQ(flags("\n a"), ScalarAnalysis::Multiline |
                                 ScalarAnalysis::AllowDoubleQuoted |
                                 ScalarAnalysis::AllowBlock);
}

TEST_F(ScalarAnalysisTest, TabBeforeBreakIsNeverSingleQuoted) {
    EXPECT_FALSE(analyzeScalar("a\t\nb").has(ScalarAnalysis::AllowSingleQuoted));
    EXPECT_TRUE(analyzeScalar("a\t\nb").has(ScalarAnalysis::AllowDoubleQuoted));

    for (const ScalarStyle style :
         {ScalarStyle::Invalid, ScalarStyle::Plain, ScalarStyle::SingleQuoted,
          ScalarStyle::Literal, ScalarStyle::Folded}) {
        const auto events = document(
            {seqStart(), scalar("a\t\nb", true, style), seqEnd()});
        const std::string text = emitEvents(events);
        EXPECT_EQ(text.find('\''), std::string::npos) << text;

        const auto reparsed = parseEvents(text);
        EXPECT_EQ(reparsed[3].value, "a\t\nb");
        EXPECT_EQ(reparsed[3].scalarStyle, ScalarStyle::DoubleQuoted);
    }
}

TEST_F(ScalarAnalysisTest, Indicators) {
    EXPECT_FALSE(analyzeScalar("- a").has(ScalarAnalysis::AllowBlockPlain));
    EXPECT_FALSE(analyzeScalar("a, b").has(ScalarAnalysis::AllowFlowPlain));
    EXPECT_TRUE(analyzeScalar("a, b").has(ScalarAnalysis::AllowBlockPlain));
    EXPECT_FALSE(analyzeScalar("a #b").has(ScalarAnalysis::AllowBlockPlain));
    EXPECT_FALSE(analyzeScalar("---").has(ScalarAnalysis::AllowBlockPlain));
    EXPECT_TRUE(analyzeScalar("a:b").has(ScalarAnalysis::AllowBlockPlain));
}

TEST_F(ScalarAnalysisTest, InvalidUtf8) {
    EXPECT_THROW((void)analyzeScalar("\xC3("), EmitterError);
}

TEST(BlockHintsTest, Hints) {
    EXPECT_EQ(ScalarWriter::determineBlockHints("", 2), "");
    EXPECT_EQ(ScalarWriter::determineBlockHints("a", 2), "-");
    EXPECT_EQ(ScalarWriter::determineBlockHints("a\n", 2), "");
    EXPECT_EQ(ScalarWriter::determineBlockHints("a\n\n", 2), "+");
    EXPECT_EQ(ScalarWriter::determineBlockHints("\n", 2), "2+");
    EXPECT_EQ(ScalarWriter::determineBlockHints(" a", 4), "4-");
}

}  // namespace strata::yaml::test

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
