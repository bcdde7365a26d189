#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <string>
#include <utility>
#include <vector>

#include "strata/yaml/emitter.hpp"
#include "strata/yaml/parser.hpp"
#include "strata/yaml/resolver.hpp"

namespace strata::yaml::test {

class RoundTripTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }

    /// Kind, anchor, resolved tag and value of every node event. Scalar
    /// styles and document markers may differ between the input and the
    /// emitted text.
    static auto nodeNotation(const std::vector<Event>& events)
        -> std::vector<std::string> {
        const Resolver resolver = Resolver::withDefaultResolvers();
        std::vector<std::string> lines;
        for (const auto& event : events) {
            if (event.id == EventId::DocumentStart ||
                event.id == EventId::DocumentEnd) {
                continue;
            }
            std::string line(eventIdName(event.id));
            line += " &" + event.anchor();
            if (event.id == EventId::Scalar ||
                event.id == EventId::SequenceStart ||
                event.id == EventId::MappingStart) {
                line += " <" + resolver.resolve(event) + ">";
            }
            if (event.id == EventId::Scalar) {
                line += " " + event.value;
            }
            lines.push_back(std::move(line));
        }
        return lines;
    }

    static auto scalarValues(const std::vector<Event>& events)
        -> std::vector<std::string> {
        std::vector<std::string> values;
        for (const auto& event : events) {
            if (event.id == EventId::Scalar) {
                values.push_back(event.value);
            }
        }
        return values;
    }

    static void expectRoundTrip(const std::string& input,
                                const EmitterSettings& settings = {}) {
        const auto events = parseEvents(input, "input");
        const std::string emitted = emitEvents(events, settings);
        const auto reparsed = parseEvents(emitted, "emitted");
        EXPECT_EQ(nodeNotation(events), nodeNotation(reparsed))
            << "emitted:\n" << emitted;
    }
};

TEST_F(RoundTripTest, Collections) {
    expectRoundTrip(
        "key: value\nlist:\n- 1\n- two\nnested:\n  a: {x: 1, y: [p, q]}\n");
}

TEST_F(RoundTripTest, AnchorsAndTags) {
    const std::string input =
        "- &anchor value\n- *anchor\n- !!str 42\n- !local tagged\n";
    expectRoundTrip(input);

    const auto reparsed = parseEvents(emitEvents(parseEvents(input)));
    const Resolver resolver = Resolver::withDefaultResolvers();
    EXPECT_EQ(reparsed[5].value, "42");
    EXPECT_EQ(resolver.resolve(reparsed[5]), "tag:yaml.org,2002:str");
    EXPECT_EQ(resolver.resolve(reparsed[6]), "!local");
}

TEST_F(RoundTripTest, ScalarStyles) {
    expectRoundTrip(
        "plain: text\nsingle: 'it''s'\ndouble: \"tab\\tend\"\n"
        "literal: |\n  line one\n  line two\nempty:\n");
}

TEST_F(RoundTripTest, MultipleDocuments) {
    expectRoundTrip("--- first\n--- second\n...\n");
}

TEST_F(RoundTripTest, TagDirectives) {
    expectRoundTrip("%TAG !e! tag:example.com,2000:\n--- !e!thing value\n");
}

TEST_F(RoundTripTest, ComplexKey) { expectRoundTrip("? [a, b]\n: complex\n"); }

TEST_F(RoundTripTest, Escapes) {
    expectRoundTrip("\"unicode \\u00e9 and \\x41\"\n");
}

TEST_F(RoundTripTest, NarrowWidthFoldsLongScalars) {
    EmitterSettings settings;
    settings.width = 20;
    expectRoundTrip(
        "text: the quick brown fox jumps over the lazy dog again and again\n",
        settings);
}

TEST_F(RoundTripTest, WindowsLineBreaks) {
    EmitterSettings settings;
    settings.lineBreak = LineBreak::Windows;
    expectRoundTrip("a:\n- 1\n- 2\nb: |\n  x\n", settings);
}

TEST_F(RoundTripTest, CanonicalKeepsValues) {
    const auto events = parseEvents("a: [1, 'two']\nb: {c: d}\n");
    EmitterSettings settings;
    settings.canonical = true;
    const auto reparsed = parseEvents(emitEvents(events, settings));
    EXPECT_EQ(scalarValues(events), scalarValues(reparsed));
}

}  // namespace strata::yaml::test

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
