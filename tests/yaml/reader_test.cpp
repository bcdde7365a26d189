#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <string>

#include "strata/error/exception.hpp"
#include "strata/yaml/exception.hpp"
#include "strata/yaml/reader.hpp"

namespace strata::yaml::test {

class ReaderTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }
};

TEST_F(ReaderTest, PeekAndForwardTrackPosition) {
    Reader reader("ab\ncd", "input.yaml");
    EXPECT_EQ(reader.peek(), U'a');
    EXPECT_EQ(reader.peek(1), U'b');
    EXPECT_EQ(reader.peek(3), U'c');
    EXPECT_EQ(reader.peek(10), kEndOfInput);

    reader.forward(3);
    EXPECT_EQ(reader.line(), 1U);
    EXPECT_EQ(reader.column(), 0U);
    EXPECT_EQ(reader.charIndex(), 3U);
    EXPECT_EQ(reader.peek(), U'c');
    EXPECT_EQ(reader.mark().toString(), "input.yaml:2,1");

    reader.forward(2);
    EXPECT_TRUE(reader.atEnd());
    EXPECT_EQ(reader.peek(), kEndOfInput);
}

TEST_F(ReaderTest, CarriageReturnLineFeedIsOneBreak) {
    Reader reader("a\r\nb\rc");
    reader.forward(3);
    EXPECT_EQ(reader.line(), 1U);
    EXPECT_EQ(reader.column(), 0U);
    EXPECT_EQ(reader.peek(), U'b');

    reader.forward(2);
    EXPECT_EQ(reader.line(), 2U);
    EXPECT_EQ(reader.column(), 0U);
    EXPECT_EQ(reader.peek(), U'c');
}

TEST_F(ReaderTest, UnicodeLineBreaks) {
    Reader reader("a b\xC2\x85" "c\xE2\x80\xA8" "d");
    reader.forward(2);
    EXPECT_EQ(reader.line(), 0U);
    EXPECT_EQ(reader.column(), 2U);
    reader.forward(2);
    EXPECT_EQ(reader.line(), 1U);
    EXPECT_EQ(reader.column(), 0U);
    EXPECT_EQ(reader.peek(), U'c');
    reader.forward(2);
    EXPECT_EQ(reader.line(), 2U);
    EXPECT_EQ(reader.peek(), U'd');
}

TEST_F(ReaderTest, MultiByteCharacters) {
    Reader reader("h\xC3\xA9llo \xE2\x82\xAC!");
    EXPECT_EQ(reader.peek(1), U'é');
    EXPECT_EQ(reader.prefix(3), "h\xC3\xA9l");
    EXPECT_EQ(reader.get(2), "h\xC3\xA9");
    EXPECT_EQ(reader.column(), 2U);
    reader.forward(4);
    EXPECT_EQ(reader.get(), U'€');
    EXPECT_EQ(reader.get(), U'!');
    EXPECT_TRUE(reader.atEnd());
}

TEST_F(ReaderTest, RepeatedLookAheadIsStable) {
    // x, U+00E9, U+20AC, U+1F600, y
    Reader reader("x\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80y");
    EXPECT_EQ(reader.peek(3), U'\U0001F600');
    EXPECT_EQ(reader.peek(1), U'\u00E9');
    EXPECT_EQ(reader.peek(3), U'\U0001F600');
    EXPECT_EQ(reader.peek(2), U'\u20AC');
    EXPECT_EQ(reader.peek(4), U'y');
    EXPECT_EQ(reader.peek(4), U'y');

    EXPECT_EQ(reader.prefix(3), "x\xC3\xA9\xE2\x82\xAC");
    EXPECT_EQ(reader.slice(2), "x\xC3\xA9");
    EXPECT_EQ(reader.prefix(3), "x\xC3\xA9\xE2\x82\xAC");
    EXPECT_EQ(reader.peek(2), U'\u20AC');
    EXPECT_EQ(reader.slice(2), "x\xC3\xA9");
    EXPECT_EQ(reader.peek(), U'x');
    EXPECT_EQ(reader.charIndex(), 0U);

    reader.forward(2);
    EXPECT_EQ(reader.peek(1), U'\U0001F600');
    EXPECT_EQ(reader.peek(0), U'\u20AC');
    EXPECT_EQ(reader.prefix(2), "\xE2\x82\xAC\xF0\x9F\x98\x80");
    EXPECT_EQ(reader.peek(1), U'\U0001F600');
}

TEST_F(ReaderTest, PrefixBytes) {
    Reader reader("abc");
    EXPECT_EQ(reader.prefixBytes(2), "ab");
    EXPECT_EQ(reader.peekByte(2), 'c');
    EXPECT_EQ(reader.peekByte(5), '\0');
    EXPECT_THROW((void)reader.prefixBytes(4), error::OutOfRange);
}

TEST_F(ReaderTest, MarkOffsetOnSameLine) {
    Reader reader("key: value", "doc");
    reader.forward(2);
    EXPECT_EQ(reader.mark(3).toString(), "doc:1,6");
    reader.setName("renamed");
    EXPECT_EQ(reader.mark().toString(), "renamed:1,3");
    EXPECT_EQ(reader.name(), "renamed");
}

TEST_F(ReaderTest, DetectsUtf16LittleEndian) {
    const std::string input("\xFF\xFE" "a\0:\0 \0b\0", 10);
    Reader reader(input);
    EXPECT_EQ(reader.encoding(), Encoding::Utf16);
    EXPECT_EQ(reader.get(4), "a: b");
    EXPECT_TRUE(reader.atEnd());
}

TEST_F(ReaderTest, DetectsUtf16BigEndian) {
    const std::string input("\xFE\xFF\0x", 4);
    Reader reader(input);
    EXPECT_EQ(reader.encoding(), Encoding::Utf16);
    EXPECT_EQ(reader.peek(), U'x');
}

TEST_F(ReaderTest, Utf8ByteOrderMarkIsSkipped) {
    Reader reader("\xEF\xBB\xBFx");
    EXPECT_EQ(reader.encoding(), Encoding::Utf8);
    EXPECT_EQ(reader.peek(), U'x');
    EXPECT_EQ(reader.column(), 0U);
}

TEST_F(ReaderTest, MisalignedUtf16Input) {
    const std::string input("\xFF\xFE" "a\0b", 5);
    try {
        Reader reader(input);
        FAIL() << "expected a ReaderError";
    } catch (const ReaderError& e) {
        EXPECT_EQ(e.getContext(),
                  "Reader error: Size of UTF-16 or UTF-32 input not aligned "
                  "to 2 or 4 bytes, respectively");
        EXPECT_EQ(e.getMark().line(), 0U);
    }
}

TEST_F(ReaderTest, InvalidUtf8Input) {
    try {
        Reader reader("ab\xC3(");
        FAIL() << "expected a ReaderError";
    } catch (const ReaderError& e) {
        EXPECT_EQ(e.getContext().rfind(
                      "Reader error: Error when converting to UTF-8: ", 0),
                  0U);
    }
}

TEST_F(ReaderTest, NonPrintableCharacter) {
    try {
        Reader reader("ok\nab\x01", "bad.yaml");
        FAIL() << "expected a ReaderError";
    } catch (const ReaderError& e) {
        EXPECT_EQ(e.getContext(),
                  "Reader error: Special unicode characters are not allowed");
        EXPECT_EQ(e.getMark().toString(), "bad.yaml:2,3");
        EXPECT_FALSE(e.getProblemMark().has_value());
    }
}

TEST_F(ReaderTest, ReaderErrorIsAYamlError) {
    EXPECT_THROW(Reader reader("\x02"), YamlError);
}

class SliceBuilderTest : public ::testing::Test {
protected:
    void SetUp() override { spdlog::set_level(spdlog::level::off); }
};

TEST_F(SliceBuilderTest, WritesConsumedTextInPlace) {
    Reader reader("abcdef");
    auto& builder = reader.sliceBuilder();
    builder.begin();
    EXPECT_TRUE(builder.inProgress());
    builder.write(reader.get(3));
    EXPECT_EQ(builder.length(), 3U);

    const Slice slice = builder.finish();
    EXPECT_FALSE(builder.inProgress());
    EXPECT_EQ(reader.view(slice), "abc");
}

TEST_F(SliceBuilderTest, TransactionEndRevertsAndInsertShifts) {
    Reader reader("abcdef");
    auto& builder = reader.sliceBuilder();
    builder.begin();
    builder.write(reader.get(3));

    SliceBuilder::Transaction transaction(builder);
    builder.write(reader.get(2));
    EXPECT_EQ(builder.length(), 5U);
    transaction.end();
    EXPECT_EQ(builder.length(), 3U);

    builder.write(U'X');
    builder.insert(U'-', 1);
    EXPECT_EQ(reader.view(builder.finish()), "a-bcX");
}

TEST_F(SliceBuilderTest, CommittedTransactionKeepsText) {
    Reader reader("abcdef");
    auto& builder = reader.sliceBuilder();
    builder.begin();
    builder.write(reader.get(2));

    SliceBuilder::Transaction transaction(builder);
    builder.write(reader.get(2));
    transaction.commit();
    transaction.end();
    EXPECT_EQ(reader.view(builder.finish()), "abcd");
}

TEST_F(SliceBuilderTest, MoveAssignmentEndsReplacedTransaction) {
    Reader reader("abcdef");
    auto& builder = reader.sliceBuilder();
    builder.begin();
    builder.write(reader.get(2));

    SliceBuilder::Transaction transaction(builder);
    builder.write(reader.get(2));
    EXPECT_EQ(builder.length(), 4U);

    transaction = SliceBuilder::Transaction();
    EXPECT_EQ(builder.length(), 2U);
    transaction.end();
    EXPECT_EQ(reader.view(builder.finish()), "ab");
}

TEST_F(SliceBuilderTest, WritesMultiByteCharacter) {
    Reader reader("\\u00e9xyz");
    auto& builder = reader.sliceBuilder();
    builder.begin();
    reader.forward(6);
    builder.write(U'é');
    EXPECT_EQ(reader.view(builder.finish()), "\xC3\xA9");
}

TEST_F(SliceBuilderTest, MisuseIsALogicError) {
    Reader reader("abc");
    auto& builder = reader.sliceBuilder();
    EXPECT_THROW((void)builder.finish(), error::LogicError);

    builder.begin();
    EXPECT_THROW(builder.begin(), error::LogicError);
    // Nothing has been consumed yet.
    EXPECT_THROW(builder.write(U'x'), error::LogicError);

    reader.forward(1);
    SliceBuilder::Transaction transaction(builder);
    EXPECT_THROW((void)builder.finish(), error::LogicError);
    transaction.end();
    EXPECT_EQ(builder.finish().length, 0U);
}

}  // namespace strata::yaml::test

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
