#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>

#include "strata/yaml/exception.hpp"
#include "strata/yaml/mark.hpp"

namespace strata::yaml::test {

class MarkTest : public ::testing::Test {};

TEST_F(MarkTest, PrintsOneBasedPosition) {
    const Mark mark(std::make_shared<const std::string>("doc.yaml"), 0, 4);
    EXPECT_EQ(mark.toString(), "doc.yaml:1,5");

    std::ostringstream oss;
    oss << mark;
    EXPECT_EQ(oss.str(), "doc.yaml:1,5");
}

TEST_F(MarkTest, DefaultNameIsUnknown) {
    EXPECT_EQ(Mark().toString(), "<unknown>:1,1");
    EXPECT_EQ(Mark(nullptr, 2, 0).name(), "<unknown>");
}

TEST_F(MarkTest, EqualityComparesNameAndPosition) {
    const auto name = std::make_shared<const std::string>("a");
    EXPECT_EQ(Mark(name, 1, 2),
              Mark(std::make_shared<const std::string>("a"), 1, 2));
    EXPECT_FALSE(Mark(name, 1, 2) == Mark(name, 1, 3));
    EXPECT_FALSE(Mark(name, 1, 2) == Mark());
}

class MarkedYamlErrorTest : public ::testing::Test {};

TEST_F(MarkedYamlErrorTest, DescribeWithoutProblem) {
    const auto name = std::make_shared<const std::string>("in");
    const ScannerError e(STRATA_FILE_NAME, STRATA_FILE_LINE, STRATA_FUNC_NAME,
                         "while scanning a quoted scalar", Mark(name, 2, 3));
    EXPECT_EQ(e.describe(), "while scanning a quoted scalar: in:3,4");
    EXPECT_EQ(e.getMessage(), e.describe());
    EXPECT_FALSE(e.getProblem().has_value());
}

TEST_F(MarkedYamlErrorTest, DescribeWithProblem) {
    const auto name = std::make_shared<const std::string>("in");
    const ParserError e(STRATA_FILE_NAME, STRATA_FILE_LINE, STRATA_FUNC_NAME,
                        "While parsing a block mapping", Mark(name, 0, 0),
                        "expected block end, but found: scalar",
                        Mark(name, 1, 2));
    EXPECT_EQ(e.describe(),
              "While parsing a block mapping: in:1,1\n"
              "expected block end, but found: scalar: in:2,3");
    EXPECT_EQ(e.getProblem(), "expected block end, but found: scalar");
    EXPECT_EQ(e.getProblemMark()->column(), 2U);
}

TEST_F(MarkedYamlErrorTest, ReaderErrorPrefixesContext) {
    try {
        THROW_READER_ERROR("bad input", Mark());
    } catch (const MarkedYamlError& e) {
        EXPECT_EQ(e.getContext(), "Reader error: bad input");
        EXPECT_EQ(e.getMessage(), "Reader error: bad input: <unknown>:1,1");
    }
}

TEST_F(MarkedYamlErrorTest, EmitterErrorIsAYamlError) {
    EXPECT_THROW(THROW_EMITTER_ERROR("Tag is not specified"), YamlError);
}

}  // namespace strata::yaml::test

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
