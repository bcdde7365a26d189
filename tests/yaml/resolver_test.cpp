#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <string>
#include <vector>

#include "strata/error/exception.hpp"
#include "strata/yaml/parser.hpp"
#include "strata/yaml/resolver.hpp"

namespace strata::yaml::test {

class ResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::set_level(spdlog::level::off);
        resolver_ = Resolver::withDefaultResolvers();
    }

    void expectResolved(const std::string& tag,
                        const std::vector<std::string>& values) const {
        for (const auto& value : values) {
            EXPECT_EQ(resolver_.resolve(NodeKind::Scalar, "", value, true),
                      "tag:yaml.org,2002:" + tag)
                << "value: " << value;
        }
    }

    Resolver resolver_;
};

TEST_F(ResolverTest, Bool) { expectResolved("bool", {"yes", "NO", "True", "on"}); }

TEST_F(ResolverTest, Float) {
    expectResolved("float", {"6.8523015e+5", "685.230_15e+03", "685_230.15",
                             "190:20:30.15", "-.inf", ".NaN"});
}

TEST_F(ResolverTest, Int) {
    expectResolved("int", {"685230", "+685_230", "02472256", "0x_0A_74_AE",
                           "0b1010_0111_0100_1010_1110", "190:20:30"});
}

TEST_F(ResolverTest, Merge) { expectResolved("merge", {"<<"}); }

TEST_F(ResolverTest, Null) { expectResolved("null", {"~", "null", ""}); }

TEST_F(ResolverTest, Str) { expectResolved("str", {"abcd", "9a8b", "9.1adsf"}); }

TEST_F(ResolverTest, Timestamp) {
    expectResolved("timestamp",
                   {"2001-12-15T02:59:43.1Z", "2001-12-14t21:59:43.10-05:00",
                    "2001-12-14 21:59:43.10 -5", "2001-12-15 2:59:43.10",
                    "2002-12-14"});
}

TEST_F(ResolverTest, Value) { expectResolved("value", {"="}); }

TEST_F(ResolverTest, Yaml) { expectResolved("yaml", {"!", "&", "*"}); }

TEST_F(ResolverTest, NonImplicitScalarIsString) {
    EXPECT_EQ(resolver_.resolve(NodeKind::Scalar, "", "42", false),
              resolver_.defaultScalarTag());
}

TEST_F(ResolverTest, ExplicitTagIsKept) {
    EXPECT_EQ(resolver_.resolve(NodeKind::Scalar, "tag:a", "42", true), "tag:a");
    EXPECT_EQ(resolver_.resolve(NodeKind::Scalar, "!", "42", true),
              "tag:yaml.org,2002:int");
}

TEST_F(ResolverTest, Collections) {
    EXPECT_EQ(resolver_.resolve(NodeKind::Sequence, "", "", true),
              "tag:yaml.org,2002:seq");
    EXPECT_EQ(resolver_.resolve(NodeKind::Mapping, "", "", true),
              "tag:yaml.org,2002:map");
    EXPECT_EQ(resolver_.resolve(NodeKind::Mapping, "!set", "", false), "!set");
}

TEST_F(ResolverTest, UserRule) {
    resolver_.addImplicitResolver("!tag", "A.*", "A");
    EXPECT_EQ(resolver_.resolve(NodeKind::Scalar, "", "Abc", true), "!tag");
    EXPECT_EQ(resolver_.resolve(NodeKind::Scalar, "", "bAc", true),
              "tag:yaml.org,2002:str");
}

TEST_F(ResolverTest, EarlierRuleWins) {
    Resolver resolver;
    resolver.addImplicitResolver("!first", "^x", "x");
    resolver.addImplicitResolver("!second", "^x", "x");
    EXPECT_EQ(resolver.resolve(NodeKind::Scalar, "", "x", true), "!first");
}

TEST_F(ResolverTest, EmptyResolverUsesDefaults) {
    const Resolver resolver;
    EXPECT_EQ(resolver.resolve(NodeKind::Scalar, "", "true", true),
              "tag:yaml.org,2002:str");
}

TEST_F(ResolverTest, InvalidPattern) {
    EXPECT_THROW(resolver_.addImplicitResolver("!bad", "(", "b"),
                 error::InvalidArgument);
}

TEST_F(ResolverTest, ResolvesParsedEvents) {
    const auto events = parseEvents("a: [1, !x y, 'true']\n");
    std::vector<std::string> tags;
    for (const auto& event : events) {
        if (event.id == EventId::Scalar || event.id == EventId::SequenceStart ||
            event.id == EventId::MappingStart) {
            tags.push_back(resolver_.resolve(event));
        }
    }
    const std::vector<std::string> expected = {
        "tag:yaml.org,2002:map", "tag:yaml.org,2002:str",
        "tag:yaml.org,2002:seq", "tag:yaml.org,2002:int", "!x",
        "tag:yaml.org,2002:str"};
    EXPECT_EQ(tags, expected);

    EXPECT_THROW((void)resolver_.resolve(events.front()), error::InvalidArgument);
}

}  // namespace strata::yaml::test

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
