#ifndef STRATA_YAML_TOKEN_HPP
#define STRATA_YAML_TOKEN_HPP

#include <cstdint>
#include <limits>
#include <string_view>

#include "strata/yaml/mark.hpp"
#include "strata/yaml/reader.hpp"
#include "strata/yaml/style.hpp"

namespace strata::yaml {

enum class TokenId : std::uint8_t {
    Invalid = 0,
    Directive,
    DocumentStart,
    DocumentEnd,
    StreamStart,
    StreamEnd,
    BlockSequenceStart,
    BlockMappingStart,
    BlockEnd,
    FlowSequenceStart,
    FlowMappingStart,
    FlowSequenceEnd,
    FlowMappingEnd,
    Key,
    Value,
    BlockEntry,
    FlowEntry,
    Alias,
    Anchor,
    Tag,
    Scalar
};

/**
 * @brief Kind of a directive token. Unknown directives are reserved and
 * carry no value.
 */
enum class DirectiveType : std::uint8_t { Yaml, Tag, Reserved };

/**
 * @brief valueDivider of tokens with a single value.
 */
inline constexpr std::uint32_t kNoDivider =
    std::numeric_limits<std::uint32_t>::max();

/**
 * @brief Lexical unit produced by the Scanner.
 *
 * The value is a slice of the Reader buffer; Scanner::value() resolves it.
 * Tag tokens store handle and suffix back to back, split at valueDivider.
 * %TAG directives store handle and prefix the same way, and %YAML directives
 * store the version as "major.minor".
 */
struct Token {
    Slice value;
    Mark startMark;
    Mark endMark;
    TokenId id = TokenId::Invalid;
    ScalarStyle style = ScalarStyle::Invalid;
    Encoding encoding = Encoding::Utf8;
    DirectiveType directive = DirectiveType::Yaml;
    std::uint32_t valueDivider = kNoDivider;
};

/**
 * @brief camelCase name of a token kind, as used in error messages.
 */
[[nodiscard]] auto tokenIdName(TokenId id) -> std::string_view;

[[nodiscard]] auto simpleToken(TokenId id, const Mark& start, const Mark& end)
    -> Token;

[[nodiscard]] auto streamStartToken(const Mark& start, const Mark& end,
                                    Encoding encoding) -> Token;

[[nodiscard]] auto directiveToken(const Mark& start, const Mark& end,
                                  Slice value, DirectiveType directive,
                                  std::uint32_t nameEnd) -> Token;

[[nodiscard]] auto aliasToken(const Mark& start, const Mark& end, Slice value)
    -> Token;

[[nodiscard]] auto anchorToken(const Mark& start, const Mark& end, Slice value)
    -> Token;

[[nodiscard]] auto tagToken(const Mark& start, const Mark& end, Slice value,
                            std::uint32_t handleEnd) -> Token;

[[nodiscard]] auto scalarToken(const Mark& start, const Mark& end,
                               Slice value, ScalarStyle style) -> Token;

}  // namespace strata::yaml

#endif
