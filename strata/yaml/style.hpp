#ifndef STRATA_YAML_STYLE_HPP
#define STRATA_YAML_STYLE_HPP

#include <cstdint>
#include <string>
#include <string_view>

namespace strata::yaml {

enum class ScalarStyle : std::uint8_t {
    Invalid = 0,   ///< Not set; the emitter chooses
    Literal,       ///< `|`
    Folded,        ///< `>`
    Plain,
    SingleQuoted,
    DoubleQuoted
};

enum class CollectionStyle : std::uint8_t { Invalid = 0, Block, Flow };

/**
 * @brief Line break written by the emitter.
 */
enum class LineBreak : std::uint8_t {
    Unix,       ///< "\n"
    Windows,    ///< "\r\n"
    Macintosh   ///< "\r"
};

/**
 * @brief Unicode encoding of a YAML stream.
 */
enum class Encoding : std::uint8_t { Utf8, Utf16, Utf32 };

/**
 * @brief A `%TAG handle prefix` pair.
 */
struct TagDirective {
    std::string handle;
    std::string prefix;

    auto operator==(const TagDirective& other) const -> bool = default;
};

[[nodiscard]] auto lineBreakText(LineBreak lineBreak) -> std::string_view;
[[nodiscard]] auto scalarStyleName(ScalarStyle style) -> std::string_view;
[[nodiscard]] auto collectionStyleName(CollectionStyle style)
    -> std::string_view;
[[nodiscard]] auto encodingName(Encoding encoding) -> std::string_view;

}  // namespace strata::yaml

#endif
