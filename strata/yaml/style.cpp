#include "style.hpp"

namespace strata::yaml {

auto lineBreakText(LineBreak lineBreak) -> std::string_view {
    switch (lineBreak) {
        case LineBreak::Unix:
            return "\n";
        case LineBreak::Windows:
            return "\r\n";
        case LineBreak::Macintosh:
            return "\r";
    }
    return "\n";
}

auto scalarStyleName(ScalarStyle style) -> std::string_view {
    switch (style) {
        case ScalarStyle::Invalid:
            return "invalid";
        case ScalarStyle::Literal:
            return "literal";
        case ScalarStyle::Folded:
            return "folded";
        case ScalarStyle::Plain:
            return "plain";
        case ScalarStyle::SingleQuoted:
            return "singleQuoted";
        case ScalarStyle::DoubleQuoted:
            return "doubleQuoted";
    }
    return "invalid";
}

auto collectionStyleName(CollectionStyle style) -> std::string_view {
    switch (style) {
        case CollectionStyle::Block:
            return "block";
        case CollectionStyle::Flow:
            return "flow";
        default:
            return "invalid";
    }
}

auto encodingName(Encoding encoding) -> std::string_view {
    switch (encoding) {
        case Encoding::Utf8:
            return "UTF-8";
        case Encoding::Utf16:
            return "UTF-16";
        case Encoding::Utf32:
            return "UTF-32";
    }
    return "UTF-8";
}

}  // namespace strata::yaml
