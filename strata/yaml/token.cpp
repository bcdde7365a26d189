#include "token.hpp"

namespace strata::yaml {

auto tokenIdName(TokenId id) -> std::string_view {
    switch (id) {
        case TokenId::Invalid:
            return "invalid";
        case TokenId::Directive:
            return "directive";
        case TokenId::DocumentStart:
            return "documentStart";
        case TokenId::DocumentEnd:
            return "documentEnd";
        case TokenId::StreamStart:
            return "streamStart";
        case TokenId::StreamEnd:
            return "streamEnd";
        case TokenId::BlockSequenceStart:
            return "blockSequenceStart";
        case TokenId::BlockMappingStart:
            return "blockMappingStart";
        case TokenId::BlockEnd:
            return "blockEnd";
        case TokenId::FlowSequenceStart:
            return "flowSequenceStart";
        case TokenId::FlowMappingStart:
            return "flowMappingStart";
        case TokenId::FlowSequenceEnd:
            return "flowSequenceEnd";
        case TokenId::FlowMappingEnd:
            return "flowMappingEnd";
        case TokenId::Key:
            return "key";
        case TokenId::Value:
            return "value";
        case TokenId::BlockEntry:
            return "blockEntry";
        case TokenId::FlowEntry:
            return "flowEntry";
        case TokenId::Alias:
            return "alias";
        case TokenId::Anchor:
            return "anchor";
        case TokenId::Tag:
            return "tag";
        case TokenId::Scalar:
            return "scalar";
    }
    return "invalid";
}

auto simpleToken(TokenId id, const Mark& start, const Mark& end) -> Token {
    Token token;
    token.id = id;
    token.startMark = start;
    token.endMark = end;
    return token;
}

auto streamStartToken(const Mark& start, const Mark& end, Encoding encoding)
    -> Token {
    Token token = simpleToken(TokenId::StreamStart, start, end);
    token.encoding = encoding;
    return token;
}

auto directiveToken(const Mark& start, const Mark& end, Slice value,
                    DirectiveType directive, std::uint32_t nameEnd) -> Token {
    Token token = simpleToken(TokenId::Directive, start, end);
    token.value = value;
    token.directive = directive;
    token.valueDivider = nameEnd;
    return token;
}

auto aliasToken(const Mark& start, const Mark& end, Slice value) -> Token {
    Token token = simpleToken(TokenId::Alias, start, end);
    token.value = value;
    return token;
}

auto anchorToken(const Mark& start, const Mark& end, Slice value) -> Token {
    Token token = simpleToken(TokenId::Anchor, start, end);
    token.value = value;
    return token;
}

auto tagToken(const Mark& start, const Mark& end, Slice value,
              std::uint32_t handleEnd) -> Token {
    Token token = simpleToken(TokenId::Tag, start, end);
    token.value = value;
    token.valueDivider = handleEnd;
    return token;
}

auto scalarToken(const Mark& start, const Mark& end, Slice value,
                 ScalarStyle style) -> Token {
    Token token = simpleToken(TokenId::Scalar, start, end);
    token.value = value;
    token.style = style;
    return token;
}

}  // namespace strata::yaml
