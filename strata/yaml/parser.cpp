#include "parser.hpp"

#include <array>
#include <initializer_list>
#include <utility>

#include <spdlog/spdlog.h>

#include "strata/error/exception.hpp"
#include "strata/yaml/encoding.hpp"
#include "strata/yaml/escapes.hpp"
#include "strata/yaml/exception.hpp"

namespace strata::yaml {

namespace {
const std::array<TagDirective, 2> DEFAULT_TAG_DIRECTIVES = {
    TagDirective{"!", "!"}, TagDirective{"!!", "tag:yaml.org,2002:"}};

auto isOneOf(TokenId id, std::initializer_list<TokenId> ids) -> bool {
    for (const TokenId candidate : ids) {
        if (id == candidate) {
            return true;
        }
    }
    return false;
}

auto hexDigitValue(char c) -> char32_t {
    if (c >= '0' && c <= '9') {
        return static_cast<char32_t>(c - '0');
    }
    return static_cast<char32_t>((c | 0x20) - 'a' + 10);
}
}  // namespace

Parser::Parser(Scanner scanner) : scanner_(std::move(scanner)) {
    states_.reserve(32);
    marks_.reserve(32);
}

Parser::Parser(std::string buffer, std::string name)
    : Parser(Scanner(std::move(buffer), std::move(name))) {}

auto Parser::empty() -> bool {
    ensureState();
    return currentEvent_.isNull();
}

auto Parser::front() -> const Event& {
    ensureState();
    if (currentEvent_.isNull()) {
        THROW_LOGIC_ERROR("No event left to peek");
    }
    return currentEvent_;
}

void Parser::popFront() {
    currentEvent_ = Event{};
    ensureState();
}

void Parser::ensureState() {
    if (currentEvent_.isNull() && state_ != State::End) {
        currentEvent_ = runState(state_);
    }
}

auto Parser::runState(State state) -> Event {
    switch (state) {
        case State::StreamStart:
            return parseStreamStart();
        case State::ImplicitDocumentStart:
            return parseImplicitDocumentStart();
        case State::DocumentStart:
            return parseDocumentStart();
        case State::DocumentEnd:
            return parseDocumentEnd();
        case State::DocumentContent:
            return parseDocumentContent();
        case State::BlockNode:
            return parseNode(true);
        case State::BlockNodeOrIndentlessSequence:
            return parseNode(true, true);
        case State::FlowNode:
            return parseNode(false);
        case State::BlockSequenceFirstEntry:
            return parseBlockSequenceEntry(true);
        case State::BlockSequenceEntry:
            return parseBlockSequenceEntry(false);
        case State::IndentlessSequenceEntry:
            return parseIndentlessSequenceEntry();
        case State::BlockMappingFirstKey:
            return parseBlockMappingKey(true);
        case State::BlockMappingKey:
            return parseBlockMappingKey(false);
        case State::BlockMappingValue:
            return parseBlockMappingValue();
        case State::FlowSequenceFirstEntry:
            return parseFlowSequenceEntry(true);
        case State::FlowSequenceEntry:
            return parseFlowSequenceEntry(false);
        case State::FlowSequenceEntryMappingKey:
            return parseFlowKey(State::FlowSequenceEntryMappingValue,
                                TokenId::FlowSequenceEnd);
        case State::FlowSequenceEntryMappingValue:
            return parseFlowValue(TokenId::FlowSequenceEnd,
                                  State::FlowSequenceEntryMappingEnd);
        case State::FlowSequenceEntryMappingEnd:
            return parseFlowSequenceEntryMappingEnd();
        case State::FlowMappingFirstKey:
            return parseFlowMappingKey(true);
        case State::FlowMappingKey:
            return parseFlowMappingKey(false);
        case State::FlowMappingValue:
            return parseFlowValue(TokenId::FlowMappingEnd,
                                  State::FlowMappingKey);
        case State::FlowMappingEmptyValue:
            return parseFlowMappingEmptyValue();
        case State::End:
            break;
    }
    THROW_LOGIC_ERROR("Parser: no state left to run");
}

auto Parser::popState() -> State {
    if (states_.empty()) {
        THROW_LOGIC_ERROR("Parser: Need to pop state but no states left to pop");
    }
    const State result = states_.back();
    states_.pop_back();
    return result;
}

auto Parser::popMark() -> Mark {
    if (marks_.empty()) {
        THROW_LOGIC_ERROR("Parser: Need to pop mark but no marks left to pop");
    }
    Mark result = marks_.back();
    marks_.pop_back();
    return result;
}

auto Parser::parseStreamStart() -> Event {
    const Token token = scanner_.front();
    scanner_.popFront();
    state_ = State::ImplicitDocumentStart;
    return streamStartEvent(token.startMark, token.endMark);
}

auto Parser::parseImplicitDocumentStart() -> Event {
    if (!isOneOf(frontId(), {TokenId::Directive, TokenId::DocumentStart,
                             TokenId::StreamEnd})) {
        tagDirectives_.assign(DEFAULT_TAG_DIRECTIVES.begin(),
                              DEFAULT_TAG_DIRECTIVES.end());
        const Token& token = scanner_.front();

        pushState(State::DocumentEnd);
        state_ = State::BlockNode;

        return documentStartEvent(token.startMark, token.endMark, false, "",
                                  {});
    }
    return parseDocumentStart();
}

auto Parser::parseDocumentStart() -> Event {
    // Extra document end markers are skipped.
    while (frontId() == TokenId::DocumentEnd) {
        scanner_.popFront();
    }

    if (frontId() != TokenId::StreamEnd) {
        const Mark startMark = scanner_.front().startMark;

        std::vector<TagDirective> tagDirectives = processDirectives();
        if (frontId() != TokenId::DocumentStart) {
            const Token& token = scanner_.front();
            spdlog::error("Parser {}: expected document start at {}",
                          scanner_.name(), token.startMark.toString());
            THROW_PARSER_ERROR(std::string("Expected document start but found ") +
                                   std::string(tokenIdName(token.id)),
                               token.startMark);
        }

        const Mark endMark = scanner_.front().endMark;
        scanner_.popFront();
        pushState(State::DocumentEnd);
        state_ = State::DocumentContent;

        spdlog::debug("Parser {}: document start at {} (version {}, {} tag "
                      "directives)",
                      scanner_.name(), startMark.toString(),
                      yamlVersion_.value_or("default"), tagDirectives.size());
        return documentStartEvent(startMark, endMark, true,
                                  yamlVersion_.value_or(""),
                                  std::move(tagDirectives));
    }

    const Token token = scanner_.front();
    scanner_.popFront();
    if (!states_.empty() || !marks_.empty()) {
        THROW_LOGIC_ERROR("Parser: stream ended with open states");
    }
    state_ = State::End;
    return streamEndEvent(token.startMark, token.endMark);
}

auto Parser::parseDocumentEnd() -> Event {
    const Mark startMark = scanner_.front().startMark;
    const bool explicitEnd = frontId() == TokenId::DocumentEnd;
    Mark endMark = startMark;
    if (explicitEnd) {
        endMark = scanner_.front().endMark;
        scanner_.popFront();
    }

    state_ = State::DocumentStart;

    return documentEndEvent(startMark, endMark, explicitEnd);
}

auto Parser::parseDocumentContent() -> Event {
    if (isOneOf(frontId(), {TokenId::Directive, TokenId::DocumentStart,
                            TokenId::DocumentEnd, TokenId::StreamEnd})) {
        state_ = popState();
        return processEmptyScalar(scanner_.front().startMark);
    }
    return parseNode(true);
}

auto Parser::processDirectives() -> std::vector<TagDirective> {
    // Version and handles never carry over from the previous document.
    yamlVersion_.reset();
    tagDirectives_.clear();

    while (frontId() == TokenId::Directive) {
        const Token token = scanner_.front();
        scanner_.popFront();
        const std::string_view value = scanner_.value(token);

        if (token.directive == DirectiveType::Yaml) {
            if (yamlVersion_) {
                spdlog::error("Parser {}: duplicate YAML directive at {}",
                              scanner_.name(), token.startMark.toString());
                THROW_PARSER_ERROR("Duplicate YAML directive", token.startMark);
            }
            const std::string_view major = value.substr(0, value.find('.'));
            if (major != "1") {
                spdlog::error("Parser {}: unsupported YAML version {}",
                              scanner_.name(), value);
                THROW_PARSER_ERROR(
                    "Incompatible document (version 1.x is required)",
                    token.startMark);
            }
            yamlVersion_ = std::string(value);
        } else if (token.directive == DirectiveType::Tag) {
            const std::string handle(value.substr(0, token.valueDivider));

            for (const auto& pair : tagDirectives_) {
                if (pair.handle == handle) {
                    spdlog::error("Parser {}: duplicate tag handle {} at {}",
                                  scanner_.name(), handle,
                                  token.startMark.toString());
                    THROW_PARSER_ERROR("Duplicate tag handle: " + handle,
                                       token.startMark);
                }
            }
            tagDirectives_.push_back(
                TagDirective{handle, std::string(value.substr(
                                         token.valueDivider))});
        }
        // Reserved directives are ignored.
    }

    std::vector<TagDirective> declared = tagDirectives_;

    for (const auto& defaultPair : DEFAULT_TAG_DIRECTIVES) {
        bool found = false;
        for (const auto& pair : tagDirectives_) {
            if (pair.handle == defaultPair.handle) {
                found = true;
                break;
            }
        }
        if (!found) {
            tagDirectives_.push_back(defaultPair);
        }
    }

    return declared;
}

auto Parser::parseNode(bool block, bool indentlessSequence) -> Event {
    if (frontId() == TokenId::Alias) {
        const Token token = scanner_.front();
        scanner_.popFront();
        state_ = popState();
        return aliasEvent(token.startMark, token.endMark,
                          std::string(scanner_.value(token)));
    }

    std::optional<std::string> anchor;
    std::optional<std::string> tag;
    Mark startMark;
    Mark endMark;
    Mark tagMark;
    bool invalidMarks = true;
    std::uint32_t tagHandleEnd = 0;

    auto get = [&](TokenId id, bool first,
                   std::optional<std::string>& target) -> bool {
        if (frontId() != id) {
            return false;
        }
        invalidMarks = false;
        const Token token = scanner_.front();
        scanner_.popFront();
        if (first) {
            startMark = token.startMark;
        }
        if (id == TokenId::Tag) {
            tagMark = token.startMark;
            tagHandleEnd = token.valueDivider;
        }
        endMark = token.endMark;
        target = std::string(scanner_.value(token));
        return true;
    };

    // Anchor and tag may come in either order.
    if (get(TokenId::Anchor, true, anchor)) {
        get(TokenId::Tag, false, tag);
    } else if (get(TokenId::Tag, true, tag)) {
        get(TokenId::Anchor, false, anchor);
    }

    if (tag) {
        tag = processTag(*tag, tagHandleEnd, startMark, tagMark);
    }

    if (invalidMarks) {
        startMark = endMark = scanner_.front().startMark;
    }

    bool implicit = !tag || *tag == "!";

    if (indentlessSequence && frontId() == TokenId::BlockEntry) {
        state_ = State::IndentlessSequenceEntry;
        return sequenceStartEvent(startMark, scanner_.front().endMark,
                                  anchor.value_or(""), tag.value_or(""),
                                  implicit, CollectionStyle::Block);
    }

    if (frontId() == TokenId::Scalar) {
        const Token token = scanner_.front();
        scanner_.popFront();
        const std::string_view raw = scanner_.value(token);
        std::string value = token.style == ScalarStyle::DoubleQuoted
                                ? handleDoubleQuotedScalarEscapes(
                                      raw, token.startMark)
                                : std::string(raw);

        implicit = (token.style == ScalarStyle::Plain && !tag) ||
                   (tag && *tag == "!");
        state_ = popState();
        return scalarEvent(startMark, token.endMark, anchor.value_or(""),
                           tag.value_or(""), implicit, std::move(value),
                           token.style);
    }

    if (frontId() == TokenId::FlowSequenceStart) {
        endMark = scanner_.front().endMark;
        state_ = State::FlowSequenceFirstEntry;
        return sequenceStartEvent(startMark, endMark, anchor.value_or(""),
                                  tag.value_or(""), implicit,
                                  CollectionStyle::Flow);
    }

    if (frontId() == TokenId::FlowMappingStart) {
        endMark = scanner_.front().endMark;
        state_ = State::FlowMappingFirstKey;
        return mappingStartEvent(startMark, endMark, anchor.value_or(""),
                                 tag.value_or(""), implicit,
                                 CollectionStyle::Flow);
    }

    if (block && frontId() == TokenId::BlockSequenceStart) {
        endMark = scanner_.front().endMark;
        state_ = State::BlockSequenceFirstEntry;
        return sequenceStartEvent(startMark, endMark, anchor.value_or(""),
                                  tag.value_or(""), implicit,
                                  CollectionStyle::Block);
    }

    if (block && frontId() == TokenId::BlockMappingStart) {
        endMark = scanner_.front().endMark;
        state_ = State::BlockMappingFirstKey;
        return mappingStartEvent(startMark, endMark, anchor.value_or(""),
                                 tag.value_or(""), implicit,
                                 CollectionStyle::Block);
    }

    if (anchor || tag) {
        state_ = popState();
        // A node with properties but no content is an empty scalar.
        return scalarEvent(startMark, endMark, anchor.value_or(""),
                           tag.value_or(""), implicit, "");
    }

    const Token& token = scanner_.front();
    spdlog::error("Parser {}: expected node content at {}", scanner_.name(),
                  token.startMark.toString());
    THROW_PARSER_ERROR(
        std::string("While parsing a ") + (block ? "block" : "flow") + " node",
        startMark,
        "expected node content, but found: " +
            std::string(tokenIdName(token.id)),
        token.startMark);
}

auto Parser::handleDoubleQuotedScalarEscapes(std::string_view value,
                                             const Mark& startMark) const
    -> std::string {
    std::string result;
    result.reserve(value.size());

    std::size_t i = 0;
    while (i < value.size()) {
        const char c = value[i++];
        if (c != '\\' || i >= value.size()) {
            result.push_back(c);
            continue;
        }

        // Escapes are ASCII; the scanner validated them.
        const char escape = value[i++];
        if (isEscape(static_cast<unsigned char>(escape))) {
            appendUtf8(result, fromEscape(static_cast<unsigned char>(escape)));
            continue;
        }

        const std::size_t hexLength =
            escapeHexLength(static_cast<unsigned char>(escape));
        if (hexLength == 0 || i + hexLength > value.size()) {
            THROW_PARSER_ERROR("While parsing a double quoted scalar", startMark,
                               std::string("found unsupported escape "
                                           "character ") +
                                   escape,
                               startMark);
        }

        char32_t decoded = 0;
        for (std::size_t j = 0; j < hexLength; ++j) {
            decoded = decoded * 16 + hexDigitValue(value[i + j]);
        }
        i += hexLength;

        if (decoded > 0x10FFFF || (decoded >= 0xD800 && decoded <= 0xDFFF)) {
            THROW_PARSER_ERROR(
                "While parsing a double quoted scalar", startMark,
                "found escape of an invalid code point: \\" +
                    std::string(1, escape) +
                    std::string(value.substr(i - hexLength, hexLength)),
                startMark);
        }
        appendUtf8(result, decoded);
    }
    return result;
}

auto Parser::processTag(std::string_view tag, std::uint32_t handleEnd,
                        const Mark& startMark, const Mark& tagMark) const
    -> std::string {
    const std::string_view handle = tag.substr(0, handleEnd);
    const std::string_view suffix = tag.substr(handleEnd);

    if (handle.empty()) {
        return std::string(suffix);
    }

    for (const auto& pair : tagDirectives_) {
        if (pair.handle == handle) {
            return pair.prefix + std::string(suffix);
        }
    }

    spdlog::error("Parser {}: undefined tag handle {} at {}", scanner_.name(),
                  handle, tagMark.toString());
    THROW_PARSER_ERROR("While parsing a node", startMark,
                       "found undefined tag handle: " + std::string(handle),
                       tagMark);
}

auto Parser::parseBlockSequenceEntry(bool first) -> Event {
    if (first) {
        pushMark(scanner_.front().startMark);
        scanner_.popFront();
    }

    if (frontId() == TokenId::BlockEntry) {
        const Token token = scanner_.front();
        scanner_.popFront();
        if (!isOneOf(frontId(), {TokenId::BlockEntry, TokenId::BlockEnd})) {
            pushState(State::BlockSequenceEntry);
            return parseNode(true);
        }

        state_ = State::BlockSequenceEntry;
        return processEmptyScalar(token.endMark);
    }

    if (frontId() != TokenId::BlockEnd) {
        const Token& token = scanner_.front();
        spdlog::error("Parser {}: expected block end at {}", scanner_.name(),
                      token.startMark.toString());
        THROW_PARSER_ERROR("While parsing a block collection", marks_.back(),
                           "expected block end, but found " +
                               std::string(tokenIdName(token.id)),
                           token.startMark);
    }

    state_ = popState();
    popMark();
    const Token token = scanner_.front();
    scanner_.popFront();
    return sequenceEndEvent(token.startMark, token.endMark);
}

auto Parser::parseIndentlessSequenceEntry() -> Event {
    if (frontId() == TokenId::BlockEntry) {
        const Token token = scanner_.front();
        scanner_.popFront();

        if (!isOneOf(frontId(), {TokenId::BlockEntry, TokenId::Key,
                                 TokenId::Value, TokenId::BlockEnd})) {
            pushState(State::IndentlessSequenceEntry);
            return parseNode(true);
        }

        state_ = State::IndentlessSequenceEntry;
        return processEmptyScalar(token.endMark);
    }

    state_ = popState();
    const Token& token = scanner_.front();
    return sequenceEndEvent(token.startMark, token.endMark);
}

auto Parser::parseBlockMappingKey(bool first) -> Event {
    if (first) {
        pushMark(scanner_.front().startMark);
        scanner_.popFront();
    }

    if (frontId() == TokenId::Key) {
        const Token token = scanner_.front();
        scanner_.popFront();

        if (!isOneOf(frontId(),
                     {TokenId::Key, TokenId::Value, TokenId::BlockEnd})) {
            pushState(State::BlockMappingValue);
            return parseNode(true, true);
        }

        state_ = State::BlockMappingValue;
        return processEmptyScalar(token.endMark);
    }

    if (frontId() != TokenId::BlockEnd) {
        const Token& token = scanner_.front();
        spdlog::error("Parser {}: expected block end at {}", scanner_.name(),
                      token.startMark.toString());
        THROW_PARSER_ERROR("While parsing a block mapping", marks_.back(),
                           "expected block end, but found: " +
                               std::string(tokenIdName(token.id)),
                           token.startMark);
    }

    state_ = popState();
    popMark();
    const Token token = scanner_.front();
    scanner_.popFront();
    return mappingEndEvent(token.startMark, token.endMark);
}

auto Parser::parseBlockMappingValue() -> Event {
    if (frontId() == TokenId::Value) {
        const Token token = scanner_.front();
        scanner_.popFront();

        if (!isOneOf(frontId(),
                     {TokenId::Key, TokenId::Value, TokenId::BlockEnd})) {
            pushState(State::BlockMappingKey);
            return parseNode(true, true);
        }

        state_ = State::BlockMappingKey;
        return processEmptyScalar(token.endMark);
    }

    state_ = State::BlockMappingKey;
    return processEmptyScalar(scanner_.front().startMark);
}

auto Parser::parseFlowSequenceEntry(bool first) -> Event {
    if (first) {
        pushMark(scanner_.front().startMark);
        scanner_.popFront();
    }

    if (frontId() != TokenId::FlowSequenceEnd) {
        if (!first) {
            if (frontId() == TokenId::FlowEntry) {
                scanner_.popFront();
            } else {
                const Token& token = scanner_.front();
                spdlog::error("Parser {}: expected ',' or ']' at {}",
                              scanner_.name(), token.startMark.toString());
                THROW_PARSER_ERROR("While parsing a flow sequence",
                                   marks_.back(),
                                   "expected ',' or ']', but got: " +
                                       std::string(tokenIdName(token.id)),
                                   token.startMark);
            }
        }

        if (frontId() == TokenId::Key) {
            // A single pair mapping inside a flow sequence: [a: b]
            const Token& token = scanner_.front();
            state_ = State::FlowSequenceEntryMappingKey;
            return mappingStartEvent(token.startMark, token.endMark, "", "",
                                     true, CollectionStyle::Flow);
        }
        if (frontId() != TokenId::FlowSequenceEnd) {
            pushState(State::FlowSequenceEntry);
            return parseNode(false);
        }
    }

    const Token token = scanner_.front();
    scanner_.popFront();
    state_ = popState();
    popMark();
    return sequenceEndEvent(token.startMark, token.endMark);
}

auto Parser::parseFlowKey(State nextState, TokenId endId) -> Event {
    const Token token = scanner_.front();
    scanner_.popFront();

    if (!isOneOf(frontId(), {TokenId::Value, TokenId::FlowEntry, endId})) {
        pushState(nextState);
        return parseNode(false);
    }

    state_ = nextState;
    return processEmptyScalar(token.endMark);
}

auto Parser::parseFlowValue(TokenId checkId, State nextState) -> Event {
    if (frontId() == TokenId::Value) {
        const Token token = scanner_.front();
        scanner_.popFront();
        if (!isOneOf(frontId(), {TokenId::FlowEntry, checkId})) {
            pushState(nextState);
            return parseNode(false);
        }

        state_ = nextState;
        return processEmptyScalar(token.endMark);
    }

    state_ = nextState;
    return processEmptyScalar(scanner_.front().startMark);
}

auto Parser::parseFlowSequenceEntryMappingEnd() -> Event {
    state_ = State::FlowSequenceEntry;
    const Token& token = scanner_.front();
    return mappingEndEvent(token.startMark, token.startMark);
}

auto Parser::parseFlowMappingKey(bool first) -> Event {
    if (first) {
        pushMark(scanner_.front().startMark);
        scanner_.popFront();
    }

    if (frontId() != TokenId::FlowMappingEnd) {
        if (!first) {
            if (frontId() == TokenId::FlowEntry) {
                scanner_.popFront();
            } else {
                const Token& token = scanner_.front();
                spdlog::error("Parser {}: expected ',' or '}}' at {}",
                              scanner_.name(), token.startMark.toString());
                THROW_PARSER_ERROR("While parsing a flow mapping",
                                   marks_.back(),
                                   "expected ',' or '}', but got: " +
                                       std::string(tokenIdName(token.id)),
                                   token.startMark);
            }
        }

        if (frontId() == TokenId::Key) {
            return parseFlowKey(State::FlowMappingValue,
                                TokenId::FlowMappingEnd);
        }

        if (frontId() != TokenId::FlowMappingEnd) {
            pushState(State::FlowMappingEmptyValue);
            return parseNode(false);
        }
    }

    const Token token = scanner_.front();
    scanner_.popFront();
    state_ = popState();
    popMark();
    return mappingEndEvent(token.startMark, token.endMark);
}

auto Parser::parseFlowMappingEmptyValue() -> Event {
    state_ = State::FlowMappingKey;
    return processEmptyScalar(scanner_.front().startMark);
}

auto Parser::processEmptyScalar(const Mark& mark) -> Event {
    return scalarEvent(mark, mark, "", "", true, "");
}

auto parseEvents(std::string buffer, std::string name) -> std::vector<Event> {
    Parser parser(std::move(buffer), std::move(name));
    std::vector<Event> events;
    while (!parser.empty()) {
        events.push_back(parser.front());
        parser.popFront();
    }
    return events;
}

}  // namespace strata::yaml
