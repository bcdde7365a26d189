#include "event.hpp"

#include <utility>

#include "strata/error/exception.hpp"

namespace strata::yaml {

namespace {
auto simpleEvent(EventId id, const Mark& start, const Mark& end) -> Event {
    Event event;
    event.id = id;
    event.startMark = start;
    event.endMark = end;
    return event;
}

auto collectionStartEvent(EventId id, const Mark& start, const Mark& end,
                          std::string anchor, std::string tag, bool implicit,
                          CollectionStyle style) -> Event {
    Event event = simpleEvent(id, start, end);
    event.properties = NodeProperties{std::move(anchor), std::move(tag)};
    event.implicit = implicit;
    event.collectionStyle = style;
    return event;
}

void appendProperties(std::string& out, const Event& event) {
    if (!event.anchor().empty()) {
        out += " &";
        out += event.anchor();
    }
    if (!event.tag().empty()) {
        out += " <";
        out += event.tag();
        out += '>';
    }
}
}  // namespace

auto eventIdName(EventId id) -> std::string_view {
    switch (id) {
        case EventId::Invalid:
            return "invalid";
        case EventId::StreamStart:
            return "streamStart";
        case EventId::StreamEnd:
            return "streamEnd";
        case EventId::DocumentStart:
            return "documentStart";
        case EventId::DocumentEnd:
            return "documentEnd";
        case EventId::Alias:
            return "alias";
        case EventId::Scalar:
            return "scalar";
        case EventId::SequenceStart:
            return "sequenceStart";
        case EventId::SequenceEnd:
            return "sequenceEnd";
        case EventId::MappingStart:
            return "mappingStart";
        case EventId::MappingEnd:
            return "mappingEnd";
    }
    return "invalid";
}

auto Event::anchor() const -> const std::string& {
    const auto* node = std::get_if<NodeProperties>(&properties);
    if (node == nullptr) {
        THROW_LOGIC_ERROR("Document start events cannot have anchors");
    }
    return node->anchor;
}

auto Event::tag() const -> const std::string& {
    const auto* node = std::get_if<NodeProperties>(&properties);
    if (node == nullptr) {
        THROW_LOGIC_ERROR("Document start events cannot have tags");
    }
    return node->tag;
}

auto Event::tagDirectives() const -> const std::vector<TagDirective>& {
    const auto* directives = std::get_if<std::vector<TagDirective>>(&properties);
    if (directives == nullptr) {
        THROW_LOGIC_ERROR("Only document start events have tag directives");
    }
    return *directives;
}

auto Event::toString() const -> std::string {
    std::string out;
    switch (id) {
        case EventId::Scalar: {
            out = "=VAL ";
            if (!anchor().empty()) {
                out += '&';
                out += anchor();
                out += ' ';
            }
            if (!tag().empty()) {
                out += '<';
                out += tag();
                out += "> ";
            }
            switch (scalarStyle) {
                case ScalarStyle::SingleQuoted:
                    out += '\'';
                    break;
                case ScalarStyle::DoubleQuoted:
                    out += '"';
                    break;
                case ScalarStyle::Literal:
                    out += '|';
                    break;
                case ScalarStyle::Folded:
                    out += '>';
                    break;
                case ScalarStyle::Invalid:
                case ScalarStyle::Plain:
                    out += ':';
                    break;
            }
            for (const char c : value) {
                switch (c) {
                    case '\n':
                        out += "\\n";
                        break;
                    case '\\':
                        out += "\\\\";
                        break;
                    case '\r':
                        out += "\\r";
                        break;
                    case '\t':
                        out += "\\t";
                        break;
                    case '\b':
                        out += "\\b";
                        break;
                    default:
                        out += c;
                }
            }
            break;
        }
        case EventId::StreamStart:
            out = "+STR";
            break;
        case EventId::StreamEnd:
            out = "-STR";
            break;
        case EventId::DocumentStart:
            out = explicitDocument() ? "+DOC ---" : "+DOC";
            break;
        case EventId::DocumentEnd:
            out = explicitDocument() ? "-DOC ..." : "-DOC";
            break;
        case EventId::MappingStart:
            out = collectionStyle == CollectionStyle::Flow ? "+MAP {}" : "+MAP";
            appendProperties(out, *this);
            break;
        case EventId::SequenceStart:
            out = collectionStyle == CollectionStyle::Flow ? "+SEQ []" : "+SEQ";
            appendProperties(out, *this);
            break;
        case EventId::MappingEnd:
            out = "-MAP";
            break;
        case EventId::SequenceEnd:
            out = "-SEQ";
            break;
        case EventId::Alias:
            out = "=ALI *" + anchor();
            break;
        case EventId::Invalid:
            THROW_LOGIC_ERROR("Cannot format an invalid event");
    }
    return out;
}

auto streamStartEvent(const Mark& start, const Mark& end) -> Event {
    return simpleEvent(EventId::StreamStart, start, end);
}

auto streamEndEvent(const Mark& start, const Mark& end) -> Event {
    return simpleEvent(EventId::StreamEnd, start, end);
}

auto documentStartEvent(const Mark& start, const Mark& end,
                        bool explicitStart, std::string yamlVersion,
                        std::vector<TagDirective> tagDirectives) -> Event {
    Event event = simpleEvent(EventId::DocumentStart, start, end);
    event.value = std::move(yamlVersion);
    event.implicit = explicitStart;
    event.properties = std::move(tagDirectives);
    return event;
}

auto documentEndEvent(const Mark& start, const Mark& end, bool explicitEnd)
    -> Event {
    Event event = simpleEvent(EventId::DocumentEnd, start, end);
    event.implicit = explicitEnd;
    return event;
}

auto aliasEvent(const Mark& start, const Mark& end, std::string anchor)
    -> Event {
    if (anchor.empty()) {
        THROW_INVALID_ARGUMENT("Missing anchor for alias event");
    }
    Event event = simpleEvent(EventId::Alias, start, end);
    event.properties = NodeProperties{std::move(anchor), {}};
    return event;
}

auto scalarEvent(const Mark& start, const Mark& end, std::string anchor,
                 std::string tag, bool implicit, std::string value,
                 ScalarStyle style) -> Event {
    Event event = simpleEvent(EventId::Scalar, start, end);
    event.value = std::move(value);
    event.properties = NodeProperties{std::move(anchor), std::move(tag)};
    event.implicit = implicit;
    event.scalarStyle = style;
    return event;
}

auto sequenceStartEvent(const Mark& start, const Mark& end, std::string anchor,
                        std::string tag, bool implicit, CollectionStyle style)
    -> Event {
    return collectionStartEvent(EventId::SequenceStart, start, end,
                                std::move(anchor), std::move(tag), implicit,
                                style);
}

auto sequenceEndEvent(const Mark& start, const Mark& end) -> Event {
    return simpleEvent(EventId::SequenceEnd, start, end);
}

auto mappingStartEvent(const Mark& start, const Mark& end, std::string anchor,
                       std::string tag, bool implicit, CollectionStyle style)
    -> Event {
    return collectionStartEvent(EventId::MappingStart, start, end,
                                std::move(anchor), std::move(tag), implicit,
                                style);
}

auto mappingEndEvent(const Mark& start, const Mark& end) -> Event {
    return simpleEvent(EventId::MappingEnd, start, end);
}

}  // namespace strata::yaml
