#ifndef STRATA_YAML_EVENT_HPP
#define STRATA_YAML_EVENT_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "strata/yaml/mark.hpp"
#include "strata/yaml/style.hpp"

namespace strata::yaml {

enum class EventId : std::uint8_t {
    Invalid = 0,
    StreamStart,
    StreamEnd,
    DocumentStart,
    DocumentEnd,
    Alias,
    Scalar,
    SequenceStart,
    SequenceEnd,
    MappingStart,
    MappingEnd
};

[[nodiscard]] auto eventIdName(EventId id) -> std::string_view;

/**
 * @brief Anchor and tag of a node event. An alias event keeps the anchor it
 * refers to.
 */
struct NodeProperties {
    std::string anchor;
    std::string tag;
};

/**
 * @brief YAML event produced by the Parser and consumed by the Emitter.
 *
 * Node events carry NodeProperties and document start events carry their
 * tag directives; the two never coexist. For node events `implicit` tells
 * whether the tag is left to the resolver. For document events it records
 * whether the `---` or `...` marker was written (see explicitDocument()).
 * A document start event stores the YAML version in `value`.
 */
struct Event {
    std::string value;
    Mark startMark;
    Mark endMark;
    std::variant<NodeProperties, std::vector<TagDirective>> properties;
    EventId id = EventId::Invalid;
    ScalarStyle scalarStyle = ScalarStyle::Invalid;
    bool implicit = false;
    CollectionStyle collectionStyle = CollectionStyle::Invalid;

    [[nodiscard]] auto isNull() const -> bool {
        return id == EventId::Invalid;
    }

    /**
     * @brief Whether a document start/end marker was written.
     */
    [[nodiscard]] auto explicitDocument() const -> bool { return implicit; }

    /**
     * @throws error::LogicError for document start events.
     */
    [[nodiscard]] auto anchor() const -> const std::string&;

    /**
     * @throws error::LogicError for document start events.
     */
    [[nodiscard]] auto tag() const -> const std::string&;

    /**
     * @throws error::LogicError unless this is a document start event.
     */
    [[nodiscard]] auto tagDirectives() const
        -> const std::vector<TagDirective>&;

    /**
     * @brief Line of the yaml-test-suite event notation, e.g.
     * `=VAL &a <tag:yaml.org,2002:str> 'text`.
     */
    [[nodiscard]] auto toString() const -> std::string;
};

[[nodiscard]] auto streamStartEvent(const Mark& start, const Mark& end)
    -> Event;
[[nodiscard]] auto streamEndEvent(const Mark& start, const Mark& end) -> Event;

[[nodiscard]] auto documentStartEvent(const Mark& start, const Mark& end,
                                      bool explicitStart,
                                      std::string yamlVersion,
                                      std::vector<TagDirective> tagDirectives)
    -> Event;

[[nodiscard]] auto documentEndEvent(const Mark& start, const Mark& end,
                                    bool explicitEnd) -> Event;

/**
 * @throws error::InvalidArgument if the anchor is empty.
 */
[[nodiscard]] auto aliasEvent(const Mark& start, const Mark& end,
                              std::string anchor) -> Event;

[[nodiscard]] auto scalarEvent(const Mark& start, const Mark& end,
                               std::string anchor, std::string tag,
                               bool implicit, std::string value,
                               ScalarStyle style = ScalarStyle::Invalid)
    -> Event;

[[nodiscard]] auto sequenceStartEvent(const Mark& start, const Mark& end,
                                      std::string anchor, std::string tag,
                                      bool implicit, CollectionStyle style)
    -> Event;

[[nodiscard]] auto sequenceEndEvent(const Mark& start, const Mark& end)
    -> Event;

[[nodiscard]] auto mappingStartEvent(const Mark& start, const Mark& end,
                                     std::string anchor, std::string tag,
                                     bool implicit, CollectionStyle style)
    -> Event;

[[nodiscard]] auto mappingEndEvent(const Mark& start, const Mark& end)
    -> Event;

}  // namespace strata::yaml

#endif
