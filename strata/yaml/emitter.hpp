#ifndef STRATA_YAML_EMITTER_HPP
#define STRATA_YAML_EMITTER_HPP

#include <cstdint>
#include <deque>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "strata/yaml/event.hpp"
#include "strata/yaml/style.hpp"

namespace strata::yaml {

/**
 * @brief Output formatting options of an Emitter.
 */
struct EmitterSettings {
    /// Write every scalar double quoted with explicit tags and markers.
    bool canonical = false;
    /// Indentation width, 2 to 9.
    int indent = 2;
    /// Preferred line width; long scalars are folded near it.
    int width = 80;
    LineBreak lineBreak = LineBreak::Unix;
    /// UTF-16 and UTF-32 output is native-endian with a byte order mark.
    Encoding encoding = Encoding::Utf8;

    /**
     * @brief Copy with out-of-range values replaced by the defaults.
     *
     * An indent outside 2..9 becomes 2; a width not larger than twice the
     * indent becomes 80.
     */
    [[nodiscard]] auto normalized() const -> EmitterSettings;
};

/**
 * @brief Which styles a scalar can be written in.
 */
struct ScalarAnalysis {
    enum Flag : std::uint8_t {
        Empty = 1 << 0,
        Multiline = 1 << 1,
        AllowFlowPlain = 1 << 2,
        AllowBlockPlain = 1 << 3,
        AllowSingleQuoted = 1 << 4,
        AllowDoubleQuoted = 1 << 5,
        AllowBlock = 1 << 6
    };

    std::string scalar;
    std::uint8_t flags = 0;

    [[nodiscard]] auto has(Flag flag) const -> bool {
        return (flags & flag) != 0;
    }
};

/**
 * @brief Analyzes a UTF-8 scalar for style selection.
 * @throws EmitterError if the scalar is not valid UTF-8.
 */
[[nodiscard]] auto analyzeScalar(std::string_view scalar) -> ScalarAnalysis;

class ScalarWriter;

/**
 * @brief Writes a stream of events as YAML text.
 *
 * Events are queued until enough look-ahead is available to pick a style:
 * one event after a document start, two after a sequence start and three
 * after a mapping start. Collection and document states are kept on an
 * explicit stack.
 *
 * @code
 * std::ostringstream out;
 * Emitter emitter(out);
 * for (const auto& event : events) {
 *     emitter.emit(event);
 * }
 * @endcode
 */
class Emitter {
public:
    explicit Emitter(std::ostream& stream, const EmitterSettings& settings = {});

    Emitter(const Emitter&) = delete;
    auto operator=(const Emitter&) -> Emitter& = delete;

    /**
     * @brief Queues an event and writes everything that can be decided.
     * @throws EmitterError if the event does not fit the event grammar.
     */
    void emit(Event event);

    [[nodiscard]] auto settings() const -> const EmitterSettings& {
        return settings_;
    }

private:
    friend class ScalarWriter;

    enum class State : std::uint8_t {
        StreamStart,
        FirstDocumentStart,
        DocumentStart,
        DocumentEnd,
        RootNode,
        FlowSequenceFirstItem,
        FlowSequenceItem,
        FlowMappingFirstKey,
        FlowMappingKey,
        FlowMappingSimpleValue,
        FlowMappingValue,
        BlockSequenceFirstItem,
        BlockSequenceItem,
        BlockMappingFirstKey,
        BlockMappingKey,
        BlockMappingSimpleValue,
        BlockMappingValue,
        Nothing
    };

    /// Where in the document the current node is.
    enum class Context : std::uint8_t {
        Root,
        Sequence,
        MappingNoSimpleKey,
        MappingSimpleKey
    };

    void runState(State state);
    auto popState() -> State;
    auto popIndent() -> int;
    void pushState(State state) { states_.push_back(state); }

    [[nodiscard]] auto needMoreEvents() const -> bool;
    [[nodiscard]] auto needEvents(std::size_t count) const -> bool;
    void increaseIndent(bool flow = false, bool indentless = false);
    void expectEvent(std::initializer_list<EventId> ids,
                     std::string_view expected) const;

    void expectStreamStart();
    void expectNothing();
    void expectDocumentStart(bool first);
    void expectDocumentEnd();
    void expectRootNode();
    void expectNode(Context context);
    void expectAlias();
    void expectScalar();
    void expectFlowSequence();
    void expectFlowSequenceItem(bool first);
    void expectFlowMapping();
    void expectFlowMappingKey(bool first);
    void expectFlowMappingSimpleValue();
    void expectFlowMappingValue();
    void expectBlockSequence();
    void expectBlockSequenceItem(bool first);
    void expectBlockMapping();
    void expectBlockMappingKey(bool first);
    void expectBlockMappingSimpleValue();
    void expectBlockMappingValue();

    [[nodiscard]] auto checkEmptySequence() const -> bool;
    [[nodiscard]] auto checkEmptyMapping() const -> bool;
    [[nodiscard]] auto checkEmptyDocument() const -> bool;
    auto checkSimpleKey() -> bool;

    void processScalar();
    void processAnchor(std::string_view indicator);
    void processTag();
    auto chooseScalarStyle() -> ScalarStyle;
    auto analysis() -> const ScalarAnalysis&;

    [[nodiscard]] static auto prepareVersion(const std::string& version)
        -> std::string;
    [[nodiscard]] static auto prepareTagHandle(const std::string& handle)
        -> std::string;
    [[nodiscard]] static auto prepareTagPrefix(const std::string& prefix)
        -> std::string;
    [[nodiscard]] auto prepareTag(const std::string& tag) -> std::string;
    [[nodiscard]] static auto prepareAnchor(const std::string& anchor)
        -> std::string;

    void writeString(std::string_view text);
    void writeStreamStart();
    void writeIndicator(std::string_view indicator, bool needWhitespace,
                        bool whitespace = false, bool indentation = false);
    void writeIndent();
    void writeLineBreak(std::string_view data = {});
    void writeVersionDirective(std::string_view version);
    void writeTagDirective(std::string_view handle, std::string_view prefix);

    std::ostream& stream_;
    EmitterSettings settings_;
    unsigned bestIndent_ = 2;
    unsigned bestWidth_ = 80;

    std::vector<State> states_;
    State state_ = State::StreamStart;

    std::deque<Event> events_;
    /// Event being written.
    Event event_;

    std::vector<int> indents_;
    /// Current indentation; -1 before the root node.
    int indent_ = -1;
    /// Flow nesting depth, 0 in block context.
    unsigned flowLevel_ = 0;
    Context context_ = Context::Root;

    // Properties of the last written character.
    unsigned line_ = 0;
    unsigned column_ = 0;
    bool whitespace_ = true;
    /// Indentation spaces or an indentation indicator (`-`, `?`, `:`).
    bool indentation_ = true;

    /// The document needs an explicit `...` before a following one.
    bool openEnded_ = false;

    std::vector<TagDirective> tagDirectives_;

    std::optional<std::string> preparedAnchor_;
    std::optional<std::string> preparedTag_;
    /// Analysis of the current scalar, computed on first use.
    std::optional<ScalarAnalysis> analysis_;
    ScalarStyle style_ = ScalarStyle::Invalid;
};

/**
 * @brief Emits a complete event sequence and returns the text.
 * @throws EmitterError if the sequence does not fit the event grammar.
 */
[[nodiscard]] auto emitEvents(const std::vector<Event>& events,
                              const EmitterSettings& settings = {})
    -> std::string;

}  // namespace strata::yaml

#endif
