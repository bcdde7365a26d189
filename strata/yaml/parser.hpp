#ifndef STRATA_YAML_PARSER_HPP
#define STRATA_YAML_PARSER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "strata/yaml/event.hpp"
#include "strata/yaml/mark.hpp"
#include "strata/yaml/scanner.hpp"
#include "strata/yaml/style.hpp"
#include "strata/yaml/token.hpp"

namespace strata::yaml {

/**
 * @brief Produces YAML events from the tokens of a Scanner.
 *
 * Grammar:
 *
 * @code
 * stream            ::= STREAM-START implicit_document? explicit_document*
 *                       STREAM-END
 * implicit_document ::= block_node DOCUMENT-END*
 * explicit_document ::= DIRECTIVE* DOCUMENT-START block_node? DOCUMENT-END*
 * block_node_or_indentless_sequence ::= ALIAS
 *                       | properties (block_content |
 *                                     indentless_block_sequence)?
 *                       | block_content
 *                       | indentless_block_sequence
 * block_node        ::= ALIAS | properties block_content? | block_content
 * flow_node         ::= ALIAS | properties flow_content? | flow_content
 * properties        ::= TAG ANCHOR? | ANCHOR TAG?
 * block_content     ::= block_collection | flow_collection | SCALAR
 * flow_content      ::= flow_collection | SCALAR
 * block_sequence    ::= BLOCK-SEQUENCE-START (BLOCK-ENTRY block_node?)*
 *                       BLOCK-END
 * indentless_sequence ::= (BLOCK-ENTRY block_node?)+
 * block_mapping     ::= BLOCK-MAPPING-START
 *                       ((KEY block_node_or_indentless_sequence?)?
 *                       (VALUE block_node_or_indentless_sequence?)?)*
 *                       BLOCK-END
 * flow_sequence     ::= FLOW-SEQUENCE-START
 *                       (flow_sequence_entry FLOW-ENTRY)*
 *                       flow_sequence_entry? FLOW-SEQUENCE-END
 * flow_sequence_entry ::= flow_node | KEY flow_node? (VALUE flow_node?)?
 * flow_mapping      ::= FLOW-MAPPING-START
 *                       (flow_mapping_entry FLOW-ENTRY)*
 *                       flow_mapping_entry? FLOW-MAPPING-END
 * flow_mapping_entry ::= flow_node | KEY flow_node? (VALUE flow_node?)?
 * @endcode
 *
 * Each production is a State; nested productions push the state to resume
 * on the states_ stack, so nesting depth is not limited by the call stack.
 */
class Parser {
public:
    explicit Parser(Scanner scanner);

    /**
     * @throws ReaderError if the buffer cannot be decoded.
     */
    explicit Parser(std::string buffer, std::string name = "<unknown>");

    /**
     * @brief True once the stream end event has been consumed.
     * @throws ScannerError or ParserError on malformed input.
     */
    auto empty() -> bool;

    /**
     * @throws error::LogicError if no event is left.
     */
    auto front() -> const Event&;

    void popFront();

    [[nodiscard]] auto name() const -> const std::string& {
        return scanner_.name();
    }

private:
    enum class State : std::uint8_t {
        End,
        StreamStart,
        ImplicitDocumentStart,
        DocumentStart,
        DocumentEnd,
        DocumentContent,
        BlockNode,
        BlockNodeOrIndentlessSequence,
        FlowNode,
        BlockSequenceFirstEntry,
        BlockSequenceEntry,
        IndentlessSequenceEntry,
        BlockMappingFirstKey,
        BlockMappingKey,
        BlockMappingValue,
        FlowSequenceFirstEntry,
        FlowSequenceEntry,
        FlowSequenceEntryMappingKey,
        FlowSequenceEntryMappingValue,
        FlowSequenceEntryMappingEnd,
        FlowMappingFirstKey,
        FlowMappingKey,
        FlowMappingValue,
        FlowMappingEmptyValue
    };

    void ensureState();
    auto runState(State state) -> Event;

    auto popState() -> State;
    auto popMark() -> Mark;
    void pushState(State state) { states_.push_back(state); }
    void pushMark(const Mark& mark) { marks_.push_back(mark); }

    auto frontId() -> TokenId { return scanner_.front().id; }

    auto parseStreamStart() -> Event;
    auto parseImplicitDocumentStart() -> Event;
    auto parseDocumentStart() -> Event;
    auto parseDocumentEnd() -> Event;
    auto parseDocumentContent() -> Event;
    auto processDirectives() -> std::vector<TagDirective>;

    auto parseNode(bool block, bool indentlessSequence = false) -> Event;
    [[nodiscard]] auto handleDoubleQuotedScalarEscapes(
        std::string_view value, const Mark& startMark) const -> std::string;
    [[nodiscard]] auto processTag(std::string_view tag, std::uint32_t handleEnd,
                                  const Mark& startMark,
                                  const Mark& tagMark) const -> std::string;

    auto parseBlockSequenceEntry(bool first) -> Event;
    auto parseIndentlessSequenceEntry() -> Event;
    auto parseBlockMappingKey(bool first) -> Event;
    auto parseBlockMappingValue() -> Event;
    auto parseFlowSequenceEntry(bool first) -> Event;
    auto parseFlowKey(State nextState, TokenId endId) -> Event;
    auto parseFlowValue(TokenId checkId, State nextState) -> Event;
    auto parseFlowSequenceEntryMappingEnd() -> Event;
    auto parseFlowMappingKey(bool first) -> Event;
    auto parseFlowMappingEmptyValue() -> Event;

    [[nodiscard]] static auto processEmptyScalar(const Mark& mark) -> Event;

    Scanner scanner_;
    /// Invalid when the next event has not been produced yet.
    Event currentEvent_;
    std::optional<std::string> yamlVersion_;
    /// Handles active in the current document, defaults included.
    std::vector<TagDirective> tagDirectives_;
    std::vector<State> states_;
    /// Start marks of the open collections, for error context.
    std::vector<Mark> marks_;
    State state_ = State::StreamStart;
};

/**
 * @brief Parses a whole buffer into its events.
 * @throws ReaderError, ScannerError or ParserError on malformed input.
 */
[[nodiscard]] auto parseEvents(std::string buffer,
                               std::string name = "<unknown>")
    -> std::vector<Event>;

}  // namespace strata::yaml

#endif
