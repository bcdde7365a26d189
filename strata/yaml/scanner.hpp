#ifndef STRATA_YAML_SCANNER_HPP
#define STRATA_YAML_SCANNER_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "strata/yaml/mark.hpp"
#include "strata/yaml/reader.hpp"
#include "strata/yaml/token.hpp"

namespace strata::yaml {

/**
 * @brief Produces YAML tokens from the characters of a Reader.
 *
 * Tokens are fetched lazily: empty() scans only as far as needed to know
 * the next token, which for a possible simple key means up to the ':' that
 * turns it into a key. Token values are slices of the reader buffer and stay
 * valid as long as the scanner lives.
 */
class Scanner {
public:
    /**
     * @brief Takes ownership of a reader and queues the stream start token.
     */
    explicit Scanner(std::unique_ptr<Reader> reader);

    /**
     * @brief Builds the reader from a byte buffer.
     * @throws ReaderError if the buffer cannot be decoded.
     */
    explicit Scanner(std::string buffer, std::string name = "<unknown>");

    Scanner(Scanner&&) noexcept = default;
    auto operator=(Scanner&&) noexcept -> Scanner& = default;

    /**
     * @brief True once the stream end token has been consumed.
     * @throws ScannerError on malformed input.
     */
    auto empty() -> bool;

    /**
     * @brief The next token.
     * @throws error::LogicError if no token is left.
     */
    auto front() -> const Token&;

    void popFront();

    /**
     * @brief Text of a token value.
     */
    [[nodiscard]] auto value(const Token& token) const -> std::string_view;

    [[nodiscard]] auto mark() const -> Mark { return reader_->mark(); }
    [[nodiscard]] auto name() const -> const std::string& {
        return reader_->name();
    }
    void setName(std::string name) { reader_->setName(std::move(name)); }

private:
    /**
     * @brief A key not introduced by '?', not yet confirmed by ':'.
     */
    struct SimpleKey {
        Mark mark;
        std::uint32_t tokenIndex = 0;
        bool required = false;
        bool isNull = true;
    };

    enum class Chomping : std::uint8_t { Strip, Clip, Keep };

    [[nodiscard]] auto needMoreTokens() -> bool;
    void fetchToken();
    void fetchNextToken();

    [[nodiscard]] auto nextPossibleSimpleKey() const -> std::uint32_t;
    void stalePossibleSimpleKeys();
    void savePossibleSimpleKey();
    void removePossibleSimpleKey();
    void unwindIndent(int column);
    auto addIndent(int column) -> bool;

    void fetchStreamStart();
    void fetchStreamEnd();
    void fetchDirective();
    void fetchDocumentIndicator(TokenId id);
    void fetchFlowCollectionStart(TokenId id);
    void fetchFlowCollectionEnd(TokenId id);
    void fetchFlowEntry();
    void blockChecks(std::string_view type, TokenId id);
    void fetchBlockEntry();
    void fetchKey();
    void fetchValue();
    void fetchAnchor(TokenId id);
    void fetchTag();
    void fetchBlockScalar(ScalarStyle style);
    void fetchFlowScalar(ScalarStyle quotes);
    void fetchPlain();

    [[nodiscard]] auto checkDirective() const -> bool;
    auto checkDocumentStart() -> bool;
    auto checkDocumentEnd() -> bool;
    auto checkBlockEntry() -> bool;
    auto checkKey() -> bool;
    auto checkValue() -> bool;
    auto checkPlain() -> bool;

    void findNextNonSpace();
    void scanAlphaNumericToSlice(std::string_view name, const Mark& startMark);
    void scanAnchorAliasToSlice(const Mark& startMark);
    void scanToNextBreak();
    void scanToNextBreakToSlice();
    void scanToNextToken();

    auto scanDirective() -> Token;
    void scanDirectiveNameToSlice(const Mark& startMark);
    void scanYamlDirectiveValueToSlice(const Mark& startMark);
    void scanYamlDirectiveNumberToSlice(const Mark& startMark);
    auto scanTagDirectiveValueToSlice(const Mark& startMark) -> std::uint32_t;
    void scanTagDirectiveHandleToSlice(const Mark& startMark);
    void scanTagDirectivePrefixToSlice(const Mark& startMark);
    void scanDirectiveIgnoredLine(const Mark& startMark);

    auto scanAnchor(TokenId id) -> Token;
    auto scanTag() -> Token;

    auto scanBlockScalar(ScalarStyle style) -> Token;
    auto scanBlockScalarIndicators(const Mark& startMark)
        -> std::pair<Chomping, int>;
    auto getChomping(char32_t& c, Chomping& chomping) -> bool;
    auto getIncrement(char32_t& c, int& increment, const Mark& startMark)
        -> bool;
    void scanBlockScalarIgnoredLine(const Mark& startMark);
    auto scanBlockScalarIndentationToSlice() -> std::pair<std::uint32_t, Mark>;
    auto scanBlockScalarBreaksToSlice(std::uint32_t indent) -> Mark;

    auto scanFlowScalar(ScalarStyle quotes) -> Token;
    void scanFlowScalarNonSpacesToSlice(ScalarStyle quotes,
                                        const Mark& startMark);
    void scanFlowScalarSpacesToSlice(const Mark& startMark);
    auto scanFlowScalarBreaksToSlice(const Mark& startMark) -> bool;

    auto scanPlain() -> Token;
    void scanPlainSpacesToSlice();
    auto atDocumentSeparator() -> bool;

    void scanTagHandleToSlice(std::string_view name, const Mark& startMark);
    void scanTagUriToSlice(std::string_view name, const Mark& startMark);
    void scanUriEscapesToSlice(std::string_view name, const Mark& startMark);

    auto scanLineBreak() -> char32_t;

    std::unique_ptr<Reader> reader_;
    bool done_ = false;

    /// 0 in block context.
    std::uint32_t flowLevel_ = 0;
    int indent_ = -1;
    std::vector<int> indents_;

    std::deque<Token> tokens_;
    /// Tokens popped so far; with tokens_.size() this numbers every token.
    std::uint32_t tokensTaken_ = 0;

    /// In block context this also tells whether a block collection may
    /// start here.
    bool allowSimpleKey_ = true;

    /// Indexed by flow level.
    std::vector<SimpleKey> possibleSimpleKeys_;
};

}  // namespace strata::yaml

#endif
