#include "scanner.hpp"

#include <algorithm>
#include <limits>
#include <optional>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "strata/error/exception.hpp"
#include "strata/yaml/encoding.hpp"
#include "strata/yaml/escapes.hpp"
#include "strata/yaml/exception.hpp"

namespace strata::yaml {

namespace {
constexpr std::uint32_t kSimpleKeyMaxColumns = 1024;

constexpr auto isLineBreak(char32_t c) -> bool {
    return c == U'\n' || c == U'\r' || c == 0x85 || c == 0x2028 ||
           c == 0x2029;
}

constexpr auto isBreak(char32_t c) -> bool {
    return c == kEndOfInput || isLineBreak(c);
}

constexpr auto isBreakOrSpace(char32_t c) -> bool {
    return c == U' ' || isBreak(c);
}

constexpr auto isWhiteSpace(char32_t c) -> bool {
    return c == U' ' || c == U'\t' || isBreak(c);
}

/// A space or a line break, but not the end of input.
constexpr auto isNSChar(char32_t c) -> bool {
    return c == U' ' || isLineBreak(c);
}

constexpr auto isFlowIndicator(char32_t c) -> bool {
    return c == U',' || c == U'[' || c == U']' || c == U'{' || c == U'}';
}

constexpr auto isNonScalarStartCharacter(char32_t c) -> bool {
    switch (c) {
        case U'-':
        case U'?':
        case U':':
        case U',':
        case U'[':
        case U']':
        case U'{':
        case U'}':
        case U'#':
        case U'&':
        case U'*':
        case U'!':
        case U'|':
        case U'>':
        case U'\'':
        case U'"':
        case U'%':
        case U'@':
        case U'`':
            return true;
        default:
            return isWhiteSpace(c);
    }
}

constexpr auto isUriChar(char32_t c) -> bool {
    switch (c) {
        case U'-':
        case U';':
        case U'/':
        case U'?':
        case U':':
        case U'@':
        case U'&':
        case U'=':
        case U'+':
        case U'$':
        case U',':
        case U'_':
        case U'.':
        case U'!':
        case U'~':
        case U'*':
        case U'\'':
        case U'(':
        case U')':
        case U'[':
        case U']':
        case U'%':
            return true;
        default:
            return false;
    }
}

constexpr auto isFlowScalarBreakSpace(char32_t c) -> bool {
    return isWhiteSpace(c) || c == U'\'' || c == U'"' || c == U'\\';
}

constexpr auto isAnchorNameChar(char32_t c) -> bool {
    return !isWhiteSpace(c) && !isFlowIndicator(c) && c != 0xFEFF;
}

constexpr auto isDigit(char32_t c) -> bool { return c >= U'0' && c <= U'9'; }

constexpr auto isAlphaNum(char32_t c) -> bool {
    return isDigit(c) || (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
}

constexpr auto isHexDigit(char32_t c) -> bool {
    return isDigit(c) || (c >= U'a' && c <= U'f') || (c >= U'A' && c <= U'F');
}

constexpr auto hexValue(char32_t c) -> unsigned {
    if (isDigit(c)) {
        return c - U'0';
    }
    return (c | 0x20) - U'a' + 10;
}

/// Printable rendering of a character for error messages.
auto charText(char32_t c) -> std::string {
    if (c == kEndOfInput) {
        return "\\0";
    }
    std::string text;
    appendUtf8(text, c);
    return text;
}
}  // namespace

Scanner::Scanner(std::unique_ptr<Reader> reader) : reader_(std::move(reader)) {
    if (!reader_) {
        THROW_INVALID_ARGUMENT("Scanner needs a reader");
    }
    fetchStreamStart();
}

Scanner::Scanner(std::string buffer, std::string name)
    : Scanner(std::make_unique<Reader>(std::move(buffer), std::move(name))) {}

auto Scanner::empty() -> bool {
    while (needMoreTokens()) {
        fetchToken();
    }
    return tokens_.empty();
}

auto Scanner::front() -> const Token& {
    if (empty()) {
        THROW_LOGIC_ERROR("No token left to peek");
    }
    return tokens_.front();
}

void Scanner::popFront() {
    if (empty()) {
        THROW_LOGIC_ERROR("No token left to pop");
    }
    ++tokensTaken_;
    tokens_.pop_front();
}

auto Scanner::value(const Token& token) const -> std::string_view {
    return reader_->view(token.value);
}

auto Scanner::needMoreTokens() -> bool {
    if (done_) {
        return false;
    }
    if (tokens_.empty()) {
        return true;
    }
    // The current token may be a possible simple key; look further.
    stalePossibleSimpleKeys();
    return nextPossibleSimpleKey() == tokensTaken_;
}

void Scanner::fetchToken() {
    scanToNextToken();
    stalePossibleSimpleKeys();
    unwindIndent(static_cast<int>(reader_->column()));

    fetchNextToken();

    const Token& fetched = tokens_.back();
    spdlog::trace("Scanner {}: fetched {} at {}", reader_->name(),
                  tokenIdName(fetched.id), fetched.startMark.toString());
}

void Scanner::fetchNextToken() {
    const char32_t c = reader_->peek();

    if (c == kEndOfInput) {
        fetchStreamEnd();
        return;
    }
    if (checkDirective()) {
        fetchDirective();
        return;
    }
    if (checkDocumentStart()) {
        fetchDocumentIndicator(TokenId::DocumentStart);
        return;
    }
    if (checkDocumentEnd()) {
        fetchDocumentIndicator(TokenId::DocumentEnd);
        return;
    }

    switch (c) {
        case U'[':
            fetchFlowCollectionStart(TokenId::FlowSequenceStart);
            return;
        case U'{':
            fetchFlowCollectionStart(TokenId::FlowMappingStart);
            return;
        case U']':
            fetchFlowCollectionEnd(TokenId::FlowSequenceEnd);
            return;
        case U'}':
            fetchFlowCollectionEnd(TokenId::FlowMappingEnd);
            return;
        case U',':
            fetchFlowEntry();
            return;
        case U'!':
            fetchTag();
            return;
        case U'\'':
            fetchFlowScalar(ScalarStyle::SingleQuoted);
            return;
        case U'"':
            fetchFlowScalar(ScalarStyle::DoubleQuoted);
            return;
        case U'*':
            fetchAnchor(TokenId::Alias);
            return;
        case U'&':
            fetchAnchor(TokenId::Anchor);
            return;
        case U'?':
            if (checkKey()) {
                fetchKey();
                return;
            }
            break;
        case U':':
            if (checkValue()) {
                fetchValue();
                return;
            }
            break;
        case U'-':
            if (checkBlockEntry()) {
                fetchBlockEntry();
                return;
            }
            break;
        case U'|':
            if (flowLevel_ == 0) {
                fetchBlockScalar(ScalarStyle::Literal);
                return;
            }
            break;
        case U'>':
            if (flowLevel_ == 0) {
                fetchBlockScalar(ScalarStyle::Folded);
                return;
            }
            break;
        default:
            break;
    }
    if (checkPlain()) {
        fetchPlain();
        return;
    }

    THROW_SCANNER_ERROR(
        fmt::format("While scanning for the next token, found character "
                    "'{}', index {} that cannot start any token",
                    charText(c), static_cast<std::uint32_t>(c)),
        reader_->mark());
}

auto Scanner::nextPossibleSimpleKey() const -> std::uint32_t {
    std::uint32_t minTokenNumber = std::numeric_limits<std::uint32_t>::max();
    for (const auto& key : possibleSimpleKeys_) {
        if (!key.isNull) {
            minTokenNumber = std::min(minTokenNumber, key.tokenIndex);
        }
    }
    return minTokenNumber;
}

void Scanner::stalePossibleSimpleKeys() {
    for (auto& key : possibleSimpleKeys_) {
        if (key.isNull) {
            continue;
        }
        if (key.mark.line() != reader_->line() ||
            reader_->column() > key.mark.column() + kSimpleKeyMaxColumns) {
            if (key.required) {
                THROW_SCANNER_ERROR(
                    "While scanning a simple key, could not find expected ':'",
                    reader_->mark(), "key started here", key.mark);
            }
            key.isNull = true;
        }
    }
}

void Scanner::savePossibleSimpleKey() {
    // A key that is the first token of a block line must be a simple key.
    const bool required =
        flowLevel_ == 0 && indent_ == static_cast<int>(reader_->column());

    if (!allowSimpleKey_) {
        return;
    }

    removePossibleSimpleKey();
    const auto tokenCount =
        tokensTaken_ + static_cast<std::uint32_t>(tokens_.size());

    if (possibleSimpleKeys_.size() <= flowLevel_) {
        possibleSimpleKeys_.resize(flowLevel_ + 1);
    }
    possibleSimpleKeys_[flowLevel_] =
        SimpleKey{reader_->mark(), tokenCount, required, false};
}

void Scanner::removePossibleSimpleKey() {
    if (possibleSimpleKeys_.size() <= flowLevel_) {
        return;
    }
    auto& key = possibleSimpleKeys_[flowLevel_];
    if (key.isNull) {
        return;
    }
    if (key.required) {
        THROW_SCANNER_ERROR(
            "While scanning a simple key, could not find expected ':'",
            reader_->mark(), "key started here", key.mark);
    }
    key.isNull = true;
}

void Scanner::unwindIndent(int column) {
    // Indentation is ignored in flow context.
    if (flowLevel_ > 0) {
        return;
    }
    while (indent_ > column) {
        indent_ = indents_.back();
        indents_.pop_back();
        tokens_.push_back(
            simpleToken(TokenId::BlockEnd, reader_->mark(), reader_->mark()));
    }
}

auto Scanner::addIndent(int column) -> bool {
    if (indent_ >= column) {
        return false;
    }
    indents_.push_back(indent_);
    indent_ = column;
    return true;
}

void Scanner::fetchStreamStart() {
    tokens_.push_back(streamStartToken(reader_->mark(), reader_->mark(),
                                       reader_->encoding()));
}

void Scanner::fetchStreamEnd() {
    unwindIndent(-1);
    removePossibleSimpleKey();
    allowSimpleKey_ = false;
    possibleSimpleKeys_.clear();

    tokens_.push_back(
        simpleToken(TokenId::StreamEnd, reader_->mark(), reader_->mark()));
    done_ = true;
}

void Scanner::fetchDirective() {
    unwindIndent(-1);
    removePossibleSimpleKey();
    allowSimpleKey_ = false;

    tokens_.push_back(scanDirective());
}

void Scanner::fetchDocumentIndicator(TokenId id) {
    unwindIndent(-1);
    // No block collection can start right after '---'.
    removePossibleSimpleKey();
    allowSimpleKey_ = false;

    const Mark startMark = reader_->mark();
    reader_->forward(3);
    tokens_.push_back(simpleToken(id, startMark, reader_->mark()));
}

void Scanner::fetchFlowCollectionStart(TokenId id) {
    savePossibleSimpleKey();
    allowSimpleKey_ = true;
    ++flowLevel_;

    const Mark startMark = reader_->mark();
    reader_->forward();
    tokens_.push_back(simpleToken(id, startMark, reader_->mark()));
}

void Scanner::fetchFlowCollectionEnd(TokenId id) {
    removePossibleSimpleKey();
    allowSimpleKey_ = false;
    // An unbalanced closing bracket is reported by the parser.
    if (flowLevel_ > 0) {
        --flowLevel_;
    }

    const Mark startMark = reader_->mark();
    reader_->forward();
    tokens_.push_back(simpleToken(id, startMark, reader_->mark()));
}

void Scanner::fetchFlowEntry() {
    removePossibleSimpleKey();
    allowSimpleKey_ = true;

    const Mark startMark = reader_->mark();
    reader_->forward();
    tokens_.push_back(
        simpleToken(TokenId::FlowEntry, startMark, reader_->mark()));
}

void Scanner::blockChecks(std::string_view type, TokenId id) {
    if (!allowSimpleKey_) {
        THROW_SCANNER_ERROR(fmt::format("{} keys are not allowed here", type),
                            reader_->mark());
    }
    if (addIndent(static_cast<int>(reader_->column()))) {
        tokens_.push_back(simpleToken(id, reader_->mark(), reader_->mark()));
    }
}

void Scanner::fetchBlockEntry() {
    // A block entry inside a flow collection is left for the parser to
    // reject.
    if (flowLevel_ == 0) {
        blockChecks("Sequence", TokenId::BlockSequenceStart);
    }
    removePossibleSimpleKey();
    allowSimpleKey_ = true;

    const Mark startMark = reader_->mark();
    reader_->forward();
    tokens_.push_back(
        simpleToken(TokenId::BlockEntry, startMark, reader_->mark()));
}

void Scanner::fetchKey() {
    if (flowLevel_ == 0) {
        blockChecks("Mapping", TokenId::BlockMappingStart);
    }
    removePossibleSimpleKey();
    allowSimpleKey_ = flowLevel_ == 0;

    const Mark startMark = reader_->mark();
    reader_->forward();
    tokens_.push_back(simpleToken(TokenId::Key, startMark, reader_->mark()));
}

void Scanner::fetchValue() {
    if (possibleSimpleKeys_.size() > flowLevel_ &&
        !possibleSimpleKeys_[flowLevel_].isNull) {
        const SimpleKey key = possibleSimpleKeys_[flowLevel_];
        possibleSimpleKeys_[flowLevel_].isNull = true;
        const auto index =
            static_cast<std::ptrdiff_t>(key.tokenIndex - tokensTaken_);

        tokens_.insert(tokens_.begin() + index,
                       simpleToken(TokenId::Key, key.mark, key.mark));

        if (flowLevel_ == 0 && addIndent(static_cast<int>(key.mark.column()))) {
            tokens_.insert(
                tokens_.begin() + index,
                simpleToken(TokenId::BlockMappingStart, key.mark, key.mark));
        }

        // Two simple keys cannot follow each other.
        allowSimpleKey_ = false;
    } else {
        // A complex value may only start where a simple key could.
        if (flowLevel_ == 0 && !allowSimpleKey_) {
            THROW_SCANNER_ERROR("Mapping values are not allowed here",
                                reader_->mark());
        }

        // The parser rejects a value starting a new block mapping.
        if (flowLevel_ == 0 &&
            addIndent(static_cast<int>(reader_->column()))) {
            tokens_.push_back(simpleToken(TokenId::BlockMappingStart,
                                          reader_->mark(), reader_->mark()));
        }

        removePossibleSimpleKey();
        allowSimpleKey_ = flowLevel_ == 0;
    }

    const Mark startMark = reader_->mark();
    reader_->forward();
    tokens_.push_back(simpleToken(TokenId::Value, startMark, reader_->mark()));
}

void Scanner::fetchAnchor(TokenId id) {
    savePossibleSimpleKey();
    allowSimpleKey_ = false;

    tokens_.push_back(scanAnchor(id));
}

void Scanner::fetchTag() {
    savePossibleSimpleKey();
    allowSimpleKey_ = false;

    tokens_.push_back(scanTag());
}

void Scanner::fetchBlockScalar(ScalarStyle style) {
    removePossibleSimpleKey();
    // A simple key may follow a block scalar.
    allowSimpleKey_ = true;

    tokens_.push_back(scanBlockScalar(style));
}

void Scanner::fetchFlowScalar(ScalarStyle quotes) {
    savePossibleSimpleKey();
    allowSimpleKey_ = false;

    tokens_.push_back(scanFlowScalar(quotes));
}

void Scanner::fetchPlain() {
    savePossibleSimpleKey();
    // scanPlain() sets this again if the scalar ends at a line start.
    allowSimpleKey_ = false;

    tokens_.push_back(scanPlain());
}

auto Scanner::checkDirective() const -> bool {
    return reader_->peekByte() == '%' && reader_->column() == 0;
}

auto Scanner::checkDocumentStart() -> bool {
    return reader_->column() == 0 && reader_->peekByte() == '-' &&
           reader_->prefix(3) == "---" && isWhiteSpace(reader_->peek(3));
}

auto Scanner::checkDocumentEnd() -> bool {
    return reader_->column() == 0 && reader_->peekByte() == '.' &&
           reader_->prefix(3) == "..." && isWhiteSpace(reader_->peek(3));
}

auto Scanner::checkBlockEntry() -> bool {
    return isWhiteSpace(reader_->peek(1));
}

auto Scanner::checkKey() -> bool {
    return flowLevel_ > 0 || isWhiteSpace(reader_->peek(1));
}

auto Scanner::checkValue() -> bool {
    return flowLevel_ > 0 || isWhiteSpace(reader_->peek(1));
}

auto Scanner::checkPlain() -> bool {
    const char32_t c = reader_->peek();
    if (!isNonScalarStartCharacter(c)) {
        return true;
    }
    // '?' and ':' start plain scalars only in block context, which keeps
    // flow context independent of spacing.
    return !isWhiteSpace(reader_->peek(1)) &&
           (c == U'-' || (flowLevel_ == 0 && (c == U'?' || c == U':')));
}

void Scanner::findNextNonSpace() {
    while (reader_->peekByte() == ' ') {
        reader_->forward();
    }
}

void Scanner::scanAlphaNumericToSlice(std::string_view name,
                                      const Mark& startMark) {
    std::size_t length = 0;
    char32_t c = reader_->peek();
    while (isAlphaNum(c) || c == U'-' || c == U'_') {
        c = reader_->peek(++length);
    }

    if (length == 0) {
        THROW_SCANNER_ERROR(
            fmt::format("While scanning a {}, expected alphanumeric, '-' or "
                        "'_', but found {}",
                        name, charText(c)),
            reader_->mark(), fmt::format("{} started here", name), startMark);
    }

    reader_->sliceBuilder().write(reader_->get(length));
}

void Scanner::scanAnchorAliasToSlice(const Mark& startMark) {
    std::size_t length = 0;
    char32_t c = reader_->peek();
    while (isAnchorNameChar(c)) {
        c = reader_->peek(++length);
    }

    if (length == 0) {
        THROW_SCANNER_ERROR(
            fmt::format("While scanning an anchor or alias, expected a "
                        "printable character besides '[', ']', '{{', '}}' "
                        "and ',', but found {}",
                        charText(c)),
            reader_->mark(), "started here", startMark);
    }

    reader_->sliceBuilder().write(reader_->get(length));
}

void Scanner::scanToNextBreak() {
    while (!isBreak(reader_->peek())) {
        reader_->forward();
    }
}

void Scanner::scanToNextBreakToSlice() {
    std::size_t length = 0;
    while (!isBreak(reader_->peek(length))) {
        ++length;
    }
    reader_->sliceBuilder().write(reader_->get(length));
}

void Scanner::scanToNextToken() {
    // Tabs are skipped only in flow context; in block context they cannot
    // start a token.
    for (;;) {
        // Flow context ignores all whitespace.
        if (flowLevel_ > 0) {
            while (reader_->peekByte() == ' ' || reader_->peekByte() == '\t') {
                reader_->forward();
            }
        } else {
            findNextNonSpace();
        }
        if (reader_->peekByte() == '#') {
            scanToNextBreak();
        }
        if (scanLineBreak() == kEndOfInput) {
            break;
        }
        if (flowLevel_ == 0) {
            allowSimpleKey_ = true;
        }
    }
}

auto Scanner::scanDirective() -> Token {
    const Mark startMark = reader_->mark();
    reader_->forward();

    auto& builder = reader_->sliceBuilder();
    builder.begin();
    scanDirectiveNameToSlice(startMark);
    const std::string_view name = reader_->view(builder.finish());

    builder.begin();
    std::uint32_t tagHandleEnd = kNoDivider;
    if (name == "YAML") {
        scanYamlDirectiveValueToSlice(startMark);
    } else if (name == "TAG") {
        tagHandleEnd = scanTagDirectiveValueToSlice(startMark);
    }
    const Slice value = builder.finish();

    const Mark endMark = reader_->mark();

    DirectiveType directive = DirectiveType::Reserved;
    if (name == "YAML") {
        directive = DirectiveType::Yaml;
    } else if (name == "TAG") {
        directive = DirectiveType::Tag;
    } else {
        scanToNextBreak();
    }

    scanDirectiveIgnoredLine(startMark);

    return directiveToken(startMark, endMark, value, directive, tagHandleEnd);
}

void Scanner::scanDirectiveNameToSlice(const Mark& startMark) {
    scanAlphaNumericToSlice("directive", startMark);

    if (!isBreakOrSpace(reader_->peek())) {
        THROW_SCANNER_ERROR(
            fmt::format("While scanning a directive, expected alphanumeric, "
                        "'-' or '_', but found {}",
                        charText(reader_->peek())),
            reader_->mark(), "directive started here", startMark);
    }
}

void Scanner::scanYamlDirectiveValueToSlice(const Mark& startMark) {
    findNextNonSpace();

    scanYamlDirectiveNumberToSlice(startMark);

    if (reader_->peekByte() != '.') {
        THROW_SCANNER_ERROR(
            fmt::format("While scanning a directive, expected digit or '.', "
                        "but found {}",
                        charText(reader_->peek())),
            reader_->mark(), "directive started here", startMark);
    }
    reader_->forward();

    reader_->sliceBuilder().write(U'.');
    scanYamlDirectiveNumberToSlice(startMark);

    if (!isBreakOrSpace(reader_->peek())) {
        THROW_SCANNER_ERROR(
            fmt::format("While scanning a directive, expected digit or '.', "
                        "but found {}",
                        charText(reader_->peek())),
            reader_->mark(), "directive started here", startMark);
    }
}

void Scanner::scanYamlDirectiveNumberToSlice(const Mark& startMark) {
    if (!isDigit(reader_->peek())) {
        THROW_SCANNER_ERROR(
            fmt::format(
                "While scanning a directive, expected a digit, but found {}",
                charText(reader_->peek())),
            reader_->mark(), "directive started here", startMark);
    }

    std::size_t length = 1;
    while (isDigit(reader_->peek(length))) {
        ++length;
    }

    reader_->sliceBuilder().write(reader_->get(length));
}

auto Scanner::scanTagDirectiveValueToSlice(const Mark& startMark)
    -> std::uint32_t {
    auto& builder = reader_->sliceBuilder();
    findNextNonSpace();
    const std::size_t startLength = builder.length();
    scanTagDirectiveHandleToSlice(startMark);
    const auto handleLength =
        static_cast<std::uint32_t>(builder.length() - startLength);
    findNextNonSpace();
    scanTagDirectivePrefixToSlice(startMark);

    return handleLength;
}

void Scanner::scanTagDirectiveHandleToSlice(const Mark& startMark) {
    scanTagHandleToSlice("directive", startMark);
    if (reader_->peekByte() != ' ') {
        THROW_SCANNER_ERROR(
            fmt::format("While scanning a directive handle, expected ' ', but "
                        "found {}",
                        charText(reader_->peek())),
            reader_->mark(), "directive started here", startMark);
    }
}

void Scanner::scanTagDirectivePrefixToSlice(const Mark& startMark) {
    scanTagUriToSlice("directive", startMark);
    if (!isBreakOrSpace(reader_->peek())) {
        THROW_SCANNER_ERROR(
            fmt::format("While scanning a directive prefix, expected ' ', but "
                        "found {}",
                        charText(reader_->peek())),
            reader_->mark(), "directive started here", startMark);
    }
}

void Scanner::scanDirectiveIgnoredLine(const Mark& startMark) {
    findNextNonSpace();
    if (reader_->peekByte() == '#') {
        scanToNextBreak();
    }
    if (!isBreak(reader_->peek())) {
        THROW_SCANNER_ERROR(
            fmt::format("While scanning a directive, expected a comment or a "
                        "line break, but found {}",
                        charText(reader_->peek())),
            reader_->mark(), "directive started here", startMark);
    }
    scanLineBreak();
}

auto Scanner::scanAnchor(TokenId id) -> Token {
    const Mark startMark = reader_->mark();
    reader_->forward();

    auto& builder = reader_->sliceBuilder();
    builder.begin();
    scanAnchorAliasToSlice(startMark);
    const Slice value = builder.finish();

    if (id == TokenId::Alias) {
        return aliasToken(startMark, reader_->mark(), value);
    }
    return anchorToken(startMark, reader_->mark(), value);
}

auto Scanner::scanTag() -> Token {
    const Mark startMark = reader_->mark();
    char32_t c = reader_->peek(1);

    auto& builder = reader_->sliceBuilder();
    builder.begin();
    std::uint32_t handleEnd = 0;

    if (c == U'<') {
        // Verbatim tag: !<uri>
        reader_->forward(2);

        scanTagUriToSlice("tag", startMark);
        if (reader_->peekByte() != '>') {
            THROW_SCANNER_ERROR(
                fmt::format("While scanning a tag, expected a '>', but found {}",
                            charText(reader_->peek())),
                reader_->mark(), "tag started here", startMark);
        }
        reader_->forward();
    } else if (isWhiteSpace(c)) {
        // The non-specific tag '!'.
        reader_->forward();
        builder.write(U'!');
    } else {
        std::size_t length = 1;
        bool useHandle = false;

        while (!isBreakOrSpace(c)) {
            if (c == U'!') {
                useHandle = true;
                break;
            }
            ++length;
            c = reader_->peek(length);
        }

        if (useHandle) {
            scanTagHandleToSlice("tag", startMark);
        } else {
            reader_->forward();
            builder.write(U'!');
        }
        handleEnd = static_cast<std::uint32_t>(builder.length());

        scanTagUriToSlice("tag", startMark);
    }

    if (!isBreakOrSpace(reader_->peek())) {
        THROW_SCANNER_ERROR(
            fmt::format("While scanning a tag, expected a ' ', but found {}",
                        charText(reader_->peek())),
            reader_->mark(), "tag started here", startMark);
    }

    const Slice value = builder.finish();
    return tagToken(startMark, reader_->mark(), value, handleEnd);
}

auto Scanner::scanBlockScalar(ScalarStyle style) -> Token {
    const Mark startMark = reader_->mark();

    // Skip the indicator.
    reader_->forward();

    const auto [chomping, increment] = scanBlockScalarIndicators(startMark);
    scanBlockScalarIgnoredLine(startMark);

    Mark endMark;
    auto indent = static_cast<std::uint32_t>(std::max(1, indent_ + 1));

    auto& builder = reader_->sliceBuilder();
    builder.begin();
    // Holds the line breaks after the last content line; chomping decides
    // whether they stay.
    SliceBuilder::Transaction breaksTransaction(builder);
    std::size_t startLength = builder.length();
    if (increment == 0) {
        const auto [maxIndent, indentationEnd] =
            scanBlockScalarIndentationToSlice();
        endMark = indentationEnd;
        indent = std::max(indent, maxIndent);
    } else {
        indent += static_cast<std::uint32_t>(increment) - 1;
        endMark = scanBlockScalarBreaksToSlice(indent);
    }

    // Empty until a content line has been read.
    std::optional<char32_t> lineBreak;

    while (reader_->column() == indent && reader_->peekByte() != '\0') {
        breaksTransaction.commit();
        const bool leadingNonSpace =
            reader_->peekByte() != ' ' && reader_->peekByte() != '\t';
        scanToNextBreakToSlice();
        lineBreak = scanLineBreak();

        breaksTransaction = SliceBuilder::Transaction(builder);
        startLength = builder.length();
        // The break ending the content line belongs before these breaks; it
        // is inserted below once it is known whether it folds.
        endMark = scanBlockScalarBreaksToSlice(indent);

        if (reader_->column() != indent || reader_->peekByte() == '\0') {
            break;
        }

        if (style == ScalarStyle::Folded && *lineBreak == U'\n' &&
            leadingNonSpace && reader_->peekByte() != ' ' &&
            reader_->peekByte() != '\t') {
            // Folded into a space unless empty lines follow.
            if (startLength == builder.length()) {
                builder.write(U' ');
            }
        } else {
            builder.insert(*lineBreak, startLength);
        }
    }

    if (chomping == Chomping::Keep) {
        breaksTransaction.commit();
    } else {
        breaksTransaction.end();
    }
    if (chomping != Chomping::Strip && lineBreak && *lineBreak != kEndOfInput) {
        if (chomping == Chomping::Keep) {
            // The first kept break goes before the trailing ones.
            builder.insert(*lineBreak, startLength);
        } else {
            builder.write(*lineBreak);
        }
    }

    const Slice value = builder.finish();
    return scalarToken(startMark, endMark, value, style);
}

auto Scanner::scanBlockScalarIndicators(const Mark& startMark)
    -> std::pair<Chomping, int> {
    auto chomping = Chomping::Clip;
    int increment = 0;
    char32_t c = reader_->peek();

    // Either order is accepted.
    if (getChomping(c, chomping)) {
        getIncrement(c, increment, startMark);
    } else if (getIncrement(c, increment, startMark)) {
        getChomping(c, chomping);
    }

    if (!isBreakOrSpace(c)) {
        THROW_SCANNER_ERROR(
            fmt::format("While scanning a block scalar, expected a chomping or "
                        "indentation indicator, but found {}",
                        charText(c)),
            reader_->mark(), "scalar started here", startMark);
    }

    return {chomping, increment};
}

auto Scanner::getChomping(char32_t& c, Chomping& chomping) -> bool {
    if (c != U'+' && c != U'-') {
        return false;
    }
    chomping = c == U'+' ? Chomping::Keep : Chomping::Strip;
    reader_->forward();
    c = reader_->peek();
    return true;
}

auto Scanner::getIncrement(char32_t& c, int& increment, const Mark& startMark)
    -> bool {
    if (!isDigit(c)) {
        return false;
    }
    increment = static_cast<int>(c - U'0');
    if (increment == 0) {
        THROW_SCANNER_ERROR(
            "While scanning a block scalar, expected an indentation indicator "
            "in range 1-9, but found 0",
            reader_->mark(), "scalar started here", startMark);
    }

    reader_->forward();
    c = reader_->peek();
    return true;
}

void Scanner::scanBlockScalarIgnoredLine(const Mark& startMark) {
    findNextNonSpace();
    if (reader_->peekByte() == '#') {
        scanToNextBreak();
    }

    if (!isBreak(reader_->peek())) {
        THROW_SCANNER_ERROR(
            fmt::format("While scanning a block scalar, expected a comment or "
                        "line break, but found {}",
                        charText(reader_->peek())),
            reader_->mark(), "scalar started here", startMark);
    }

    scanLineBreak();
}

auto Scanner::scanBlockScalarIndentationToSlice()
    -> std::pair<std::uint32_t, Mark> {
    std::uint32_t maxIndent = 0;
    Mark endMark = reader_->mark();

    while (isNSChar(reader_->peek())) {
        if (reader_->peekByte() != ' ') {
            reader_->sliceBuilder().write(scanLineBreak());
            endMark = reader_->mark();
            continue;
        }
        reader_->forward();
        maxIndent = std::max(reader_->column(), maxIndent);
    }

    return {maxIndent, endMark};
}

auto Scanner::scanBlockScalarBreaksToSlice(std::uint32_t indent) -> Mark {
    Mark endMark = reader_->mark();

    for (;;) {
        while (reader_->column() < indent && reader_->peekByte() == ' ') {
            reader_->forward();
        }
        if (!isLineBreak(reader_->peek())) {
            break;
        }
        reader_->sliceBuilder().write(scanLineBreak());
        endMark = reader_->mark();
    }

    return endMark;
}

auto Scanner::scanFlowScalar(ScalarStyle quotes) -> Token {
    const Mark startMark = reader_->mark();
    const char32_t quote = reader_->get();

    auto& builder = reader_->sliceBuilder();
    builder.begin();

    scanFlowScalarNonSpacesToSlice(quotes, startMark);

    while (reader_->peek() != quote) {
        scanFlowScalarSpacesToSlice(startMark);
        scanFlowScalarNonSpacesToSlice(quotes, startMark);
    }
    reader_->forward();

    const Slice value = builder.finish();
    return scalarToken(startMark, reader_->mark(), value, quotes);
}

void Scanner::scanFlowScalarNonSpacesToSlice(ScalarStyle quotes,
                                             const Mark& startMark) {
    auto& builder = reader_->sliceBuilder();
    for (;;) {
        std::size_t numCodePoints = 0;
        while (!isFlowScalarBreakSpace(reader_->peek(numCodePoints))) {
            ++numCodePoints;
        }
        if (numCodePoints > 0) {
            builder.write(reader_->get(numCodePoints));
        }

        char32_t c = reader_->peek();
        if (quotes == ScalarStyle::SingleQuoted && c == U'\'' &&
            reader_->peek(1) == U'\'') {
            reader_->forward(2);
            builder.write(U'\'');
        } else if ((quotes == ScalarStyle::DoubleQuoted && c == U'\'') ||
                   (quotes == ScalarStyle::SingleQuoted &&
                    (c == U'"' || c == U'\\'))) {
            reader_->forward();
            builder.write(c);
        } else if (quotes == ScalarStyle::DoubleQuoted && c == U'\\') {
            reader_->forward();
            c = reader_->peek();
            if (isEscape(c)) {
                // Escapes are kept as written; the parser expands them since
                // some expand to more bytes than they occupy.
                reader_->forward();
                builder.write(U'\\');
                builder.write(c);
            } else if (isHexEscape(c)) {
                const std::size_t hexLength = escapeHexLength(c);
                reader_->forward();

                for (std::size_t i = 0; i < hexLength; ++i) {
                    if (!isHexDigit(reader_->peek(i))) {
                        THROW_SCANNER_ERROR(
                            fmt::format("While scanning a double quoted "
                                        "scalar, expected an escape sequence "
                                        "of hexadecimal numbers, but found {}",
                                        charText(reader_->peek(i))),
                            reader_->mark(), "scalar started here", startMark);
                    }
                }
                const std::string_view hex = reader_->get(hexLength);

                builder.write(U'\\');
                builder.write(c);
                builder.write(hex);
            } else if (isLineBreak(c)) {
                scanLineBreak();
                scanFlowScalarBreaksToSlice(startMark);
            } else {
                THROW_SCANNER_ERROR(
                    fmt::format("While scanning a double quoted scalar, found "
                                "unsupported escape character {}",
                                charText(c)),
                    reader_->mark(), "scalar started here", startMark);
            }
        } else {
            return;
        }
    }
}

void Scanner::scanFlowScalarSpacesToSlice(const Mark& startMark) {
    auto& builder = reader_->sliceBuilder();

    std::size_t length = 0;
    while (reader_->peekByte(length) == ' ' ||
           reader_->peekByte(length) == '\t') {
        ++length;
    }
    const std::string_view whitespaces = reader_->prefixBytes(length);

    const char32_t c = reader_->peek(length);
    if (c == kEndOfInput) {
        THROW_SCANNER_ERROR(
            "While scanning a quoted scalar, found unexpected end of buffer",
            reader_->mark(), "scalar started here", startMark);
    }

    if (!isLineBreak(c)) {
        reader_->forward(length);
        builder.write(whitespaces);
        return;
    }

    // Trailing spaces before a line break are dropped.
    reader_->forward(length);
    const char32_t lineBreak = scanLineBreak();

    if (lineBreak != U'\n') {
        builder.write(lineBreak);
    }

    const bool extraBreaks = scanFlowScalarBreaksToSlice(startMark);

    // A single line break folds into a space.
    if (lineBreak == U'\n' && !extraBreaks) {
        builder.write(U' ');
    }
}

auto Scanner::scanFlowScalarBreaksToSlice(const Mark& startMark) -> bool {
    bool anyBreaks = false;
    for (;;) {
        // Document separators end the document even inside quotes.
        const std::string_view prefix = reader_->prefix(3);
        if ((prefix == "---" || prefix == "...") &&
            isWhiteSpace(reader_->peek(3))) {
            THROW_SCANNER_ERROR(
                "While scanning a quoted scalar, found unexpected document "
                "separator",
                reader_->mark(), "scalar started here", startMark);
        }

        while (reader_->peekByte() == ' ' || reader_->peekByte() == '\t') {
            reader_->forward();
        }

        if (!isNSChar(reader_->peek())) {
            break;
        }

        reader_->sliceBuilder().write(scanLineBreak());
        anyBreaks = true;
    }
    return anyBreaks;
}

auto Scanner::scanPlain() -> Token {
    const Mark startMark = reader_->mark();
    Mark endMark = startMark;
    // Continuation lines of a block plain scalar must be indented past the
    // enclosing collection.
    const int indent = indent_ + 1;

    auto& builder = reader_->sliceBuilder();
    builder.begin();

    SliceBuilder::Transaction spacesTransaction;
    // A comment ends the scalar.
    while (reader_->peekByte() != '#') {
        std::size_t length = 0;
        char32_t c = reader_->peek(length);
        for (;;) {
            const char32_t next = reader_->peek(length + 1);
            if (isWhiteSpace(c) ||
                (flowLevel_ == 0 && c == U':' && isWhiteSpace(next)) ||
                (flowLevel_ > 0 && c == U':' &&
                 (isWhiteSpace(next) || isFlowIndicator(next))) ||
                (flowLevel_ > 0 && isFlowIndicator(c))) {
                break;
            }
            ++length;
            c = next;
        }

        if (length == 0) {
            break;
        }

        allowSimpleKey_ = false;

        builder.write(reader_->get(length));

        endMark = reader_->mark();

        // Spaces are only kept if more content follows them.
        spacesTransaction.commit();
        spacesTransaction = SliceBuilder::Transaction(builder);

        const std::size_t startLength = builder.length();
        scanPlainSpacesToSlice();
        if (startLength == builder.length() ||
            (flowLevel_ == 0 &&
             static_cast<int>(reader_->column()) < indent)) {
            break;
        }
    }

    spacesTransaction.end();
    const Slice value = builder.finish();

    return scalarToken(startMark, endMark, value, ScalarStyle::Plain);
}

void Scanner::scanPlainSpacesToSlice() {
    auto& builder = reader_->sliceBuilder();

    // Tabs never continue a plain scalar.
    std::size_t length = 0;
    while (reader_->peekByte(length) == ' ') {
        ++length;
    }
    const std::string_view whitespaces = reader_->prefixBytes(length);
    reader_->forward(length);

    const char32_t c = reader_->peek();
    if (!isNSChar(c)) {
        if (length > 0) {
            builder.write(whitespaces);
        }
        return;
    }

    const char32_t lineBreak = scanLineBreak();
    allowSimpleKey_ = true;

    if (atDocumentSeparator()) {
        return;
    }

    bool extraBreaks = false;

    SliceBuilder::Transaction transaction(builder);
    if (lineBreak != U'\n') {
        builder.write(lineBreak);
    }
    while (isNSChar(reader_->peek())) {
        if (reader_->peekByte() == ' ') {
            reader_->forward();
            continue;
        }
        builder.write(scanLineBreak());
        extraBreaks = true;

        if (atDocumentSeparator()) {
            transaction.end();
            return;
        }
    }
    transaction.commit();

    // One line break and no empty lines fold into a space.
    if (lineBreak == U'\n' && !extraBreaks) {
        builder.write(U' ');
    }
}

auto Scanner::atDocumentSeparator() -> bool {
    const std::string_view prefix = reader_->prefix(3);
    return (prefix == "---" || prefix == "...") &&
           isWhiteSpace(reader_->peek(3));
}

void Scanner::scanTagHandleToSlice(std::string_view name,
                                   const Mark& startMark) {
    char32_t c = reader_->peek();
    if (c != U'!') {
        THROW_SCANNER_ERROR(
            fmt::format("While scanning a {}, expected a !, but found {}", name,
                        charText(c)),
            reader_->mark(), "tag started here", startMark);
    }

    std::size_t length = 1;
    c = reader_->peek(length);
    if (c != U' ') {
        while (isAlphaNum(c) || c == U'-' || c == U'_') {
            ++length;
            c = reader_->peek(length);
        }
        if (c != U'!') {
            THROW_SCANNER_ERROR(
                fmt::format("While scanning a {}, expected a !, but found {}",
                            name, charText(c)),
                reader_->mark(length), "tag started here", startMark);
        }
        ++length;
    }

    reader_->sliceBuilder().write(reader_->get(length));
}

void Scanner::scanTagUriToSlice(std::string_view name, const Mark& startMark) {
    auto& builder = reader_->sliceBuilder();
    // The URI is not checked for well-formedness.
    char32_t c = reader_->peek();
    const std::size_t startLength = builder.length();

    std::size_t length = 0;
    while (isAlphaNum(c) || isUriChar(c)) {
        if (c == U'%') {
            if (length > 0) {
                builder.write(reader_->get(length));
                length = 0;
            }
            scanUriEscapesToSlice(name, startMark);
        } else {
            ++length;
        }
        c = reader_->peek(length);
    }
    if (length > 0) {
        builder.write(reader_->get(length));
    }

    if (builder.length() == startLength) {
        THROW_SCANNER_ERROR(
            fmt::format("While parsing a {}, expected a URI, but found {}", name,
                        charText(c)),
            reader_->mark(), "tag started here", startMark);
    }
}

void Scanner::scanUriEscapesToSlice(std::string_view name,
                                    const Mark& startMark) {
    // The escapes encode UTF-8 bytes.
    std::string bytes;

    while (reader_->peekByte() == '%') {
        reader_->forward();
        const char high = reader_->peekByte();
        const char low = reader_->peekByte(1);

        if (!isHexDigit(static_cast<unsigned char>(high)) ||
            !isHexDigit(static_cast<unsigned char>(low))) {
            THROW_SCANNER_ERROR(
                fmt::format("While scanning a {}, expected a URI escape "
                            "sequence of 2 hexadecimal numbers, but found {}{}",
                            name, charText(static_cast<unsigned char>(high)),
                            charText(static_cast<unsigned char>(low))),
                reader_->mark(), "tag started here", startMark);
        }

        bytes.push_back(static_cast<char>(
            hexValue(static_cast<unsigned char>(high)) * 16 +
            hexValue(static_cast<unsigned char>(low))));

        reader_->forward(2);
    }

    if (!decodeUtf8String(bytes)) {
        THROW_SCANNER_ERROR(
            fmt::format("While scanning a {}, found invalid UTF-8 data encoded "
                        "in URI escape sequence",
                        name),
            reader_->mark(), "tag started here", startMark);
    }
    reader_->sliceBuilder().write(std::string_view(bytes));
}

auto Scanner::scanLineBreak() -> char32_t {
    // '\r\n', '\r', '\n' and NEL become '\n'; LS and PS are kept.
    const char b = reader_->peekByte();
    if (static_cast<unsigned char>(b) < 0x80) {
        if (b == '\n' || b == '\r') {
            if (b == '\r' && reader_->peekByte(1) == '\n') {
                reader_->forward(2);
            } else {
                reader_->forward();
            }
            return U'\n';
        }
        return kEndOfInput;
    }

    const char32_t c = reader_->peek();
    if (c == 0x85) {
        reader_->forward();
        return U'\n';
    }
    if (c == 0x2028 || c == 0x2029) {
        reader_->forward();
        return c;
    }
    return kEndOfInput;
}

}  // namespace strata::yaml
