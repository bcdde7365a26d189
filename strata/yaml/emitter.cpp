#include "emitter.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "strata/yaml/encoding.hpp"
#include "strata/yaml/exception.hpp"
#include "strata/yaml/scalar_writer.hpp"

namespace strata::yaml {

namespace {
const std::array<TagDirective, 2> DEFAULT_TAG_DIRECTIVES = {
    TagDirective{"!", "!"}, TagDirective{"!!", "tag:yaml.org,2002:"}};

constexpr std::string_view STR_TAG = "tag:yaml.org,2002:str";

constexpr auto isNewLine(char32_t c) -> bool {
    return c == U'\n' || c == 0x85 || c == 0x2028 || c == 0x2029;
}

constexpr auto isSpecialChar(char32_t c) -> bool {
    switch (c) {
        case U'#':
        case U',':
        case U'[':
        case U']':
        case U'{':
        case U'}':
        case U'&':
        case U'*':
        case U'!':
        case U'|':
        case U'>':
        case U'\\':
        case U'\'':
        case U'"':
        case U'%':
        case U'@':
        case U'`':
            return true;
        default:
            return false;
    }
}

constexpr auto isFlowIndicator(char32_t c) -> bool {
    return c == U',' || c == U'?' || c == U'[' || c == U']' || c == U'{' ||
           c == U'}';
}

constexpr auto isSpace(char32_t c) -> bool {
    return c == 0 || c == U' ' || c == U'\t' || c == U'\r' || isNewLine(c);
}

constexpr auto isAlphaNum(char32_t c) -> bool {
    return (c >= U'0' && c <= U'9') || (c >= U'a' && c <= U'z') ||
           (c >= U'A' && c <= U'Z');
}

constexpr auto isAnchorChar(char32_t c) -> bool {
    return !isSpace(c) && c != U'[' && c != U']' && c != U'{' && c != U'}' &&
           c != U',' && c != 0xFEFF;
}

/// Characters written unescaped in a tag or tag prefix.
constexpr auto isUriChar(char32_t c) -> bool {
    if (isAlphaNum(c)) {
        return true;
    }
    constexpr std::string_view allowed = "-;/?:@&=+$,_.~*\\'()[]";
    return c < 0x80 && allowed.find(static_cast<char>(c)) != std::string_view::npos;
}

/// Appends `%XX` for every UTF-8 byte of `c`.
void appendPercentEncoded(std::string& out, char32_t c) {
    std::array<char, 4> bytes{};
    const std::size_t length = encodeUtf8(c, bytes.data());
    for (std::size_t i = 0; i < length; ++i) {
        out += fmt::format("%{:02X}", static_cast<unsigned char>(bytes[i]));
    }
}

auto lessIgnoreCase(std::string_view a, std::string_view b) -> bool {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) <
                   std::tolower(static_cast<unsigned char>(y));
        });
}
}  // namespace

auto EmitterSettings::normalized() const -> EmitterSettings {
    EmitterSettings result = *this;
    if (result.indent < 2 || result.indent > 9) {
        result.indent = 2;
    }
    if (result.width <= result.indent * 2) {
        result.width = 80;
    }
    return result;
}

auto analyzeScalar(std::string_view scalar) -> ScalarAnalysis {
    ScalarAnalysis analysis;
    analysis.scalar = std::string(scalar);

    if (scalar.empty()) {
        analysis.flags = ScalarAnalysis::Empty | ScalarAnalysis::AllowBlockPlain |
                         ScalarAnalysis::AllowSingleQuoted |
                         ScalarAnalysis::AllowDoubleQuoted;
        return analysis;
    }

    const auto decoded = decodeUtf8String(scalar);
    if (!decoded) {
        spdlog::error("Emitter: scalar is not valid UTF-8");
        THROW_EMITTER_ERROR("Scalar is not valid UTF-8");
    }
    const std::u32string& text = *decoded;

    bool blockIndicators = false;
    bool flowIndicators = false;
    bool lineBreaks = false;
    bool specialCharacters = false;

    bool leadingSpace = false;
    bool leadingBreak = false;
    bool trailingSpace = false;
    bool trailingBreak = false;
    bool breakSpace = false;
    bool spaceBreak = false;

    if (scalar.starts_with("---") || scalar.starts_with("...")) {
        blockIndicators = flowIndicators = true;
    }

    bool precededByWhitespace = true;
    bool followedByWhitespace = text.size() == 1 || isSpace(text[1]);

    bool previousSpace = false;
    bool previousBreak = false;

    for (std::size_t index = 0; index < text.size(); ++index) {
        const char32_t c = text[index];

        if (index == 0) {
            // Leading indicators are special characters.
            if (isSpecialChar(c)) {
                flowIndicators = blockIndicators = true;
            }
            if (c == U':' || c == U'?') {
                flowIndicators = true;
                if (followedByWhitespace) {
                    blockIndicators = true;
                }
            }
            if (c == U'-' && followedByWhitespace) {
                flowIndicators = blockIndicators = true;
            }
        } else {
            if (isFlowIndicator(c)) {
                flowIndicators = true;
            }
            if (c == U':') {
                flowIndicators = true;
                if (followedByWhitespace) {
                    blockIndicators = true;
                }
            }
            if (c == U'#' && precededByWhitespace) {
                flowIndicators = blockIndicators = true;
            }
        }

        if (isNewLine(c)) {
            lineBreaks = true;
        }
        const bool printableAscii = c == U'\n' || (c >= 0x20 && c <= 0x7E);
        const bool printableUnicode =
            (c == 0x85 || (c >= 0xA0 && c <= 0xD7FF) ||
             (c >= 0xE000 && c <= 0xFFFD)) &&
            c != 0xFEFF;
        if (!printableAscii && !printableUnicode) {
            specialCharacters = true;
        }

        if (c == U' ') {
            if (index == 0) {
                leadingSpace = true;
            }
            if (index == text.size() - 1) {
                trailingSpace = true;
            }
            if (previousBreak) {
                breakSpace = true;
            }
            previousSpace = true;
            previousBreak = false;
        } else if (isNewLine(c)) {
            if (index == 0) {
                leadingBreak = true;
            }
            if (index == text.size() - 1) {
                trailingBreak = true;
            }
            if (previousSpace) {
                spaceBreak = true;
            }
            previousSpace = false;
            previousBreak = true;
        } else {
            previousSpace = previousBreak = false;
        }

        precededByWhitespace = isSpace(c);
        followedByWhitespace =
            index + 2 >= text.size() || isSpace(text[index + 2]);
    }

    std::uint8_t flags =
        ScalarAnalysis::AllowFlowPlain | ScalarAnalysis::AllowBlockPlain |
        ScalarAnalysis::AllowSingleQuoted | ScalarAnalysis::AllowDoubleQuoted |
        ScalarAnalysis::AllowBlock;
    constexpr std::uint8_t PLAIN =
        ScalarAnalysis::AllowFlowPlain | ScalarAnalysis::AllowBlockPlain;

    // Leading and trailing whitespace rule out plain scalars.
    if (leadingSpace || leadingBreak || trailingSpace || trailingBreak) {
        flags &= ~PLAIN;
    }
    if (trailingSpace) {
        flags &= ~ScalarAnalysis::AllowBlock;
    }
    // Spaces at the start of a line survive only in block scalars.
    if (breakSpace) {
        flags &= ~(PLAIN | ScalarAnalysis::AllowSingleQuoted);
    }
    if (spaceBreak || specialCharacters) {
        flags &= ~(PLAIN | ScalarAnalysis::AllowSingleQuoted |
                   ScalarAnalysis::AllowBlock);
    }
    // Multiline plain scalars are never written.
    if (lineBreaks) {
        flags &= ~PLAIN;
        flags |= ScalarAnalysis::Multiline;
    }
    if (flowIndicators) {
        flags &= ~ScalarAnalysis::AllowFlowPlain;
    }
    if (blockIndicators) {
        flags &= ~ScalarAnalysis::AllowBlockPlain;
    }

    analysis.flags = flags;
    return analysis;
}

Emitter::Emitter(std::ostream& stream, const EmitterSettings& settings)
    : stream_(stream), settings_(settings.normalized()) {
    states_.reserve(32);
    indents_.reserve(32);
    bestIndent_ = static_cast<unsigned>(settings_.indent);
    bestWidth_ = static_cast<unsigned>(settings_.width);
    spdlog::debug("Emitter: canonical {}, indent {}, width {}, encoding {}",
                  settings_.canonical, settings_.indent, settings_.width,
                  encodingName(settings_.encoding));
}

void Emitter::emit(Event event) {
    events_.push_back(std::move(event));
    while (!needMoreEvents()) {
        event_ = std::move(events_.front());
        events_.pop_front();
        runState(state_);
        event_ = Event{};
    }
}

void Emitter::runState(State state) {
    switch (state) {
        case State::StreamStart:
            expectStreamStart();
            return;
        case State::FirstDocumentStart:
            expectDocumentStart(true);
            return;
        case State::DocumentStart:
            expectDocumentStart(false);
            return;
        case State::DocumentEnd:
            expectDocumentEnd();
            return;
        case State::RootNode:
            expectRootNode();
            return;
        case State::FlowSequenceFirstItem:
            expectFlowSequenceItem(true);
            return;
        case State::FlowSequenceItem:
            expectFlowSequenceItem(false);
            return;
        case State::FlowMappingFirstKey:
            expectFlowMappingKey(true);
            return;
        case State::FlowMappingKey:
            expectFlowMappingKey(false);
            return;
        case State::FlowMappingSimpleValue:
            expectFlowMappingSimpleValue();
            return;
        case State::FlowMappingValue:
            expectFlowMappingValue();
            return;
        case State::BlockSequenceFirstItem:
            expectBlockSequenceItem(true);
            return;
        case State::BlockSequenceItem:
            expectBlockSequenceItem(false);
            return;
        case State::BlockMappingFirstKey:
            expectBlockMappingKey(true);
            return;
        case State::BlockMappingKey:
            expectBlockMappingKey(false);
            return;
        case State::BlockMappingSimpleValue:
            expectBlockMappingSimpleValue();
            return;
        case State::BlockMappingValue:
            expectBlockMappingValue();
            return;
        case State::Nothing:
            expectNothing();
            return;
    }
}

auto Emitter::popState() -> State {
    if (states_.empty()) {
        spdlog::error("Emitter: no state left at {}", eventIdName(event_.id));
        THROW_EMITTER_ERROR(
            "Emitter: Need to pop a state but there are no states left");
    }
    const State result = states_.back();
    states_.pop_back();
    return result;
}

auto Emitter::popIndent() -> int {
    if (indents_.empty()) {
        spdlog::error("Emitter: no indent level left at {}",
                      eventIdName(event_.id));
        THROW_EMITTER_ERROR(
            "Emitter: Need to pop an indent level but there are no indent "
            "levels left");
    }
    const int result = indents_.back();
    indents_.pop_back();
    return result;
}

auto Emitter::needMoreEvents() const -> bool {
    if (events_.empty()) {
        return true;
    }

    switch (events_.front().id) {
        case EventId::DocumentStart:
            return needEvents(1);
        case EventId::SequenceStart:
            return needEvents(2);
        case EventId::MappingStart:
            return needEvents(3);
        default:
            return false;
    }
}

auto Emitter::needEvents(std::size_t count) const -> bool {
    int level = 0;
    for (auto it = std::next(events_.begin()); it != events_.end(); ++it) {
        switch (it->id) {
            case EventId::DocumentStart:
            case EventId::SequenceStart:
            case EventId::MappingStart:
                ++level;
                break;
            case EventId::DocumentEnd:
            case EventId::SequenceEnd:
            case EventId::MappingEnd:
                --level;
                break;
            case EventId::StreamStart:
                level = -1;
                break;
            default:
                break;
        }
        // The node closes within the queue; nothing more can matter.
        if (level < 0) {
            return false;
        }
    }
    return events_.size() < count + 1;
}

void Emitter::increaseIndent(bool flow, bool indentless) {
    indents_.push_back(indent_);
    if (indent_ == -1) {
        indent_ = flow ? static_cast<int>(bestIndent_) : 0;
    } else if (!indentless) {
        indent_ += static_cast<int>(bestIndent_);
    }
}

void Emitter::expectEvent(std::initializer_list<EventId> ids,
                          std::string_view expected) const {
    if (std::find(ids.begin(), ids.end(), event_.id) != ids.end()) {
        return;
    }
    spdlog::error("Emitter: expected {}, got {}", expected,
                  eventIdName(event_.id));
    THROW_EMITTER_ERROR("Expected ", expected, ", but got ",
                        eventIdName(event_.id));
}

void Emitter::expectStreamStart() {
    expectEvent({EventId::StreamStart}, "streamStart");
    writeStreamStart();
    state_ = State::FirstDocumentStart;
}

void Emitter::expectNothing() {
    spdlog::error("Emitter: event {} after the stream end",
                  eventIdName(event_.id));
    THROW_EMITTER_ERROR("Expected nothing, but got ", eventIdName(event_.id));
}

void Emitter::expectDocumentStart(bool first) {
    expectEvent({EventId::DocumentStart, EventId::StreamEnd},
                "documentStart or streamEnd");

    if (event_.id == EventId::StreamEnd) {
        if (openEnded_) {
            writeIndicator("...", true);
            writeIndent();
        }
        stream_.flush();
        state_ = State::Nothing;
        return;
    }

    const std::string& version = event_.value;
    const std::vector<TagDirective>& directives = event_.tagDirectives();
    if (openEnded_ && (!version.empty() || !directives.empty())) {
        writeIndicator("...", true);
        writeIndent();
    }

    if (!version.empty()) {
        writeVersionDirective(prepareVersion(version));
    }

    // Handles never carry over from the previous document.
    tagDirectives_ = directives;
    std::sort(tagDirectives_.begin(), tagDirectives_.end(),
              [](const TagDirective& a, const TagDirective& b) {
                  return lessIgnoreCase(a.handle, b.handle);
              });
    for (const auto& pair : tagDirectives_) {
        writeTagDirective(prepareTagHandle(pair.handle),
                          prepareTagPrefix(pair.prefix));
    }

    for (const auto& defaultPair : DEFAULT_TAG_DIRECTIVES) {
        const bool overridden =
            std::any_of(tagDirectives_.begin(), tagDirectives_.end(),
                        [&](const TagDirective& pair) {
                            return pair.handle == defaultPair.handle;
                        });
        if (!overridden) {
            tagDirectives_.push_back(defaultPair);
        }
    }

    const bool implicit = first && !event_.explicitDocument() &&
                          !settings_.canonical && version.empty() &&
                          directives.empty() && !checkEmptyDocument();
    if (!implicit) {
        writeIndent();
        writeIndicator("---", true);
        if (settings_.canonical) {
            writeIndent();
        }
    }
    state_ = State::RootNode;
}

void Emitter::expectDocumentEnd() {
    expectEvent({EventId::DocumentEnd}, "documentEnd");

    writeIndent();
    if (event_.explicitDocument()) {
        writeIndicator("...", true);
        writeIndent();
    }
    state_ = State::DocumentStart;
}

void Emitter::expectRootNode() {
    pushState(State::DocumentEnd);
    expectNode(Context::Root);
}

void Emitter::expectNode(Context context) {
    context_ = context;

    const bool flowCollection = event_.collectionStyle == CollectionStyle::Flow;

    switch (event_.id) {
        case EventId::Alias:
            expectAlias();
            return;
        case EventId::Scalar:
            processAnchor("&");
            processTag();
            expectScalar();
            return;
        case EventId::SequenceStart:
            processAnchor("&");
            processTag();
            if (flowLevel_ > 0 || settings_.canonical || flowCollection ||
                checkEmptySequence()) {
                expectFlowSequence();
            } else {
                expectBlockSequence();
            }
            return;
        case EventId::MappingStart:
            processAnchor("&");
            processTag();
            if (flowLevel_ > 0 || settings_.canonical || flowCollection ||
                checkEmptyMapping()) {
                expectFlowMapping();
            } else {
                expectBlockMapping();
            }
            return;
        default:
            break;
    }
    expectEvent({EventId::Alias, EventId::Scalar, EventId::SequenceStart,
                 EventId::MappingStart},
                "alias, scalar, sequenceStart or mappingStart");
}

void Emitter::expectAlias() {
    if (event_.anchor().empty()) {
        spdlog::error("Emitter: alias without an anchor");
        THROW_EMITTER_ERROR("Anchor is not specified for alias");
    }
    processAnchor("*");
    state_ = popState();
}

void Emitter::expectScalar() {
    increaseIndent(true);
    processScalar();
    indent_ = popIndent();
    state_ = popState();
}

void Emitter::expectFlowSequence() {
    writeIndicator("[", true, true);
    ++flowLevel_;
    increaseIndent(true);
    state_ = State::FlowSequenceFirstItem;
}

void Emitter::expectFlowSequenceItem(bool first) {
    if (event_.id == EventId::SequenceEnd) {
        indent_ = popIndent();
        --flowLevel_;
        if (!first && settings_.canonical) {
            writeIndicator(",", false);
            writeIndent();
        }
        writeIndicator("]", false);
        state_ = popState();
        return;
    }
    if (!first) {
        writeIndicator(",", false);
    }
    if (settings_.canonical || column_ > bestWidth_) {
        writeIndent();
    }
    pushState(State::FlowSequenceItem);
    expectNode(Context::Sequence);
}

void Emitter::expectFlowMapping() {
    writeIndicator("{", true, true);
    ++flowLevel_;
    increaseIndent(true);
    state_ = State::FlowMappingFirstKey;
}

void Emitter::expectFlowMappingKey(bool first) {
    if (event_.id == EventId::MappingEnd) {
        indent_ = popIndent();
        --flowLevel_;
        if (!first && settings_.canonical) {
            writeIndicator(",", false);
            writeIndent();
        }
        writeIndicator("}", false);
        state_ = popState();
        return;
    }

    if (!first) {
        writeIndicator(",", false);
    }
    if (settings_.canonical || column_ > bestWidth_) {
        writeIndent();
    }
    if (!settings_.canonical && checkSimpleKey()) {
        pushState(State::FlowMappingSimpleValue);
        expectNode(Context::MappingSimpleKey);
        return;
    }

    writeIndicator("?", true);
    pushState(State::FlowMappingValue);
    expectNode(Context::MappingNoSimpleKey);
}

void Emitter::expectFlowMappingSimpleValue() {
    writeIndicator(":", false);
    pushState(State::FlowMappingKey);
    expectNode(Context::MappingNoSimpleKey);
}

void Emitter::expectFlowMappingValue() {
    if (settings_.canonical || column_ > bestWidth_) {
        writeIndent();
    }
    writeIndicator(":", true);
    pushState(State::FlowMappingKey);
    expectNode(Context::MappingNoSimpleKey);
}

void Emitter::expectBlockSequence() {
    const bool indentless = (context_ == Context::MappingNoSimpleKey ||
                             context_ == Context::MappingSimpleKey) &&
                            !indentation_;
    increaseIndent(false, indentless);
    state_ = State::BlockSequenceFirstItem;
}

void Emitter::expectBlockSequenceItem(bool first) {
    if (!first && event_.id == EventId::SequenceEnd) {
        indent_ = popIndent();
        state_ = popState();
        return;
    }

    writeIndent();
    writeIndicator("-", true, false, true);
    pushState(State::BlockSequenceItem);
    expectNode(Context::Sequence);
}

void Emitter::expectBlockMapping() {
    increaseIndent(false);
    state_ = State::BlockMappingFirstKey;
}

void Emitter::expectBlockMappingKey(bool first) {
    if (!first && event_.id == EventId::MappingEnd) {
        indent_ = popIndent();
        state_ = popState();
        return;
    }

    writeIndent();
    if (checkSimpleKey()) {
        pushState(State::BlockMappingSimpleValue);
        expectNode(Context::MappingSimpleKey);
        return;
    }

    writeIndicator("?", true, false, true);
    pushState(State::BlockMappingValue);
    expectNode(Context::MappingNoSimpleKey);
}

void Emitter::expectBlockMappingSimpleValue() {
    writeIndicator(":", false);
    pushState(State::BlockMappingKey);
    expectNode(Context::MappingNoSimpleKey);
}

void Emitter::expectBlockMappingValue() {
    writeIndent();
    writeIndicator(":", true, false, true);
    pushState(State::BlockMappingKey);
    expectNode(Context::MappingNoSimpleKey);
}

auto Emitter::checkEmptySequence() const -> bool {
    return event_.id == EventId::SequenceStart && !events_.empty() &&
           events_.front().id == EventId::SequenceEnd;
}

auto Emitter::checkEmptyMapping() const -> bool {
    return event_.id == EventId::MappingStart && !events_.empty() &&
           events_.front().id == EventId::MappingEnd;
}

auto Emitter::checkEmptyDocument() const -> bool {
    if (event_.id != EventId::DocumentStart || events_.empty()) {
        return false;
    }

    const Event& event = events_.front();
    return event.id == EventId::Scalar && event.anchor().empty() &&
           event.tag().empty() && event.implicit && event.value.empty();
}

auto Emitter::checkSimpleKey() -> bool {
    std::size_t length = 0;
    const EventId id = event_.id;
    const bool scalar = id == EventId::Scalar;
    const bool collectionStart =
        id == EventId::MappingStart || id == EventId::SequenceStart;

    if ((id == EventId::Alias || scalar || collectionStart) &&
        !event_.anchor().empty()) {
        if (!preparedAnchor_) {
            preparedAnchor_ = prepareAnchor(event_.anchor());
        }
        length += preparedAnchor_->size();
    }

    if ((scalar || collectionStart) && !event_.tag().empty()) {
        if (!preparedTag_) {
            preparedTag_ = prepareTag(event_.tag());
        }
        length += preparedTag_->size();
    }

    if (scalar) {
        length += analysis().scalar.size();
    }

    if (length >= 128) {
        return false;
    }

    return id == EventId::Alias ||
           (scalar && !analysis().has(ScalarAnalysis::Empty) &&
            !analysis().has(ScalarAnalysis::Multiline)) ||
           checkEmptySequence() || checkEmptyMapping();
}

auto Emitter::analysis() -> const ScalarAnalysis& {
    if (!analysis_) {
        analysis_ = analyzeScalar(event_.value);
    }
    return *analysis_;
}

void Emitter::processScalar() {
    const ScalarAnalysis& current = analysis();
    if (style_ == ScalarStyle::Invalid) {
        style_ = chooseScalarStyle();
    }

    ScalarWriter writer(*this, current.scalar,
                        context_ != Context::MappingSimpleKey);
    switch (style_) {
        case ScalarStyle::DoubleQuoted:
            writer.writeDoubleQuoted();
            break;
        case ScalarStyle::SingleQuoted:
            writer.writeSingleQuoted();
            break;
        case ScalarStyle::Folded:
            writer.writeFolded();
            break;
        case ScalarStyle::Literal:
            writer.writeLiteral();
            break;
        case ScalarStyle::Plain:
        case ScalarStyle::Invalid:
            writer.writePlain();
            break;
    }
    analysis_.reset();
    style_ = ScalarStyle::Invalid;
}

void Emitter::processAnchor(std::string_view indicator) {
    if (event_.anchor().empty()) {
        preparedAnchor_.reset();
        return;
    }
    if (!preparedAnchor_) {
        preparedAnchor_ = prepareAnchor(event_.anchor());
    }
    writeIndicator(indicator, true);
    writeString(*preparedAnchor_);
    preparedAnchor_.reset();
}

void Emitter::processTag() {
    std::string tag = event_.tag();

    if (event_.id == EventId::Scalar) {
        if (style_ == ScalarStyle::Invalid) {
            style_ = chooseScalarStyle();
        }
        const bool tagImplied = style_ == ScalarStyle::Plain
                                    ? event_.implicit
                                    : !event_.implicit && tag.empty();
        if ((!settings_.canonical || tag.empty()) &&
            (tag == STR_TAG || tagImplied)) {
            preparedTag_.reset();
            return;
        }
        if (event_.implicit && tag.empty()) {
            tag = "!";
            preparedTag_.reset();
        }
    } else if ((!settings_.canonical || tag.empty()) && event_.implicit) {
        preparedTag_.reset();
        return;
    }

    if (tag.empty()) {
        spdlog::error("Emitter: {} without a tag is not implicit",
                      eventIdName(event_.id));
        THROW_EMITTER_ERROR("Tag is not specified");
    }
    if (!preparedTag_) {
        preparedTag_ = prepareTag(tag);
    }
    writeIndicator(*preparedTag_, true);
    preparedTag_.reset();
}

auto Emitter::chooseScalarStyle() -> ScalarStyle {
    const ScalarAnalysis& current = analysis();

    const ScalarStyle style = event_.scalarStyle;
    const bool invalidOrPlain =
        style == ScalarStyle::Invalid || style == ScalarStyle::Plain;
    const bool block =
        style == ScalarStyle::Literal || style == ScalarStyle::Folded;
    const bool singleQuoted = style == ScalarStyle::SingleQuoted;
    const bool doubleQuoted = style == ScalarStyle::DoubleQuoted;

    const bool allowPlain = flowLevel_ > 0
                                ? current.has(ScalarAnalysis::AllowFlowPlain)
                                : current.has(ScalarAnalysis::AllowBlockPlain);
    // Empty or multiline simple keys cannot be plain.
    const bool simpleNonPlain = context_ == Context::MappingSimpleKey &&
                                (current.has(ScalarAnalysis::Empty) ||
                                 current.has(ScalarAnalysis::Multiline));

    if (doubleQuoted || settings_.canonical) {
        return ScalarStyle::DoubleQuoted;
    }

    if (invalidOrPlain && event_.implicit && !simpleNonPlain && allowPlain) {
        return ScalarStyle::Plain;
    }

    if (block && flowLevel_ == 0 && context_ != Context::MappingSimpleKey &&
        current.has(ScalarAnalysis::AllowBlock)) {
        return style;
    }

    if ((invalidOrPlain || singleQuoted) &&
        current.has(ScalarAnalysis::AllowSingleQuoted) &&
        !(context_ == Context::MappingSimpleKey &&
          current.has(ScalarAnalysis::Multiline))) {
        return ScalarStyle::SingleQuoted;
    }

    return ScalarStyle::DoubleQuoted;
}

auto Emitter::prepareVersion(const std::string& version) -> std::string {
    if (version.substr(0, version.find('.')) != "1") {
        spdlog::error("Emitter: unsupported YAML version {}", version);
        THROW_EMITTER_ERROR("Unsupported YAML version: ", version);
    }
    return version;
}

auto Emitter::prepareTagHandle(const std::string& handle) -> std::string {
    if (handle.empty()) {
        THROW_EMITTER_ERROR("Tag handle must not be empty");
    }
    const bool delimited = handle.front() == '!' && handle.back() == '!';
    const bool validName = std::all_of(
        std::next(handle.begin()), handle.end() - (handle.size() > 1 ? 1 : 0),
        [](char c) {
            return isAlphaNum(static_cast<unsigned char>(c)) || c == '-' ||
                   c == '_';
        });
    if (!delimited || !validName) {
        spdlog::error("Emitter: invalid tag handle {}", handle);
        THROW_EMITTER_ERROR("Tag handle contains invalid characters: ", handle);
    }
    return handle;
}

auto Emitter::prepareTagPrefix(const std::string& prefix) -> std::string {
    if (prefix.empty()) {
        THROW_EMITTER_ERROR("Tag prefix must not be empty");
    }
    if (!decodeUtf8String(prefix)) {
        THROW_EMITTER_ERROR("Tag prefix is not valid UTF-8");
    }

    std::string result;
    std::size_t start = 0;
    std::size_t end = prefix.front() == '!' ? 1 : 0;
    while (end < prefix.size()) {
        std::size_t next = end;
        const char32_t c = decodeUtf8(prefix, next);
        if (isUriChar(c) || c == U'!' || c == U'%') {
            end = next;
            continue;
        }
        if (start < end) {
            result.append(prefix, start, end - start);
        }
        start = end = next;
        appendPercentEncoded(result, c);
    }
    if (start < end) {
        result.append(prefix, start, end - start);
    }
    return result;
}

auto Emitter::prepareTag(const std::string& tag) -> std::string {
    if (tag.empty()) {
        THROW_EMITTER_ERROR("Tag must not be empty");
    }
    if (tag == "!") {
        return tag;
    }
    if (!decodeUtf8String(tag)) {
        THROW_EMITTER_ERROR("Tag is not valid UTF-8");
    }

    std::string handle;
    std::string_view suffix = tag;

    // The most specific matching prefix wins.
    std::sort(tagDirectives_.begin(), tagDirectives_.end(),
              [](const TagDirective& a, const TagDirective& b) {
                  return lessIgnoreCase(a.prefix, b.prefix);
              });
    for (const auto& pair : tagDirectives_) {
        const std::string& prefix = pair.prefix;
        if (tag.starts_with(prefix) &&
            (prefix != "!" || prefix.size() < tag.size())) {
            handle = pair.handle;
            suffix = std::string_view(tag).substr(prefix.size());
        }
    }

    std::string result = handle.empty() ? "!<" : handle;
    std::size_t start = 0;
    std::size_t end = 0;
    while (end < suffix.size()) {
        std::size_t next = end;
        const char32_t c = decodeUtf8(suffix, next);
        if (isUriChar(c) || (c == U'!' && handle != "!")) {
            end = next;
            continue;
        }
        if (start < end) {
            result.append(suffix.substr(start, end - start));
        }
        start = end = next;
        appendPercentEncoded(result, c);
    }
    if (start < end) {
        result.append(suffix.substr(start, end - start));
    }
    if (handle.empty()) {
        result += '>';
    }
    return result;
}

auto Emitter::prepareAnchor(const std::string& anchor) -> std::string {
    if (anchor.empty()) {
        THROW_EMITTER_ERROR("Anchor must not be empty");
    }
    const auto decoded = decodeUtf8String(anchor);
    if (!decoded || !std::all_of(decoded->begin(), decoded->end(),
                                 [](char32_t c) { return isAnchorChar(c); })) {
        spdlog::error("Emitter: invalid anchor {}", anchor);
        THROW_EMITTER_ERROR("Anchor contains invalid characters: ", anchor);
    }
    return anchor;
}

void Emitter::writeString(std::string_view text) {
    if (settings_.encoding == Encoding::Utf8) {
        stream_.write(text.data(), static_cast<std::streamsize>(text.size()));
        return;
    }
    const std::string encoded = fromUtf8(text, settings_.encoding, false);
    stream_.write(encoded.data(), static_cast<std::streamsize>(encoded.size()));
}

void Emitter::writeStreamStart() {
    if (settings_.encoding != Encoding::Utf8) {
        const std::string bom = fromUtf8("", settings_.encoding, true);
        stream_.write(bom.data(), static_cast<std::streamsize>(bom.size()));
    }
}

void Emitter::writeIndicator(std::string_view indicator, bool needWhitespace,
                             bool whitespace, bool indentation) {
    const bool prefixSpace = !whitespace_ && needWhitespace;
    whitespace_ = whitespace;
    indentation_ = indentation_ && indentation;
    openEnded_ = false;
    column_ += static_cast<unsigned>(indicator.size());
    if (prefixSpace) {
        ++column_;
        writeString(" ");
    }
    writeString(indicator);
}

void Emitter::writeIndent() {
    const unsigned indent = indent_ == -1 ? 0 : static_cast<unsigned>(indent_);

    if (!indentation_ || column_ > indent ||
        (column_ == indent && !whitespace_)) {
        writeLineBreak();
    }
    if (column_ < indent) {
        whitespace_ = true;
        const std::string spaces(indent - column_, ' ');
        column_ = indent;
        writeString(spaces);
    }
}

void Emitter::writeLineBreak(std::string_view data) {
    whitespace_ = indentation_ = true;
    ++line_;
    column_ = 0;
    writeString(data.empty() ? lineBreakText(settings_.lineBreak) : data);
}

void Emitter::writeVersionDirective(std::string_view version) {
    writeString("%YAML ");
    writeString(version);
    writeLineBreak();
}

void Emitter::writeTagDirective(std::string_view handle,
                                std::string_view prefix) {
    writeString("%TAG ");
    writeString(handle);
    writeString(" ");
    writeString(prefix);
    writeLineBreak();
}

auto emitEvents(const std::vector<Event>& events,
                const EmitterSettings& settings) -> std::string {
    std::ostringstream out;
    Emitter emitter(out, settings);
    for (const auto& event : events) {
        emitter.emit(event);
    }
    return out.str();
}

}  // namespace strata::yaml
