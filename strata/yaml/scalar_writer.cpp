#include "scalar_writer.hpp"

#include <fmt/format.h>

#include "strata/yaml/emitter.hpp"
#include "strata/yaml/encoding.hpp"
#include "strata/yaml/escapes.hpp"

namespace strata::yaml {

namespace {
constexpr auto isNewLine(char32_t c) -> bool {
    return c == U'\n' || c == 0x85 || c == 0x2028 || c == 0x2029;
}

/// Byte offset of the last character of non-empty UTF-8 text.
auto lastCharOffset(std::string_view text) -> std::size_t {
    std::size_t offset = text.size() - 1;
    while (offset > 0 &&
           (static_cast<unsigned char>(text[offset]) & 0xC0) == 0x80) {
        --offset;
    }
    return offset;
}

auto charAt(std::string_view text, std::size_t offset) -> char32_t {
    return decodeUtf8(text, offset);
}

/// Characters a double-quoted scalar writes as escapes.
auto needsEscape(char32_t c) -> bool {
    if (c == U'"' || c == U'\\' || c == 0x85 || c == 0x2028 || c == 0x2029 ||
        c == 0xFEFF) {
        return true;
    }
    return !((c >= 0x20 && c <= 0x7E) || (c >= 0xA0 && c <= 0xD7FF) ||
             (c >= 0xE000 && c <= 0xFFFD));
}
}  // namespace

ScalarWriter::ScalarWriter(Emitter& emitter, std::string_view text, bool split)
    : emitter_(emitter), text_(text), split_(split) {}

void ScalarWriter::writeSingleQuoted() {
    emitter_.writeIndicator("'", true);
    spaces_ = breaks_ = false;
    resetTextPosition();

    do {
        const char32_t c = nextChar();
        if (spaces_) {
            if (c != U' ' && tooWide() && split_ && startByte_ != 0 &&
                endByte_ != text_.size()) {
                writeIndent(false);
                updateRangeStart();
            } else if (c != U' ') {
                writeCurrentRange(true);
            }
        } else if (breaks_) {
            if (!isNewLine(c)) {
                writeStartLineBreak();
                writeLineBreaks();
                emitter_.writeIndent();
            }
        } else if ((c == kNone || c == U'\'' || c == U' ' || isNewLine(c)) &&
                   startChar_ < endChar_) {
            writeCurrentRange(true);
        }
        if (c == U'\'') {
            emitter_.column_ += 2;
            emitter_.writeString("''");
            startByte_ = endByte_ + 1;
            startChar_ = endChar_ + 1;
        }
        updateBreaks(c, true);
    } while (endByte_ < text_.size());

    emitter_.writeIndicator("'", false);
}

void ScalarWriter::writeDoubleQuoted() {
    resetTextPosition();
    emitter_.writeIndicator("\"", true);
    const std::size_t lastChar = text_.empty() ? 0 : lastCharOffset(text_);

    do {
        const char32_t c = nextChar();
        if (c == kNone || needsEscape(c)) {
            if (startChar_ < endChar_) {
                writeCurrentRange(true);
            }
            if (c != kNone) {
                std::string data;
                if (const char32_t escape = toEscape(c); escape != 0) {
                    data += '\\';
                    appendUtf8(data, escape);
                } else if (c <= 0xFF) {
                    data = fmt::format("\\x{:02X}", static_cast<unsigned>(c));
                } else if (c <= 0xFFFF) {
                    data = fmt::format("\\u{:04X}", static_cast<unsigned>(c));
                } else {
                    data = fmt::format("\\U{:08X}", static_cast<unsigned>(c));
                }
                emitter_.column_ += static_cast<unsigned>(data.size());
                emitter_.writeString(data);
                startChar_ = endChar_ + 1;
                startByte_ = nextEndByte_;
            }
        }

        const std::int64_t pending = endChar_ - startChar_;
        if (endByte_ > 0 && endByte_ < lastChar &&
            (c == U' ' || startChar_ >= endChar_) &&
            static_cast<std::int64_t>(emitter_.column_) + pending >
                static_cast<std::int64_t>(emitter_.bestWidth_) &&
            split_) {
            // Fold with an escaped line break.
            if (startByte_ < endByte_) {
                emitter_.writeString(
                    text_.substr(startByte_, endByte_ - startByte_));
            }
            emitter_.writeString("\\");
            emitter_.column_ += static_cast<unsigned>(
                (pending > 0 ? pending : 0) + 1);
            if (startChar_ < endChar_) {
                startChar_ = endChar_;
                startByte_ = endByte_;
            }

            writeIndent(true);
            if (charAtStart() == U' ') {
                emitter_.writeString("\\");
                ++emitter_.column_;
            }
        }
    } while (endByte_ < text_.size());

    emitter_.writeIndicator("\"", false);
}

void ScalarWriter::writeFolded() {
    initBlock('>');
    bool leadingSpace = true;
    spaces_ = false;
    breaks_ = true;
    resetTextPosition();

    do {
        const char32_t c = nextChar();
        if (breaks_) {
            if (!isNewLine(c)) {
                if (!leadingSpace && c != kNone && c != U' ') {
                    writeStartLineBreak();
                }
                leadingSpace = c == U' ';
                writeLineBreaks();
                if (c != kNone) {
                    emitter_.writeIndent();
                }
            }
        } else if (spaces_) {
            if (c != U' ' && tooWide()) {
                writeIndent(false);
                updateRangeStart();
            } else if (c != U' ') {
                writeCurrentRange(true);
            }
        } else if (c == kNone || isNewLine(c) || c == U' ') {
            writeCurrentRange(true);
            if (c == kNone) {
                emitter_.writeLineBreak();
            }
        }
        updateBreaks(c, true);
    } while (endByte_ < text_.size());
}

void ScalarWriter::writeLiteral() {
    initBlock('|');
    breaks_ = true;
    resetTextPosition();

    do {
        const char32_t c = nextChar();
        if (breaks_) {
            if (!isNewLine(c)) {
                writeLineBreaks();
                if (c != kNone) {
                    emitter_.writeIndent();
                }
            }
        } else if (c == kNone || isNewLine(c)) {
            writeCurrentRange(false);
            if (c == kNone) {
                emitter_.writeLineBreak();
            }
        }
        updateBreaks(c, false);
    } while (endByte_ < text_.size());
}

void ScalarWriter::writePlain() {
    if (emitter_.context_ == Emitter::Context::Root) {
        emitter_.openEnded_ = true;
    }
    if (text_.empty()) {
        // An empty mapping value keeps the space after its indicator.
        if (emitter_.context_ == Emitter::Context::MappingNoSimpleKey &&
            !emitter_.whitespace_) {
            ++emitter_.column_;
            emitter_.writeString(" ");
            emitter_.whitespace_ = true;
        }
        return;
    }
    if (!emitter_.whitespace_) {
        ++emitter_.column_;
        emitter_.writeString(" ");
    }
    emitter_.whitespace_ = emitter_.indentation_ = false;
    spaces_ = breaks_ = false;
    resetTextPosition();

    do {
        const char32_t c = nextChar();
        if (spaces_) {
            if (c != U' ' && tooWide() && split_) {
                writeIndent(true);
                updateRangeStart();
            } else if (c != U' ') {
                writeCurrentRange(true);
            }
        } else if (breaks_) {
            if (!isNewLine(c)) {
                writeStartLineBreak();
                writeLineBreaks();
                writeIndent(true);
            }
        } else if (c == kNone || isNewLine(c) || c == U' ') {
            writeCurrentRange(true);
        }
        updateBreaks(c, true);
    } while (endByte_ < text_.size());
}

auto ScalarWriter::determineBlockHints(std::string_view text,
                                       unsigned bestIndent) -> std::string {
    std::string hints;
    if (text.empty()) {
        return hints;
    }

    const char32_t first = charAt(text, 0);
    const std::size_t lastOffset = lastCharOffset(text);
    const char32_t last = charAt(text, lastOffset);

    if (isNewLine(first) || first == U' ') {
        hints += static_cast<char>('0' + bestIndent);
    }
    if (!isNewLine(last)) {
        hints += '-';
    } else if (lastOffset == 0 ||
               isNewLine(charAt(text, lastCharOffset(text.substr(
                                          0, lastOffset))))) {
        hints += '+';
    }
    return hints;
}

auto ScalarWriter::nextChar() -> char32_t {
    ++endChar_;
    endByte_ = nextEndByte_;
    if (endByte_ >= text_.size()) {
        return kNone;
    }
    return decodeUtf8(text_, nextEndByte_);
}

auto ScalarWriter::charAtStart() const -> char32_t {
    if (startByte_ >= text_.size()) {
        return kNone;
    }
    return charAt(text_, startByte_);
}

auto ScalarWriter::tooWide() const -> bool {
    return startChar_ + 1 == endChar_ && emitter_.column_ > emitter_.bestWidth_;
}

void ScalarWriter::initBlock(char indicator) {
    std::string header(1, indicator);
    header += determineBlockHints(text_, emitter_.bestIndent_);
    emitter_.writeIndicator(header, true);
    if (header.back() == '+') {
        emitter_.openEnded_ = true;
    }
    emitter_.writeLineBreak();
}

void ScalarWriter::writeCurrentRange(bool updateColumn) {
    if (startByte_ < endByte_) {
        emitter_.writeString(text_.substr(startByte_, endByte_ - startByte_));
    }
    if (updateColumn && endChar_ > startChar_) {
        emitter_.column_ += static_cast<unsigned>(endChar_ - startChar_);
    }
    updateRangeStart();
}

void ScalarWriter::writeLineBreaks() {
    std::size_t offset = startByte_;
    while (offset < endByte_) {
        const std::size_t begin = offset;
        const char32_t lineBreak = decodeUtf8(text_, offset);
        if (lineBreak == U'\n') {
            emitter_.writeLineBreak();
        } else {
            emitter_.writeLineBreak(text_.substr(begin, offset - begin));
        }
    }
    updateRangeStart();
}

void ScalarWriter::writeStartLineBreak() {
    if (charAtStart() == U'\n') {
        emitter_.writeLineBreak();
    }
}

void ScalarWriter::writeIndent(bool resetSpace) {
    emitter_.writeIndent();
    if (resetSpace) {
        emitter_.whitespace_ = emitter_.indentation_ = false;
    }
}

void ScalarWriter::updateRangeStart() {
    startByte_ = endByte_;
    startChar_ = endChar_;
}

void ScalarWriter::updateBreaks(char32_t c, bool updateSpaces) {
    if (c == kNone) {
        return;
    }
    breaks_ = isNewLine(c);
    if (updateSpaces) {
        spaces_ = c == U' ';
    }
}

void ScalarWriter::resetTextPosition() {
    startByte_ = endByte_ = nextEndByte_ = 0;
    startChar_ = 0;
    endChar_ = -1;
}

}  // namespace strata::yaml
