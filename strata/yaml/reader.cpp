#include "reader.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include <spdlog/spdlog.h>

#include "strata/error/exception.hpp"
#include "strata/yaml/encoding.hpp"
#include "strata/yaml/exception.hpp"

namespace strata::yaml {

namespace {
auto isUnicodeBreak(char32_t c) -> bool {
    return c == 0x85 || c == 0x2028 || c == 0x2029;
}
}  // namespace

Reader::Reader(std::string buffer, std::string name)
    : name_(std::make_shared<const std::string>(std::move(name))),
      sliceBuilder_(*this) {
    const ByteOrder order = detectByteOrder(buffer);
    buffer.erase(0, order.bomLength);
    encoding_ = order.encoding;

    if ((order.encoding == Encoding::Utf16 && buffer.size() % 2 != 0) ||
        (order.encoding == Encoding::Utf32 && buffer.size() % 4 != 0)) {
        spdlog::error("Reader {}: {} input of {} bytes is misaligned", *name_,
                      encodingName(order.encoding), buffer.size());
        THROW_READER_ERROR(
            "Size of UTF-16 or UTF-32 input not aligned to 2 or 4 bytes, "
            "respectively",
            Mark(name_, 0, 0));
    }

    Utf8Conversion converted = toUtf8(std::move(buffer), order);
    if (!converted.errorMessage.empty()) {
        spdlog::error("Reader {}: {}", *name_, converted.errorMessage);
        THROW_READER_ERROR(
            "Error when converting to UTF-8: " + converted.errorMessage,
            Mark(name_, 0, 0));
    }
    buffer_ = std::move(converted.utf8);
    characterCount_ = converted.characterCount;

    if (auto offset = findNonPrintable(buffer_)) {
        const Mark where = markAt(*offset);
        spdlog::error("Reader {}: non-printable character at {}", *name_,
                      where.toString());
        THROW_READER_ERROR("Special unicode characters are not allowed",
                           where);
    }

    checkAscii();
    spdlog::debug("Reader {}: {} input, {} characters", *name_,
                  encodingName(encoding_), characterCount_);
}

auto Reader::peek(std::size_t index) -> char32_t {
    if (index < upcomingAscii_) {
        return static_cast<unsigned char>(buffer_[bufferOffset_ + index]);
    }
    if (characterCount_ <= charIndex_ + index) {
        return kEndOfInput;
    }

    // Scanner code usually peeks characters in order to measure a run.
    if (index == lastDecodedCharOffset_) {
        return decodeNext();
    }

    const std::size_t asciiToTake = std::min(upcomingAscii_, index);
    lastDecodedCharOffset_ = asciiToTake;
    lastDecodedBufferOffset_ = bufferOffset_ + asciiToTake;
    char32_t c = kEndOfInput;
    while (lastDecodedCharOffset_ <= index) {
        c = decodeNext();
    }
    return c;
}

auto Reader::peek() -> char32_t {
    if (upcomingAscii_ > 0) {
        return static_cast<unsigned char>(buffer_[bufferOffset_]);
    }
    if (characterCount_ <= charIndex_) {
        return kEndOfInput;
    }
    lastDecodedCharOffset_ = 0;
    lastDecodedBufferOffset_ = bufferOffset_;
    return decodeNext();
}

auto Reader::peekByte(std::size_t index) const -> char {
    return bufferOffset_ + index < buffer_.size()
               ? buffer_[bufferOffset_ + index]
               : '\0';
}

auto Reader::peekByte() const -> char { return peekByte(0); }

auto Reader::prefix(std::size_t length) -> std::string_view {
    return slice(length);
}

auto Reader::prefixBytes(std::size_t length) const -> std::string_view {
    if (bufferOffset_ + length > buffer_.size()) {
        THROW_OUT_OF_RANGE("prefixBytes(", length, ") reaches past the end ",
                           "of the buffer");
    }
    return std::string_view(buffer_).substr(bufferOffset_, length);
}

auto Reader::slice(std::size_t end) -> std::string_view {
    const std::string_view whole(buffer_);
    if (end == lastDecodedCharOffset_) {
        return whole.substr(bufferOffset_,
                            lastDecodedBufferOffset_ - bufferOffset_);
    }

    const std::size_t asciiToTake =
        std::min({upcomingAscii_, end, buffer_.size()});
    lastDecodedCharOffset_ = asciiToTake;
    lastDecodedBufferOffset_ = bufferOffset_ + asciiToTake;

    while (lastDecodedCharOffset_ < end &&
           lastDecodedBufferOffset_ < buffer_.size()) {
        decodeNext();
    }
    return whole.substr(bufferOffset_, lastDecodedBufferOffset_ - bufferOffset_);
}

auto Reader::get() -> char32_t {
    const char32_t result = peek();
    forward();
    return result;
}

auto Reader::get(std::size_t length) -> std::string_view {
    const std::string_view result = slice(length);
    forward(length);
    return result;
}

void Reader::forward(std::size_t length) {
    while (length > 0) {
        std::size_t asciiToTake = std::min(upcomingAscii_, length);
        charIndex_ += asciiToTake;
        length -= asciiToTake;
        upcomingAscii_ -= asciiToTake;

        for (; asciiToTake > 0; --asciiToTake) {
            const char c = buffer_[bufferOffset_++];
            if (c == '\n' ||
                (c == '\r' && peekByte() != '\n')) {
                ++line_;
                column_ = 0;
                continue;
            }
            ++column_;
        }

        if (length == 0) {
            break;
        }
        if (bufferOffset_ >= buffer_.size()) {
            // Moving past the end only advances the character index.
            charIndex_ += length;
            break;
        }

        ++charIndex_;
        const char32_t c = decodeUtf8(buffer_, bufferOffset_);
        if (isUnicodeBreak(c)) {
            ++line_;
            column_ = 0;
        } else if (c != 0xFEFF) {
            ++column_;
        }
        --length;
        checkAscii();
    }

    lastDecodedBufferOffset_ = bufferOffset_;
    lastDecodedCharOffset_ = 0;
}

void Reader::forward() {
    if (bufferOffset_ >= buffer_.size()) {
        ++charIndex_;
        lastDecodedBufferOffset_ = bufferOffset_;
        lastDecodedCharOffset_ = 0;
        return;
    }

    ++charIndex_;
    if (upcomingAscii_ > 0) {
        --upcomingAscii_;
        const char c = buffer_[bufferOffset_++];
        lastDecodedBufferOffset_ = bufferOffset_;
        lastDecodedCharOffset_ = 0;
        if (c == '\n' || (c == '\r' && peekByte() != '\n')) {
            ++line_;
            column_ = 0;
            return;
        }
        ++column_;
        return;
    }

    const char32_t c = decodeUtf8(buffer_, bufferOffset_);
    lastDecodedBufferOffset_ = bufferOffset_;
    lastDecodedCharOffset_ = 0;
    if (isUnicodeBreak(c)) {
        ++line_;
        column_ = 0;
    } else if (c != 0xFEFF) {
        ++column_;
    }
    checkAscii();
}

auto Reader::mark() const -> Mark { return Mark(name_, line_, column_); }

auto Reader::mark(std::size_t columns) const -> Mark {
    return Mark(name_, line_,
                column_ + static_cast<std::uint32_t>(columns));
}

void Reader::setName(std::string name) {
    name_ = std::make_shared<const std::string>(std::move(name));
}

auto Reader::view(const Slice& slice) const -> std::string_view {
    return std::string_view(buffer_).substr(slice.offset, slice.length);
}

void Reader::checkAscii() {
    upcomingAscii_ =
        countAscii(std::string_view(buffer_).substr(bufferOffset_));
}

auto Reader::decodeNext() -> char32_t {
    ++lastDecodedCharOffset_;
    return decodeUtf8(buffer_, lastDecodedBufferOffset_);
}

auto Reader::markAt(std::size_t offset) const -> Mark {
    std::uint32_t line = 0;
    std::uint32_t column = 0;
    std::size_t position = 0;
    while (position < offset) {
        const char32_t c = decodeUtf8(buffer_, position);
        if (c == '\n' || isUnicodeBreak(c) ||
            (c == '\r' && (position >= buffer_.size() ||
                           buffer_[position] != '\n'))) {
            ++line;
            column = 0;
        } else if (c != 0xFEFF) {
            ++column;
        }
    }
    return Mark(name_, line, column);
}

SliceBuilder::SliceBuilder(Reader& reader) : reader_(reader) {}

void SliceBuilder::begin() {
    if (inProgress()) {
        THROW_LOGIC_ERROR("Beginning a slice while another slice is being built");
    }
    start_ = reader_.bufferOffset_;
    end_ = reader_.bufferOffset_;
}

auto SliceBuilder::finish() -> Slice {
    if (!inProgress()) {
        THROW_LOGIC_ERROR("finish called without begin");
    }
    if (endStackUsed_ != 0) {
        THROW_LOGIC_ERROR("Finishing a slice with running transactions");
    }
    const Slice result{start_, end_ - start_};
    start_ = end_ = std::string::npos;
    return result;
}

void SliceBuilder::ensureRoom(std::size_t bytes) const {
    if (!inProgress()) {
        THROW_LOGIC_ERROR("write called without begin");
    }
    if (end_ + bytes > reader_.bufferOffset_) {
        THROW_LOGIC_ERROR("Slice would extend past the reader position");
    }
}

void SliceBuilder::write(std::string_view str) {
    if (str.empty()) {
        return;
    }
    ensureRoom(str.size());
    char* target = reader_.buffer_.data() + end_;
    if (str.data() != target) {
        std::memmove(target, str.data(), str.size());
    }
    end_ += str.size();
}

void SliceBuilder::write(char32_t c) {
    char encoded[4];
    const std::size_t bytes = encodeUtf8(c, encoded);
    ensureRoom(bytes);
    std::memcpy(reader_.buffer_.data() + end_, encoded, bytes);
    end_ += bytes;
}

void SliceBuilder::insert(char32_t c, std::size_t position) {
    if (!inProgress()) {
        THROW_LOGIC_ERROR("insert called without begin");
    }
    if (start_ + position > end_) {
        THROW_LOGIC_ERROR("Trying to insert after the end of the slice");
    }
    char encoded[4];
    const std::size_t bytes = encodeUtf8(c, encoded);
    ensureRoom(bytes);

    char* point = reader_.buffer_.data() + start_ + position;
    const std::size_t movedLength = end_ - (start_ + position);
    if (movedLength > 0) {
        std::memmove(point + bytes, point, movedLength);
    }
    std::memcpy(point, encoded, bytes);
    end_ += bytes;
}

auto SliceBuilder::length() const -> std::size_t {
    return inProgress() ? end_ - start_ : 0;
}

void SliceBuilder::push() {
    if (!inProgress()) {
        THROW_LOGIC_ERROR("push called without begin");
    }
    if (endStackUsed_ >= endStack_.size()) {
        THROW_LOGIC_ERROR("Slice stack overflow");
    }
    endStack_[endStackUsed_++] = end_;
}

void SliceBuilder::pop() {
    if (endStackUsed_ == 0) {
        THROW_LOGIC_ERROR("Trying to pop an empty slice stack");
    }
    end_ = endStack_[--endStackUsed_];
}

void SliceBuilder::apply() {
    if (endStackUsed_ == 0) {
        THROW_LOGIC_ERROR("Trying to apply an empty slice stack");
    }
    --endStackUsed_;
}

SliceBuilder::Transaction::Transaction(SliceBuilder& builder)
    : builder_(&builder), stackLevel_(builder.endStackUsed_) {
    builder_->push();
}

SliceBuilder::Transaction::Transaction(Transaction&& other) noexcept
    : builder_(std::exchange(other.builder_, nullptr)),
      stackLevel_(other.stackLevel_),
      committed_(other.committed_) {}

auto SliceBuilder::Transaction::operator=(Transaction&& other)
    -> Transaction& {
    if (this == &other) {
        return *this;
    }
    end();
    builder_ = std::exchange(other.builder_, nullptr);
    stackLevel_ = other.stackLevel_;
    committed_ = other.committed_;
    return *this;
}

void SliceBuilder::Transaction::commit() {
    if (builder_ == nullptr) {
        return;
    }
    if (committed_) {
        THROW_LOGIC_ERROR("Can't commit a transaction more than once");
    }
    if (builder_->endStackUsed_ != stackLevel_ + 1) {
        THROW_LOGIC_ERROR(
            "Parent transactions don't fully contain child transactions");
    }
    builder_->apply();
    committed_ = true;
}

void SliceBuilder::Transaction::end() {
    if (builder_ == nullptr) {
        return;
    }
    if (!committed_) {
        if (builder_->endStackUsed_ != stackLevel_ + 1) {
            THROW_LOGIC_ERROR(
                "Parent transactions don't fully contain child transactions");
        }
        builder_->pop();
    }
    builder_ = nullptr;
}

}  // namespace strata::yaml
