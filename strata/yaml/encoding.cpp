#include "encoding.hpp"

#include <cstdint>
#include <initializer_list>
#include <utility>

#include <fmt/format.h>

namespace strata::yaml {

namespace {

constexpr char32_t kMaxCodePoint = 0x10FFFF;

auto isSurrogate(char32_t c) -> bool { return c >= 0xD800 && c <= 0xDFFF; }

auto byteAt(std::string_view bytes, std::size_t index) -> std::uint8_t {
    return static_cast<std::uint8_t>(bytes[index]);
}

auto readUnit16(std::string_view bytes, std::size_t index, std::endian endian)
    -> std::uint16_t {
    const auto b0 = byteAt(bytes, index);
    const auto b1 = byteAt(bytes, index + 1);
    return endian == std::endian::little
               ? static_cast<std::uint16_t>(b0 | (b1 << 8))
               : static_cast<std::uint16_t>((b0 << 8) | b1);
}

auto readUnit32(std::string_view bytes, std::size_t index, std::endian endian)
    -> std::uint32_t {
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        const std::size_t shift =
            endian == std::endian::little ? 8 * i : 8 * (3 - i);
        value |= static_cast<std::uint32_t>(byteAt(bytes, index + i)) << shift;
    }
    return value;
}

/**
 * Validates UTF-8 and counts code points. Returns an error message on
 * malformed input.
 */
auto validateUtf8(std::string_view utf8, std::size_t& count) -> std::string {
    count = 0;
    std::size_t i = 0;
    while (i < utf8.size()) {
        const auto lead = byteAt(utf8, i);
        std::size_t length = 0;
        char32_t c = 0;
        if (lead < 0x80) {
            ++i;
            ++count;
            continue;
        }
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            c = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            c = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            c = lead & 0x07;
        } else {
            return fmt::format("Invalid UTF-8 lead byte 0x{:02X} at offset {}",
                               lead, i);
        }
        if (i + length > utf8.size()) {
            return fmt::format("Truncated UTF-8 sequence at offset {}", i);
        }
        for (std::size_t k = 1; k < length; ++k) {
            const auto cont = byteAt(utf8, i + k);
            if ((cont & 0xC0) != 0x80) {
                return fmt::format(
                    "Invalid UTF-8 continuation byte 0x{:02X} at offset {}",
                    cont, i + k);
            }
            c = (c << 6) | (cont & 0x3F);
        }
        static constexpr char32_t MIN_VALUE[] = {0, 0, 0x80, 0x800, 0x10000};
        if (c < MIN_VALUE[length]) {
            return fmt::format("Overlong UTF-8 sequence at offset {}", i);
        }
        if (isSurrogate(c) || c > kMaxCodePoint) {
            return fmt::format("Invalid code point U+{:X} at offset {}",
                               static_cast<std::uint32_t>(c), i);
        }
        i += length;
        ++count;
    }
    return {};
}

void appendUnit16(std::string& out, std::uint16_t unit) {
    char bytes[2];
    if constexpr (std::endian::native == std::endian::little) {
        bytes[0] = static_cast<char>(unit & 0xFF);
        bytes[1] = static_cast<char>(unit >> 8);
    } else {
        bytes[0] = static_cast<char>(unit >> 8);
        bytes[1] = static_cast<char>(unit & 0xFF);
    }
    out.append(bytes, 2);
}

void appendUnit32(std::string& out, std::uint32_t unit) {
    for (std::size_t i = 0; i < 4; ++i) {
        const std::size_t shift = std::endian::native == std::endian::little
                                      ? 8 * i
                                      : 8 * (3 - i);
        out.push_back(static_cast<char>((unit >> shift) & 0xFF));
    }
}

}  // namespace

auto detectByteOrder(std::string_view bytes) -> ByteOrder {
    auto startsWith = [&](std::initializer_list<std::uint8_t> bom) {
        if (bytes.size() < bom.size()) {
            return false;
        }
        std::size_t i = 0;
        for (auto b : bom) {
            if (byteAt(bytes, i++) != b) {
                return false;
            }
        }
        return true;
    };

    // UTF-32 marks must be checked before UTF-16: FF FE is a prefix of
    // FF FE 00 00.
    if (startsWith({0xEF, 0xBB, 0xBF})) {
        return {Encoding::Utf8, std::endian::native, 3};
    }
    if (startsWith({0xFF, 0xFE, 0x00, 0x00})) {
        return {Encoding::Utf32, std::endian::little, 4};
    }
    if (startsWith({0x00, 0x00, 0xFE, 0xFF})) {
        return {Encoding::Utf32, std::endian::big, 4};
    }
    if (startsWith({0xFF, 0xFE})) {
        return {Encoding::Utf16, std::endian::little, 2};
    }
    if (startsWith({0xFE, 0xFF})) {
        return {Encoding::Utf16, std::endian::big, 2};
    }
    return {};
}

auto toUtf8(std::string bytes, const ByteOrder& order) -> Utf8Conversion {
    Utf8Conversion result;
    switch (order.encoding) {
        case Encoding::Utf8: {
            result.errorMessage = validateUtf8(bytes, result.characterCount);
            if (result.errorMessage.empty()) {
                result.utf8 = std::move(bytes);
            }
            return result;
        }
        case Encoding::Utf16: {
            result.utf8.reserve(bytes.size());
            for (std::size_t i = 0; i + 1 < bytes.size(); i += 2) {
                char32_t c = readUnit16(bytes, i, order.endian);
                if (c >= 0xD800 && c <= 0xDBFF) {
                    if (i + 3 >= bytes.size()) {
                        result.errorMessage = fmt::format(
                            "Unpaired surrogate UTF-16 value at offset {}", i);
                        return result;
                    }
                    const char32_t low = readUnit16(bytes, i + 2, order.endian);
                    if (low < 0xDC00 || low > 0xDFFF) {
                        result.errorMessage = fmt::format(
                            "Unpaired surrogate UTF-16 value at offset {}", i);
                        return result;
                    }
                    c = 0x10000 + ((c - 0xD800) << 10) + (low - 0xDC00);
                    i += 2;
                } else if (c >= 0xDC00 && c <= 0xDFFF) {
                    result.errorMessage = fmt::format(
                        "Unpaired surrogate UTF-16 value at offset {}", i);
                    return result;
                }
                appendUtf8(result.utf8, c);
                ++result.characterCount;
            }
            return result;
        }
        case Encoding::Utf32: {
            result.utf8.reserve(bytes.size());
            for (std::size_t i = 0; i + 3 < bytes.size(); i += 4) {
                const char32_t c = readUnit32(bytes, i, order.endian);
                if (isSurrogate(c) || c > kMaxCodePoint) {
                    result.errorMessage =
                        fmt::format("Invalid UTF-32 value 0x{:X} at offset {}",
                                    static_cast<std::uint32_t>(c), i);
                    return result;
                }
                appendUtf8(result.utf8, c);
                ++result.characterCount;
            }
            return result;
        }
    }
    return result;
}

auto fromUtf8(std::string_view utf8, Encoding encoding, bool withBom)
    -> std::string {
    if (encoding == Encoding::Utf8) {
        return std::string(utf8);
    }

    std::string out;
    out.reserve(utf8.size() * (encoding == Encoding::Utf16 ? 2 : 4) + 4);
    if (encoding == Encoding::Utf16) {
        if (withBom) {
            appendUnit16(out, 0xFEFF);
        }
        std::size_t offset = 0;
        while (offset < utf8.size()) {
            const char32_t c = decodeUtf8(utf8, offset);
            if (c >= 0x10000) {
                const char32_t v = c - 0x10000;
                appendUnit16(out, static_cast<std::uint16_t>(0xD800 + (v >> 10)));
                appendUnit16(out,
                             static_cast<std::uint16_t>(0xDC00 + (v & 0x3FF)));
            } else {
                appendUnit16(out, static_cast<std::uint16_t>(c));
            }
        }
        return out;
    }

    if (withBom) {
        appendUnit32(out, 0xFEFF);
    }
    std::size_t offset = 0;
    while (offset < utf8.size()) {
        appendUnit32(out, static_cast<std::uint32_t>(decodeUtf8(utf8, offset)));
    }
    return out;
}

auto isPrintable(char32_t c) -> bool {
    if (isSurrogate(c) || c > kMaxCodePoint) {
        return false;
    }
    if (c < 0x20) {
        return c >= 0x09 && c <= 0x0D;
    }
    if (c >= 0x7F && c <= 0x9F) {
        return c == 0x85;
    }
    return true;
}

auto findNonPrintable(std::string_view utf8) -> std::optional<std::size_t> {
    std::size_t offset = 0;
    while (offset < utf8.size()) {
        const std::size_t start = offset;
        if (!isPrintable(decodeUtf8(utf8, offset))) {
            return start;
        }
    }
    return std::nullopt;
}

auto countAscii(std::string_view bytes) -> std::size_t {
    std::size_t count = 0;
    while (count < bytes.size() && byteAt(bytes, count) < 0x80) {
        ++count;
    }
    return count;
}

auto encodeUtf8(char32_t c, char* out) -> std::size_t {
    if (c < 0x80) {
        out[0] = static_cast<char>(c);
        return 1;
    }
    if (c < 0x800) {
        out[0] = static_cast<char>(0xC0 | (c >> 6));
        out[1] = static_cast<char>(0x80 | (c & 0x3F));
        return 2;
    }
    if (c < 0x10000) {
        out[0] = static_cast<char>(0xE0 | (c >> 12));
        out[1] = static_cast<char>(0x80 | ((c >> 6) & 0x3F));
        out[2] = static_cast<char>(0x80 | (c & 0x3F));
        return 3;
    }
    out[0] = static_cast<char>(0xF0 | (c >> 18));
    out[1] = static_cast<char>(0x80 | ((c >> 12) & 0x3F));
    out[2] = static_cast<char>(0x80 | ((c >> 6) & 0x3F));
    out[3] = static_cast<char>(0x80 | (c & 0x3F));
    return 4;
}

void appendUtf8(std::string& out, char32_t c) {
    char buffer[4];
    out.append(buffer, encodeUtf8(c, buffer));
}

auto decodeUtf8(std::string_view utf8, std::size_t& offset) -> char32_t {
    const auto lead = byteAt(utf8, offset);
    if (lead < 0x80) {
        ++offset;
        return lead;
    }
    std::size_t length = 4;
    char32_t c = lead & 0x07;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        c = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        c = lead & 0x0F;
    }
    for (std::size_t k = 1; k < length && offset + k < utf8.size(); ++k) {
        c = (c << 6) | (byteAt(utf8, offset + k) & 0x3F);
    }
    offset += length;
    return c;
}

auto decodeUtf8String(std::string_view utf8) -> std::optional<std::u32string> {
    std::size_t count = 0;
    if (!validateUtf8(utf8, count).empty()) {
        return std::nullopt;
    }
    std::u32string result;
    result.reserve(count);
    std::size_t offset = 0;
    while (offset < utf8.size()) {
        result.push_back(decodeUtf8(utf8, offset));
    }
    return result;
}

}  // namespace strata::yaml
