#ifndef STRATA_YAML_ENCODING_HPP
#define STRATA_YAML_ENCODING_HPP

#include <bit>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "strata/yaml/style.hpp"

namespace strata::yaml {

/**
 * @brief Result of byte order mark detection.
 */
struct ByteOrder {
    Encoding encoding = Encoding::Utf8;
    std::endian endian = std::endian::native;
    std::size_t bomLength = 0;
};

/**
 * @brief Result of converting an input buffer to UTF-8.
 *
 * `errorMessage` is empty on success.
 */
struct Utf8Conversion {
    std::string utf8;
    std::size_t characterCount = 0;
    std::string errorMessage;
};

/**
 * @brief Detects a UTF-8/16/32 byte order mark at the start of `bytes`.
 *
 * Input without a BOM is UTF-8.
 */
[[nodiscard]] auto detectByteOrder(std::string_view bytes) -> ByteOrder;

/**
 * @brief Converts BOM-stripped input in the given byte order to UTF-8,
 * validating every code unit sequence.
 */
[[nodiscard]] auto toUtf8(std::string bytes, const ByteOrder& order)
    -> Utf8Conversion;

/**
 * @brief Transcodes UTF-8 text to native-endian UTF-16 or UTF-32 bytes.
 *
 * UTF-8 input is returned unchanged. When `withBom` is set a byte order mark
 * is written first.
 */
[[nodiscard]] auto fromUtf8(std::string_view utf8, Encoding encoding,
                            bool withBom) -> std::string;

/**
 * @brief Checks a code point against the characters YAML allows in a stream.
 *
 * C0 and C1 control characters other than tab, line feed, vertical tab,
 * form feed, carriage return and NEL are rejected, as are surrogates and
 * values beyond U+10FFFF.
 */
[[nodiscard]] auto isPrintable(char32_t c) -> bool;

/**
 * @brief Byte offset of the first non-printable character in valid UTF-8.
 */
[[nodiscard]] auto findNonPrintable(std::string_view utf8)
    -> std::optional<std::size_t>;

/**
 * @brief Number of leading ASCII bytes.
 */
[[nodiscard]] auto countAscii(std::string_view bytes) -> std::size_t;

/**
 * @brief Encodes `c` as UTF-8 into `out`, which must hold 4 bytes.
 * @return The number of bytes written.
 */
auto encodeUtf8(char32_t c, char* out) -> std::size_t;

void appendUtf8(std::string& out, char32_t c);

/**
 * @brief Decodes the code point at `offset` in valid UTF-8 and advances
 * `offset` past it.
 */
auto decodeUtf8(std::string_view utf8, std::size_t& offset) -> char32_t;

/**
 * @brief Decodes a whole UTF-8 string, returning nullopt if it is malformed.
 */
[[nodiscard]] auto decodeUtf8String(std::string_view utf8)
    -> std::optional<std::u32string>;

}  // namespace strata::yaml

#endif
