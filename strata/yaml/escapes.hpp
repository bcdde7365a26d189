#ifndef STRATA_YAML_ESCAPES_HPP
#define STRATA_YAML_ESCAPES_HPP

#include <cstddef>

namespace strata::yaml {

/**
 * @brief True for characters that may follow `\` in a double-quoted scalar
 * as a simple escape (`0 a b t TAB n v f r e SPACE " \ N _ L P`).
 */
[[nodiscard]] auto isEscape(char32_t c) -> bool;

/**
 * @brief True for `x`, `u` and `U`, the hexadecimal escape introducers.
 */
[[nodiscard]] auto isHexEscape(char32_t c) -> bool;

/**
 * @brief Character a simple escape stands for. `c` must satisfy isEscape().
 */
[[nodiscard]] auto fromEscape(char32_t c) -> char32_t;

/**
 * @brief Escape letter for `value`, or 0 if it has no simple escape.
 */
[[nodiscard]] auto toEscape(char32_t value) -> char32_t;

/**
 * @brief Number of hex digits following a hex escape introducer:
 * 2 for `x`, 4 for `u`, 8 for `U`, 0 otherwise.
 */
[[nodiscard]] auto escapeHexLength(char32_t c) -> std::size_t;

}  // namespace strata::yaml

#endif
