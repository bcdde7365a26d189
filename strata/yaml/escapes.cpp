#include "escapes.hpp"

namespace strata::yaml {

auto isEscape(char32_t c) -> bool {
    switch (c) {
        case U'0':
        case U'a':
        case U'b':
        case U't':
        case U'\t':
        case U'n':
        case U'v':
        case U'f':
        case U'r':
        case U'e':
        case U' ':
        case U'"':
        case U'\\':
        case U'N':
        case U'_':
        case U'L':
        case U'P':
            return true;
        default:
            return false;
    }
}

auto isHexEscape(char32_t c) -> bool {
    return c == U'x' || c == U'u' || c == U'U';
}

auto fromEscape(char32_t c) -> char32_t {
    switch (c) {
        case U'0':
            return 0x00;
        case U'a':
            return 0x07;
        case U'b':
            return 0x08;
        case U't':
        case U'\t':
            return 0x09;
        case U'n':
            return 0x0A;
        case U'v':
            return 0x0B;
        case U'f':
            return 0x0C;
        case U'r':
            return 0x0D;
        case U'e':
            return 0x1B;
        case U' ':
            return 0x20;
        case U'"':
            return U'"';
        case U'\\':
            return U'\\';
        case U'N':
            return 0x85;
        case U'_':
            return 0xA0;
        case U'L':
            return 0x2028;
        case U'P':
            return 0x2029;
        default:
            return 0;
    }
}

auto toEscape(char32_t value) -> char32_t {
    switch (value) {
        case 0x00:
            return U'0';
        case 0x07:
            return U'a';
        case 0x08:
            return U'b';
        case 0x09:
            return U't';
        case 0x0A:
            return U'n';
        case 0x0B:
            return U'v';
        case 0x0C:
            return U'f';
        case 0x0D:
            return U'r';
        case 0x1B:
            return U'e';
        case U'"':
            return U'"';
        case U'\\':
            return U'\\';
        case 0xA0:
            return U'_';
        case 0x85:
            return U'N';
        case 0x2028:
            return U'L';
        case 0x2029:
            return U'P';
        default:
            return 0;
    }
}

auto escapeHexLength(char32_t c) -> std::size_t {
    switch (c) {
        case U'x':
            return 2;
        case U'u':
            return 4;
        case U'U':
            return 8;
        default:
            return 0;
    }
}

}  // namespace strata::yaml
