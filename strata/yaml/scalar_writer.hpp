#ifndef STRATA_YAML_SCALAR_WRITER_HPP
#define STRATA_YAML_SCALAR_WRITER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace strata::yaml {

class Emitter;

/**
 * @brief Writes one scalar in a given style through an Emitter.
 *
 * The text is walked as ranges of runs (spaces, breaks, other characters);
 * a range is written when the run kind changes. Lines are folded only
 * between runs and only when `split` is set, which is never the case for
 * simple keys. The text must be valid UTF-8 and must outlive the writer.
 */
class ScalarWriter {
public:
    ScalarWriter(Emitter& emitter, std::string_view text, bool split = true);

    void writeSingleQuoted();
    void writeDoubleQuoted();
    void writeFolded();
    void writeLiteral();
    void writePlain();

    /**
     * @brief Block scalar header hints: an indentation digit when the text
     * starts with a space or break, then `-` (strip) or `+` (keep).
     */
    [[nodiscard]] static auto determineBlockHints(std::string_view text,
                                                  unsigned bestIndent)
        -> std::string;

private:
    /// Returned by nextChar() past the end of the text.
    static constexpr char32_t kNone = 0xFFFFFFFF;

    auto nextChar() -> char32_t;
    [[nodiscard]] auto charAtStart() const -> char32_t;
    [[nodiscard]] auto tooWide() const -> bool;

    void initBlock(char indicator);
    void writeCurrentRange(bool updateColumn);
    void writeLineBreaks();
    void writeStartLineBreak();
    void writeIndent(bool resetSpace);
    void updateRangeStart();
    void updateBreaks(char32_t c, bool updateSpaces);
    void resetTextPosition();

    Emitter& emitter_;
    std::string_view text_;
    bool split_;
    bool spaces_ = false;
    bool breaks_ = false;

    // Byte and character bounds of the pending range.
    std::size_t startByte_ = 0;
    std::size_t endByte_ = 0;
    /// Byte just past the current character.
    std::size_t nextEndByte_ = 0;
    std::int64_t startChar_ = 0;
    std::int64_t endChar_ = -1;
};

}  // namespace strata::yaml

#endif
