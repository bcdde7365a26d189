#ifndef STRATA_YAML_READER_HPP
#define STRATA_YAML_READER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "strata/yaml/mark.hpp"
#include "strata/yaml/style.hpp"

namespace strata::yaml {

/**
 * @brief Value returned by Reader::peek() past the end of the input.
 *
 * NUL never appears in accepted input, so it cannot be confused with content.
 */
inline constexpr char32_t kEndOfInput = U'\0';

/**
 * @brief Byte range inside a Reader buffer.
 */
struct Slice {
    std::size_t offset = 0;
    std::size_t length = 0;

    [[nodiscard]] auto empty() const -> bool { return length == 0; }
};

class Reader;

/**
 * @brief Builds slices of already consumed Reader data in place.
 *
 * A slice starts at the current reader position when begin() is called and
 * can only grow up to the reader position. Data written to it overwrites
 * consumed bytes, which lets the scanner collapse escapes and line folds
 * without allocating. Transactions save the slice end so tentatively written
 * data can be rolled back.
 */
class SliceBuilder {
public:
    /**
     * @brief Saves the slice end and restores it unless committed.
     *
     * A transaction must be ended or committed after every transaction
     * created inside it and before the slice is finished.
     */
    class Transaction {
    public:
        Transaction() = default;
        explicit Transaction(SliceBuilder& builder);

        Transaction(const Transaction&) = delete;
        auto operator=(const Transaction&) -> Transaction& = delete;
        Transaction(Transaction&& other) noexcept;
        /**
         * @brief Ends the current transaction, then takes over `other`.
         */
        auto operator=(Transaction&& other) -> Transaction&;
        ~Transaction() = default;

        /**
         * @brief Keeps everything written since the transaction started.
         *
         * Does nothing for a default-constructed transaction.
         */
        void commit();

        /**
         * @brief Ends the transaction, reverting the slice unless committed.
         */
        void end();

    private:
        SliceBuilder* builder_ = nullptr;
        std::size_t stackLevel_ = 0;
        bool committed_ = false;
    };

    explicit SliceBuilder(Reader& reader);

    SliceBuilder(const SliceBuilder&) = delete;
    auto operator=(const SliceBuilder&) -> SliceBuilder& = delete;

    /**
     * @brief Starts a slice at the current reader position.
     * @throws error::LogicError if a slice is already being built.
     */
    void begin();

    /**
     * @brief Finishes the slice and returns its range.
     * @throws error::LogicError if no slice is being built or a transaction
     * is still open.
     */
    auto finish() -> Slice;

    /**
     * @brief Appends text. Text that already starts at the slice end (a view
     * just returned by Reader::get()) only extends the slice.
     */
    void write(std::string_view str);

    /**
     * @brief Appends one character, UTF-8 encoded.
     */
    void write(char32_t c);

    /**
     * @brief Inserts a character at a byte position inside the slice.
     * @param position Offset from the slice start, at most length().
     */
    void insert(char32_t c, std::size_t position);

    [[nodiscard]] auto length() const -> std::size_t;

    [[nodiscard]] auto inProgress() const -> bool {
        return start_ != std::string::npos;
    }

private:
    void push();
    void pop();
    void apply();
    void ensureRoom(std::size_t bytes) const;

    Reader& reader_;
    std::size_t start_ = std::string::npos;
    std::size_t end_ = std::string::npos;
    std::array<std::size_t, 4> endStack_{};
    std::size_t endStackUsed_ = 0;
};

/**
 * @brief Decodes a YAML byte buffer and provides character lookahead.
 *
 * The buffer is converted to UTF-8 at construction and owned by the reader.
 * Slices handed out by the SliceBuilder refer into it, so the reader must
 * outlive every token built from it.
 */
class Reader {
public:
    /**
     * @brief Takes ownership of a UTF-8/16/32 byte buffer.
     * @param buffer Raw input, optionally starting with a BOM.
     * @param name Source name used in marks.
     * @throws ReaderError on misaligned UTF-16/32 input, malformed code unit
     * sequences or non-printable characters.
     */
    explicit Reader(std::string buffer, std::string name = "<unknown>");

    Reader(const Reader&) = delete;
    auto operator=(const Reader&) -> Reader& = delete;

    /**
     * @brief Character `index` code points after the current position, or
     * kEndOfInput past the end.
     */
    auto peek(std::size_t index) -> char32_t;
    auto peek() -> char32_t;

    /**
     * @brief Byte `index` bytes after the current position, or '\0' past the
     * end.
     */
    [[nodiscard]] auto peekByte(std::size_t index) const -> char;
    [[nodiscard]] auto peekByte() const -> char;

    /**
     * @brief Up to `length` code points starting at the current position.
     *
     * The view is only valid until the next reader or slice builder call.
     */
    auto prefix(std::size_t length) -> std::string_view;

    /**
     * @brief Exactly `length` bytes starting at the current position.
     */
    [[nodiscard]] auto prefixBytes(std::size_t length) const
        -> std::string_view;

    /**
     * @brief View from the current position up to `end` code points ahead.
     */
    auto slice(std::size_t end) -> std::string_view;

    auto get() -> char32_t;

    /**
     * @brief Returns `length` code points and moves past them.
     */
    auto get(std::size_t length) -> std::string_view;

    /**
     * @brief Moves forward, tracking line and column.
     *
     * `\n`, a `\r` not followed by `\n`, NEL, LS and PS start a new line. A
     * BOM does not advance the column.
     */
    void forward(std::size_t length);
    void forward();

    [[nodiscard]] auto atEnd() const -> bool {
        return charIndex_ >= characterCount_;
    }

    [[nodiscard]] auto mark() const -> Mark;

    /**
     * @brief Mark `columns` characters to the right of the current position
     * on the same line.
     */
    [[nodiscard]] auto mark(std::size_t columns) const -> Mark;
    [[nodiscard]] auto name() const -> const std::string& { return *name_; }
    void setName(std::string name);
    [[nodiscard]] auto line() const -> std::uint32_t { return line_; }
    [[nodiscard]] auto column() const -> std::uint32_t { return column_; }
    [[nodiscard]] auto charIndex() const -> std::size_t { return charIndex_; }
    [[nodiscard]] auto encoding() const -> Encoding { return encoding_; }

    auto sliceBuilder() -> SliceBuilder& { return sliceBuilder_; }

    /**
     * @brief Text of a finished slice.
     */
    [[nodiscard]] auto view(const Slice& slice) const -> std::string_view;

private:
    friend class SliceBuilder;

    void checkAscii();
    auto decodeNext() -> char32_t;
    [[nodiscard]] auto markAt(std::size_t offset) const -> Mark;

    std::string buffer_;
    std::size_t bufferOffset_ = 0;
    std::size_t charIndex_ = 0;
    std::size_t characterCount_ = 0;
    std::shared_ptr<const std::string> name_;
    std::uint32_t line_ = 0;
    std::uint32_t column_ = 0;
    Encoding encoding_ = Encoding::Utf8;
    std::size_t upcomingAscii_ = 0;
    std::size_t lastDecodedBufferOffset_ = 0;
    std::size_t lastDecodedCharOffset_ = 0;
    SliceBuilder sliceBuilder_;
};

}  // namespace strata::yaml

#endif
