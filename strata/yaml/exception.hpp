#ifndef STRATA_YAML_EXCEPTION_HPP
#define STRATA_YAML_EXCEPTION_HPP

#include <optional>
#include <string>

#include "strata/error/exception.hpp"
#include "strata/yaml/mark.hpp"

namespace strata::yaml {

/**
 * @brief Base class of every error raised by the YAML engine.
 */
class YamlError : public error::Exception {
public:
    using Exception::Exception;
};

/**
 * @brief YAML error with a position.
 *
 * Carries a context message and its mark, and optionally a problem label
 * with a second mark (for example "key started here"). describe() renders
 * `context: mark` followed, when present, by `\nproblem: problemMark`.
 */
class MarkedYamlError : public YamlError {
public:
    MarkedYamlError(const char* file, int line, const char* func,
                    std::string context, Mark mark);

    MarkedYamlError(const char* file, int line, const char* func,
                    std::string context, Mark mark, std::string problem,
                    Mark problemMark);

    [[nodiscard]] auto getContext() const -> const std::string& {
        return context_;
    }
    [[nodiscard]] auto getMark() const -> const Mark& { return mark_; }
    [[nodiscard]] auto getProblem() const -> const std::optional<std::string>& {
        return problem_;
    }
    [[nodiscard]] auto getProblemMark() const -> const std::optional<Mark>& {
        return problemMark_;
    }

    /**
     * @brief Text suitable for presenting to end users.
     */
    [[nodiscard]] auto describe() const -> std::string;

private:
    std::string context_;
    Mark mark_;
    std::optional<std::string> problem_;
    std::optional<Mark> problemMark_;
};

/**
 * @brief Input could not be decoded or contains non-printable characters.
 *
 * The context is prefixed with "Reader error: ".
 */
class ReaderError : public MarkedYamlError {
public:
    ReaderError(const char* file, int line, const char* func,
                const std::string& message, Mark mark);
};

class ScannerError : public MarkedYamlError {
public:
    using MarkedYamlError::MarkedYamlError;
};

class ParserError : public MarkedYamlError {
public:
    using MarkedYamlError::MarkedYamlError;
};

/**
 * @brief The emitter was fed an event sequence it cannot write.
 */
class EmitterError : public YamlError {
public:
    using YamlError::YamlError;
};

}  // namespace strata::yaml

#define THROW_READER_ERROR(...)                                         \
    throw strata::yaml::ReaderError(STRATA_FILE_NAME, STRATA_FILE_LINE, \
                                    STRATA_FUNC_NAME, __VA_ARGS__)

#define THROW_SCANNER_ERROR(...)                                         \
    throw strata::yaml::ScannerError(STRATA_FILE_NAME, STRATA_FILE_LINE, \
                                     STRATA_FUNC_NAME, __VA_ARGS__)

#define THROW_PARSER_ERROR(...)                                         \
    throw strata::yaml::ParserError(STRATA_FILE_NAME, STRATA_FILE_LINE, \
                                    STRATA_FUNC_NAME, __VA_ARGS__)

#define THROW_EMITTER_ERROR(...)                                         \
    throw strata::yaml::EmitterError(STRATA_FILE_NAME, STRATA_FILE_LINE, \
                                     STRATA_FUNC_NAME, __VA_ARGS__)

#endif
