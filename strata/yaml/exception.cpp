#include "exception.hpp"

#include <utility>

namespace strata::yaml {

MarkedYamlError::MarkedYamlError(const char* file, int line, const char* func,
                                 std::string context, Mark mark)
    : YamlError(file, line, func), context_(std::move(context)),
      mark_(std::move(mark)) {
    setMessage(describe());
}

MarkedYamlError::MarkedYamlError(const char* file, int line, const char* func,
                                 std::string context, Mark mark,
                                 std::string problem, Mark problemMark)
    : YamlError(file, line, func), context_(std::move(context)),
      mark_(std::move(mark)), problem_(std::move(problem)),
      problemMark_(std::move(problemMark)) {
    setMessage(describe());
}

auto MarkedYamlError::describe() const -> std::string {
    std::string result = context_ + ": " + mark_.toString();
    if (problemMark_) {
        result += "\n" + problem_.value_or("") + ": " + problemMark_->toString();
    }
    return result;
}

ReaderError::ReaderError(const char* file, int line, const char* func,
                         const std::string& message, Mark mark)
    : MarkedYamlError(file, line, func, "Reader error: " + message,
                      std::move(mark)) {}

}  // namespace strata::yaml
