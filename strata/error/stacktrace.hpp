#ifndef STRATA_ERROR_STACKTRACE_HPP
#define STRATA_ERROR_STACKTRACE_HPP

#include <cstdlib>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata::error {

/**
 * @brief Captures the call stack at construction time.
 *
 * Frames are symbolized lazily in toString(). With STRATA_USE_BOOST the
 * rendering is delegated to boost::stacktrace.
 */
class StackTrace {
public:
    /**
     * @brief Captures the current stack trace.
     */
    StackTrace();

    /**
     * @brief Renders one line per frame: demangled function, address and
     * module.
     */
    [[nodiscard]] auto toString() const -> std::string;

private:
    void capture();

    [[nodiscard]] auto processFrame(void* frame, int frameIndex) const
        -> std::string;

#if defined(__APPLE__) || defined(__linux__)
    std::shared_ptr<char*> symbols_;
    std::vector<void*> frames_;
    int num_frames_ = 0;
    mutable std::unordered_map<void*, std::string> symbolCache_;
#endif
};

}  // namespace strata::error

#endif
