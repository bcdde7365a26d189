#include "stacktrace.hpp"

#include <cstdint>
#include <iomanip>
#include <regex>
#include <sstream>
#include <utility>

#if defined(__APPLE__) || defined(__linux__)
#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>
#endif

#ifdef STRATA_USE_BOOST
#include <boost/stacktrace.hpp>
#endif

namespace strata::error {

namespace {

#if defined(__linux__) || defined(__APPLE__)
auto demangle(const std::string& mangled) -> std::string {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status),
        std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
    return mangled;
}

auto processString(const std::string& input) -> std::string {
    size_t startIndex = input.find("_Z");
    if (startIndex == std::string::npos) {
        return input;
    }

    size_t endIndex = input.find('+', startIndex);
    if (endIndex == std::string::npos) {
        return input;
    }

    std::string abiName = input.substr(startIndex, endIndex - startIndex);
    abiName = demangle(abiName);

    std::string result = input;
    result.replace(startIndex, endIndex - startIndex, abiName);
    return result;
}
#endif

auto prettifyStacktrace(const std::string& input) -> std::string {
    std::string output = input;

    static const std::vector<std::pair<std::string, std::string>> REPLACEMENTS =
        {{"std::__1::", "std::"},
         {"std::__cxx11::", "std::"},
         {", std::allocator<[^<>]+>", ""}};

    for (const auto& [from, to] : REPLACEMENTS) {
        output = std::regex_replace(output, std::regex(from), to);
    }
    output = std::regex_replace(output, std::regex(R"( {2,})"), " ");

    return output;
}

auto formatAddress(uintptr_t address) -> std::string {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setfill('0')
        << std::setw(sizeof(void*) * 2) << address;
    return oss.str();
}

auto getBaseName(const std::string& path) -> std::string {
    size_t lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        return path.substr(lastSlash + 1);
    }
    return path;
}

}  // namespace

StackTrace::StackTrace() { capture(); }

auto StackTrace::toString() const -> std::string {
    std::ostringstream oss;
    oss << "Stack trace:\n";

#ifdef STRATA_USE_BOOST
    oss << boost::stacktrace::stacktrace();
#elif defined(__APPLE__) || defined(__linux__)
    for (int i = 0; i < num_frames_; ++i) {
        oss << "\t[" << i << "] " << processFrame(frames_[i], i) << "\n";
    }
#else
    oss << "\tStack trace not available on this platform.\n";
#endif

    return prettifyStacktrace(oss.str());
}

#if defined(__APPLE__) || defined(__linux__)
auto StackTrace::processFrame(void* frame, int frameIndex) const
    -> std::string {
    auto it = symbolCache_.find(frame);
    if (it != symbolCache_.end()) {
        return it->second;
    }

    std::ostringstream oss;
    auto address = reinterpret_cast<uintptr_t>(frame);

    Dl_info dlInfo;
    std::string functionName = "<unknown function>";
    std::string moduleName;
    uintptr_t offset = 0;

    if (dladdr(frame, &dlInfo) != 0) {
        if (dlInfo.dli_fname != nullptr) {
            moduleName = dlInfo.dli_fname;
        }
        if (dlInfo.dli_fbase != nullptr) {
            offset = address - reinterpret_cast<uintptr_t>(dlInfo.dli_fbase);
        }
        if (dlInfo.dli_sname != nullptr) {
            functionName = demangle(dlInfo.dli_sname);
        }
    }

    if (functionName == "<unknown function>" && frameIndex < num_frames_ &&
        symbols_) {
        functionName = processString(symbols_.get()[frameIndex]);
    }

    oss << functionName << " at " << formatAddress(address);

    if (!moduleName.empty()) {
        oss << " in " << getBaseName(moduleName);
        if (offset > 0) {
            oss << " (+" << std::hex << offset << ")";
        }
    }

    std::string result = oss.str();
    symbolCache_[frame] = result;
    return result;
}
#else
auto StackTrace::processFrame(void* frame, int /*frameIndex*/) const
    -> std::string {
    std::ostringstream oss;
    oss << "<frame information unavailable> at "
        << formatAddress(reinterpret_cast<uintptr_t>(frame));
    return oss.str();
}
#endif

void StackTrace::capture() {
#ifdef STRATA_USE_BOOST
    // boost::stacktrace captures at render time
#elif defined(__APPLE__) || defined(__linux__)
    constexpr int MAX_FRAMES = 128;
    void* framePtrs[MAX_FRAMES];

    num_frames_ = backtrace(framePtrs, MAX_FRAMES);
    if (num_frames_ > 1) {
        symbols_ = std::shared_ptr<char*>(
            backtrace_symbols(framePtrs + 1, num_frames_ - 1), std::free);
        frames_.assign(framePtrs + 1, framePtrs + num_frames_);
        num_frames_--;
    } else {
        symbols_.reset();
        frames_.clear();
        num_frames_ = 0;
    }

    symbolCache_.clear();
#endif
}

}  // namespace strata::error
