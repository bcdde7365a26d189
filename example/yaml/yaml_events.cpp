#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "strata/yaml/emitter.hpp"
#include "strata/yaml/exception.hpp"
#include "strata/yaml/parser.hpp"
#include "strata/yaml/resolver.hpp"

using namespace strata::yaml;

namespace {
struct Options {
    std::string path;
    bool emit = false;
    bool resolve = false;
    bool verbose = false;
    EmitterSettings settings;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--emit] [--canonical] [--indent N] [--width N]\n"
                 "       [--line-break unix|windows|macintosh] [--resolve]"
                 " [--verbose] <file.yaml>\n";
}

auto parseLineBreak(std::string_view name, LineBreak& lineBreak) -> bool {
    if (name == "unix") {
        lineBreak = LineBreak::Unix;
    } else if (name == "windows") {
        lineBreak = LineBreak::Windows;
    } else if (name == "macintosh") {
        lineBreak = LineBreak::Macintosh;
    } else {
        return false;
    }
    return true;
}

auto parseOptions(int argc, char** argv, Options& options) -> bool {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool hasValue = i + 1 < argc;
        if (arg == "--emit") {
            options.emit = true;
        } else if (arg == "--canonical") {
            options.settings.canonical = true;
        } else if (arg == "--resolve") {
            options.resolve = true;
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--indent" && hasValue) {
            options.settings.indent = std::atoi(argv[++i]);
        } else if (arg == "--width" && hasValue) {
            options.settings.width = std::atoi(argv[++i]);
        } else if (arg == "--line-break" && hasValue) {
            if (!parseLineBreak(argv[++i], options.settings.lineBreak)) {
                std::cerr << "Unknown line break: " << argv[i] << "\n";
                return false;
            }
        } else if (!arg.empty() && arg.front() != '-' && options.path.empty()) {
            options.path = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return false;
        }
    }
    return !options.path.empty();
}

auto readFile(const std::string& path, std::string& content) -> bool {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    content.assign(std::istreambuf_iterator<char>(file),
                   std::istreambuf_iterator<char>());
    return true;
}
}  // namespace

int main(int argc, char** argv) {
    Options options;
    if (!parseOptions(argc, argv, options)) {
        printUsage(argv[0]);
        return 1;
    }
    spdlog::set_level(options.verbose ? spdlog::level::debug
                                      : spdlog::level::warn);

    std::string content;
    if (!readFile(options.path, content)) {
        std::cerr << "Cannot read " << options.path << "\n";
        return 1;
    }

    try {
        const std::vector<Event> events = parseEvents(content, options.path);

        if (options.emit) {
            std::cout << emitEvents(events, options.settings);
            return 0;
        }

        const Resolver resolver = Resolver::withDefaultResolvers();
        for (const auto& event : events) {
            std::cout << event.toString();
            if (options.resolve &&
                (event.id == EventId::Scalar ||
                 event.id == EventId::SequenceStart ||
                 event.id == EventId::MappingStart)) {
                std::cout << "  # " << resolver.resolve(event);
            }
            std::cout << "\n";
        }
    } catch (const MarkedYamlError& e) {
        std::cerr << e.describe() << "\n";
        return 2;
    } catch (const YamlError& e) {
        std::cerr << e.getMessage() << "\n";
        return 2;
    }
    return 0;
}
