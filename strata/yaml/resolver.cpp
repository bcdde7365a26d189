#include "resolver.hpp"

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "strata/error/exception.hpp"
#include "strata/yaml/encoding.hpp"

namespace strata::yaml {

namespace {
struct DefaultRule {
    const char* tag;
    const char* pattern;
    std::string_view first;
};

// The null rule also applies to the empty scalar, looked up under U'\0'.
const DefaultRule DEFAULT_RULES[] = {
    {"tag:yaml.org,2002:bool",
     R"(^(?:yes|Yes|YES|no|No|NO|true|True|TRUE|false|False|FALSE|on|On|ON|off|Off|OFF)$)",
     "yYnNtTfFoO"},
    {"tag:yaml.org,2002:float",
     R"(^(?:[-+]?(?:[0-9][0-9_]*)\.[0-9_]*(?:[eE][-+][0-9]+)?)"
     R"(|[-+]?(?:[0-9][0-9_]*)?\.[0-9_]+(?:[eE][-+][0-9]+)?)"
     R"(|[-+]?[0-9][0-9_]*(?::[0-5]?[0-9])+\.[0-9_]*)"
     R"(|[-+]?\.(?:inf|Inf|INF)|\.(?:nan|NaN|NAN))$)",
     "-+0123456789."},
    {"tag:yaml.org,2002:int",
     R"(^(?:[-+]?0b[0-1_]+|[-+]?0[0-7_]+|[-+]?(?:0|[1-9][0-9_]*))"
     R"(|[-+]?0x[0-9a-fA-F_]+|[-+]?[1-9][0-9_]*(?::[0-5]?[0-9])+)$)",
     "-+0123456789"},
    {"tag:yaml.org,2002:merge", R"(^<<$)", "<"},
    {"tag:yaml.org,2002:null", R"(^$|^(?:~|null|Null|NULL)$)",
     std::string_view("~nN\0", 4)},
    {"tag:yaml.org,2002:timestamp",
     R"(^(?:[0-9][0-9][0-9][0-9]-[0-9][0-9]-[0-9][0-9])"
     R"(|[0-9][0-9][0-9][0-9]-[0-9][0-9]?-[0-9][0-9]?)"
     R"((?:[Tt]|[ \t]+)[0-9][0-9]?:[0-9][0-9]:[0-9][0-9](?:\.[0-9]*)?)"
     R"((?:[ \t]*(?:Z|[-+][0-9][0-9]?(?::[0-9][0-9])?))?)$)",
     "0123456789"},
    {"tag:yaml.org,2002:value", R"(^=$)", "="},
    // Plain scalars cannot start with these; kept for completeness.
    {"tag:yaml.org,2002:yaml", R"(^(?:!|&|\*)$)", "!&*"},
};

auto matches(const Regex& regexp, std::string_view value) -> bool {
#ifdef STRATA_USE_BOOST
    return boost::regex_search(value.begin(), value.end(), regexp);
#else
    return std::regex_search(value.begin(), value.end(), regexp);
#endif
}
}  // namespace

auto Resolver::withDefaultResolvers() -> Resolver {
    Resolver resolver;
    for (const auto& rule : DEFAULT_RULES) {
        resolver.addRule(rule.tag, std::make_shared<const Regex>(rule.pattern),
                         rule.first);
    }
    return resolver;
}

void Resolver::addImplicitResolver(std::string tag, Regex regexp,
                                   std::string_view first) {
    if (!decodeUtf8String(first)) {
        THROW_INVALID_ARGUMENT("First characters of resolver ", tag,
                               " are not valid UTF-8");
    }
    spdlog::debug("Resolver: implicit rule for {} on first characters \"{}\"",
                  tag, first);
    addRule(tag, std::make_shared<const Regex>(std::move(regexp)), first);
}

void Resolver::addImplicitResolver(std::string tag, std::string_view pattern,
                                   std::string_view first) {
    Regex regexp;
    try {
        regexp = Regex(pattern.begin(), pattern.end());
    } catch (const std::runtime_error& e) {
        spdlog::error("Resolver: invalid pattern {} for {}: {}", pattern, tag,
                      e.what());
        THROW_INVALID_ARGUMENT("Invalid resolver pattern ", pattern, ": ",
                               e.what());
    }
    addImplicitResolver(std::move(tag), std::move(regexp), first);
}

void Resolver::addRule(const std::string& tag,
                       const std::shared_ptr<const Regex>& regexp,
                       std::string_view first) {
    std::size_t offset = 0;
    while (offset < first.size()) {
        const char32_t c = decodeUtf8(first, offset);
        implicitResolvers_[c].push_back(ImplicitRule{tag, regexp});
    }
}

auto Resolver::resolve(NodeKind kind, std::string_view tag,
                       std::string_view value, bool implicit) const
    -> std::string {
    if (!tag.empty() && tag != "!") {
        return std::string(tag);
    }

    switch (kind) {
        case NodeKind::Scalar: {
            if (!implicit) {
                return defaultScalarTag_;
            }

            char32_t first = 0;
            if (!value.empty()) {
                std::size_t offset = 0;
                first = decodeUtf8(value, offset);
            }

            const auto rules = implicitResolvers_.find(first);
            if (rules == implicitResolvers_.end()) {
                return defaultScalarTag_;
            }
            for (const auto& rule : rules->second) {
                if (matches(*rule.regexp, value)) {
                    return rule.tag;
                }
            }
            return defaultScalarTag_;
        }
        case NodeKind::Sequence:
            return defaultSequenceTag_;
        case NodeKind::Mapping:
            return defaultMappingTag_;
    }
    return defaultScalarTag_;
}

auto Resolver::resolve(const Event& event) const -> std::string {
    switch (event.id) {
        case EventId::Scalar:
            return resolve(NodeKind::Scalar, event.tag(), event.value,
                           event.implicit);
        case EventId::SequenceStart:
            return resolve(NodeKind::Sequence, event.tag(), {}, event.implicit);
        case EventId::MappingStart:
            return resolve(NodeKind::Mapping, event.tag(), {}, event.implicit);
        default:
            THROW_INVALID_ARGUMENT("Cannot resolve the tag of a ",
                                   eventIdName(event.id), " event");
    }
}

}  // namespace strata::yaml
