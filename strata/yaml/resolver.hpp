#ifndef STRATA_YAML_RESOLVER_HPP
#define STRATA_YAML_RESOLVER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#ifdef STRATA_USE_BOOST
#include <boost/regex.hpp>
#else
#include <regex>
#endif

#include "strata/yaml/event.hpp"

namespace strata::yaml {

#ifdef STRATA_USE_BOOST
using Regex = boost::regex;
#else
using Regex = std::regex;
#endif

enum class NodeKind : std::uint8_t { Scalar, Sequence, Mapping };

/**
 * @brief Resolves the tags of nodes written without one.
 *
 * Implicit scalar rules are indexed by the first character of the value;
 * an empty value is looked up under U'\0'. Rules added first take
 * precedence. Scalars matching no rule, and sequences and mappings, get
 * the default `tag:yaml.org,2002:str|seq|map` tags.
 */
class Resolver {
public:
    Resolver() = default;

    /**
     * @brief Resolver with the YAML 1.1 rules for bool, float, int, merge,
     * null, timestamp, value and yaml.
     */
    [[nodiscard]] static auto withDefaultResolvers() -> Resolver;

    /**
     * @brief Adds an implicit scalar rule.
     *
     * A plain scalar whose first character is in `first` and that contains
     * a match of `regexp` resolves to `tag`.
     */
    void addImplicitResolver(std::string tag, Regex regexp,
                             std::string_view first);

    /**
     * @throws error::InvalidArgument if `pattern` is not a valid regex or
     * `first` is not valid UTF-8.
     */
    void addImplicitResolver(std::string tag, std::string_view pattern,
                             std::string_view first);

    /**
     * @brief Tag of a node.
     *
     * An explicit tag other than the non-specific `!` is returned as is.
     * Non-implicit scalars are strings.
     */
    [[nodiscard]] auto resolve(NodeKind kind, std::string_view tag,
                               std::string_view value, bool implicit) const
        -> std::string;

    /**
     * @brief Tag of the node an event starts.
     * @throws error::InvalidArgument for events that do not start a node.
     */
    [[nodiscard]] auto resolve(const Event& event) const -> std::string;

    [[nodiscard]] auto defaultScalarTag() const -> const std::string& {
        return defaultScalarTag_;
    }
    [[nodiscard]] auto defaultSequenceTag() const -> const std::string& {
        return defaultSequenceTag_;
    }
    [[nodiscard]] auto defaultMappingTag() const -> const std::string& {
        return defaultMappingTag_;
    }

private:
    struct ImplicitRule {
        std::string tag;
        std::shared_ptr<const Regex> regexp;
    };

    void addRule(const std::string& tag, const std::shared_ptr<const Regex>& regexp,
                 std::string_view first);

    std::string defaultScalarTag_ = "tag:yaml.org,2002:str";
    std::string defaultSequenceTag_ = "tag:yaml.org,2002:seq";
    std::string defaultMappingTag_ = "tag:yaml.org,2002:map";

    std::unordered_map<char32_t, std::vector<ImplicitRule>> implicitResolvers_;
};

}  // namespace strata::yaml

#endif
