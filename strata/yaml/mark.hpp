#ifndef STRATA_YAML_MARK_HPP
#define STRATA_YAML_MARK_HPP

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

namespace strata::yaml {

/**
 * @brief Position in a YAML stream, used for diagnostics.
 *
 * Line and column are zero-based; toString() displays them one-based as
 * `name:line,column`. The source name is shared between every mark produced
 * by the same reader.
 */
class Mark {
public:
    Mark();
    Mark(std::shared_ptr<const std::string> name, std::uint32_t line,
         std::uint32_t column);

    [[nodiscard]] auto name() const -> const std::string& { return *name_; }
    [[nodiscard]] auto line() const -> std::uint32_t { return line_; }
    [[nodiscard]] auto column() const -> std::uint32_t { return column_; }

    [[nodiscard]] auto toString() const -> std::string;

    auto operator==(const Mark& other) const -> bool;

private:
    std::shared_ptr<const std::string> name_;
    std::uint32_t line_ = 0;
    std::uint32_t column_ = 0;
};

auto operator<<(std::ostream& os, const Mark& mark) -> std::ostream&;

}  // namespace strata::yaml

#endif
