#include "mark.hpp"

#include <utility>

namespace strata::yaml {

namespace {
auto unknownName() -> std::shared_ptr<const std::string> {
    static const auto NAME = std::make_shared<const std::string>("<unknown>");
    return NAME;
}
}  // namespace

Mark::Mark() : name_(unknownName()) {}

Mark::Mark(std::shared_ptr<const std::string> name, std::uint32_t line,
           std::uint32_t column)
    : name_(name ? std::move(name) : unknownName()),
      line_(line),
      column_(column) {}

auto Mark::toString() const -> std::string {
    return *name_ + ":" + std::to_string(static_cast<std::uint64_t>(line_) + 1) +
           "," + std::to_string(static_cast<std::uint64_t>(column_) + 1);
}

auto Mark::operator==(const Mark& other) const -> bool {
    return line_ == other.line_ && column_ == other.column_ &&
           *name_ == *other.name_;
}

auto operator<<(std::ostream& os, const Mark& mark) -> std::ostream& {
    return os << mark.toString();
}

}  // namespace strata::yaml
