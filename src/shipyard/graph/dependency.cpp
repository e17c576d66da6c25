#include "shipyard/graph/dependency.hpp"

namespace shipyard {

auto parse_dependency(std::string_view text) -> DependencyRef {
  auto pos = text.rfind(':');
  if (pos == std::string_view::npos) {
    return DependencyRef{std::string(text), std::string(kDefaultRelation)};
  }
  return DependencyRef{std::string(text.substr(0, pos)),
                       std::string(text.substr(pos + 1))};
}

}  // namespace shipyard
