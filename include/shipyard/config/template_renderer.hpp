#pragma once

#include "shipyard/config/variables.hpp"
#include "shipyard/core/error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace shipyard {

// Per-call variables that shadow the container (loop values, module extras).
using ExtraVariables =
    std::unordered_map<std::string, std::string, StringHash, StringEqual>;

class TemplateRenderer {
 public:
  explicit TemplateRenderer(const VariableContainer& variables);

  // Mustache subset over string values: {{ name }}, {{{ name }}} and
  // {{& name }} (no escaping in either form), sections {{#name}}..{{/name}}
  // rendered when the value is present and non-empty, inverted sections
  // {{^name}}..{{/name}}, and {{! comments }}. Lines holding only a section or
  // comment tag are dropped. Fails with UnresolvedPlaceholder when the output
  // still contains an opening "{{" or a section is never closed.
  [[nodiscard]] auto render(std::string_view tmpl,
                            const ExtraVariables& extra_vars = {}) const
      -> Result<std::string>;

 private:
  [[nodiscard]] auto lookup(std::string_view token,
                            const ExtraVariables& extra_vars) const
      -> std::optional<std::string_view>;

  [[nodiscard]] auto render_range(std::string_view tmpl, std::size_t pos,
                                  std::size_t end,
                                  const ExtraVariables& extra_vars,
                                  std::string& output) const -> Result<void>;

  const VariableContainer& variables_;
};

}  // namespace shipyard
