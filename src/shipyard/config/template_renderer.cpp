#include "shipyard/config/template_renderer.hpp"

#include "shipyard/util/log.hpp"

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace shipyard {

TemplateRenderer::TemplateRenderer(const VariableContainer& variables)
    : variables_(variables) {}

namespace {

// Trim leading/trailing whitespace from a string_view
auto trim(std::string_view sv) -> std::string_view {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

// Find closing }} using char-by-char scan
// Returns npos if not found
auto find_closing_braces(std::string_view tmpl, size_t start) -> size_t {
  for (size_t i = start; i + 1 < tmpl.size(); ++i) {
    if (tmpl[i] == '}' && tmpl[i + 1] == '}') {
      return i;
    }
  }
  return std::string_view::npos;
}

auto first_placeholder(std::string_view text) -> std::string_view {
  auto open = text.find("{{");
  auto close = find_closing_braces(text, open + 2);
  if (close == std::string_view::npos) {
    return text.substr(open);
  }
  return text.substr(open, close + 2 - open);
}

// kind: '\0' variable, '&' unescaped variable, '#' section, '^' inverted
// section, '/' section end, '!' comment.
struct Tag {
  size_t begin;
  size_t end;
  char kind;
  std::string_view name;
};

auto parse_tag(std::string_view tmpl, size_t open, size_t end)
    -> std::optional<Tag> {
  auto view = tmpl.substr(0, end);

  if (open + 2 < view.size() && view[open + 2] == '{') {
    auto close = view.find("}}}", open + 3);
    if (close == std::string_view::npos) {
      return std::nullopt;
    }
    return Tag{open, close + 3, '&',
               trim(view.substr(open + 3, close - open - 3))};
  }

  auto close = find_closing_braces(view, open + 2);
  if (close == std::string_view::npos) {
    return std::nullopt;
  }
  auto inner = trim(view.substr(open + 2, close - open - 2));
  char kind = '\0';
  if (!inner.empty() && std::string_view{"#^/!&"}.contains(inner.front())) {
    kind = inner.front();
    inner = trim(inner.substr(1));
  }
  return Tag{open, close + 2, kind, inner};
}

constexpr auto is_block_tag(char kind) noexcept -> bool {
  return kind == '#' || kind == '^' || kind == '/' || kind == '!';
}

// [line start, start of next line) when the tag is alone on its line.
auto standalone_line(std::string_view tmpl, const Tag& tag, size_t end)
    -> std::optional<std::pair<size_t, size_t>> {
  size_t line_begin = tag.begin;
  while (line_begin > 0 &&
         (tmpl[line_begin - 1] == ' ' || tmpl[line_begin - 1] == '\t')) {
    --line_begin;
  }
  if (line_begin > 0 && tmpl[line_begin - 1] != '\n') {
    return std::nullopt;
  }

  size_t line_end = tag.end;
  while (line_end < end && (tmpl[line_end] == ' ' || tmpl[line_end] == '\t')) {
    ++line_end;
  }
  if (line_end < end) {
    if (tmpl[line_end] == '\n') {
      ++line_end;
    } else if (tmpl[line_end] == '\r' && line_end + 1 < end &&
               tmpl[line_end + 1] == '\n') {
      line_end += 2;
    } else {
      return std::nullopt;
    }
  }
  return std::pair{line_begin, line_end};
}

// Matching {{/name}} for a section opened before `pos`, skipping nested
// sections of the same name.
auto find_section_close(std::string_view tmpl, size_t pos, size_t end,
                        std::string_view name) -> std::optional<Tag> {
  int depth = 0;
  while (pos < end) {
    auto open = tmpl.find("{{", pos);
    if (open == std::string_view::npos || open >= end) {
      return std::nullopt;
    }
    auto tag = parse_tag(tmpl, open, end);
    if (!tag) {
      return std::nullopt;
    }
    if (tag->name == name) {
      if (tag->kind == '#' || tag->kind == '^') {
        ++depth;
      } else if (tag->kind == '/') {
        if (depth == 0) {
          return tag;
        }
        --depth;
      }
    }
    pos = tag->end;
  }
  return std::nullopt;
}

}  // namespace

auto TemplateRenderer::lookup(std::string_view token,
                              const ExtraVariables& extra_vars) const
    -> std::optional<std::string_view> {
  if (auto it = extra_vars.find(token); it != extra_vars.end()) {
    return it->second;
  }
  auto it = variables_.values().find(token);
  if (it == variables_.values().end() || !it->second) {
    return std::nullopt;
  }
  return *it->second;
}

auto TemplateRenderer::render_range(std::string_view tmpl, size_t pos,
                                    size_t end,
                                    const ExtraVariables& extra_vars,
                                    std::string& output) const -> Result<void> {
  while (pos < end) {
    auto open = tmpl.find("{{", pos);
    if (open == std::string_view::npos || open >= end) {
      output.append(tmpl.substr(pos, end - pos));
      break;
    }

    auto tag = parse_tag(tmpl, open, end);
    if (!tag) {
      // Unclosed {{ - copied through, rejected by the final check
      output.append(tmpl.substr(pos, end - pos));
      break;
    }

    auto line = is_block_tag(tag->kind) ? standalone_line(tmpl, *tag, end)
                                        : std::nullopt;
    output.append(tmpl.substr(pos, (line ? line->first : tag->begin) - pos));
    auto next = line ? line->second : tag->end;

    switch (tag->kind) {
      case '!':
        break;

      case '#':
      case '^': {
        auto close = find_section_close(tmpl, next, end, tag->name);
        if (!close) {
          log::error("Unclosed section '{}' in template", tag->name);
          return fail(Error::UnresolvedPlaceholder);
        }
        auto close_line = standalone_line(tmpl, *close, end);
        auto inner_end = close_line ? close_line->first : close->begin;

        auto value = lookup(tag->name, extra_vars);
        bool truthy = value && !value->empty();
        if (truthy == (tag->kind == '#')) {
          if (auto r = render_range(tmpl, next, inner_end, extra_vars, output);
              !r) {
            return r;
          }
        }
        next = close_line ? close_line->second : close->end;
        break;
      }

      case '/':
        // Stray section end - left as literal, rejected by the final check
        output.append(tmpl.substr(tag->begin, tag->end - tag->begin));
        break;

      default:
        if (auto value = lookup(tag->name, extra_vars)) {
          output.append(*value);
        } else {
          // Unknown or valueless variable - left as literal
          output.append(tmpl.substr(tag->begin, tag->end - tag->begin));
        }
        break;
    }
    pos = next;
  }
  return ok();
}

auto TemplateRenderer::render(std::string_view tmpl,
                              const ExtraVariables& extra_vars) const
    -> Result<std::string> {
  std::string output;
  output.reserve(tmpl.size());

  if (auto r = render_range(tmpl, 0, tmpl.size(), extra_vars, output); !r) {
    return fail(r.error());
  }

  if (output.find("{{") != std::string::npos) {
    log::error("Unresolved variable {} in template", first_placeholder(output));
    return fail(Error::UnresolvedPlaceholder);
  }
  return output;
}

}  // namespace shipyard
