#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace shipyard {

enum class Error : int {
  Success,
  FileNotFound,
  FileOpenFailed,
  ParseError,
  InvalidArgument,
  NotFound,
  MissingVariable,
  DisallowedValue,
  UnresolvedPlaceholder,
  DuplicateSection,
  MissingEntityType,
  UnknownEntityType,
  InvalidEntity,
  DanglingDependency,
  CycleDetected,
  ModuleLoadFailed,
  ModuleContractViolation,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "file not found",
      "failed to open file",
      "parse error",
      "invalid argument",
      "not found",
      "missing required variable",
      "variable value not allowed",
      "unresolved template placeholder",
      "section declared in base config and include",
      "entity has no type",
      "unknown entity type",
      "invalid entity configuration",
      "dependency references an unknown entity",
      "cycle detected in dependency graph",
      "failed to load module",
      "module violates the module contract",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "shipyard";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

// Errors caused by the user's documents or variables ("fix your config"), as
// opposed to defects in an entity module ("fix your module").
[[nodiscard]] inline auto is_configuration_error(std::error_code ec) noexcept
    -> bool {
  if (ec.category() != error_category()) {
    return false;
  }
  switch (static_cast<Error>(ec.value())) {
    case Error::FileNotFound:
    case Error::FileOpenFailed:
    case Error::ParseError:
    case Error::MissingVariable:
    case Error::DisallowedValue:
    case Error::UnresolvedPlaceholder:
    case Error::DuplicateSection:
    case Error::MissingEntityType:
    case Error::UnknownEntityType:
    case Error::InvalidEntity:
    case Error::DanglingDependency:
    case Error::CycleDetected:
    case Error::ModuleLoadFailed:
      return true;
    default:
      return false;
  }
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

}  // namespace shipyard

template <>
struct std::is_error_code_enum<shipyard::Error> : std::true_type {};

namespace shipyard {

struct StringHash {
  using is_transparent = void;

  [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
    return std::hash<std::string_view>{}(sv);
  }

  [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }

  [[nodiscard]] std::size_t operator()(const char* s) const noexcept {
    return std::hash<std::string_view>{}(s);
  }
};

using StringEqual = std::equal_to<>;

}  // namespace shipyard
