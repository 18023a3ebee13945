#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace tickback {

enum class Error : int {
  Success,
  FileNotFound,
  ParseError,
  InvalidConfig,
  DatabaseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  InvalidArgument,
  NotFound,
  InvalidTimeSpec,
  IncompleteTask,
  UnsupportedMethod,
  InvalidTag,
  InvalidCallbackURL,
  NegativeField,
  InvalidTaskRef,
  LookupFailed,
  StatusUnavailable,
  StorageError,
  CorruptRecord,
  QueueFull,
  ConnectFailed,
  Timeout,
  TransportError,
  ResponseTooLarge,
  TlsError,
  Busy,
  Cancelled,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "file not found",
      "parse error",
      "invalid configuration",
      "database error",
      "failed to open database",
      "database query failed",
      "invalid argument",
      "task not found",
      "invalid time specification",
      "tag, trigger_at and callback are required",
      "unsupported HTTP method",
      "invalid tag: only [A-Za-z0-9] allowed",
      "invalid callback URL",
      "retry and max_delay must be non-negative",
      "invalid task reference",
      "failed to look up tasks",
      "failed to retrieve status",
      "failed to persist task",
      "corrupt task record",
      "worker queue is full",
      "connection failed",
      "timeout",
      "transport error",
      "response too large",
      "TLS error",
      "operation already in progress",
      "cancelled",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "tickback";
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

}  // namespace tickback

template <>
struct std::is_error_code_enum<tickback::Error> : std::true_type {};

namespace tickback {

// Errors caused by caller input rather than by the system itself.
[[nodiscard]] inline auto is_validation_error(std::error_code ec) noexcept
    -> bool {
  if (ec.category() != error_category()) {
    return false;
  }
  switch (static_cast<Error>(ec.value())) {
    case Error::ParseError:
    case Error::InvalidArgument:
    case Error::InvalidTimeSpec:
    case Error::IncompleteTask:
    case Error::UnsupportedMethod:
    case Error::InvalidTag:
    case Error::InvalidCallbackURL:
    case Error::NegativeField:
    case Error::InvalidTaskRef:
      return true;
    default:
      return false;
  }
}

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

}  // namespace tickback
