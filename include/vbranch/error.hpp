#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace vbranch {

enum class ErrorKind : std::uint8_t {
  not_found,            // mandatory key missing
  invalid,              // key present, content fails typed parsing
  malformed_identifier, // identifier text fails its format check
  ownership_parse,      // ownership text cannot be decomposed
  invalid_range,        // hunk with end < start
  content_mismatch,     // stored content has the wrong shape (text vs bytes, bool, number)
  store,                // underlying store failed
};

constexpr auto to_string_view(ErrorKind kind) -> std::string_view {
  switch (kind) {
  case ErrorKind::not_found:            return "not_found";
  case ErrorKind::invalid:              return "invalid";
  case ErrorKind::malformed_identifier: return "malformed_identifier";
  case ErrorKind::ownership_parse:      return "ownership_parse";
  case ErrorKind::invalid_range:        return "invalid_range";
  case ErrorKind::content_mismatch:     return "content_mismatch";
  case ErrorKind::store:                return "store";
  }
  return "unknown";
}

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class MalformedIdentifier : public Error {
public:
  explicit MalformedIdentifier(std::string text)
      : Error(ErrorKind::malformed_identifier, "malformed identifier: " + text),
        text_(std::move(text)) {}

  [[nodiscard]] const std::string &text() const { return text_; }

private:
  std::string text_;
};

class OwnershipParseError : public Error {
public:
  OwnershipParseError(std::string fragment, std::string_view reason)
      : Error(ErrorKind::ownership_parse,
              "ownership: " + std::string(reason) + ": '" + fragment + "'"),
        fragment_(std::move(fragment)) {}

  [[nodiscard]] const std::string &fragment() const { return fragment_; }

private:
  std::string fragment_;
};

class InvalidRange : public Error {
public:
  InvalidRange(std::uint32_t start, std::uint32_t end)
      : Error(ErrorKind::invalid_range, "hunk: invalid range " + std::to_string(start) + "-" +
                                            std::to_string(end) + " (end before start)") {}
};

class StoreError : public Error {
public:
  explicit StoreError(const std::string &message) : Error(ErrorKind::store, "store: " + message) {}
};

// Failure to reconstruct one field of a stored record. `field()` is always the
// key the value was read from, e.g. "meta/tree".
class LoadError : public Error {
public:
  static LoadError not_found(std::string field) {
    return LoadError(ErrorKind::not_found, std::move(field), ErrorKind::not_found, "not found");
  }

  static LoadError invalid(std::string field, const Error &cause) {
    return LoadError(ErrorKind::invalid, std::move(field), cause.kind(), cause.what());
  }

  static LoadError invalid(std::string field, ErrorKind cause_kind, std::string cause) {
    return LoadError(ErrorKind::invalid, std::move(field), cause_kind, std::move(cause));
  }

  [[nodiscard]] const std::string &field() const { return field_; }
  [[nodiscard]] ErrorKind cause_kind() const { return cause_kind_; }
  [[nodiscard]] const std::string &cause() const { return cause_; }

private:
  LoadError(ErrorKind kind, std::string field, ErrorKind cause_kind, std::string cause)
      : Error(kind, field + ": " + cause), field_(std::move(field)), cause_kind_(cause_kind),
        cause_(std::move(cause)) {}

  std::string field_;
  ErrorKind cause_kind_;
  std::string cause_;
};

} // namespace vbranch
